#include "CliOptions.hh"

#include <cstring>
#include <iostream>
#include <sstream>

namespace {

template <typename T>
bool readarg(int argc, const char * const argv[], int & iarg, T & value)
{
    if (iarg + 1 >= argc) {
        std::cerr << "*****Error: option " << argv[iarg] << " needs a value" << std::endl;
        return false;
    }
    iarg++;
    std::istringstream ss(argv[iarg]);
    if (!(ss >> value)) {
        std::cerr << "*****Error: unable to convert argument of " << argv[iarg - 1]
                  << ": " << argv[iarg] << std::endl;
        return false;
    }
    return true;
}

} // namespace

bool ParseCliOptions(int argc, const char * const argv[], CliOptions & opts)
{
    if (argc < 3) {
        std::cerr << "*****Error: need a command and a data file" << std::endl;
        return false;
    }
    opts.command = argv[1];
    opts.datafile = argv[2];

    for (int iarg = 3; iarg < argc; iarg++) {
        bool ok = true;
        if (!strcmp(argv[iarg], "-item")) ok = readarg(argc, argv, iarg, opts.item_id);
        else if (!strcmp(argv[iarg], "-quad")) ok = readarg(argc, argv, iarg, opts.nquad);
        else if (!strcmp(argv[iarg], "-maxiter")) ok = readarg(argc, argv, iarg, opts.maxiter);
        else if (!strcmp(argv[iarg], "-seed")) ok = readarg(argc, argv, iarg, opts.seed);
        else if (!strcmp(argv[iarg], "-print")) ok = readarg(argc, argv, iarg, opts.printlvl);
        else if (!strcmp(argv[iarg], "-o")) ok = readarg(argc, argv, iarg, opts.outfile);
        else if (!strcmp(argv[iarg], "-nostderr")) opts.stderrs = false;
        else {
            std::cerr << "*****Error: unknown option " << argv[iarg] << std::endl;
            ok = false;
        }
        if (!ok) return false;
    }

    if (opts.printlvl > 0 && opts.outfile.empty()) {
        std::cerr << "*****Error: -print " << opts.printlvl
                  << " writes progress to stdout, use -o for the JSON payload" << std::endl;
        return false;
    }
    return true;
}
