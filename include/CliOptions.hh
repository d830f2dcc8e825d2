#ifndef CLIOPTIONS_HH
#define CLIOPTIONS_HH

#include <string>

// Command line of the irtana tool:
//   irtana <analyze|icc|iif|tif> <data.csv> [options]
struct CliOptions {
    std::string command;
    std::string datafile;
    std::string item_id;    // icc only; empty = every item
    std::string outfile;    // empty = stdout
    int nquad;
    int maxiter;
    unsigned int seed;
    int printlvl;
    bool stderrs;

    CliOptions() : nquad(41), maxiter(10000), seed(12345), printlvl(0), stderrs(true) {}
};

// Fills opts from argv. Returns false and prints the reason to std::cerr on
// a malformed command line. Progress output goes to stdout, so a print
// level above 0 needs -o to keep the JSON payload separate.
bool ParseCliOptions(int argc, const char * const argv[], CliOptions & opts);

#endif // CLIOPTIONS_HH
