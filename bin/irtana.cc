#include "AnalysisService.hh"
#include "CliOptions.hh"
#include "IpoptEstimationClient.hh"
#include "IrtErrors.hh"
#include "ModelCache.hh"
#include "ModelFitter.hh"
#include "ResponseData.hh"
#include "ResultWriter.hh"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

namespace {

void usage(const char * prog)
{
    printf("Usage: %s <analyze|icc|iif|tif> <data.csv> [options]\n", prog);
    printf("Options:\n");
    printf("  -item item_N    item for icc (default: every item)\n");
    printf("  -quad N         quadrature points (default 41)\n");
    printf("  -maxiter N      iteration budget per fit (default 10000)\n");
    printf("  -seed N         start value seed (default 12345)\n");
    printf("  -nostderr       skip Hessian standard errors\n");
    printf("  -print N        print level (default 0, needs -o)\n");
    printf("  -o file         write the JSON payload to file instead of stdout\n");
}

} // namespace

int main(int argc, char * argv[])
{
    CliOptions opts;
    if (!ParseCliOptions(argc, argv, opts)) {
        usage(argv[0]);
        return 2;
    }
    const std::string & command = opts.command;
    const std::string & datafile = opts.datafile;
    const int printlvl = opts.printlvl;

    IpoptEstimationClient engine;
    engine.SetNQuadPoints(opts.nquad);
    engine.SetHessStdErr(opts.stderrs);
    engine.SetPrintLevel(printlvl);

    ModelFitter fitter(engine);
    fitter.SetSeed(opts.seed);
    fitter.SetMaxIter(opts.maxiter);
    fitter.SetPrintLevel(printlvl);

    ModelCache cache(fitter);
    cache.SetPrintLevel(printlvl);

    AnalysisService service(cache);
    service.SetPrintLevel(printlvl);

    Json::Value payload;
    bool failed = false;
    try {
        RawTable table = ReadResponseCsv(datafile);
        if (command == "analyze") {
            payload = ResultWriter::ToJson(service.Analyze(datafile, table));
        }
        else if (command == "icc") {
            payload = ResultWriter::ToJson(service.ItemCurve(datafile, table, opts.item_id));
        }
        else if (command == "iif") {
            payload = ResultWriter::ToJson(service.ItemInformationFunction(datafile, table));
        }
        else if (command == "tif") {
            payload = ResultWriter::ToJson(service.TestInformationFunction(datafile, table));
        }
        else {
            throw RequestError("Unknown command '" + command + "'");
        }
    }
    catch (const std::exception & e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        payload = ResultWriter::ErrorPayload(e);
        failed = true;
    }

    if (opts.outfile.empty()) {
        ResultWriter::Write(payload, std::cout);
    }
    else {
        std::ofstream out(opts.outfile.c_str());
        if (!out) {
            std::cerr << "ERROR: cannot open output file " << opts.outfile << std::endl;
            return 1;
        }
        ResultWriter::Write(payload, out);
    }

    return failed ? 1 : 0;
}
