#ifndef ANALYSISSERVICE_HH
#define ANALYSISSERVICE_HH

#include "CurveEngine.hh"
#include "IrtTypes.hh"
#include "ModelCache.hh"
#include "ParameterExtractor.hh"
#include "ResponseData.hh"

#include <string>
#include <vector>

struct ModelInfo {
    ModelType type;
    bool converged;
    int iterations;
    double log_likelihood;

    ModelInfo() : type(ModelType::SIMPLE_2PL), converged(false), iterations(0), log_likelihood(kMissing) {}
};

struct DataSummary {
    int n_students;          // after cleaning
    int n_items;
    int original_students;   // before cleaning
    double response_rate;    // mean score over non-missing cleaned cells

    DataSummary() : n_students(0), n_items(0), original_students(0), response_rate(kMissing) {}
};

struct ModelFit {
    M2Statistic m2;
    double reliability;
    double log_likelihood;
    double aic;
    double bic;
    bool converged;

    ModelFit() : reliability(kMissing), log_likelihood(kMissing), aic(kMissing), bic(kMissing), converged(false) {}
};

struct AnalysisResult {
    ModelInfo model_info;
    DataSummary data_summary;
    std::vector<ItemParameter> item_parameters;
    ModelFit model_fit;
    Curve test_information;
    Curve standard_error;     // 1/sqrt(test information)
};

struct ItemCurveSet {
    std::vector<std::string> item_ids;
    std::vector<Curve> curves;
    bool single_item;         // true when one item was requested

    ItemCurveSet() : single_item(false) {}
};

struct ItemInformationSet {
    std::vector<std::string> item_ids;
    std::vector<ItemCurveResult> results;
};

struct TestInformationResult {
    Curve information;
};

// The four operations of the analysis core. Every operation validates the
// raw table again and fits through the cache, so repeated calls for the same
// dataset key do not refit.
class AnalysisService {
private:
    DataValidator validator;
    ModelCache & cache;
    ParameterExtractor extractor;
    CurveEngine curves;
    int printlvl;

    std::shared_ptr<const FitResult> Prepare(const std::string & key, const RawTable & table,
                                             ValidatedData & data) const;

public:
    explicit AnalysisService(ModelCache & modelcache);

    void SetPrintLevel(int lvl);
    DataValidator & GetValidator() { return validator; }

    AnalysisResult Analyze(const std::string & key, const RawTable & table) const;

    // item_id is "item_N" or "N" (1-based); empty means every item
    ItemCurveSet ItemCurve(const std::string & key, const RawTable & table,
                           const std::string & item_id = "") const;

    ItemInformationSet ItemInformationFunction(const std::string & key, const RawTable & table) const;

    TestInformationResult TestInformationFunction(const std::string & key, const RawTable & table) const;

    // Column index for an item id, throws RequestError if unknown
    static int ParseItemId(const std::string & item_id, int nitem);
};

#endif // ANALYSISSERVICE_HH
