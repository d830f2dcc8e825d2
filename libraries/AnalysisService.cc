#include "AnalysisService.hh"
#include "IrtErrors.hh"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>

AnalysisService::AnalysisService(ModelCache & modelcache)
    : cache(modelcache), printlvl(0)
{
}

void AnalysisService::SetPrintLevel(int lvl)
{
    printlvl = lvl;
    validator.SetPrintLevel(lvl);
    extractor.SetPrintLevel(lvl);
    curves.SetPrintLevel(lvl);
}

int AnalysisService::ParseItemId(const std::string & item_id, int nitem)
{
    std::string digits = item_id;
    if (digits.compare(0, 5, "item_") == 0) digits = digits.substr(5);

    bool numeric = !digits.empty();
    for (char c : digits) {
        if (!std::isdigit((unsigned char)c)) numeric = false;
    }
    if (numeric && digits.size() < 10) {
        int idx = std::atoi(digits.c_str());
        if (idx >= 1 && idx <= nitem) return idx - 1;
    }
    std::stringstream msg;
    msg << "Unknown item '" << item_id << "' (dataset has " << nitem << " items)";
    throw RequestError(msg.str());
}

std::shared_ptr<const FitResult> AnalysisService::Prepare(const std::string & key, const RawTable & table,
                                                          ValidatedData & data) const
{
    data = validator.Validate(table);
    if (printlvl > 0) {
        printf("Dataset %s: %d valid rows, %d items\n", key.c_str(),
               data.GetNRespondents(), data.GetNItems());
    }
    std::shared_ptr<const FitResult> fit = cache.GetOrFit(key, data.responses);
    if (fit->model->GetNItems() != data.GetNItems()) {
        std::stringstream msg;
        msg << "Cached model for " << key << " has " << fit->model->GetNItems()
            << " items but the data has " << data.GetNItems();
        throw RequestError(msg.str());
    }
    return fit;
}

AnalysisResult AnalysisService::Analyze(const std::string & key, const RawTable & table) const
{
    ValidatedData data;
    std::shared_ptr<const FitResult> fit = Prepare(key, table, data);
    const FittedModel & model = *fit->model;

    AnalysisResult result;

    // ===== STEP 1: Model info and data summary =====
    if (!model.IsConverged()) std::cerr << "WARNING: Model did not converge properly" << std::endl;
    if (printlvl > 0) printf("Model successfully retrieved/fitted: %s\n", ModelTypeName(fit->type));

    result.model_info.type = fit->type;
    result.model_info.converged = model.IsConverged();
    result.model_info.iterations = model.GetIterations();
    result.model_info.log_likelihood = model.GetLogLikelihood();

    result.data_summary.n_students = data.GetNRespondents();
    result.data_summary.n_items = data.GetNItems();
    result.data_summary.original_students = data.original_rows;
    double sum = 0.0;
    int nobs = 0;
    for (int i = 0; i < data.responses.rows(); i++) {
        for (int j = 0; j < data.responses.cols(); j++) {
            if (IsMissing(data.responses(i, j))) continue;
            sum += data.responses(i, j);
            nobs++;
        }
    }
    if (nobs > 0) result.data_summary.response_rate = sum / nobs;

    // ===== STEP 2: Item parameters =====
    result.item_parameters = extractor.ExtractFromModel(model, fit->type);

    // ===== STEP 3: Fit statistics, each one optional =====
    ModelFit & mf = result.model_fit;
    mf.converged = model.IsConverged();
    try {
        mf.m2 = model.CalcM2();
        mf.m2.m2 = RoundTo(mf.m2.m2, 6);
        mf.m2.p = RoundTo(mf.m2.p, 6);
        mf.m2.tli = RoundTo(mf.m2.tli, 6);
        mf.m2.rmsea = RoundTo(mf.m2.rmsea, 6);
    }
    catch (const std::exception & e) {
        std::cerr << "WARNING: M2 statistic not available: " << e.what() << std::endl;
        mf.m2 = M2Statistic();
    }
    try {
        mf.reliability = RoundTo(model.CalcReliability(), 6);
    }
    catch (const std::exception & e) {
        std::cerr << "WARNING: Reliability not available: " << e.what() << std::endl;
    }
    try {
        mf.log_likelihood = RoundTo(model.GetLogLikelihood(), 6);
        mf.aic = RoundTo(model.GetAIC(), 6);
        mf.bic = RoundTo(model.GetBIC(), 6);
    }
    catch (const std::exception & e) {
        std::cerr << "WARNING: Information criteria not available: " << e.what() << std::endl;
    }

    // ===== STEP 4: Test information =====
    result.test_information = curves.TestInformation(model);
    result.standard_error = CurveEngine::StandardErrorCurve(result.test_information);

    return result;
}

ItemCurveSet AnalysisService::ItemCurve(const std::string & key, const RawTable & table,
                                        const std::string & item_id) const
{
    ValidatedData data;
    std::shared_ptr<const FitResult> fit = Prepare(key, table, data);

    ItemCurveSet set;
    if (!item_id.empty()) {
        int idx = ParseItemId(item_id, data.GetNItems());
        set.single_item = true;
        set.item_ids.push_back(ItemId(idx));
        set.curves.push_back(curves.ResponseCurve(*fit->model, idx));
        return set;
    }

    set.curves = curves.ResponseCurves(*fit->model);
    for (size_t i = 0; i < set.curves.size(); i++) set.item_ids.push_back(ItemId(int(i)));
    return set;
}

ItemInformationSet AnalysisService::ItemInformationFunction(const std::string & key, const RawTable & table) const
{
    ValidatedData data;
    std::shared_ptr<const FitResult> fit = Prepare(key, table, data);

    ItemInformationSet set;
    set.results = curves.ItemInformationAll(*fit->model);
    for (const auto & r : set.results) set.item_ids.push_back(ItemId(r.item));
    return set;
}

TestInformationResult AnalysisService::TestInformationFunction(const std::string & key, const RawTable & table) const
{
    ValidatedData data;
    std::shared_ptr<const FitResult> fit = Prepare(key, table, data);

    TestInformationResult result;
    result.information = curves.TestInformation(*fit->model);
    return result;
}
