#include "ResultWriter.hh"
#include "IrtErrors.hh"

#include <cmath>
#include <memory>

Json::Value ResultWriter::Number(double x)
{
    if (!std::isfinite(x)) return Json::Value(Json::nullValue);
    return Json::Value(x);
}

namespace {

Json::Value ToArray(const std::vector<double> & values)
{
    Json::Value arr(Json::arrayValue);
    for (double x : values) arr.append(ResultWriter::Number(x));
    return arr;
}

} // namespace

Json::Value ResultWriter::ToJson(const ItemParameter & param)
{
    Json::Value row(Json::objectValue);
    row["item_id"] = param.item_id;
    row["discrimination"] = Number(param.discrimination);
    row["difficulty"] = Number(param.difficulty);
    row["guessing"] = Number(param.guessing);
    row["se_discrimination"] = Number(param.se_discrimination);
    row["se_difficulty"] = Number(param.se_difficulty);
    row["se_guessing"] = Number(param.se_guessing);
    row["model_type"] = ModelTypeName(param.model_type);
    return row;
}

Json::Value ResultWriter::ToJson(const AnalysisResult & result)
{
    Json::Value root(Json::objectValue);
    root["status"] = "success";
    root["analysis_type"] = ModelTypeName(result.model_info.type);

    Json::Value info(Json::objectValue);
    info["type"] = ModelTypeName(result.model_info.type);
    info["converged"] = result.model_info.converged;
    info["iterations"] = result.model_info.iterations;
    info["log_likelihood"] = Number(result.model_info.log_likelihood);
    root["model_info"] = info;

    Json::Value summary(Json::objectValue);
    summary["n_students"] = result.data_summary.n_students;
    summary["n_items"] = result.data_summary.n_items;
    summary["original_students"] = result.data_summary.original_students;
    summary["response_rate"] = Number(result.data_summary.response_rate);
    root["data_summary"] = summary;

    Json::Value params(Json::arrayValue);
    for (const auto & p : result.item_parameters) params.append(ToJson(p));
    root["item_parameters"] = params;

    const ModelFit & mf = result.model_fit;
    Json::Value fit(Json::objectValue);
    fit["m2"] = Number(mf.m2.m2);
    if (mf.m2.df >= 0) fit["m2_df"] = mf.m2.df;
    else fit["m2_df"] = Json::Value(Json::nullValue);
    fit["m2_p"] = Number(mf.m2.p);
    fit["tli"] = Number(mf.m2.tli);
    fit["rmsea"] = Number(mf.m2.rmsea);
    fit["reliability"] = Number(mf.reliability);
    fit["log_likelihood"] = Number(mf.log_likelihood);
    fit["aic"] = Number(mf.aic);
    fit["bic"] = Number(mf.bic);
    fit["converged"] = mf.converged;
    root["model_fit"] = fit;

    Json::Value tif(Json::objectValue);
    tif["theta"] = ToArray(result.test_information.theta);
    tif["information"] = ToArray(result.test_information.value);
    tif["standard_error"] = ToArray(result.standard_error.value);
    root["test_information"] = tif;

    return root;
}

Json::Value ResultWriter::ToJson(const ItemCurveSet & set)
{
    Json::Value root(Json::objectValue);
    root["status"] = "success";

    if (set.single_item && set.curves.size() == 1) {
        root["item_id"] = set.item_ids[0];
        root["theta"] = ToArray(set.curves[0].theta);
        root["probability"] = ToArray(set.curves[0].value);
        return root;
    }

    // long format: one row per (item, theta)
    Json::Value rows(Json::arrayValue);
    for (size_t i = 0; i < set.curves.size(); i++) {
        const Curve & c = set.curves[i];
        for (size_t k = 0; k < c.size(); k++) {
            Json::Value row(Json::objectValue);
            row["theta"] = Number(c.theta[k]);
            row["probability"] = Number(c.value[k]);
            row["item_id"] = set.item_ids[i];
            rows.append(row);
        }
    }
    root["icc_data"] = rows;
    return root;
}

Json::Value ResultWriter::ToJson(const ItemInformationSet & set)
{
    Json::Value root(Json::objectValue);
    root["status"] = "success";

    Json::Value rows(Json::arrayValue);
    for (size_t i = 0; i < set.results.size(); i++) {
        const Curve & c = set.results[i].curve;
        for (size_t k = 0; k < c.size(); k++) {
            Json::Value row(Json::objectValue);
            row["theta"] = Number(c.theta[k]);
            row["iif"] = Number(c.value[k]);
            row["item_id"] = set.item_ids[i];
            rows.append(row);
        }
    }
    root["iif_data"] = rows;
    return root;
}

Json::Value ResultWriter::ToJson(const TestInformationResult & result)
{
    Json::Value root(Json::objectValue);
    root["status"] = "success";
    root["theta"] = ToArray(result.information.theta);
    root["information"] = ToArray(result.information.value);
    return root;
}

Json::Value ResultWriter::ErrorPayload(const std::string & message, const std::string & kind)
{
    Json::Value root(Json::objectValue);
    root["status"] = "error";
    root["error"] = message;
    if (!kind.empty()) root["kind"] = kind;
    return root;
}

Json::Value ResultWriter::ErrorPayload(const std::exception & e)
{
    const IrtError * irterr = dynamic_cast<const IrtError *>(&e);
    if (irterr) return ErrorPayload(e.what(), ErrorKindName(irterr->GetKind()));
    return ErrorPayload(e.what());
}

void ResultWriter::Write(const Json::Value & payload, std::ostream & out)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["precision"] = 10;
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(payload, &out);
    out << std::endl;
}
