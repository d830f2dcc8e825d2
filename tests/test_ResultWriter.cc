#include "IrtErrors.hh"
#include "ResultWriter.hh"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <gtest/gtest.h>

namespace {

Curve SmallCurve(double v0, double v1)
{
    Curve c;
    c.theta = {-1.0, 1.0};
    c.value = {v0, v1};
    return c;
}

} // namespace

TEST(ResultWriter, MissingNumbersBecomeNull)
{
    EXPECT_TRUE(ResultWriter::Number(kMissing).isNull());
    EXPECT_TRUE(ResultWriter::Number(HUGE_VAL).isNull());
    EXPECT_DOUBLE_EQ(ResultWriter::Number(0.25).asDouble(), 0.25);
}

TEST(ResultWriter, AnalysisPayload)
{
    AnalysisResult result;
    result.model_info.type = ModelType::RICH_3PL;
    result.model_info.converged = true;
    result.model_info.iterations = 30;
    result.model_info.log_likelihood = -100.5;
    result.data_summary.n_students = 10;
    result.data_summary.n_items = 2;
    result.data_summary.original_students = 12;
    result.data_summary.response_rate = 0.55;

    ItemParameter p;
    p.item_id = "item_1";
    p.discrimination = 1.2;
    p.guessing = 0.15;
    p.model_type = ModelType::RICH_3PL;
    result.item_parameters.push_back(p);

    result.model_fit.m2.m2 = 3.2;
    result.model_fit.m2.df = 4;
    result.model_fit.converged = true;
    result.test_information = SmallCurve(0.5, 0.7);
    result.standard_error = SmallCurve(1.414214, kMissing);

    Json::Value root = ResultWriter::ToJson(result);
    EXPECT_EQ(root["status"].asString(), "success");
    EXPECT_EQ(root["analysis_type"].asString(), "3PL");
    EXPECT_EQ(root["model_info"]["iterations"].asInt(), 30);
    EXPECT_EQ(root["data_summary"]["original_students"].asInt(), 12);
    ASSERT_EQ(root["item_parameters"].size(), 1u);
    EXPECT_EQ(root["item_parameters"][0]["item_id"].asString(), "item_1");
    EXPECT_DOUBLE_EQ(root["item_parameters"][0]["guessing"].asDouble(), 0.15);
    EXPECT_EQ(root["item_parameters"][0]["model_type"].asString(), "3PL");
    EXPECT_EQ(root["model_fit"]["m2_df"].asInt(), 4);
    EXPECT_TRUE(root["model_fit"]["tli"].isNull());
    EXPECT_TRUE(root["model_fit"]["bic"].isNull());
    EXPECT_TRUE(root["model_fit"]["converged"].asBool());
    EXPECT_EQ(root["test_information"]["theta"].size(), 2u);
    EXPECT_TRUE(root["test_information"]["standard_error"][1].isNull());
}

TEST(ResultWriter, UnavailableM2DegreesOfFreedomIsNull)
{
    AnalysisResult result;
    Json::Value root = ResultWriter::ToJson(result);
    EXPECT_TRUE(root["model_fit"]["m2"].isNull());
    EXPECT_TRUE(root["model_fit"]["m2_df"].isNull());
    EXPECT_EQ(root["analysis_type"].asString(), "2PL");
}

TEST(ResultWriter, CurvePayloads)
{
    ItemCurveSet single;
    single.single_item = true;
    single.item_ids.push_back("item_2");
    single.curves.push_back(SmallCurve(0.2, 0.8));
    Json::Value one = ResultWriter::ToJson(single);
    EXPECT_EQ(one["item_id"].asString(), "item_2");
    EXPECT_EQ(one["probability"].size(), 2u);

    ItemCurveSet all;
    all.item_ids = {"item_1", "item_2"};
    all.curves = {SmallCurve(0.1, 0.9), SmallCurve(0.2, 0.8)};
    Json::Value rows = ResultWriter::ToJson(all)["icc_data"];
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[2]["item_id"].asString(), "item_2");
    EXPECT_DOUBLE_EQ(rows[2]["theta"].asDouble(), -1.0);
    EXPECT_DOUBLE_EQ(rows[2]["probability"].asDouble(), 0.2);

    ItemInformationSet info;
    info.item_ids = {"item_1", "item_2"};
    info.results.resize(2);
    info.results[0].curve = SmallCurve(0.3, 0.4);
    info.results[1].curve = SmallCurve(kMissing, kMissing);
    Json::Value iif = ResultWriter::ToJson(info)["iif_data"];
    ASSERT_EQ(iif.size(), 4u);
    EXPECT_DOUBLE_EQ(iif[1]["iif"].asDouble(), 0.4);
    EXPECT_TRUE(iif[3]["iif"].isNull());

    TestInformationResult tif;
    tif.information = SmallCurve(1.0, 2.0);
    EXPECT_EQ(ResultWriter::ToJson(tif)["information"].size(), 2u);
}

TEST(ResultWriter, ErrorPayloadCarriesTheKind)
{
    Json::Value err = ResultWriter::ErrorPayload(InsufficientDataError("Not enough valid response patterns"));
    EXPECT_EQ(err["status"].asString(), "error");
    EXPECT_EQ(err["error"].asString(), "Not enough valid response patterns");
    EXPECT_EQ(err["kind"].asString(), "InsufficientDataError");

    Json::Value plain = ResultWriter::ErrorPayload(std::runtime_error("boom"));
    EXPECT_FALSE(plain.isMember("kind"));
}

TEST(ResultWriter, WritesParsableJson)
{
    std::stringstream out;
    ResultWriter::Write(ResultWriter::ErrorPayload("bad request", "RequestError"), out);

    Json::CharReaderBuilder builder;
    Json::Value parsed;
    std::string errs;
    ASSERT_TRUE(Json::parseFromStream(builder, out, &parsed, &errs)) << errs;
    EXPECT_EQ(parsed["kind"].asString(), "RequestError");
}
