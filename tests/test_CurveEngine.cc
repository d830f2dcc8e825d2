#include "CurveEngine.hh"
#include "FakeEstimation.hh"

#include <cmath>
#include <gtest/gtest.h>

TEST(AbilityGrid, HundredAndOnePointsFromMinusFourToFour)
{
    const std::vector<double> & grid = AbilityGrid::Get();
    ASSERT_EQ(int(grid.size()), AbilityGrid::kNPoints);
    EXPECT_DOUBLE_EQ(grid.front(), -4.0);
    EXPECT_DOUBLE_EQ(grid[50], 0.0);
    EXPECT_DOUBLE_EQ(grid.back(), 4.0);
    EXPECT_NEAR(grid[1] - grid[0], 0.08, 1e-12);
}

TEST(CurveEngine, ResponseCurveOnTheGrid)
{
    FakeFittedModel model(ModelType::SIMPLE_2PL, MakeCoefficients(3, 1.5, 0.4, kMissing));
    CurveEngine engine;

    Curve curve = engine.ResponseCurve(model, 1);
    ASSERT_EQ(curve.size(), 101u);
    EXPECT_DOUBLE_EQ(curve.theta[0], -4.0);
    EXPECT_DOUBLE_EQ(curve.theta[100], 4.0);

    // P(b) = 0.5 for a 2PL item; theta = 0.4 is grid point 55
    EXPECT_NEAR(curve.value[55], 0.5, 1e-8);
    for (size_t k = 1; k < curve.size(); k++) EXPECT_GE(curve.value[k], curve.value[k - 1]);
}

TEST(CurveEngine, ValuesAreRoundedToEightDecimals)
{
    FakeFittedModel model(ModelType::SIMPLE_2PL, MakeCoefficients(1, 1.3, 0.1, kMissing));
    CurveEngine engine;
    Curve curve = engine.ResponseCurve(model, 0);
    for (double v : curve.value) EXPECT_DOUBLE_EQ(v, RoundTo(v, 8));
}

TEST(CurveEngine, ResponseCurveOutOfRange)
{
    FakeFittedModel model(ModelType::SIMPLE_2PL, MakeCoefficients(3, 1.0, 0.0, kMissing));
    CurveEngine engine;
    EXPECT_THROW(engine.ResponseCurve(model, 3), CurveComputationError);
    EXPECT_THROW(engine.ResponseCurve(model, -1), CurveComputationError);
    EXPECT_EQ(engine.ResponseCurves(model).size(), 3u);
}

TEST(CurveEngine, ItemInformationFailureIsIsolated)
{
    FakeFittedModel model(ModelType::SIMPLE_2PL, MakeCoefficients(4, 1.0, 0.0, kMissing));
    model.failing_info_item = 2;
    CurveEngine engine;

    std::vector<ItemCurveResult> results = engine.ItemInformationAll(model);
    ASSERT_EQ(results.size(), 4u);
    for (int j = 0; j < 4; j++) {
        EXPECT_EQ(results[j].item, j);
        ASSERT_EQ(results[j].curve.size(), 101u);
        if (j == 2) {
            EXPECT_FALSE(results[j].ok);
            EXPECT_EQ(results[j].error, "information failed");
            for (double v : results[j].curve.value) EXPECT_TRUE(IsMissing(v));
        }
        else {
            EXPECT_TRUE(results[j].ok);
            // a 2PL item with a=1 peaks at 0.25 where theta = b
            EXPECT_NEAR(results[j].curve.value[50], 0.25, 1e-8);
        }
    }
}

TEST(CurveEngine, TestInformationIsTheSumOfItems)
{
    FakeFittedModel model(ModelType::RICH_3PL, MakeCoefficients(3, 1.2, -0.5, 0.15));
    CurveEngine engine;

    Curve total = engine.TestInformation(model);
    Curve single = engine.ItemInformation(model, 0).curve;
    ASSERT_EQ(total.size(), 101u);
    for (size_t k = 0; k < total.size(); k++) EXPECT_NEAR(total.value[k], 3.0 * single.value[k], 1e-7);
}

TEST(CurveEngine, TestInformationFailureGivesMissingValues)
{
    FakeFittedModel model(ModelType::SIMPLE_2PL, MakeCoefficients(2, 1.0, 0.0, kMissing));
    model.testinfo_throws = true;
    CurveEngine engine;

    Curve total = engine.TestInformation(model);
    ASSERT_EQ(total.size(), 101u);
    EXPECT_DOUBLE_EQ(total.theta[0], -4.0);
    for (double v : total.value) EXPECT_TRUE(IsMissing(v));
}

TEST(CurveEngine, StandardErrorCurve)
{
    Curve info;
    info.theta = {-1.0, 0.0, 1.0, 2.0};
    info.value = {4.0, 0.0, kMissing, 0.25};

    Curve sem = CurveEngine::StandardErrorCurve(info);
    ASSERT_EQ(sem.size(), 4u);
    EXPECT_DOUBLE_EQ(sem.value[0], 0.5);
    EXPECT_DOUBLE_EQ(sem.value[1], RoundTo(1.0 / std::sqrt(1e-9), 6));
    EXPECT_TRUE(IsMissing(sem.value[2]));
    EXPECT_DOUBLE_EQ(sem.value[3], 2.0);
}
