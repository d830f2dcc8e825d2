#include "CurveEngine.hh"
#include "IrtErrors.hh"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <sstream>

Curve CurveEngine::MakeCurve(const std::vector<double> & values)
{
    const std::vector<double> & grid = AbilityGrid::Get();
    if (values.size() != grid.size()) {
        std::stringstream msg;
        msg << "Engine returned " << values.size() << " values for "
            << grid.size() << " ability points";
        throw CurveComputationError(msg.str());
    }

    Curve curve;
    curve.theta.resize(grid.size());
    curve.value.resize(grid.size());
    for (size_t i = 0; i < grid.size(); i++) {
        curve.theta[i] = RoundTo(grid[i], 6);
        curve.value[i] = RoundTo(values[i], 8);
    }
    return curve;
}

Curve CurveEngine::MissingCurve()
{
    return MakeCurve(std::vector<double>(AbilityGrid::Get().size(), kMissing));
}

Curve CurveEngine::ResponseCurve(const FittedModel & model, int item) const
{
    if (item < 0 || item >= model.GetNItems()) {
        std::stringstream msg;
        msg << "Item index " << item << " out of range (model has " << model.GetNItems() << " items)";
        throw CurveComputationError(msg.str());
    }
    try {
        return MakeCurve(model.EvalProbability(item, AbilityGrid::Get()));
    }
    catch (const IrtError &) {
        throw;
    }
    catch (const std::exception & e) {
        throw CurveComputationError("Response curve for " + ItemId(item) + " failed: " + e.what());
    }
}

std::vector<Curve> CurveEngine::ResponseCurves(const FittedModel & model) const
{
    std::vector<Curve> curves;
    int nitem = model.GetNItems();
    curves.reserve(nitem);
    for (int i = 0; i < nitem; i++) curves.push_back(ResponseCurve(model, i));
    return curves;
}

ItemCurveResult CurveEngine::ItemInformation(const FittedModel & model, int item) const
{
    ItemCurveResult result;
    result.item = item;
    try {
        if (item < 0 || item >= model.GetNItems()) {
            throw CurveComputationError("Item index out of range");
        }
        result.curve = MakeCurve(model.EvalItemInformation(item, AbilityGrid::Get()));
        result.ok = true;
        if (printlvl > 1) printf("  Item information computed for %s\n", ItemId(item).c_str());
    }
    catch (const std::exception & e) {
        std::cerr << "WARNING: Could not compute IIF for item " << (item + 1) << ": " << e.what() << std::endl;
        result.ok = false;
        result.error = e.what();
        result.curve = MissingCurve();
    }
    return result;
}

std::vector<ItemCurveResult> CurveEngine::ItemInformationAll(const FittedModel & model) const
{
    std::vector<ItemCurveResult> results;
    int nitem = model.GetNItems();
    results.reserve(nitem);

    int nfailed = 0;
    for (int i = 0; i < nitem; i++) {
        results.push_back(ItemInformation(model, i));
        if (!results.back().ok) nfailed++;
    }
    if (nfailed > 0) {
        std::cerr << "WARNING: " << nfailed * AbilityGrid::kNPoints << " NA values in IIF results" << std::endl;
    }
    return results;
}

Curve CurveEngine::TestInformation(const FittedModel & model) const
{
    try {
        return MakeCurve(model.EvalTestInformation(AbilityGrid::Get()));
    }
    catch (const std::exception & e) {
        std::cerr << "WARNING: Could not compute test information: " << e.what() << std::endl;
        return MissingCurve();
    }
}

Curve CurveEngine::StandardErrorCurve(const Curve & test_information)
{
    Curve sem;
    sem.theta = test_information.theta;
    sem.value.resize(test_information.value.size());
    for (size_t i = 0; i < test_information.value.size(); i++) {
        double info = test_information.value[i];
        if (IsMissing(info)) sem.value[i] = kMissing;
        else sem.value[i] = RoundTo(1.0 / std::sqrt(std::max(info, 1e-9)), 6);
    }
    return sem;
}
