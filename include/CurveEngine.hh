#ifndef CURVEENGINE_HH
#define CURVEENGINE_HH

#include "FittedModel.hh"
#include "IrtTypes.hh"

#include <string>
#include <vector>

// Outcome of one item's curve: either a curve, or a placeholder curve of
// NaN values plus the reason it could not be computed.
struct ItemCurveResult {
    int item;
    bool ok;
    Curve curve;
    std::string error;

    ItemCurveResult() : item(-1), ok(false) {}
};

// Derived functions of a fitted model on the fixed AbilityGrid.
// Ability values are rounded to 6 decimals, derived values to 8.
class CurveEngine {
private:
    int printlvl;

    static Curve MakeCurve(const std::vector<double> & values);
    static Curve MissingCurve();

public:
    CurveEngine() : printlvl(0) {}

    void SetPrintLevel(int lvl) { printlvl = lvl; }

    // Item characteristic curve. Throws CurveComputationError on failure.
    Curve ResponseCurve(const FittedModel & model, int item) const;
    std::vector<Curve> ResponseCurves(const FittedModel & model) const;

    // Item information. Never throws: a failure is reported in the result.
    ItemCurveResult ItemInformation(const FittedModel & model, int item) const;
    std::vector<ItemCurveResult> ItemInformationAll(const FittedModel & model) const;

    // Test information; every value is NaN if it cannot be computed
    Curve TestInformation(const FittedModel & model) const;

    // Standard error of measurement 1/sqrt(I), rounded to 6 decimals
    static Curve StandardErrorCurve(const Curve & test_information);
};

#endif // CURVEENGINE_HH
