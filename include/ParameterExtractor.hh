#ifndef PARAMETEREXTRACTOR_HH
#define PARAMETEREXTRACTOR_HH

#include "FittedModel.hh"
#include "IrtTypes.hh"

#include <vector>

class ParameterExtractor {
private:
    int printlvl;

public:
    ParameterExtractor() : printlvl(0) {}

    void SetPrintLevel(int lvl) { printlvl = lvl; }

    // Build the parameter table in column order. Missing coefficients get
    // defaults (a=1, b=0, g=0), missing standard errors are 0.
    // standard_errors may be empty (no standard errors at all).
    std::vector<ItemParameter> Extract(const std::vector<ItemCoefficients> & coefficients,
                                       const std::vector<ItemCoefficients> & standard_errors,
                                       ModelType type) const;

    // Clamp to reporting bounds, in this order per item:
    //   a<0 -> |a|, a>4 -> 4, a<0.1 -> 0.1, b into [-4,4], 3PL only: g into [0,0.5]
    void Clean(std::vector<ItemParameter> & params, ModelType type) const;

    // Extract() + Clean() straight from a fitted model. A failure to get
    // standard errors is not fatal: zero standard errors are used.
    std::vector<ItemParameter> ExtractFromModel(const FittedModel & model, ModelType type) const;
};

#endif // PARAMETEREXTRACTOR_HH
