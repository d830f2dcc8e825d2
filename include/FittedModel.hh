#ifndef FITTEDMODEL_HH
#define FITTEDMODEL_HH

#include "IrtTypes.hh"
#include <vector>

// Read-only handle to a model produced by a ModelEstimationClient.
//
// Coefficients are reported in IRT parameterization (a, b, g); the guessing
// coefficient is NaN for 2PL fits. Evaluation methods throw on failure
// (EstimationError or CurveComputationError); callers decide whether a
// failure is isolated or fatal.
class FittedModel {
public:
    virtual ~FittedModel() {}

    virtual ModelType GetType() const = 0;
    virtual bool IsConverged() const = 0;
    virtual int GetIterations() const = 0;
    virtual double GetLogLikelihood() const = 0;
    virtual int GetNItems() const = 0;

    // One entry per item, in column order
    virtual std::vector<ItemCoefficients> GetCoefficients() const = 0;

    // Same shape as GetCoefficients(); NaN where unavailable.
    // May throw if the engine could not produce standard errors at all.
    virtual std::vector<ItemCoefficients> GetStandardErrors() const = 0;

    // Probability of a correct response at each ability value
    virtual std::vector<double> EvalProbability(int item, const std::vector<double> & theta) const = 0;

    // Fisher information of one item at each ability value
    virtual std::vector<double> EvalItemInformation(int item, const std::vector<double> & theta) const = 0;

    // Sum of item information at each ability value
    virtual std::vector<double> EvalTestInformation(const std::vector<double> & theta) const = 0;

    // Fit statistics
    virtual M2Statistic CalcM2() const = 0;
    virtual double CalcReliability() const = 0;
    virtual double GetAIC() const = 0;
    virtual double GetBIC() const = 0;
};

#endif // FITTEDMODEL_HH
