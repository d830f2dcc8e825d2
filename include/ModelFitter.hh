#ifndef MODELFITTER_HH
#define MODELFITTER_HH

#include "FittedModel.hh"
#include "IrtTypes.hh"
#include "ModelEstimationClient.hh"

#include <memory>
#include <string>
#include <vector>
#include <Eigen/Dense>

// States of the 3PL -> 2PL fallback.
// Terminal states are RICH_ACCEPTED and SIMPLE_ACCEPTED.
enum class FitState {
    ATTEMPTING_RICH,
    RICH_ACCEPTED,
    RICH_REJECTED,
    ATTEMPTING_SIMPLE,
    SIMPLE_ACCEPTED
};

const char * FitStateName(FitState state);

struct FitResult {
    std::shared_ptr<const FittedModel> model;
    ModelType type;
    std::vector<FitState> trace;    // states visited, in order
    std::string rejection;          // why the 3PL fit was rejected (empty if accepted)

    FitResult() : type(ModelType::SIMPLE_2PL) {}
};

class ModelFitter {
private:
    ModelEstimationClient & client;
    unsigned int seed;
    int max_iter;
    int printlvl;

    // Plausibility bounds for an accepted 3PL fit
    double min_discrim;     // exclusive
    double max_discrim;     // inclusive
    double max_abs_difficulty;
    double max_guessing;

public:
    explicit ModelFitter(ModelEstimationClient & estclient);

    void SetSeed(unsigned int s) { seed = s; }
    unsigned int GetSeed() const { return seed; }
    void SetMaxIter(int n) { max_iter = n; }
    int GetMaxIter() const { return max_iter; }
    void SetPrintLevel(int lvl) { printlvl = lvl; }

    // Run the fallback state machine. Throws EstimationError if the 2PL
    // fit itself fails.
    FitResult Fit(const Eigen::MatrixXd & responses) const;

    // Empty string if every item is inside the 3PL bounds, otherwise a
    // description of the first offending item.
    std::string CheckPlausible(const std::vector<ItemCoefficients> & coef) const;
};

#endif // MODELFITTER_HH
