#ifndef MODELESTIMATIONCLIENT_HH
#define MODELESTIMATIONCLIENT_HH

#include "FittedModel.hh"
#include "IrtTypes.hh"

#include <memory>
#include <Eigen/Dense>

// Boundary to the maximum likelihood engine.
class ModelEstimationClient {
public:
    virtual ~ModelEstimationClient() {}

    // Fit a unidimensional model of the given type to a cleaned response
    // matrix (NaN = missing). Returns a model with converged() == false when
    // the iteration budget runs out; throws EstimationError on numerical
    // failure.
    virtual std::shared_ptr<const FittedModel> Fit(const Eigen::MatrixXd & responses,
                                                   ModelType type,
                                                   unsigned int seed,
                                                   int max_iter) = 0;
};

#endif // MODELESTIMATIONCLIENT_HH
