#ifndef QUADRATUREMODEL_HH
#define QUADRATUREMODEL_HH

#include "IrtItem.hh"
#include "IrtTypes.hh"

#include <vector>
#include <Eigen/Dense>

// Marginal likelihood of a unidimensional dichotomous IRT model, with the
// ability integrated out over Gauss-Hermite nodes (theta ~ N(0,1)).
//
// Parameter layout, item by item:
//   2PL: [a_1, d_1, a_2, d_2, ...]
//   3PL: [a_1, d_1, g_1, a_2, d_2, g_2, ...]
// Missing cells (NaN) do not contribute to the likelihood.
class QuadratureModel {
private:
    int nobs;
    int nitem;
    ModelType type;
    int nparperitem;
    Eigen::MatrixXd data;

    int nquad_points;
    std::vector<double> quad_nodes;
    std::vector<double> quad_weights;

public:
    QuadratureModel(const Eigen::MatrixXd & responses, ModelType modeltype, int nquad = 41);

    int GetNObs() const { return nobs; }
    int GetNItems() const { return nitem; }
    int GetNParam() const { return nitem * nparperitem; }
    int GetNParamPerItem() const { return nparperitem; }
    ModelType GetType() const { return type; }
    const Eigen::MatrixXd & GetData() const { return data; }
    bool HasMissing() const;

    const std::vector<double> & GetQuadNodes() const { return quad_nodes; }
    const std::vector<double> & GetQuadWeights() const { return quad_weights; }

    std::vector<IrtItem> UnpackItems(const std::vector<double> & param) const;

    // Box bounds of every parameter
    void GetBounds(std::vector<double> & lower, std::vector<double> & upper) const;

    // a = 1, d = logit of the observed proportion correct, g = 0.2 (3PL)
    std::vector<double> GetStartingValues() const;

    // Log-likelihood and (iflag >= 2) its gradient with respect to param.
    // iflag - 1=likelihood only, 2=+gradient
    void CalcLkhd(const std::vector<double> & param,
                  double & logLkhd,
                  std::vector<double> & gradL,
                  int iflag) const;

    double CalcLogLikelihood(const std::vector<double> & param) const;

    // Hessian of the log-likelihood by central differences of the gradient
    Eigen::MatrixXd CalcNumericalHessian(const std::vector<double> & param, double step = 1e-5) const;
};

#endif // QUADRATUREMODEL_HH
