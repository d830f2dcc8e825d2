#ifndef IPOPTESTIMATIONCLIENT_HH
#define IPOPTESTIMATIONCLIENT_HH

#include "ModelEstimationClient.hh"
#include "QuadratureFittedModel.hh"

#include <memory>
#include <string>
#include <Eigen/Dense>
#include "IpReturnCodes.hpp"

// Maximum marginal likelihood estimation with Ipopt.
class IpoptEstimationClient : public ModelEstimationClient {
private:
    int nquad;
    double tolerance;
    std::string linear_solver;
    bool hess_stderr;      // compute standard errors from the Hessian
    double start_jitter;   // half-width of the uniform start value perturbation
    int printlvl;

    void CalcStandardErrors(const QuadratureModel & model, QuadratureFittedModel & fitted) const;

public:
    IpoptEstimationClient();

    void SetNQuadPoints(int n) { nquad = n; }
    int GetNQuadPoints() const { return nquad; }
    void SetTolerance(double tol) { tolerance = tol; }
    void SetLinearSolver(const std::string & solver) { linear_solver = solver; }
    void SetHessStdErr(bool flag) { hess_stderr = flag; }
    void SetStartJitter(double width) { start_jitter = width; }
    void SetPrintLevel(int lvl) { printlvl = lvl; }

    std::shared_ptr<const FittedModel> Fit(const Eigen::MatrixXd & responses,
                                           ModelType type,
                                           unsigned int seed,
                                           int max_iter) override;

    // Solution usable: converged, or stopped early on a budget or a stalled
    // search direction. converged is set for Solve_Succeeded and
    // Solved_To_Acceptable_Level only.
    static bool IsUsableStatus(Ipopt::ApplicationReturnStatus status, bool & converged);

    // Covariance from the information matrix. Returns false if it is singular;
    // ndiagneg counts negative variances.
    static bool InvertInformation(const Eigen::MatrixXd & info, Eigen::MatrixXd & cov, int & ndiagneg);
};

#endif // IPOPTESTIMATIONCLIENT_HH
