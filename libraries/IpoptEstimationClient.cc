#include "IpoptEstimationClient.hh"
#include "IrtErrors.hh"
#include "IrtLkhdNLP.hh"
#include "QuadratureModel.hh"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <random>
#include <sstream>

#include "IpIpoptApplication.hpp"
#include "IpSolveStatistics.hpp"

using namespace Ipopt;

IpoptEstimationClient::IpoptEstimationClient()
    : nquad(41), tolerance(1e-6), linear_solver("mumps"), hess_stderr(true),
      start_jitter(0.05), printlvl(0)
{
}

std::shared_ptr<const FittedModel> IpoptEstimationClient::Fit(const Eigen::MatrixXd & responses,
                                                              ModelType type,
                                                              unsigned int seed,
                                                              int max_iter)
{
    std::shared_ptr<QuadratureModel> model = std::make_shared<QuadratureModel>(responses, type, nquad);
    const int npar = model->GetNParam();

    if (printlvl > 0) {
        printf("Estimating %s model: %d observations, %d items, %d parameters, %d quadrature points\n",
               ModelTypeName(type), model->GetNObs(), model->GetNItems(), npar, nquad);
    }

    // ===== STEP 1: Starting values and bounds =====
    std::vector<double> xlo, xup;
    model->GetBounds(xlo, xup);
    std::vector<double> xinit = model->GetStartingValues();

    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> jitter(-start_jitter, start_jitter);
    for (int i = 0; i < npar; i++) {
        xinit[i] = std::min(std::max(xinit[i] + jitter(gen), xlo[i]), xup[i]);
    }

    // ===== STEP 2: Solve =====
    SmartPtr<IrtLkhdNLP> mynlp = new IrtLkhdNLP(*model, xinit, xlo, xup);
    SmartPtr<IpoptApplication> app = IpoptApplicationFactory();

    app->Options()->SetStringValue("mu_strategy", "adaptive");
    app->Options()->SetStringValue("hessian_approximation", "limited-memory");
    app->Options()->SetStringValue("linear_solver", linear_solver);
    app->Options()->SetNumericValue("tol", tolerance);
    app->Options()->SetIntegerValue("max_iter", max_iter);
    app->Options()->SetIntegerValue("print_level", (printlvl > 1) ? 5 : 0);
    app->Options()->SetStringValue("sb", "yes");

    ApplicationReturnStatus status = app->Initialize();
    if (status != Solve_Succeeded) {
        std::stringstream msg;
        msg << "Ipopt initialization failed with code " << int(status);
        throw EstimationError(msg.str());
    }

    status = app->OptimizeTNLP(mynlp);

    bool converged = false;
    bool usable = IsUsableStatus(status, converged);
    if (!usable || !mynlp->HasSolution()) {
        std::stringstream msg;
        msg << ModelTypeName(type) << " estimation failed with Ipopt code " << int(status);
        throw EstimationError(msg.str());
    }
    if (!converged) {
        std::cerr << "WARNING: " << ModelTypeName(type) << " estimation stopped with Ipopt code "
                  << int(status) << std::endl;
    }

    int niter = 0;
    SmartPtr<SolveStatistics> stats = app->Statistics();
    if (IsValid(stats)) niter = stats->IterationCount();

    std::shared_ptr<QuadratureFittedModel> fitted =
        std::make_shared<QuadratureFittedModel>(model, mynlp->GetFinalParam(), converged, niter);

    if (printlvl > 0) {
        printf("Finished %s estimation after %d iterations, log-likelihood %12.4f\n",
               ModelTypeName(type), niter, fitted->GetLogLikelihood());
    }

    // ===== STEP 3: Standard errors =====
    if (hess_stderr) CalcStandardErrors(*model, *fitted);

    return fitted;
}

bool IpoptEstimationClient::IsUsableStatus(ApplicationReturnStatus status, bool & converged)
{
    converged = (status == Solve_Succeeded || status == Solved_To_Acceptable_Level);
    return converged || status == Maximum_Iterations_Exceeded
        || status == Search_Direction_Becomes_Too_Small || status == Maximum_CpuTime_Exceeded;
}

bool IpoptEstimationClient::InvertInformation(const Eigen::MatrixXd & info, Eigen::MatrixXd & cov, int & ndiagneg)
{
    ndiagneg = 0;
    Eigen::FullPivLU<Eigen::MatrixXd> lu(info);
    if (!lu.isInvertible()) return false;
    cov = lu.inverse();
    for (int i = 0; i < cov.rows(); i++) {
        if (cov(i, i) < 0.0) ndiagneg++;
    }
    return true;
}

void IpoptEstimationClient::CalcStandardErrors(const QuadratureModel & model, QuadratureFittedModel & fitted) const
{
    const int npar = model.GetNParam();
    if (printlvl > 0) std::cout << "Inverting Hessian..." << std::endl;

    // information matrix is the negative Hessian of the log-likelihood
    Eigen::MatrixXd info = -model.CalcNumericalHessian(fitted.GetParameters());
    Eigen::MatrixXd cov;
    int diagneg = 0;
    if (!InvertInformation(info, cov, diagneg)) {
        std::cerr << "WARNING: Hessian is singular, standard errors not available" << std::endl;
        return;
    }
    if (diagneg > 0) {
        std::cerr << "WARNING: " << diagneg << "/" << npar << " diagonal elements of the covariance are negative" << std::endl;
    }

    fitted.SetCovariance(cov);
}
