#include "QuadratureModel.hh"
#include "IrtErrors.hh"
#include "gauss_hermite.hh"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

const double kProbFloor = 1e-12;

double ClampProb(double p)
{
    return std::min(std::max(p, kProbFloor), 1.0 - kProbFloor);
}

} // namespace

QuadratureModel::QuadratureModel(const Eigen::MatrixXd & responses, ModelType modeltype, int nquad)
    : nobs(int(responses.rows())), nitem(int(responses.cols())), type(modeltype),
      nparperitem(::GetNParamPerItem(modeltype)), data(responses), nquad_points(nquad)
{
    if (nobs == 0 || nitem == 0) {
        throw EstimationError("Cannot estimate a model on an empty response matrix");
    }
    calcnormalquadrature(nquad_points, quad_nodes, quad_weights);
}

bool QuadratureModel::HasMissing() const
{
    for (int i = 0; i < nobs; i++) {
        for (int j = 0; j < nitem; j++) {
            if (IsMissing(data(i, j))) return true;
        }
    }
    return false;
}

std::vector<IrtItem> QuadratureModel::UnpackItems(const std::vector<double> & param) const
{
    if (int(param.size()) != GetNParam()) {
        std::stringstream msg;
        msg << "Parameter vector has " << param.size() << " entries, model expects " << GetNParam();
        throw EstimationError(msg.str());
    }

    std::vector<IrtItem> items;
    items.reserve(nitem);
    for (int j = 0; j < nitem; j++) {
        const double * p = &param[j * nparperitem];
        double g = (type == ModelType::RICH_3PL) ? p[2] : 0.0;
        items.push_back(IrtItem(p[0], p[1], g));
    }
    return items;
}

void QuadratureModel::GetBounds(std::vector<double> & lower, std::vector<double> & upper) const
{
    lower.resize(GetNParam());
    upper.resize(GetNParam());
    for (int j = 0; j < nitem; j++) {
        int ipar = j * nparperitem;
        lower[ipar] = -20.0;     // a
        upper[ipar] = 20.0;
        lower[ipar + 1] = -30.0; // d
        upper[ipar + 1] = 30.0;
        if (type == ModelType::RICH_3PL) {
            lower[ipar + 2] = 0.0;  // g
            upper[ipar + 2] = 0.99;
        }
    }
}

std::vector<double> QuadratureModel::GetStartingValues() const
{
    std::vector<double> start(GetNParam(), 0.0);
    for (int j = 0; j < nitem; j++) {
        double sum = 0.0;
        int nobserved = 0;
        for (int i = 0; i < nobs; i++) {
            if (IsMissing(data(i, j))) continue;
            sum += data(i, j);
            nobserved++;
        }
        double p = (nobserved > 0) ? sum / nobserved : 0.5;
        p = std::min(std::max(p, 0.01), 0.99);

        int ipar = j * nparperitem;
        start[ipar] = 1.0;
        start[ipar + 1] = std::log(p / (1.0 - p));
        if (type == ModelType::RICH_3PL) start[ipar + 2] = 0.2;
    }
    return start;
}

void QuadratureModel::CalcLkhd(const std::vector<double> & param,
                               double & logLkhd,
                               std::vector<double> & gradL,
                               int iflag) const
{
    std::vector<IrtItem> items = UnpackItems(param);
    const int npar = GetNParam();

    // ===== STEP 1: Item probabilities and derivatives at each node =====
    std::vector<double> prob(nquad_points * nitem);
    std::vector<double> logp(nquad_points * nitem);
    std::vector<double> logq(nquad_points * nitem);
    std::vector<double> dprob;
    if (iflag >= 2) dprob.resize(nquad_points * nitem * 3);

    for (int iq = 0; iq < nquad_points; iq++) {
        double theta = quad_nodes[iq];
        for (int j = 0; j < nitem; j++) {
            int idx = iq * nitem + j;
            double P = ClampProb(items[j].Prob(theta));
            prob[idx] = P;
            logp[idx] = std::log(P);
            logq[idx] = std::log(1.0 - P);
            if (iflag >= 2) {
                items[j].ProbGradient(theta, dprob[3 * idx], dprob[3 * idx + 1], dprob[3 * idx + 2]);
            }
        }
    }

    // ===== STEP 2: Integrate each observation over the nodes =====
    logLkhd = 0.0;
    if (iflag >= 2) gradL.assign(npar, 0.0);

    std::vector<double> lognode(nquad_points);
    for (int i = 0; i < nobs; i++) {
        double maxlog = -HUGE_VAL;
        for (int iq = 0; iq < nquad_points; iq++) {
            double ll = std::log(quad_weights[iq]);
            for (int j = 0; j < nitem; j++) {
                double y = data(i, j);
                if (IsMissing(y)) continue;
                int idx = iq * nitem + j;
                ll += (y > 0.5) ? logp[idx] : logq[idx];
            }
            lognode[iq] = ll;
            maxlog = std::max(maxlog, ll);
        }

        double sum = 0.0;
        for (int iq = 0; iq < nquad_points; iq++) sum += std::exp(lognode[iq] - maxlog);
        logLkhd += maxlog + std::log(sum);

        if (iflag < 2) continue;

        // posterior weight of each node times score of each item parameter
        for (int iq = 0; iq < nquad_points; iq++) {
            double post = std::exp(lognode[iq] - maxlog) / sum;
            if (post < 1e-300) continue;
            for (int j = 0; j < nitem; j++) {
                double y = data(i, j);
                if (IsMissing(y)) continue;
                int idx = iq * nitem + j;
                double P = prob[idx];
                double resid = post * (y - P) / (P * (1.0 - P));
                int ipar = j * nparperitem;
                gradL[ipar] += resid * dprob[3 * idx];
                gradL[ipar + 1] += resid * dprob[3 * idx + 1];
                if (type == ModelType::RICH_3PL) gradL[ipar + 2] += resid * dprob[3 * idx + 2];
            }
        }
    }
}

double QuadratureModel::CalcLogLikelihood(const std::vector<double> & param) const
{
    double logLkhd = 0.0;
    std::vector<double> gradL;
    CalcLkhd(param, logLkhd, gradL, 1);
    return logLkhd;
}

Eigen::MatrixXd QuadratureModel::CalcNumericalHessian(const std::vector<double> & param, double step) const
{
    const int npar = GetNParam();
    Eigen::MatrixXd hess(npar, npar);

    double obj;
    std::vector<double> gradup, graddn;
    std::vector<double> x = param;
    for (int k = 0; k < npar; k++) {
        double h = step * std::max(1.0, std::fabs(param[k]));
        x[k] = param[k] + h;
        CalcLkhd(x, obj, gradup, 2);
        x[k] = param[k] - h;
        CalcLkhd(x, obj, graddn, 2);
        x[k] = param[k];
        for (int l = 0; l < npar; l++) hess(l, k) = (gradup[l] - graddn[l]) / (2.0 * h);
    }
    return 0.5 * (hess + hess.transpose());
}
