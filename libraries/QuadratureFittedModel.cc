#include "QuadratureFittedModel.hh"
#include "IrtErrors.hh"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <boost/math/distributions/chi_squared.hpp>

const int QuadratureFittedModel::kMaxM2Items;

QuadratureFittedModel::QuadratureFittedModel(std::shared_ptr<const QuadratureModel> model,
                                             const std::vector<double> & estimates,
                                             bool isconverged, int iterations)
    : quadmodel(model), param(estimates), converged(isconverged), niter(iterations),
      has_stderr(false)
{
    if (!quadmodel) throw EstimationError("Fitted model needs a likelihood model");
    items = quadmodel->UnpackItems(param);
    loglkhd = quadmodel->CalcLogLikelihood(param);
}

void QuadratureFittedModel::SetCovariance(const Eigen::MatrixXd & cov)
{
    const int npar = quadmodel->GetNParam();
    if (cov.rows() != npar || cov.cols() != npar) {
        std::stringstream msg;
        msg << "Covariance matrix is " << cov.rows() << "x" << cov.cols()
            << ", expected " << npar << "x" << npar;
        throw EstimationError(msg.str());
    }

    const int npp = quadmodel->GetNParamPerItem();
    stderrs.assign(items.size(), ItemCoefficients());
    for (size_t j = 0; j < items.size(); j++) {
        int ia = int(j) * npp;
        int id = ia + 1;

        double vara = cov(ia, ia);
        if (vara >= 0.0) stderrs[j].a = std::sqrt(vara);

        // b = -d/a: db/da = d/a^2, db/dd = -1/a
        double a = items[j].GetSlope();
        double d = items[j].GetIntercept();
        if (a != 0.0) {
            double dba = d / (a * a);
            double dbd = -1.0 / a;
            double varb = dba * dba * cov(ia, ia) + 2.0 * dba * dbd * cov(ia, id) + dbd * dbd * cov(id, id);
            if (varb >= 0.0) stderrs[j].b = std::sqrt(varb);
        }

        if (quadmodel->GetType() == ModelType::RICH_3PL) {
            double varg = cov(ia + 2, ia + 2);
            if (varg >= 0.0) stderrs[j].g = std::sqrt(varg);
        }
    }
    has_stderr = true;
}

void QuadratureFittedModel::CheckItem(int item) const
{
    if (item < 0 || item >= GetNItems()) {
        std::stringstream msg;
        msg << "Item index " << item << " out of range (model has " << GetNItems() << " items)";
        throw CurveComputationError(msg.str());
    }
}

std::vector<ItemCoefficients> QuadratureFittedModel::GetCoefficients() const
{
    std::vector<ItemCoefficients> coef;
    coef.reserve(items.size());
    bool rich = (quadmodel->GetType() == ModelType::RICH_3PL);
    for (const IrtItem & item : items) {
        coef.push_back(ItemCoefficients(item.GetSlope(), item.GetDifficulty(),
                                        rich ? item.GetGuessing() : kMissing));
    }
    return coef;
}

std::vector<ItemCoefficients> QuadratureFittedModel::GetStandardErrors() const
{
    if (!has_stderr) throw EstimationError("Standard errors were not computed for this model");
    return stderrs;
}

std::vector<double> QuadratureFittedModel::EvalProbability(int item, const std::vector<double> & theta) const
{
    CheckItem(item);
    std::vector<double> values(theta.size());
    for (size_t k = 0; k < theta.size(); k++) values[k] = items[item].Prob(theta[k]);
    return values;
}

std::vector<double> QuadratureFittedModel::EvalItemInformation(int item, const std::vector<double> & theta) const
{
    CheckItem(item);
    std::vector<double> values(theta.size());
    for (size_t k = 0; k < theta.size(); k++) {
        values[k] = items[item].Information(theta[k]);
        if (!std::isfinite(values[k])) {
            throw CurveComputationError("Non-finite information for " + ItemId(item));
        }
    }
    return values;
}

std::vector<double> QuadratureFittedModel::EvalTestInformation(const std::vector<double> & theta) const
{
    std::vector<double> values(theta.size(), 0.0);
    for (size_t j = 0; j < items.size(); j++) {
        std::vector<double> info = EvalItemInformation(int(j), theta);
        for (size_t k = 0; k < theta.size(); k++) values[k] += info[k];
    }
    return values;
}

double QuadratureFittedModel::CalcM2Value(const std::vector<IrtItem> & modelitems, bool intercepts_only,
                                          int & df) const
{
    const Eigen::MatrixXd & data = quadmodel->GetData();
    const std::vector<double> & nodes = quadmodel->GetQuadNodes();
    const std::vector<double> & weights = quadmodel->GetQuadWeights();
    const int nobs = quadmodel->GetNObs();
    const int nitem = int(modelitems.size());
    const int nq = int(nodes.size());
    const int npp = intercepts_only ? 1 : quadmodel->GetNParamPerItem();
    const int ncol = nitem * npp;

    // ===== STEP 1: First and second order moments =====
    std::vector<std::pair<int, int> > moments;
    for (int i = 0; i < nitem; i++) moments.push_back(std::make_pair(i, -1));
    for (int i = 0; i < nitem; i++) {
        for (int j = i + 1; j < nitem; j++) moments.push_back(std::make_pair(i, j));
    }
    const int nmom = int(moments.size());
    df = nmom - ncol;
    if (df <= 0) throw EstimationError("M2 has no degrees of freedom left");

    Eigen::MatrixXd prob(nq, nitem);
    for (int iq = 0; iq < nq; iq++) {
        for (int j = 0; j < nitem; j++) prob(iq, j) = modelitems[j].Prob(nodes[iq]);
    }

    // probability that every item in the list is answered correctly
    auto jointprob = [&](const int * idx, int count) {
        double total = 0.0;
        for (int iq = 0; iq < nq; iq++) {
            double prod = weights[iq];
            for (int c = 0; c < count; c++) prod *= prob(iq, idx[c]);
            total += prod;
        }
        return total;
    };

    Eigen::VectorXd observed(nmom), expected(nmom);
    for (int k = 0; k < nmom; k++) {
        int i = moments[k].first;
        int j = moments[k].second;
        double sum = 0.0;
        for (int r = 0; r < nobs; r++) sum += (j < 0) ? data(r, i) : data(r, i) * data(r, j);
        observed(k) = sum / nobs;

        int idx[2] = {i, j};
        expected(k) = jointprob(idx, (j < 0) ? 1 : 2);
    }

    // ===== STEP 2: Covariance of the moment indicators =====
    Eigen::MatrixXd xi(nmom, nmom);
    for (int k = 0; k < nmom; k++) {
        for (int l = 0; l <= k; l++) {
            int idx[4];
            int count = 0;
            int cand[4] = {moments[k].first, moments[k].second, moments[l].first, moments[l].second};
            for (int c = 0; c < 4; c++) {
                if (cand[c] < 0) continue;
                if (std::find(idx, idx + count, cand[c]) == idx + count) idx[count++] = cand[c];
            }
            xi(k, l) = jointprob(idx, count) - expected(k) * expected(l);
            xi(l, k) = xi(k, l);
        }
    }

    // ===== STEP 3: Jacobian of the moments =====
    Eigen::MatrixXd delta = Eigen::MatrixXd::Zero(nmom, ncol);
    for (int k = 0; k < nmom; k++) {
        int members[2] = {moments[k].first, moments[k].second};
        int nmember = (members[1] < 0) ? 1 : 2;
        for (int m = 0; m < nmember; m++) {
            int s = members[m];
            int other = (nmember == 2) ? members[1 - m] : -1;
            for (int iq = 0; iq < nq; iq++) {
                double rest = weights[iq];
                if (other >= 0) rest *= prob(iq, other);
                double dpda, dpdd, dpdg;
                modelitems[s].ProbGradient(nodes[iq], dpda, dpdd, dpdg);
                if (intercepts_only) {
                    delta(k, s) += rest * dpdd;
                    continue;
                }
                delta(k, s * npp) += rest * dpda;
                delta(k, s * npp + 1) += rest * dpdd;
                if (npp == 3) delta(k, s * npp + 2) += rest * dpdg;
            }
        }
    }

    // ===== STEP 4: C = Xi^-1 - Xi^-1 D (D' Xi^-1 D)^-1 D' Xi^-1 =====
    Eigen::LDLT<Eigen::MatrixXd> xildlt(xi);
    if (xildlt.info() != Eigen::Success || !xildlt.isPositive()) {
        throw EstimationError("Covariance of the margins is not positive definite");
    }
    Eigen::MatrixXd xiinv = xildlt.solve(Eigen::MatrixXd::Identity(nmom, nmom));
    Eigen::MatrixXd xid = xiinv * delta;
    Eigen::MatrixXd dxd = delta.transpose() * xid;

    Eigen::LDLT<Eigen::MatrixXd> dxdldlt(dxd);
    if (dxdldlt.info() != Eigen::Success) {
        throw EstimationError("Information matrix of the margins is singular");
    }
    Eigen::MatrixXd cmat = xiinv - xid * dxdldlt.solve(xid.transpose());

    Eigen::VectorXd resid = observed - expected;
    double m2 = nobs * resid.dot(cmat * resid);
    if (!std::isfinite(m2)) throw EstimationError("M2 statistic is not finite");
    return m2;
}

M2Statistic QuadratureFittedModel::CalcM2() const
{
    const int nitem = GetNItems();
    if (nitem > kMaxM2Items) {
        std::stringstream msg;
        msg << "M2 is not computed for more than " << kMaxM2Items << " items";
        throw EstimationError(msg.str());
    }
    if (quadmodel->HasMissing()) throw EstimationError("M2 requires complete response data");

    M2Statistic stat;
    int df = 0;
    double m2 = CalcM2Value(items, false, df);

    const int nobs = quadmodel->GetNObs();
    stat.m2 = m2;
    stat.df = df;
    boost::math::chi_squared chisq(df);
    stat.p = boost::math::cdf(boost::math::complement(chisq, m2));
    stat.rmsea = (nobs > 1) ? std::sqrt(std::max(m2 - df, 0.0) / (df * (nobs - 1.0))) : kMissing;

    // Independence model: a = 0, d = logit of the observed proportion
    const Eigen::MatrixXd & data = quadmodel->GetData();
    std::vector<IrtItem> nullitems;
    for (int j = 0; j < nitem; j++) {
        double p = data.col(j).mean();
        p = std::min(std::max(p, 1e-6), 1.0 - 1e-6);
        nullitems.push_back(IrtItem(0.0, std::log(p / (1.0 - p)), 0.0));
    }
    try {
        int dfnull = 0;
        double m2null = CalcM2Value(nullitems, true, dfnull);
        double rnull = m2null / dfnull;
        double rmodel = m2 / df;
        if (rnull != 1.0) stat.tli = (rnull - rmodel) / (rnull - 1.0);
    }
    catch (const EstimationError & e) {
        std::cerr << "WARNING: TLI not available: " << e.what() << std::endl;
    }
    return stat;
}

double QuadratureFittedModel::CalcReliability() const
{
    const std::vector<double> & nodes = quadmodel->GetQuadNodes();
    const std::vector<double> & weights = quadmodel->GetQuadWeights();
    std::vector<double> info = EvalTestInformation(nodes);

    // error variance averaged over the ability distribution
    double errvar = 0.0;
    for (size_t iq = 0; iq < nodes.size(); iq++) errvar += weights[iq] / std::max(info[iq], 1e-10);
    return 1.0 / (1.0 + errvar);
}

double QuadratureFittedModel::GetAIC() const
{
    return -2.0 * loglkhd + 2.0 * quadmodel->GetNParam();
}

double QuadratureFittedModel::GetBIC() const
{
    return -2.0 * loglkhd + quadmodel->GetNParam() * std::log(double(quadmodel->GetNObs()));
}
