#ifndef QUADRATUREFITTEDMODEL_HH
#define QUADRATUREFITTEDMODEL_HH

#include "FittedModel.hh"
#include "IrtItem.hh"
#include "QuadratureModel.hh"

#include <memory>
#include <vector>
#include <Eigen/Dense>

// FittedModel over parameters estimated on a QuadratureModel.
class QuadratureFittedModel : public FittedModel {
private:
    std::shared_ptr<const QuadratureModel> quadmodel;
    std::vector<double> param;
    std::vector<IrtItem> items;
    bool converged;
    int niter;
    double loglkhd;

    bool has_stderr;
    std::vector<ItemCoefficients> stderrs;

    void CheckItem(int item) const;

    // M2 of a set of items against the observed first and second order
    // margins. With intercepts_only the Jacobian has one column per item
    // (independence model).
    double CalcM2Value(const std::vector<IrtItem> & modelitems, bool intercepts_only, int & df) const;

public:
    static const int kMaxM2Items = 60;

    QuadratureFittedModel(std::shared_ptr<const QuadratureModel> model,
                          const std::vector<double> & estimates,
                          bool isconverged, int iterations);

    // Standard errors from a parameter covariance matrix (layout of the
    // QuadratureModel). b uses the delta method. Negative variances give NaN.
    void SetCovariance(const Eigen::MatrixXd & cov);

    const std::vector<double> & GetParameters() const { return param; }

    ModelType GetType() const override { return quadmodel->GetType(); }
    bool IsConverged() const override { return converged; }
    int GetIterations() const override { return niter; }
    double GetLogLikelihood() const override { return loglkhd; }
    int GetNItems() const override { return quadmodel->GetNItems(); }

    std::vector<ItemCoefficients> GetCoefficients() const override;
    std::vector<ItemCoefficients> GetStandardErrors() const override;

    std::vector<double> EvalProbability(int item, const std::vector<double> & theta) const override;
    std::vector<double> EvalItemInformation(int item, const std::vector<double> & theta) const override;
    std::vector<double> EvalTestInformation(const std::vector<double> & theta) const override;

    M2Statistic CalcM2() const override;
    double CalcReliability() const override;
    double GetAIC() const override;
    double GetBIC() const override;
};

#endif // QUADRATUREFITTEDMODEL_HH
