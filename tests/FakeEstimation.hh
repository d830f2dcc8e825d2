#ifndef FAKEESTIMATION_HH
#define FAKEESTIMATION_HH

#include "FittedModel.hh"
#include "IrtErrors.hh"
#include "IrtItem.hh"
#include "ModelEstimationClient.hh"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

// Fitted model with fixed coefficients, evaluated with IrtItem
class FakeFittedModel : public FittedModel {
public:
    ModelType type;
    bool converged;
    std::vector<ItemCoefficients> coef;
    std::vector<ItemCoefficients> se;
    bool se_throws;
    int failing_info_item;      // EvalItemInformation throws for this item
    bool testinfo_throws;
    bool m2_throws;

    FakeFittedModel(ModelType t, const std::vector<ItemCoefficients> & c)
        : type(t), converged(true), coef(c), se(c.size(), ItemCoefficients(0.1, 0.2, 0.03)),
          se_throws(false), failing_info_item(-1), testinfo_throws(false), m2_throws(false) {}

    IrtItem Item(int i) const
    {
        double g = (type == ModelType::RICH_3PL && !IsMissing(coef[i].g)) ? coef[i].g : 0.0;
        return IrtItem::FromDifficulty(coef[i].a, coef[i].b, g);
    }

    ModelType GetType() const override { return type; }
    bool IsConverged() const override { return converged; }
    int GetIterations() const override { return 42; }
    double GetLogLikelihood() const override { return -123.456; }
    int GetNItems() const override { return int(coef.size()); }

    std::vector<ItemCoefficients> GetCoefficients() const override { return coef; }

    std::vector<ItemCoefficients> GetStandardErrors() const override
    {
        if (se_throws) throw EstimationError("no standard errors");
        return se;
    }

    std::vector<double> EvalProbability(int item, const std::vector<double> & theta) const override
    {
        std::vector<double> p;
        for (double t : theta) p.push_back(Item(item).Prob(t));
        return p;
    }

    std::vector<double> EvalItemInformation(int item, const std::vector<double> & theta) const override
    {
        if (item == failing_info_item) throw std::runtime_error("information failed");
        std::vector<double> info;
        for (double t : theta) info.push_back(Item(item).Information(t));
        return info;
    }

    std::vector<double> EvalTestInformation(const std::vector<double> & theta) const override
    {
        if (testinfo_throws) throw std::runtime_error("test information failed");
        std::vector<double> total(theta.size(), 0.0);
        for (int j = 0; j < GetNItems(); j++) {
            for (size_t k = 0; k < theta.size(); k++) total[k] += Item(j).Information(theta[k]);
        }
        return total;
    }

    M2Statistic CalcM2() const override
    {
        if (m2_throws) throw EstimationError("M2 not available");
        M2Statistic m2;
        m2.m2 = 12.3456789;
        m2.df = 5;
        m2.p = 0.0303030303;
        m2.tli = 0.95;
        m2.rmsea = 0.04;
        return m2;
    }

    double CalcReliability() const override { return 0.8123456789; }
    double GetAIC() const override { return 262.912; }
    double GetBIC() const override { return 270.0; }
};

// Estimation client returning preset models, counting calls
class FakeEstimationClient : public ModelEstimationClient {
public:
    std::shared_ptr<FakeFittedModel> rich;
    std::shared_ptr<FakeFittedModel> simple;
    bool rich_throws;
    bool simple_throws;
    bool simple_throws_std;     // throw a plain std::runtime_error
    int delay_ms;
    std::atomic<int> nrich;
    std::atomic<int> nsimple;
    unsigned int last_seed;
    int last_max_iter;

    FakeEstimationClient()
        : rich_throws(false), simple_throws(false), simple_throws_std(false), delay_ms(0),
          nrich(0), nsimple(0), last_seed(0), last_max_iter(0) {}

    std::shared_ptr<const FittedModel> Fit(const Eigen::MatrixXd & responses, ModelType type,
                                           unsigned int seed, int max_iter) override
    {
        last_seed = seed;
        last_max_iter = max_iter;
        if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));

        if (type == ModelType::RICH_3PL) {
            nrich++;
            if (rich_throws) throw EstimationError("3PL engine failure");
            return rich;
        }
        nsimple++;
        if (simple_throws_std) throw std::runtime_error("numerical failure");
        if (simple_throws) throw EstimationError("2PL engine failure");
        return simple;
    }
};

inline std::vector<ItemCoefficients> MakeCoefficients(int nitem, double a, double b, double g)
{
    return std::vector<ItemCoefficients>(nitem, ItemCoefficients(a, b, g));
}

#endif // FAKEESTIMATION_HH
