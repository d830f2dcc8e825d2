#include "IrtItem.hh"
#include "IrtTypes.hh"

#include <cmath>

IrtItem::IrtItem(double slope, double intercept, double guess)
    : a(slope), d(intercept), g(guess)
{
}

IrtItem IrtItem::FromDifficulty(double slope, double difficulty, double guess)
{
    return IrtItem(slope, -slope * difficulty, guess);
}

double IrtItem::GetDifficulty() const
{
    if (a == 0.0) return kMissing;
    return -d / a;
}

double IrtItem::Logistic(double theta) const
{
    double z = a * theta + d;
    // numerically stable for large |z|
    if (z >= 0.0) return 1.0 / (1.0 + std::exp(-z));
    double ez = std::exp(z);
    return ez / (1.0 + ez);
}

double IrtItem::Prob(double theta) const
{
    return g + (1.0 - g) * Logistic(theta);
}

void IrtItem::ProbGradient(double theta, double & dpda, double & dpdd, double & dpdg) const
{
    double L = Logistic(theta);
    double dL = (1.0 - g) * L * (1.0 - L);
    dpda = dL * theta;
    dpdd = dL;
    dpdg = 1.0 - L;
}

double IrtItem::ProbSlope(double theta) const
{
    double L = Logistic(theta);
    return a * (1.0 - g) * L * (1.0 - L);
}

double IrtItem::Information(double theta) const
{
    double P = Prob(theta);
    double pq = P * (1.0 - P);
    if (pq <= 0.0) return 0.0;
    double dp = ProbSlope(theta);
    return dp * dp / pq;
}
