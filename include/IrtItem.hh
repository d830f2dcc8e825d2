#ifndef IRTITEM_HH
#define IRTITEM_HH

// One dichotomous item in slope-intercept form:
//   P(theta) = g + (1-g) / (1 + exp(-(a*theta + d)))
// The IRT difficulty is b = -d/a. For 2PL items g is 0.
class IrtItem {
private:
    double a;   // slope
    double d;   // intercept
    double g;   // lower asymptote

public:
    IrtItem(double slope = 1.0, double intercept = 0.0, double guess = 0.0);

    // From IRT parameterization (a, b, g)
    static IrtItem FromDifficulty(double slope, double difficulty, double guess = 0.0);

    double GetSlope() const { return a; }
    double GetIntercept() const { return d; }
    double GetGuessing() const { return g; }
    double GetDifficulty() const;   // NaN when the slope is zero

    double Logistic(double theta) const;
    double Prob(double theta) const;

    // dP/da, dP/dd, dP/dg at theta
    void ProbGradient(double theta, double & dpda, double & dpdd, double & dpdg) const;

    // dP/dtheta
    double ProbSlope(double theta) const;

    // Fisher information (dP/dtheta)^2 / (P (1-P))
    double Information(double theta) const;
};

#endif // IRTITEM_HH
