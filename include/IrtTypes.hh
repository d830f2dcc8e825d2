#ifndef IRTTYPES_HH
#define IRTTYPES_HH

#include <cmath>
#include <limits>
#include <string>
#include <vector>

// Model types
enum class ModelType {
    RICH_3PL = 3,     // discrimination, difficulty, guessing
    SIMPLE_2PL = 2    // discrimination, difficulty
};

const char * ModelTypeName(ModelType type);  // "3PL" / "2PL"
int GetNParamPerItem(ModelType type);

const double kMissing = std::numeric_limits<double>::quiet_NaN();

inline bool IsMissing(double x) { return std::isnan(x); }

// Round to ndigits decimals, NaN passes through
double RoundTo(double x, int ndigits);

// Coefficients of one item in IRT parameterization.
// NaN marks a coefficient the engine did not report.
struct ItemCoefficients {
    double a;   // discrimination
    double b;   // difficulty
    double g;   // guessing (NaN for 2PL)

    ItemCoefficients() : a(kMissing), b(kMissing), g(kMissing) {}
    ItemCoefficients(double da, double db, double dg = kMissing) : a(da), b(db), g(dg) {}
};

// Normalized view of one item (one row of the parameter table)
struct ItemParameter {
    std::string item_id;
    double discrimination;
    double difficulty;
    double guessing;
    double se_discrimination;
    double se_difficulty;
    double se_guessing;
    ModelType model_type;

    ItemParameter()
        : discrimination(1.0), difficulty(0.0), guessing(0.0),
          se_discrimination(0.0), se_difficulty(0.0), se_guessing(0.0),
          model_type(ModelType::SIMPLE_2PL) {}
};

// (ability, value) pairs; NaN values are missing-value placeholders
struct Curve {
    std::vector<double> theta;
    std::vector<double> value;

    size_t size() const { return theta.size(); }
};

// Global goodness-of-fit block. Every field is NaN when unavailable.
struct M2Statistic {
    double m2;
    int df;
    double p;
    double tli;
    double rmsea;

    M2Statistic() : m2(kMissing), df(-1), p(kMissing), tli(kMissing), rmsea(kMissing) {}
};

// Fixed ability grid shared by every curve computation:
// 101 evenly spaced points from -4 to 4 inclusive.
class AbilityGrid {
public:
    static const int kNPoints = 101;
    static constexpr double kMin = -4.0;
    static constexpr double kMax = 4.0;

    static const std::vector<double> & Get();
};

// "item_3" for item index 2
std::string ItemId(int item_index);

#endif // IRTTYPES_HH
