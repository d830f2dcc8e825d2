#include "IrtTypes.hh"
#include "IrtErrors.hh"

#include <cmath>
#include <sstream>

const char * ModelTypeName(ModelType type)
{
    return (type == ModelType::RICH_3PL) ? "3PL" : "2PL";
}

int GetNParamPerItem(ModelType type)
{
    return (type == ModelType::RICH_3PL) ? 3 : 2;
}

double RoundTo(double x, int ndigits)
{
    if (!std::isfinite(x)) return x;
    double scale = std::pow(10.0, ndigits);
    return std::round(x * scale) / scale;
}

const int AbilityGrid::kNPoints;
constexpr double AbilityGrid::kMin;
constexpr double AbilityGrid::kMax;

const std::vector<double> & AbilityGrid::Get()
{
    static const std::vector<double> grid = [] {
        std::vector<double> theta(kNPoints);
        double step = (kMax - kMin) / double(kNPoints - 1);
        for (int i = 0; i < kNPoints; i++) theta[i] = kMin + step * i;
        theta[kNPoints - 1] = kMax;
        return theta;
    }();
    return grid;
}

std::string ItemId(int item_index)
{
    std::stringstream out;
    out << "item_" << (item_index + 1);
    return out.str();
}

const char * ErrorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::SCHEMA: return "SchemaError";
        case ErrorKind::INSUFFICIENT_DATA: return "InsufficientDataError";
        case ErrorKind::ESTIMATION: return "EstimationError";
        case ErrorKind::CURVE_COMPUTATION: return "CurveComputationError";
        case ErrorKind::REQUEST: return "RequestError";
    }
    return "IrtError";
}
