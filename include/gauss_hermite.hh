#ifndef GAUSS_HERMITE_HH
#define GAUSS_HERMITE_HH

#include <vector>

// Gauss-Hermite nodes and weights for the weight function W(x) = exp(-x^2).
// 1 <= n <= 190; throws std::invalid_argument otherwise.
void calcgausshermitequadrature(int n, std::vector<double>& x, std::vector<double>& w);

// Same rule rescaled to integrate against the standard normal density:
//   x_scaled = sqrt(2) * x, w_scaled = w / sqrt(pi)
// The scaled weights sum to one.
void calcnormalquadrature(int n, std::vector<double>& nodes, std::vector<double>& weights);

#endif // GAUSS_HERMITE_HH
