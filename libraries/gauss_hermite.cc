#include "gauss_hermite.hh"

#include <cmath>
#include <sstream>
#include <stdexcept>

/*************************************************************************
Nodes and weights of the Gauss-Hermite rule on (-infinity, +infinity)
with weight function W(x)=Exp(-x*x).

Roots of the orthonormal Hermite polynomial are found by Newton iteration
from asymptotic initial guesses (QUADRULE); symmetry gives the other half.
*************************************************************************/

void calcgausshermitequadrature(int n, std::vector<double>& x, std::vector<double>& w)
{
    if (n < 1 || n > 190) {
        std::stringstream msg;
        msg << "Gauss-Hermite quadrature needs 1 to 190 points, got " << n;
        throw std::invalid_argument(msg.str());
    }

    x.assign(n, 0.0);
    w.assign(n, 0.0);

    const double pi = 3.14159265358979323846;
    const double pipm4 = std::pow(pi, -0.25);
    double r = 0.0;

    for (int i = 0; i <= (n + 1) / 2 - 1; i++) {
        // Initial guess for the i-th largest root
        if (i == 0) r = std::sqrt(double(2 * n + 1)) - 1.85575 * std::pow(double(2 * n + 1), -1.0 / 6.0);
        else if (i == 1) r = r - 1.14 * std::pow(double(n), 0.426) / r;
        else if (i == 2) r = 1.86 * r - 0.86 * x[0];
        else if (i == 3) r = 1.91 * r - 0.91 * x[1];
        else r = 2.0 * r - x[i - 2];

        double r1, p1, p2, p3, dp3;
        int j;
        do {
            p2 = 0.0;
            p3 = pipm4;
            for (j = 0; j < n; j++) {
                p1 = p2;
                p2 = p3;
                p3 = p2 * r * std::sqrt(2.0 / double(j + 1)) - p1 * std::sqrt(double(j) / double(j + 1));
            }
            dp3 = std::sqrt(double(2 * j)) * p2;
            r1 = r;
            r = r - p3 / dp3;
        } while ((std::fabs(r - r1) >= std::fabs(r) * 1e-15) && (std::fabs(r - r1) >= 1e-100));

        x[i] = r;
        w[i] = 2.0 / (dp3 * dp3);
        x[n - 1 - i] = -x[i];
        w[n - 1 - i] = w[i];
    }
}

void calcnormalquadrature(int n, std::vector<double>& nodes, std::vector<double>& weights)
{
    calcgausshermitequadrature(n, nodes, weights);

    const double sqrt2 = std::sqrt(2.0);
    const double sqrtpi = std::sqrt(3.14159265358979323846);
    for (int i = 0; i < n; i++) {
        nodes[i] *= sqrt2;
        weights[i] /= sqrtpi;
    }
}
