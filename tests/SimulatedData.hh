#ifndef SIMULATEDDATA_HH
#define SIMULATEDDATA_HH

#include "IrtItem.hh"

#include <random>
#include <Eigen/Dense>

// Slope and difficulty of item j in SimulateResponses
inline double SimulatedSlope(int j) { return 0.8 + 0.2 * j; }
inline double SimulatedDifficulty(int j) { return -1.0 + 0.5 * j; }

// Responses simulated from a 2PL with slopes 0.8..1.6 and spread difficulties
inline Eigen::MatrixXd SimulateResponses(int nobs, int nitem, unsigned int seed)
{
    std::mt19937 gen(seed);
    std::normal_distribution<double> ability(0.0, 1.0);
    std::uniform_real_distribution<double> unif(0.0, 1.0);

    Eigen::MatrixXd data(nobs, nitem);
    for (int i = 0; i < nobs; i++) {
        double theta = ability(gen);
        for (int j = 0; j < nitem; j++) {
            IrtItem item = IrtItem::FromDifficulty(SimulatedSlope(j), SimulatedDifficulty(j));
            data(i, j) = (unif(gen) < item.Prob(theta)) ? 1.0 : 0.0;
        }
    }
    return data;
}

#endif // SIMULATEDDATA_HH
