#ifndef JRAND_STATS_H
#define JRAND_STATS_H

#include <JRand/random.hpp>
#include <JRand/utils.hpp>
#include <Eigen/Dense>
#include <functional>
#include <utility>

// Running moments of a sample: size, mean and summed squared distance to
// the mean
struct Moments {
    long count = 0;
    double mean = 0;
    double m2 = 0;
};

Moments sampleMoments(Eigen::ArrayXd const &samples);

// Moments of the union of two samples (Chan et al. parallel algorithm)
Moments combineMoments(Moments const &a, Moments const &b);

// Sample variance m2 / (count - 1), zero for fewer than two values
double variance(Moments const &m);

// Draws of one run from its own generator
Eigen::ArrayXd sampleRun(RandomGenerator rnd, Params const &p);

// Moments of all p.nRuns runs, run r seeded with p.seed + r. At most
// maxTasks runs are in flight at a time (0 means one per hardware thread),
// each batch is merged before the next one starts. onRun is called with the
// number of runs merged so far.
Moments runMoments(Params const &p, unsigned maxTasks = 0,
                   std::function<void(int)> const &onRun = {});

// Theoretical mean and variance of the values p.method produces
std::pair<double, double> expectedMoments(Params const &p);

#endif // JRAND_STATS_H
