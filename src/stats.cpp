#include <JRand/stats.hpp>
#include <JRand/sampler.hpp>
#include <algorithm>
#include <cmath>
#include <future>
#include <thread>
#include <vector>

Moments sampleMoments(Eigen::ArrayXd const &samples)
{
    Moments m;
    m.count = samples.size();
    if (m.count == 0)
        return m;

    m.mean = samples.mean();
    m.m2 = (samples - m.mean).square().sum();
    return m;
}

Moments combineMoments(Moments const &a, Moments const &b)
{
    if (a.count == 0)
        return b;
    if (b.count == 0)
        return a;

    Moments res;
    res.count = a.count + b.count;

    double delta = b.mean - a.mean;
    double const na = static_cast<double>(a.count);
    double const nb = static_cast<double>(b.count);
    double const n = static_cast<double>(res.count);

    // weighted form for large samples of similar size
    if (na / nb > 0.5 and nb > 500000)
        res.mean = (na * a.mean + nb * b.mean) / n;
    else
        res.mean = a.mean + delta * nb / n;

    res.m2 = a.m2 + b.m2 + delta * delta * na * nb / n;
    return res;
}

Eigen::ArrayXd sampleRun(RandomGenerator rnd, Params const &p)
{
    Eigen::ArrayXd samples(p.count);
    for (int idx = 0; idx < p.count; ++idx)
        samples[idx] = drawValue(rnd, p);
    return samples;
}

Moments runMoments(Params const &p, unsigned maxTasks,
                   std::function<void(int)> const &onRun)
{
    if (maxTasks == 0)
        maxTasks = std::max(1u, std::thread::hardware_concurrency());

    int const batch = static_cast<int>(
        std::min(maxTasks, static_cast<unsigned>(p.nRuns)));

    Moments total;
    std::vector<std::future<Eigen::ArrayXd>> results;
    results.reserve(batch);

    for (int first = 0, last = 0; first < p.nRuns; first = last)
    {
        last = first + std::min(batch, p.nRuns - first);

        for (int run = first; run < last; ++run)
        {
            // every task gets its own generator
            RandomGenerator rnd(p.seed + static_cast<uint64_t>(run));
            results.push_back(
                std::async(std::launch::async, sampleRun, rnd, std::cref(p)));
        }

        // merge in run order so the result does not depend on maxTasks
        for (int run = first; run < last; ++run)
        {
            total = combineMoments(total,
                                   sampleMoments(results[run - first].get()));
            if (onRun)
                onRun(run + 1);
        }
        results.clear();
    }
    return total;
}

double variance(Moments const &m)
{
    if (m.count < 2)
        return 0;
    return m.m2 / (m.count - 1);
}

std::pair<double, double> expectedMoments(Params const &p)
{
    // uniform over the n integers [lo, lo + n)
    auto discrete = [](double lo, double n) {
        return std::make_pair(lo + (n - 1) / 2, (n * n - 1) / 12);
    };

    switch (p.method)
    {
        case Method::Bits:
            return discrete(0, std::ldexp(1.0, p.bits));
        case Method::Int:
            return discrete(-std::ldexp(1.0, 31), std::ldexp(1.0, 32));
        case Method::UInt:
            return discrete(0, std::ldexp(1.0, 32));
        case Method::Long:
            return discrete(-std::ldexp(1.0, 63), std::ldexp(1.0, 64));
        case Method::ULong:
            return discrete(0, std::ldexp(1.0, 64));
        case Method::Bool:
            return discrete(0, 2);
        case Method::IntBound:
            return discrete(0, p.bound);
        case Method::Float:
        case Method::Double:
            return {0.5, 1.0 / 12};
        case Method::Gaussian:
            return {0, 1};
    }
    return {0, 0};
}
