#include <doctest/doctest.h>
#include <JRand/random.hpp>
#include <JRand/sampler.hpp>
#include <JRand/stats.hpp>
#include <Eigen/Dense>
#include <cmath>
#include <vector>

using Eigen::ArrayXd;

TEST_CASE("sampleMoments")
{
    ArrayXd samples(4);
    samples << 1, 2, 3, 6;

    Moments m = sampleMoments(samples);
    CHECK(m.count == 4);
    CHECK(m.mean == doctest::Approx(3.0));
    CHECK(m.m2 == doctest::Approx(14.0));
    CHECK(variance(m) == doctest::Approx(14.0 / 3));

    CHECK(sampleMoments(ArrayXd()).count == 0);
    CHECK(variance(Moments{}) == 0);
}

TEST_CASE("combineMoments matches the pooled sample")
{
    RandomGenerator rnd(5);
    ArrayXd all(300);
    for (int i = 0; i < all.size(); ++i)
        all[i] = rnd.RandomGaussian(3.0, 2.0);

    Moments left = sampleMoments(all.head(120));
    Moments right = sampleMoments(all.tail(180));
    Moments merged = combineMoments(left, right);
    Moments pooled = sampleMoments(all);

    CHECK(merged.count == 300);
    CHECK(merged.mean == doctest::Approx(pooled.mean));
    CHECK(merged.m2 == doctest::Approx(pooled.m2));

    Moments empty;
    CHECK(combineMoments(empty, left).m2 == left.m2);
    CHECK(combineMoments(left, empty).mean == left.mean);
}

TEST_CASE("combineMoments weighted form for large samples")
{
    Moments a{1000000, 2.0, 3.0e6};
    Moments b{1000000, 4.0, 5.0e6};

    Moments merged = combineMoments(a, b);
    CHECK(merged.count == 2000000);
    CHECK(merged.mean == doctest::Approx(3.0));
    CHECK(merged.m2 == doctest::Approx(1.0e7));

    // unequal sizes, still above the threshold
    Moments c{600000, -1.0, 1.2e6};
    Moments d{900000, 1.5, 0.9e6};
    Moments cd = combineMoments(c, d);
    CHECK(cd.count == 1500000);
    CHECK(cd.mean == doctest::Approx((600000 * -1.0 + 900000 * 1.5) / 1500000));
    CHECK(cd.m2 == doctest::Approx(1.2e6 + 0.9e6 +
                                   2.5 * 2.5 * 600000.0 * 900000.0 / 1500000));
}

TEST_CASE("runMoments merges runs in order whatever the batch size")
{
    Params p;
    p.seed = 77;
    p.method = Method::Gaussian;
    p.count = 250;
    p.nRuns = 10;

    Moments serial;
    for (int run = 0; run < p.nRuns; ++run)
        serial = combineMoments(
            serial, sampleMoments(sampleRun(RandomGenerator(p.seed + run), p)));

    unsigned const taskLimits[] = {1, 3, 4, 10, 64, 0};
    for (unsigned maxTasks: taskLimits)
    {
        CAPTURE(maxTasks);
        std::vector<int> done;
        Moments m = runMoments(p, maxTasks, [&](int n) { done.push_back(n); });

        CHECK(m.count == 2500);
        CHECK(m.mean == serial.mean);
        CHECK(m.m2 == serial.m2);

        REQUIRE(done.size() == 10);
        for (int i = 0; i < 10; ++i)
            CHECK(done[i] == i + 1);
    }
}

TEST_CASE("runMoments handles many more runs than tasks")
{
    Params p;
    p.method = Method::Bool;
    p.count = 1;
    p.nRuns = 2000;

    Moments m = runMoments(p, 2);
    CHECK(m.count == 2000);
    CHECK(m.mean >= 0.0);
    CHECK(m.mean <= 1.0);
}

TEST_CASE("expectedMoments")
{
    Params p;

    p.method = Method::Gaussian;
    CHECK(expectedMoments(p).first == 0);
    CHECK(expectedMoments(p).second == 1);

    p.method = Method::IntBound;
    p.bound = 10;
    CHECK(expectedMoments(p).first == doctest::Approx(4.5));
    CHECK(expectedMoments(p).second == doctest::Approx(99.0 / 12));

    p.method = Method::Bool;
    CHECK(expectedMoments(p).first == doctest::Approx(0.5));
    CHECK(expectedMoments(p).second == doctest::Approx(0.25));

    p.method = Method::Int;
    CHECK(expectedMoments(p).first == doctest::Approx(-0.5));
}

TEST_CASE("drawBits records raw patterns")
{
    Params p;

    p.method = Method::Int;
    RandomGenerator a(42);
    CHECK(drawBits(a, p) == 3124862261u);

    p.method = Method::Gaussian;
    RandomGenerator b(42);
    CHECK(drawBits(b, p) == 0x3ff2453e82115d86ULL);

    p.method = Method::Float;
    RandomGenerator c(3);
    CHECK(drawBits(c, p) == 0x3f3b2693u);

    p.method = Method::IntBound;
    p.bound = 10;
    RandomGenerator d(0);
    CHECK(drawBits(d, p) == 0);
    CHECK(drawBits(d, p) == 8);

    p.method = Method::Bits;
    p.bits = 48;
    RandomGenerator e(1);
    CHECK(drawBits(e, p) == 205723924636679ULL);
}

TEST_CASE("drawValue sample moments approach the expected ones")
{
    Params p;
    p.method = Method::Double;

    RandomGenerator rnd(1);
    ArrayXd samples(20000);
    for (int i = 0; i < samples.size(); ++i)
        samples[i] = drawValue(rnd, p);

    Moments m = sampleMoments(samples);
    auto expected = expectedMoments(p);
    CHECK(std::fabs(m.mean - expected.first) < 0.01);
    CHECK(std::fabs(variance(m) - expected.second) < 0.005);
}
