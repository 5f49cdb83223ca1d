#include <JRand/stats.hpp>
#include <JRand/utils.hpp>
#include <exception>
#include <iomanip>
#include <iostream>

int report(int argc, char *argv[])
{
    CmdArgs cmdargs = processCmdArguments(argc, argv);
    Params p = loadParams(cmdargs.paramsFName);
    if (not cmdargs.quiet)
        std::cout << p << '\n';

    if (not cmdargs.quiet)
        print_progress(std::cout, 0, p.nRuns, "", "", 1, 20);

    // one task per hardware thread
    Moments total = runMoments(p, 0, [&](int done) {
        if (not cmdargs.quiet)
            print_progress(std::cout, done, p.nRuns, "", "", 1, 20);
    });

    auto expected = expectedMoments(p);

    std::cout << std::setprecision(10) << std::defaultfloat
              << "samples = " << total.count << '\n'
              << "mean = " << total.mean
              << " (expected " << expected.first << ")\n"
              << "var = " << variance(total)
              << " (expected " << expected.second << ")\n";
    return 0;
}

int main(int argc, char *argv[])
{
    try
    {
        return report(argc, argv);
    }
    catch (std::exception const &e)
    {
        std::cerr << "rnd_stats: " << e.what() << '\n';
        return 1;
    }
}
