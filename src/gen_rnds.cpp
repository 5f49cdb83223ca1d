#include <JRand/random.hpp>
#include <JRand/sampler.hpp>
#include <JRand/utils.hpp>
#include <cstdint>
#include <exception>
#include <iostream>
#include <vector>

// Records the raw bit patterns of p.nRuns * p.count draws, run r seeded with
// p.seed + r, as regression vectors
int generate(int argc, char *argv[])
{
    CmdArgs cmdargs = processCmdArguments(argc, argv);
    Params p = loadParams(cmdargs.paramsFName);
    if (not cmdargs.quiet)
        std::cout << p << '\n';

    std::vector<uint64_t> rands;
    rands.reserve(static_cast<size_t>(p.nRuns) * p.count);

    if (not cmdargs.quiet)
        print_progress(std::cout, 0, p.nRuns, "", "", 1, 20);

    for (int run = 0; run < p.nRuns; ++run)
    {
        RandomGenerator rnd(p.seed + static_cast<uint64_t>(run));

        for (int idx = 0; idx < p.count; ++idx)
            rands.push_back(drawBits(rnd, p));

        if (not cmdargs.quiet)
            print_progress(std::cout, run + 1, p.nRuns, "", "", 1, 20);
    }

    if (not cmdargs.outFile)
        return 0;

    if (cmdargs.outFName.empty())
        cmdargs.outFName = nowStrLocal("%Y%m%d%H%M%S.rnds");

    std::cout << cmdargs.outFName << '\n';

    saveData(cmdargs.outFName, rands.data(), rands.size(), p);
    return 0;
}

int main(int argc, char *argv[])
{
    try
    {
        return generate(argc, argv);
    }
    catch (std::exception const &e)
    {
        std::cerr << "gen_rnds: " << e.what() << '\n';
        return 1;
    }
}
