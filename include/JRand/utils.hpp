#ifndef JRAND_UTILS_H
#define JRAND_UTILS_H

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// Derived value the tools draw from a generator
enum class Method
{
    Bits,     // RandomBits(bits)
    Int,      // RandomInt()
    UInt,     // RandomUInt()
    Long,     // RandomLong()
    ULong,    // RandomULong()
    Bool,     // RandomBool()
    IntBound, // RandomInt(bound)
    Float,    // RandomFloat()
    Double,   // RandomDouble()
    Gaussian  // RandomGaussian()
};

// Throws std::runtime_error for unknown names
Method parseMethod(std::string const &name);

std::string methodName(Method method);

struct Params {
    uint64_t seed = 0; // Seed of the first run, run r uses seed + r
    Method method = Method::Int;
    int count = 1000; // Draws per run
    int bits = 32; // Bit count for Method::Bits
    int bound = 10; // Exclusive upper bound for Method::IntBound
    int nRuns = 1; // Number of independent runs
};

// Command line arguments for the programs
struct CmdArgs {
    std::string paramsFName;
    std::string outFName;
    bool quiet = false;
    bool outFile = true;
};

// Parse options from the command line
CmdArgs processCmdArguments(int argc, char *argv[]);

// Load parameters from a json file
Params loadParams(std::string const &fname);

// Parse parameters from json text, throws std::runtime_error on values out
// of range
Params parseParams(std::string const &contents);

// Convenience function for printing parameters
std::ostream &operator<<(std::ostream &os, Params const &p);

void saveData(std::string const &fname, std::vector<uint8_t> data,
              Params const &p);

// Save data to a msgpack file along with the parameters
template <class T>
void saveData(std::string const &fname, T *data, size_t size, Params const &p)
{
    // prepare input as binary data
    std::vector<uint8_t> binData(reinterpret_cast<uint8_t *>(data),
                                 reinterpret_cast<uint8_t *>(data) +
                                     size * sizeof(T));

    saveData(fname, std::move(binData), p);
}

// Call in a loop to create terminal progress bar
// @params:
//     os          - Required  : ostream to output to
//     iter        - Required  : current iteration
//     total       - Required  : total iterations
//     prefix      - Optional  : prefix string
//     suffix      - Optional  : suffix string
//     decimals    - Optional  : positive number of decimals in percent complete
//     barLength   - Optional  : character length of bar
void print_progress(std::ostream &os, int iter, int total,
                    std::string const &prefix = "",
                    std::string const &suffix = "", int decimals = 1,
                    int barLength = 40);

// get the current local timestamp as string
std::string nowStrLocal(std::string const &fmt = "%Y-%m-%d %H:%M:%S");

#endif // JRAND_UTILS_H
