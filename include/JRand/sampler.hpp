#ifndef JRAND_SAMPLER_H
#define JRAND_SAMPLER_H

#include <JRand/random.hpp>
#include <JRand/utils.hpp>
#include <cstdint>

// One draw of p.method, returned as its raw bit pattern: integers
// zero-extended from their unsigned representation, floats and doubles by
// their IEEE-754 bits, booleans as 0 or 1
uint64_t drawBits(RandomGenerator &rnd, Params const &p);

// One draw of p.method converted to double
double drawValue(RandomGenerator &rnd, Params const &p);

#endif // JRAND_SAMPLER_H
