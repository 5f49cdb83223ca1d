#include <JRand/random.hpp>
#include <JRand/strictmath.hpp>
#include <atomic>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace chrono = std::chrono;

namespace
{
    std::atomic<uint64_t> seedUniquifier{8682522807148012ULL};
}

uint64_t seedFromClock()
{
    // L'Ecuyer, "Tables of Linear Congruential Generators of
    // Different Sizes and Good Lattice Structure", 1999
    uint64_t current = seedUniquifier.load();
    uint64_t next;
    do
    {
        next = current * 1181783497276652981ULL;
    } while (not seedUniquifier.compare_exchange_weak(current, next));

    chrono::time_point<chrono::system_clock> nowTp =
        chrono::system_clock::now();

    uint64_t now = static_cast<uint64_t>(
        chrono::duration_cast<chrono::microseconds>(
            nowTp.time_since_epoch()).count());

    return next ^ now;
}

RandomGenerator::RandomGenerator(uint64_t seed)
:
    _state((seed ^ Multiplier) & Mask),
    _nextGaussian()
{}

void RandomGenerator::SetSeed(uint64_t seed)
{
    *this = RandomGenerator(seed);
}

uint64_t RandomGenerator::RandomBits(int bits)
{
    if (bits < 0 or bits > 48)
        throw std::invalid_argument(
            "RandomBits: bit count must be in [0, 48], got " +
            std::to_string(bits));

    // unsigned arithmetic wraps modulo 2^64, the mask then reduces mod 2^48
    _state = (_state * Multiplier + Increment) & Mask;

    return _state >> (48 - bits);
}

int32_t RandomGenerator::RandomInt()
{
    return static_cast<int32_t>(RandomUInt());
}

uint32_t RandomGenerator::RandomUInt()
{
    return static_cast<uint32_t>(RandomBits(32));
}

int32_t RandomGenerator::RandomInt(int32_t bound)
{
    if (bound <= 0)
        throw std::invalid_argument(
            "RandomInt: bound must be positive, got " + std::to_string(bound));

    if ((bound & -bound) == bound) // i.e., bound is a power of 2
        return static_cast<int32_t>(
            (static_cast<uint64_t>(bound) * RandomBits(31)) >> 31);

    int32_t bits;
    int32_t val;
    uint32_t const m = static_cast<uint32_t>(bound - 1);

    // Reject draws from the last, incomplete copy of [0, bound) in
    // [0, 2^31). bits - val + (bound - 1) wraps negative exactly then.
    do
    {
        bits = static_cast<int32_t>(RandomBits(31));
        val = bits % bound;
    } while (static_cast<int32_t>(static_cast<uint32_t>(bits - val) + m) < 0);

    return val;
}

uint32_t RandomGenerator::RandomUInt(uint32_t bound)
{
    return static_cast<uint32_t>(RandomInt(static_cast<int32_t>(bound)));
}

int RandomGenerator::RandomInt(int lower, int upper)
{
    int64_t span = static_cast<int64_t>(upper) - lower + 1;
    if (span <= 0 or span > std::numeric_limits<int32_t>::max())
        throw std::invalid_argument(
            "RandomInt: invalid range [" + std::to_string(lower) + ", " +
            std::to_string(upper) + "]");

    return lower + RandomInt(static_cast<int32_t>(span));
}

int64_t RandomGenerator::RandomLong()
{
    return static_cast<int64_t>(RandomULong());
}

uint64_t RandomGenerator::RandomULong()
{
    uint64_t high = RandomBits(32);
    uint64_t low = RandomBits(32);

    return (high << 32) + low;
}

bool RandomGenerator::RandomBool()
{
    return RandomBits(1) == 1;
}

void RandomGenerator::RandomBytes(uint8_t *bytes, size_t size)
{
    size_t idx = 0;
    while (idx < size)
    {
        uint32_t block = RandomUInt();
        for (int n = 0; n < 4 and idx < size; ++n, ++idx)
        {
            bytes[idx] = static_cast<uint8_t>(block & 0xFF);
            block >>= 8;
        }
    }
}

void RandomGenerator::RandomBytes(std::vector<uint8_t> &bytes)
{
    RandomBytes(bytes.data(), bytes.size());
}

float RandomGenerator::RandomFloat()
{
    return static_cast<float>(RandomBits(24)) /
           static_cast<float>(uint32_t{1} << 24);
}

double RandomGenerator::RandomDouble()
{
    // the 26-bit draw has to come first
    int64_t high = static_cast<int64_t>(RandomBits(26)) << 27;
    int64_t low = static_cast<int64_t>(RandomBits(27));

    return static_cast<double>(high + low) /
           static_cast<double>(uint64_t{1} << 53);
}

double RandomGenerator::RandomDouble(double lower, double upper)
{
    return (upper - lower) * RandomDouble() + lower;
}

double RandomGenerator::RandomGaussian()
{
    if (_nextGaussian)
    {
        double next = *_nextGaussian;
        _nextGaussian.reset();
        return next;
    }

    double v1, v2, s;

    // Pick (v1, v2) uniform in the unit disc, origin excluded
    do
    {
        v1 = 2 * RandomDouble() - 1;
        v2 = 2 * RandomDouble() - 1;
        s = v1 * v1 + v2 * v2;
    } while (s >= 1 or s == 0);

    // strictLog keeps the result independent of the host libm, sqrt is
    // correctly rounded by IEEE-754 everywhere
    double multiplier = std::sqrt(-2 * strictLog(s) / s);

    _nextGaussian = v2 * multiplier;
    return v1 * multiplier;
}

double RandomGenerator::RandomGaussian(double mean, double stddev)
{
    return mean + stddev * RandomGaussian();
}
