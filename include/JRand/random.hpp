#ifndef JRAND_RANDOM_H
#define JRAND_RANDOM_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Using the system clock and a process wide uniquifier, return a seed that
// differs between any two calls, even within the same clock tick
uint64_t seedFromClock();

// 48-bit linear congruential generator producing the same sequences as
// java.util.Random. Given the same seed and the same sequence of calls every
// result is bit identical, floating point values included.
//
// The state advances as
//     state = (state * 0x5DEECE66D + 0xB) mod 2^48
// and every derived value is built from the top bits of successive states.
//
// Not thread safe: give every thread its own generator.
class RandomGenerator
{
public:
    static constexpr uint64_t Multiplier = 0x5DEECE66DULL;
    static constexpr uint64_t Increment = 0xBULL;
    static constexpr uint64_t Mask = (uint64_t{1} << 48) - 1;

    // The seed is scrambled (xor with the multiplier) before use, so
    // RandomGenerator(s) and java.util.Random(s) start in the same state
    explicit RandomGenerator(uint64_t seed);

    // Seeds from the clock, see seedFromClock()
    RandomGenerator()
    :
        RandomGenerator(seedFromClock())
    {}

    // Equivalent to assigning RandomGenerator(seed), the pending gaussian
    // is dropped as well
    void SetSeed(uint64_t seed);

    // Advances the state and returns its top `bits` bits, 0 <= bits <= 48.
    // Throws std::invalid_argument for any other bit count.
    uint64_t RandomBits(int bits);

    int32_t RandomInt();
    uint32_t RandomUInt();

    // Uniform in [0, bound). Throws std::invalid_argument if bound <= 0.
    int32_t RandomInt(int32_t bound);

    // Same draw as RandomInt(static_cast<int32_t>(bound)), so bounds of
    // 2^31 and above are rejected
    uint32_t RandomUInt(uint32_t bound);

    // Return random integer within a range, lower -> upper INCLUSIVE
    int RandomInt(int lower, int upper);

    // Two 32-bit draws, high word first
    int64_t RandomLong();
    uint64_t RandomULong();

    bool RandomBool();

    // Fills the buffer with the bytes of successive RandomUInt() draws, least
    // significant byte first. The unused high bytes of the last draw are
    // discarded.
    void RandomBytes(uint8_t *bytes, size_t size);
    void RandomBytes(std::vector<uint8_t> &bytes);

    // [0, 1) with 24 bits of precision
    float RandomFloat();

    // [0, 1) with 53 bits of precision
    double RandomDouble();

    // Return random double within a range, lower -> upper
    double RandomDouble(double lower, double upper);

    // Standard normal deviate (polar Box-Muller). Deviates come in pairs:
    // the second one of a pair is cached and returned by the next call
    // without advancing the state.
    double RandomGaussian();

    double RandomGaussian(double mean, double stddev);

    uint64_t State() const { return _state; }
    bool HasPendingGaussian() const { return _nextGaussian.has_value(); }

private:
    uint64_t _state;
    std::optional<double> _nextGaussian;
};

#endif // JRAND_RANDOM_H
