#include <JRand/strictmath.hpp>
#include <cstdint>
#include <cstring>
#include <limits>

namespace
{
    double const ln2_hi = 6.93147180369123816490e-01; // 3fe62e42 fee00000
    double const ln2_lo = 1.90821492927058770002e-10; // 3dea39ef 35793c76
    double const two54  = 1.80143985094819840000e+16; // 43500000 00000000
    double const Lg1 = 6.666666666666735130e-01;      // 3FE55555 55555593
    double const Lg2 = 3.999999999940941908e-01;      // 3FD99999 9997FA04
    double const Lg3 = 2.857142874366239149e-01;      // 3FD24924 94229359
    double const Lg4 = 2.222219843214978396e-01;      // 3FCC71C5 1D8E78AF
    double const Lg5 = 1.818357216161805012e-01;      // 3FC74664 96CB03DE
    double const Lg6 = 1.531383769920937332e-01;      // 3FC39A09 D078C69F
    double const Lg7 = 1.479819860511658591e-01;      // 3FC2F112 DF3E5244

    inline uint64_t toBits(double x)
    {
        uint64_t bits;
        std::memcpy(&bits, &x, sizeof bits);
        return bits;
    }

    inline double fromBits(uint64_t bits)
    {
        double x;
        std::memcpy(&x, &bits, sizeof x);
        return x;
    }

    inline int32_t highWord(double x)
    {
        return static_cast<int32_t>(toBits(x) >> 32);
    }

    inline uint32_t lowWord(double x)
    {
        return static_cast<uint32_t>(toBits(x));
    }

    inline double withHighWord(double x, int32_t hi)
    {
        return fromBits((static_cast<uint64_t>(static_cast<uint32_t>(hi)) << 32)
                        | lowWord(x));
    }
}

// Method:
//  1. Argument reduction: find k and f such that
//         x = 2^k * (1 + f),  sqrt(2)/2 < 1 + f < sqrt(2)
//  2. Approximation of log(1 + f). Let s = f / (2 + f), then
//         log(1 + f) = log(1 + s) - log(1 - s) = 2s + 2/3 s^3 + 2/5 s^5 + ...
//                    = 2s + s * R(z),  z = s*s
//     where R is a degree 14 minimax polynomial in z, and
//         log(1 + f) = f - s * (f - R)               (if f is not too large)
//                    = f - (hfsq - s * (hfsq + R))   (better accuracy)
//     with hfsq = f*f/2.
//  3. log(x) = k * ln2 + log(1 + f)
//            = k * ln2_hi + (f - (hfsq - (s * (hfsq + R) + k * ln2_lo)))
//     where ln2_hi has its low bits cleared so k * ln2_hi is exact for |k| < 2000.
double strictLog(double x)
{
    double hfsq, f, s, z, R, w, t1, t2, dk;
    int32_t k, hx, i, j;
    uint32_t lx;

    hx = highWord(x);
    lx = lowWord(x);

    k = 0;
    if (hx < 0x00100000) // x < 2^-1022
    {
        if (((hx & 0x7fffffff) | lx) == 0)
            return -std::numeric_limits<double>::infinity(); // log(+-0)
        if (hx < 0)
            return std::numeric_limits<double>::quiet_NaN(); // log(-#)
        k -= 54;
        x *= two54; // subnormal, scale up x
        hx = highWord(x);
    }
    if (hx >= 0x7ff00000) // inf or NaN
        return x + x;

    k += (hx >> 20) - 1023;
    hx &= 0x000fffff;
    i = (hx + 0x95f64) & 0x100000;
    x = withHighWord(x, hx | (i ^ 0x3ff00000)); // normalize x or x/2
    k += (i >> 20);
    f = x - 1.0;

    if ((0x000fffff & (2 + hx)) < 3) // |f| < 2^-20
    {
        if (f == 0.0)
        {
            if (k == 0)
                return 0.0;
            dk = static_cast<double>(k);
            return dk * ln2_hi + dk * ln2_lo;
        }
        R = f * f * (0.5 - 0.33333333333333333 * f);
        if (k == 0)
            return f - R;
        dk = static_cast<double>(k);
        return dk * ln2_hi - ((R - dk * ln2_lo) - f);
    }

    s = f / (2.0 + f);
    dk = static_cast<double>(k);
    z = s * s;
    i = hx - 0x6147a;
    w = z * z;
    j = 0x6b851 - hx;
    t1 = w * (Lg2 + w * (Lg4 + w * Lg6));
    t2 = z * (Lg1 + w * (Lg3 + w * (Lg5 + w * Lg7)));
    i |= j;
    R = t2 + t1;

    if (i > 0)
    {
        hfsq = 0.5 * f * f;
        if (k == 0)
            return f - (hfsq - s * (hfsq + R));
        return dk * ln2_hi - ((hfsq - (s * (hfsq + R) + dk * ln2_lo)) - f);
    }

    if (k == 0)
        return f - s * (f - R);
    return dk * ln2_hi - ((s * (f - R) - dk * ln2_lo) - f);
}
