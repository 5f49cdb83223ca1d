#ifndef JRAND_STRICTMATH_H
#define JRAND_STRICTMATH_H

// Natural logarithm computed with the fdlibm 5.3 algorithm (e_log.c), the
// one java.lang.StrictMath.log is defined by. The result only depends on the
// IEEE-754 bit pattern of x, so it is identical on every platform, whereas
// std::log may differ in the last bit between C libraries.
//
// Error is below 1 ulp.
//     strictLog(x < 0)  = NaN
//     strictLog(+-0)    = -inf
//     strictLog(+inf)   = +inf
//     strictLog(NaN)    = NaN
double strictLog(double x);

#endif // JRAND_STRICTMATH_H
