#include <JRand/sampler.hpp>
#include <cstring>
#include <stdexcept>

uint64_t drawBits(RandomGenerator &rnd, Params const &p)
{
    switch (p.method)
    {
        case Method::Bits:
            return rnd.RandomBits(p.bits);
        case Method::Int:
            return static_cast<uint32_t>(rnd.RandomInt());
        case Method::UInt:
            return rnd.RandomUInt();
        case Method::Long:
            return static_cast<uint64_t>(rnd.RandomLong());
        case Method::ULong:
            return rnd.RandomULong();
        case Method::Bool:
            return rnd.RandomBool() ? 1 : 0;
        case Method::IntBound:
            return static_cast<uint32_t>(rnd.RandomInt(p.bound));
        case Method::Float:
        {
            float value = rnd.RandomFloat();
            uint32_t bits;
            std::memcpy(&bits, &value, sizeof bits);
            return bits;
        }
        case Method::Double:
        {
            double value = rnd.RandomDouble();
            uint64_t bits;
            std::memcpy(&bits, &value, sizeof bits);
            return bits;
        }
        case Method::Gaussian:
        {
            double value = rnd.RandomGaussian();
            uint64_t bits;
            std::memcpy(&bits, &value, sizeof bits);
            return bits;
        }
    }
    throw std::runtime_error("drawBits: unhandled method");
}

double drawValue(RandomGenerator &rnd, Params const &p)
{
    switch (p.method)
    {
        case Method::Bits:
            return static_cast<double>(rnd.RandomBits(p.bits));
        case Method::Int:
            return rnd.RandomInt();
        case Method::UInt:
            return rnd.RandomUInt();
        case Method::Long:
            return static_cast<double>(rnd.RandomLong());
        case Method::ULong:
            return static_cast<double>(rnd.RandomULong());
        case Method::Bool:
            return rnd.RandomBool() ? 1.0 : 0.0;
        case Method::IntBound:
            return rnd.RandomInt(p.bound);
        case Method::Float:
            return rnd.RandomFloat();
        case Method::Double:
            return rnd.RandomDouble();
        case Method::Gaussian:
            return rnd.RandomGaussian();
    }
    throw std::runtime_error("drawValue: unhandled method");
}
