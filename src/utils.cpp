#include <JRand/utils.hpp>
#include <nlohmann/json.hpp>
#include <getopt.h>
#include <iomanip>
#include <cmath>
#include <chrono>
#include <ctime>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace chrono = std::chrono;
using json = nlohmann::json;

namespace
{
    struct MethodEntry {
        Method method;
        char const *name;
    };

    MethodEntry const methodNames[] =
    {
        {Method::Bits, "bits"},
        {Method::Int, "int"},
        {Method::UInt, "uint"},
        {Method::Long, "long"},
        {Method::ULong, "ulong"},
        {Method::Bool, "bool"},
        {Method::IntBound, "intBound"},
        {Method::Float, "float"},
        {Method::Double, "double"},
        {Method::Gaussian, "gaussian"}
    };

    // Optional integer field, rejected instead of truncated when it does
    // not fit an int
    int intField(json const &pdata, char const *key, int fallback)
    {
        auto it = pdata.find(key);
        if (it == pdata.end())
            return fallback;

        if (not it->is_number_integer())
            throw std::runtime_error(std::string(key) + " must be an integer");

        bool fits;
        if (it->is_number_unsigned())
            fits = it->get<uint64_t>() <=
                   static_cast<uint64_t>(std::numeric_limits<int>::max());
        else
        {
            int64_t value = it->get<int64_t>();
            fits = value >= std::numeric_limits<int>::min() and
                   value <= std::numeric_limits<int>::max();
        }

        if (not fits)
            throw std::runtime_error(std::string(key) + " is out of range: " +
                                     it->dump());
        return static_cast<int>(it->get<int64_t>());
    }
}

Method parseMethod(std::string const &name)
{
    for (auto const &entry: methodNames)
        if (name == entry.name)
            return entry.method;

    throw std::runtime_error("Unknown method: " + name);
}

std::string methodName(Method method)
{
    for (auto const &entry: methodNames)
        if (method == entry.method)
            return entry.name;

    throw std::runtime_error("Unknown method id: " +
                             std::to_string(static_cast<int>(method)));
}

CmdArgs processCmdArguments(int argc, char *argv[])
{
    struct option const long_options[] =
    {
        {"no-outfile", 0, NULL, 'x'}, // to allow --no-outfile 
        {NULL, 0, NULL, 0}
    };

    CmdArgs cargs;

    int ch;
    int option_index;
    while ((ch = getopt_long(argc, argv, "p:o:qx", 
                                long_options, &option_index)) != -1)
    {
        switch (static_cast<char>(ch))
        {
            case 'p':
                cargs.paramsFName = optarg;
                break;
            case 'o':
                cargs.outFName = optarg;
                break;
            case 'q':
                cargs.quiet = true;
                break;
            case 'x':
                cargs.outFile = false;
                break;
            default:
                throw std::runtime_error(
                    "usage: " + std::string(argv[0]) +
                    " [-p params.json] [-o outfile] [-q] [--no-outfile]");
        }
    }

    if (cargs.paramsFName.empty())
    {
        if (cargs.quiet)
            cargs.paramsFName = "params.json";
        else
        {
            std::cout << "Enter a parameter file name: " << '\n';
            std::cin >> cargs.paramsFName;
        }
    }
    
    return cargs;
}

Params parseParams(std::string const &contents)
{
    json pdata = json::parse(contents);
    Params prms;

    // seeds are 64-bit patterns, negative json integers wrap around
    prms.seed = pdata.at("seed").get<uint64_t>();
    prms.method = parseMethod(pdata.at("method").get<std::string>());
    prms.count = intField(pdata, "count", prms.count);
    prms.bits = intField(pdata, "bits", prms.bits);
    prms.bound = intField(pdata, "bound", prms.bound);
    prms.nRuns = intField(pdata, "nRuns", prms.nRuns);

    if (prms.count < 1)
        throw std::runtime_error("count must be at least 1");
    if (prms.nRuns < 1)
        throw std::runtime_error("nRuns must be at least 1");
    if (prms.bits < 0 or prms.bits > 48)
        throw std::runtime_error("bits must be in [0, 48]");
    if (prms.bound < 1)
        throw std::runtime_error("bound must be at least 1");

    return prms;
}

Params loadParams(std::string const &fname)
{
    std::ifstream in(fname, std::ios::in | std::ios::binary);
    if (in)
    {
        std::string contents;
        in.seekg(0, std::ios::end);
        contents.resize(in.tellg());
        in.seekg(0, std::ios::beg);
        in.read(&contents[0], contents.size());
        in.close();
        
        return parseParams(contents);
    }
    throw std::runtime_error(std::string("Error opening file: ") + 
                             std::strerror(errno));
}

std::ostream &operator<<(std::ostream &os, Params const &p)
{
    os << "seed = " << p.seed << '\n'
       << "method = " << methodName(p.method) << '\n';
    if (p.method == Method::Bits)
        os << "bits = " << p.bits << '\n';
    if (p.method == Method::IntBound)
        os << "bound = " << p.bound << '\n';
    os << "count = " << p.count << '\n'
       << "nRuns = " << p.nRuns;
    return os;
}

void saveData(std::string const &fname, std::vector<uint8_t> data, 
              Params const &p)
{
    json::binary_t binData(std::move(data));

    json dataset;    
    dataset["seed"] = p.seed;
    dataset["method"] = methodName(p.method);
    dataset["count"] = p.count;
    dataset["bits"] = p.bits;
    dataset["bound"] = p.bound;
    dataset["nRuns"] = p.nRuns;
    dataset["data"] = binData;

    std::vector<uint8_t> msg = json::to_msgpack(dataset);

    std::ofstream file(fname, std::ios::out | std::ios::binary);
    if (not file)
        throw std::runtime_error("Error opening file: " + fname);
    file.write(reinterpret_cast<char *>(msg.data()), msg.size());
}

// Print a progress bar 
void print_progress(std::ostream &os, int iter, int total, 
                    std::string const &prefix, std::string const &suffix,
                    int decimals, int barLength)
{   
    static constexpr char barChar[] = "█";

    double percents = 100 * (iter / static_cast<double>(total));
    int filledLength = 
        static_cast<int>(
            std::round(barLength * iter / static_cast<double>(total)));

    std::string bar;
    bar.reserve(filledLength * (sizeof(barChar) - 1) + barLength);
    for (int i = 0; i < filledLength; ++i)
        bar.append(barChar);
    bar.append(barLength - filledLength, '-');

    os << "\33[2K\r" << prefix << "(" << iter << '/' << total << ") |" 
       << bar << "| "
       << std::fixed << std::setprecision(decimals)
       << percents << '%' << suffix;

    if (iter == total)
        os << '\n';
    
    os << std::flush;
}

// get the current local timestamp as string
std::string nowStrLocal(std::string const &fmt)
{
    chrono::time_point<chrono::system_clock> nowTp = 
        chrono::system_clock::now();

    std::ostringstream oss;
    std::time_t t = chrono::system_clock::to_time_t(nowTp);
    std::tm tmValue{*std::localtime(&t)};
    oss << std::put_time(&tmValue, fmt.c_str());
    return oss.str();
}
