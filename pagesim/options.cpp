#include "options.h"

#include <errno.h>
#include <limits.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <stdexcept>

static
std::invalid_argument BadValue(const char* what, const char* arg)
{
    return std::invalid_argument(std::string("bad ") + what + ": '" + arg + "'");
}

static
int ToInt(const char* arg, const char* what)
{
    char *end = nullptr;
    errno = 0;
    long const val = strtol(arg, &end, 10);
    if (end == arg || *end != '\0')
        throw BadValue(what, arg);
    if (errno == ERANGE || val > INT_MAX || val < INT_MIN)
        throw BadValue(what, arg);
    return static_cast<int>(val);
}

static
unsigned ToUnsigned(const char* arg, const char* what)
{
    char *end = nullptr;
    errno = 0;
    unsigned long const val = strtoul(arg, &end, 10);
    //strtoul quietly negates "-5"
    if (end == arg || *end != '\0' || arg[strspn(arg, " \t")] == '-')
        throw BadValue(what, arg);
    if (errno == ERANGE || val > UINT_MAX)
        throw BadValue(what, arg);
    return static_cast<unsigned>(val);
}

static
double ToSize(const char* arg, const char* what)
{
    char *end = nullptr;
    errno = 0;
    double const val = strtod(arg, &end);
    if (end == arg || *end != '\0')
        throw BadValue(what, arg);
    if (! isfinite(val) || val < 0.0)//inf and nan parse fine, neither is a size
        throw BadValue(what, arg);
    return val;
}

Options ParseOptions(int argc, char** argv)
{
    Options opt;
    //may be called more than once per process
#ifdef __GLIBC__
    optind = 0;//glibc: full reinit, drops leftover permutation state
#else
    optind = 1;
#endif
    opterr = 0;

    int arg;
    while ((arg = getopt(argc, argv, "f:a:s:m:r:qh")) != -1)
    {
        switch (arg)
        {
        case 'f':
            opt.frames = ToInt(optarg, "frame count");
            break;
        case 'a':
            if (optarg[0] == '\0' || optarg[1] != '\0')
                throw BadValue("policy", optarg);
            opt.algo = optarg[0];
            if (opt.algo != 'l' && opt.algo != 'o' && opt.algo != 'b')
                throw BadValue("policy", optarg);
            break;
        case 's':
            opt.refs = optarg;
            break;
        case 'm':
            opt.memoryMb = ToSize(optarg, "process size");
            opt.generate = true;
            break;
        case 'r':
            opt.seed = ToUnsigned(optarg, "seed");
            break;
        case 'q':
            opt.quiet = true;
            break;
        case 'h':
            opt.help = true;
            break;
        default:
            throw std::invalid_argument(std::string("unknown or incomplete option -") + char(optopt));
        }
    }
    if (optind != argc)
        throw std::invalid_argument(std::string("unexpected argument: '") + argv[optind] + "'");
    return opt;
}

void Usage(const char* prog)
{
    fprintf(stderr, "usage: %s [-f frames] [-a l|o|b] [-s 1,2,3,...] [-m MB [-r seed]] [-q]\n", prog);
}
