#ifndef H_PAGESIM_OPTIONS
#define H_PAGESIM_OPTIONS

#include "util.h"

#include <string>

struct Options
{
    int frames = DefaultFrames;
    char algo = 'b';//l, o or b(oth)
    std::string refs = "1,2,3,4,1,2,5,1,2,3,4,5";
    bool generate = false;//-m given, refs unused
    double memoryMb = 0.0;
    unsigned seed = DefaultSeed;
    bool quiet = false;
    bool help = false;
};

//getopt over argv; throws std::invalid_argument on any bad flag or value
Options ParseOptions(int argc, char** argv);

void Usage(const char* prog);

#endif // H_PAGESIM_OPTIONS
