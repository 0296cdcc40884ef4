#ifndef H_PAGESIM_UTIL
#define H_PAGESIM_UTIL

#include <stdint.h>
#include <stddef.h>

#include <vector>

enum
{
    DefaultFrames = 3,
    GenLength = 30,//references per generated string
    GenMinPages = 4,
    GenMaxPages = 10,
    GenHotPages = 5,
    GenNewPageAfter = 20,//only past this step may a generated string touch new pages
    DefaultSeed = 0xabcdef
};

using pageno_t = int32_t;//twos complement signed 32-bit integer

//negatives are never valid page ids
enum:pageno_t{ EmptyFrame = -1 };

//returned by slot lookups that found nothing
enum:int{ NoSlot = -1 };

using RefString = std::vector<pageno_t>;
using FrameState = std::vector<pageno_t>;//one entry per frame, EmptyFrame if unused

inline
bool IsEmpty(pageno_t page)
{
    return page<0;
}

template<class T, size_t N>
T* endof(T (&a)[N]) { return a+N; }

#endif // H_PAGESIM_UTIL
