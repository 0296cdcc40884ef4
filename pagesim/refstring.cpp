#include "refstring.h"

#include <errno.h>
#include <math.h>
#include <stdlib.h>

#include <algorithm>
#include <set>
#include <stdexcept>

static
std::string Trim(const std::string& s)
{
    const char *const blanks = " \t\r\n";
    size_t const b = s.find_first_not_of(blanks);
    if (b == std::string::npos)
        return std::string();
    size_t const e = s.find_last_not_of(blanks);
    return s.substr(b, e - b + 1);
}

static
pageno_t ParsePage(const std::string& token)
{
    const char *const str = token.c_str();
    char *end = nullptr;
    errno = 0;
    long const val = strtol(str, &end, 10);

    if (end == str || *end != '\0')
        throw std::invalid_argument("not a page id: '" + token + "'");
    if (errno == ERANGE || val > INT32_MAX || val < INT32_MIN)
        throw std::invalid_argument("page id out of range: '" + token + "'");
    if (val < 0)
        throw std::invalid_argument("page ids cannot be negative: '" + token + "'");

    return static_cast<pageno_t>(val);
}

RefString ParseReferenceString(const std::string& text)
{
    RefString seq;
    size_t pos = 0;
    for (;;)
    {
        size_t const comma = text.find(',', pos);
        std::string const token = Trim(text.substr(pos, comma - pos));
        if (! token.empty())//"1,,2" and "1,2," are just 1,2
            seq.push_back(ParsePage(token));
        if (comma == std::string::npos)
            break;
        pos = comma + 1;
    }
    return seq;
}

//true with probability p, to 1/10000
static
bool Chance(Rng& rng, double p)
{
    return (rng() % 10000u) < unsigned(p * 10000.0);
}

template<class T>
static
T Pick(Rng& rng, const std::vector<T>& from)
{
    return from[rng() % from.size()];
}

RefString GenerateProcessReferences(double memoryMb, Rng& rng, int length)
{
    if (! isfinite(memoryMb) || memoryMb < 0.0)
        throw std::invalid_argument("process size must be a finite, non-negative number of MB");

    //clamp before narrowing, huge sizes do not fit an int
    int const npages = int(std::min<double>(GenMaxPages, std::max<double>(GenMinPages, memoryMb / 50.0)));

    std::vector<pageno_t> hot, cold, all;
    for (pageno_t p=1; p<=npages; ++p)
    {
        if (p <= GenHotPages) hot.push_back(p);
        else                  cold.push_back(p);
        all.push_back(p);
    }

    //larger processes tend to have more locality
    double const locality = std::min(0.8, std::max(0.2, 0.4 + memoryMb / 1000.0));

    RefString seq;
    std::set<pageno_t> seen;
    for (int i=0; i<length; ++i)
    {
        pageno_t page;
        if (Chance(rng, locality))
            page = Pick(rng, hot);
        else if (i > GenNewPageAfter && Chance(rng, 0.3))
            page = npages + 1 + static_cast<pageno_t>(seen.size());
        else if (! cold.empty())
            page = Pick(rng, cold);
        else
            page = Pick(rng, all);

        seq.push_back(page);
        seen.insert(page);
    }
    return seq;
}
