#undef NDEBUG
#include "refstring.h"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <set>
#include <stdexcept>

static bool rejects(const char* text)
{
    try {
        ParseReferenceString(text);
    } catch (const std::invalid_argument& e) {
        printf("rejected '%s': %s\n", text, e.what());
        return true;
    }
    return false;
}

static void parsing()
{
    assert((ParseReferenceString("1,2,3,4,1,2,5") == RefString{1, 2, 3, 4, 1, 2, 5}));
    assert((ParseReferenceString(" 7 ,0,  12\t") == RefString{7, 0, 12}));
    assert((ParseReferenceString("42") == RefString{42}));
    assert(ParseReferenceString("").empty());
    assert(ParseReferenceString("   ").empty());

    //empty tokens are dropped, not errors
    assert((ParseReferenceString("1,,3") == RefString{1, 3}));
    assert((ParseReferenceString("1,2,") == RefString{1, 2}));
    assert((ParseReferenceString(", ,4, ") == RefString{4}));
    assert(ParseReferenceString(",,").empty());

    assert(rejects("1,two,3"));
    assert(rejects("1,-4"));
    assert(rejects("3.5"));
    assert(rejects("99999999999"));
}

static void generator()
{
    Rng a(1234), b(1234);
    RefString const s1 = GenerateProcessReferences(300.0, a);
    RefString const s2 = GenerateProcessReferences(300.0, b);
    assert(s1 == s2);//same seed, same string
    assert(s1.size() == GenLength);

    for (double mb : {0.0, 120.0, 300.0, 2000.0}) {
        int const npages = mb / 50 < GenMinPages ? GenMinPages : (mb / 50 > GenMaxPages ? GenMaxPages : int(mb / 50));
        for (unsigned seed = 1; seed <= 50; ++seed) {
            Rng rng(seed);
            RefString const seq = GenerateProcessReferences(mb, rng, 40);
            assert(seq.size() == 40);

            std::set<pageno_t> seen;
            for (size_t i = 0; i < seq.size(); ++i) {
                assert(seq[i] >= 1);
                //pages past npages only show up late, and each one fresh
                if (seq[i] > npages) {
                    assert(i > GenNewPageAfter);
                    assert(seen.count(seq[i]) == 0);
                }
                seen.insert(seq[i]);
            }
        }
    }

    Rng rng(7);
    assert(GenerateProcessReferences(100.0, rng, 0).empty());
}

static bool rejects_size(double mb)
{
    Rng rng(1);
    try {
        GenerateProcessReferences(mb, rng, 5);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static void huge_and_bad_sizes()
{
    //far past INT_MAX * 50 MB: still 10 pages
    for (unsigned seed = 1; seed <= 20; ++seed) {
        Rng rng(seed);
        RefString const seq = GenerateProcessReferences(1e12, rng, 40);
        assert(seq.size() == 40);
        for (size_t i = 0; i < seq.size(); ++i) {
            assert(seq[i] >= 1);
            if (i <= GenNewPageAfter)
                assert(seq[i] <= GenMaxPages);
        }
    }

    assert(rejects_size(-1.0));
    assert(rejects_size(HUGE_VAL));
    assert(rejects_size(NAN));
}

int main(int argc, char **argv) {
    parsing();
    generator();
    huge_and_bad_sizes();

    printf("success\n");
    return 0;
}
