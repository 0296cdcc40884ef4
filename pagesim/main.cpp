/*
    pagesim: page replacement on a reference string

    usage: pagesim [-f frames] [-a l|o|b] [-s 1,2,3,...] [-m MB [-r seed]] [-q]

    -f  number of physical frames (default 3)
    -a  l = LRU, o = Optimal, b = both (default)
    -s  comma-separated reference string
    -m  instead of -s, generate a string for a process with MB resident
    -r  seed for -m, same seed gives the same string
    -q  summary only, no step trace

    To hook in another policy derive from PagePolicy, then add it to "algos".
*/
#include "lru.h"
#include "optimal.h"
#include "options.h"
#include "refstring.h"

#include <math.h>
#include <stdio.h>

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

struct AlgoDescriptor
{
    PagePolicy* (*fpNewUp)(int frameCount);
    const char* name;
    char key;//-a flag selecting it
};

template<class T>
PagePolicy* NewUp(int frameCount)
{
    return static_cast<PagePolicy*>(new T(frameCount));
}

const AlgoDescriptor algos[]=
{
    { &NewUp<LruPolicy>, "LRU: Least Recently Used", 'l' },
    { &NewUp<OptimalPolicy>, "OPT: Optimal (Belady)", 'o' }
};

static void PrintRefs(const RefString& seq)
{
    fputs("reference string:", stdout);
    for (pageno_t const x : seq)
        printf(" %d", x);
    putchar('\n');
}

int main(int argc, char** argv)
{
    try
    {
        Options const opt = ParseOptions(argc, argv);
        if (opt.help)
        {
            Usage(argv[0]);
            return 0;
        }

        RefString seq;
        if (opt.generate)
        {
            Rng rng(opt.seed);
            seq = GenerateProcessReferences(opt.memoryMb, rng);
            printf("# generated for a %.1f MB process, seed %u\n", opt.memoryMb, opt.seed);
        }
        else
            seq = ParseReferenceString(opt.refs);

        printf("frames: %d\n", opt.frames);
        PrintRefs(seq);

        struct Row { const char* name; int faults; double rate; };
        std::vector<Row> rows;

        for (const AlgoDescriptor *algo=algos; algo!=endof(algos); ++algo)
        {
            if (opt.algo != 'b' && opt.algo != algo->key)
                continue;

            std::unique_ptr<PagePolicy> const policy((*algo->fpNewUp)(opt.frames));
            SimulationResult const res = policy->Simulate(seq);

            if (! opt.quiet)
            {
                printf("\n *** Testing Policy [%s] ***\n", algo->name);
                PrintTrace(res);
                policy->print();
            }
            PrintSummary(res, algo->name);

            Row const row = { algo->name, res.faults, FaultRate(res) };
            rows.push_back(row);
        }

        if (rows.size() > 1)
        {
            puts("\n# Comparison\n policy                        faults  fault rate");
            for (const Row& r : rows)
            {
                if (isnan(r.rate)) printf(" %-28s %7d  %10s\n", r.name, r.faults, "n/a");
                else               printf(" %-28s %7d  %9.2f%%\n", r.name, r.faults, r.rate * 100.0);
            }
        }
    }
    catch (const std::exception& e)
    {
        fprintf(stderr, "pagesim: %s\n", e.what());
        Usage(argv[0]);
        return 1;
    }

    return 0;
}
