#include "history.h"

#include <assert.h>
#include <math.h>
#include <stdio.h>

int Hits(const SimulationResult& res)
{
    return static_cast<int>(res.history.size()) - res.faults;
}

int Evictions(const SimulationResult& res)
{
    int cnt = 0;
    for (const StepRecord& rec : res.history)
        if (! IsEmpty(rec.evicted)) ++cnt;
    return cnt;
}

double FaultRate(const SimulationResult& res)
{
    if (res.history.empty())
        return NAN;
    return double(res.faults) / double(res.history.size());
}

FrameState ApplyStep(const StepRecord& rec)
{
    FrameState after = rec.before;
    assert(rec.frame >= 0 && rec.frame < static_cast<int>(after.size()));

    if (rec.fault)
    {
        assert(after[rec.frame] == rec.evicted);
        after[rec.frame] = rec.page;
    }
    else
        assert(after[rec.frame] == rec.page);

    return after;
}

void PrintFrames(const FrameState& frames)
{
    for (pageno_t const x : frames)
    {
        if (IsEmpty(x)) fputs("   -", stdout);
        else            printf("%4d", x);
    }
}

void PrintTrace(const SimulationResult& res)
{
    puts(" step  page  frames before -> result");
    int step = 0;
    for (const StepRecord& rec : res.history)
    {
        printf("%5d %5d ", ++step, rec.page);
        PrintFrames(rec.before);
        if (! rec.fault)
            printf("  HIT   frame [%2d]\n", rec.frame);
        else if (IsEmpty(rec.evicted))
            printf("  FAULT frame [%2d], was free\n", rec.frame);
        else
            printf("  FAULT frame [%2d], evicted %d\n", rec.frame, rec.evicted);
    }
    fputs("final:      ", stdout);
    PrintFrames(res.finalFrames);
    putchar('\n');
}

void PrintSummary(const SimulationResult& res, const char* name)
{
    printf("\n *** [%s] results ***\n", name);
    printf("references: %u\n", unsigned(res.history.size()));
    printf("hits: %d\n", Hits(res));
    printf("evictions: %d\n", Evictions(res));
    printf("faults: %d\n", res.faults);

    double const rate = FaultRate(res);
    if (isnan(rate)) puts("fault rate: n/a");
    else             printf("fault rate: %.2f%%\n", rate * 100.0);
}
