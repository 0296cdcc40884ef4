#ifndef H_PAGESIM_HISTORY
#define H_PAGESIM_HISTORY

#include "util.h"

struct StepRecord
{
    pageno_t page;//referenced at this step
    FrameState before;//frames as they were when hit/fault was decided
    bool fault;
    int frame;//slot that held the page (hit) or received it (fault)
    pageno_t evicted;//EmptyFrame unless a resident page was thrown out
};

struct SimulationResult
{
    int faults = 0;
    FrameState finalFrames;
    std::vector<StepRecord> history;//one per reference, in reference order
};

int Hits(const SimulationResult& res);
int Evictions(const SimulationResult& res);

//faults per reference, NaN when nothing was referenced
double FaultRate(const SimulationResult& res);

//frames after the step, rebuilt from the record alone
FrameState ApplyStep(const StepRecord& rec);

void PrintFrames(const FrameState& frames);
void PrintTrace(const SimulationResult& res);
void PrintSummary(const SimulationResult& res, const char* name);

#endif // H_PAGESIM_HISTORY
