#include "policy.h"

#include <assert.h>

#include <stdexcept>
#include <string>
#include <utility>

static
int CheckedFrameCount(int frameCount)
{
    if (frameCount <= 0)
        throw std::invalid_argument("frame count must be positive, got " + std::to_string(frameCount));
    return frameCount;
}

/*ctor*/ PagePolicy::PagePolicy(int frameCount)
: table(CheckedFrameCount(frameCount))
, refs(nullptr)
, step(0)
{ }

SimulationResult PagePolicy::Simulate(const RefString& seq)
{
    for (size_t i=0; i!=seq.size(); ++i)
        if (IsEmpty(seq[i]))
            throw std::invalid_argument("negative page id " + std::to_string(seq[i])
                                        + " at reference " + std::to_string(i));

    table.Reset();
    Reset();
    refs = &seq;

    SimulationResult res;
    res.history.reserve(seq.size());

    for (step=0; step!=seq.size(); ++step)
    {
        pageno_t const page = seq[step];

        StepRecord rec;
        rec.page = page;
        rec.before = table.Snapshot();
        rec.evicted = EmptyFrame;

        int fi = table.SlotOf(page);
        if (fi != NoSlot)
        {
            rec.fault = false;
            UpdateAfterHit(fi);
        }
        else
        {
            rec.fault = true;
            ++res.faults;
            //Now 2 cases. 1: have free frame, or 2: need to evict
            fi = table.FirstEmptySlot();
            if (fi != NoSlot)//1
                UseFreeFrame(fi);
            else//2
            {
                fi = PickFrameToEvict();
                rec.evicted = table.At(fi);
                assert(! IsEmpty(rec.evicted));
            }
            table.Assign(fi, page);
        }
        rec.frame = fi;

        res.history.push_back(std::move(rec));
    }

    refs = nullptr;
    res.finalFrames = table.Snapshot();
    return res;
}
