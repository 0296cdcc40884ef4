#ifndef H_PAGESIM_POLICY
#define H_PAGESIM_POLICY

#include "frames.h"
#include "history.h"

/*
    Simulate() owns the walk over the reference string: snapshot, hit check,
    free frame or eviction, history record. A policy only answers the
    4 hooks below, always in terms of frame slots.

    Every Simulate() call starts from empty frames, so one instance can run
    any number of independent reference strings.
*/
class PagePolicy
{
public:
    explicit PagePolicy(int frameCount);//throws std::invalid_argument if frameCount<=0

    PagePolicy(const PagePolicy&) = delete;
    PagePolicy& operator=(const PagePolicy&) = delete;//disable copying

    virtual
    /*dtor*/ ~PagePolicy() { };

    //throws std::invalid_argument on a negative page id, before touching any frame
    SimulationResult Simulate(const RefString& seq);

    int FrameCount() const { return table.Size(); }

    virtual
    void print(){}//optional

protected:
    virtual
    void Reset() = 0;//forget everything from the previous run

    virtual
    void UpdateAfterHit(int frameno) = 0;

    virtual
    void UseFreeFrame(int frameno) = 0;

    //only called with every frame occupied, before the new page is assigned
    virtual
    int PickFrameToEvict() = 0;

    FrameTable table;
    const RefString *refs;//the string being simulated, null between runs
    size_t step;//index into *refs of the reference being served
};

template<class T>
SimulationResult SimulateWith(int frameCount, const RefString& seq)
{
    T policy(frameCount);
    return policy.Simulate(seq);
}

#endif // H_PAGESIM_POLICY
