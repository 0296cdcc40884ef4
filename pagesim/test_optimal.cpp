#undef NDEBUG
#include "optimal.h"

#include <cassert>
#include <cstdio>
#include <stdexcept>

static const RefString kClassic = {1, 2, 3, 4, 1, 2, 5, 1, 2, 3, 4, 5};

static void classic_three_frames()
{
    OptimalPolicy opt(3);
    SimulationResult const res = opt.Simulate(kClassic);

    assert(res.faults == 7);
    assert(res.history.size() == kClassic.size());
    assert((res.finalFrames == FrameState{4, 2, 5}));

    //4 arrives: 3 is needed last
    assert(res.history[3].evicted == 3);
    assert(res.history[3].frame == 2);
    //5 arrives: 4 is needed last
    assert(res.history[6].evicted == 4);
    //3 arrives: neither 1 nor 2 recur, lowest frame loses
    assert((res.history[9].before == FrameState{1, 2, 5}));
    assert(res.history[9].evicted == 1);
    assert(res.history[9].frame == 0);
    //4 arrives: 3 and 2 never recur, 3 sits in the lower frame
    assert(res.history[10].evicted == 3);
    assert(! res.history[11].fault);
}

static void ties_go_to_lowest_frame()
{
    SimulationResult const res = SimulateWith<OptimalPolicy>(3, {7, 8, 9, 1});
    assert(res.history[3].evicted == 7);
    assert((res.finalFrames == FrameState{1, 8, 9}));

    //7 comes back, 8 and 9 never do: the lower of those two goes
    SimulationResult const mix = SimulateWith<OptimalPolicy>(3, {7, 8, 9, 1, 7});
    assert(mix.history[3].evicted == 8);
}

static void future_excludes_current_step()
{
    //at the fault on 3 (index 2), 1 comes back at index 3, 2 never: evict 2
    SimulationResult const res = SimulateWith<OptimalPolicy>(2, {1, 2, 3, 1});
    assert(res.history[2].evicted == 2);
    assert(res.faults == 3);
}

static void empty_reference_string()
{
    OptimalPolicy opt(4);
    SimulationResult const res = opt.Simulate(RefString());
    assert(res.faults == 0);
    assert(res.history.empty());
    assert((res.finalFrames == FrameState{-1, -1, -1, -1}));
}

static void negative_page_rejected()
{
    bool thrown = false;
    try { SimulateWith<OptimalPolicy>(2, {3, -2}); } catch (const std::invalid_argument&) { thrown = true; }
    assert(thrown);
}

int main(int argc, char **argv) {
    classic_three_frames();
    ties_go_to_lowest_frame();
    future_excludes_current_step();
    empty_reference_string();
    negative_page_rejected();

    printf("success\n");
    return 0;
}
