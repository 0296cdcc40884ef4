#include "optimal.h"

#include <assert.h>
#include <stdint.h>

enum:size_t{ NeverUsed = SIZE_MAX };

//index of the next reference to page after the current step
size_t OptimalPolicy::NextUse(pageno_t page) const
{
    const RefString& seq = *refs;
    for (size_t j=step+1; j<seq.size(); ++j)
        if (seq[j] == page)
            return j;
    return NeverUsed;
}

int OptimalPolicy::PickFrameToEvict()
{
    assert(refs != nullptr);
    assert(table.FirstEmptySlot() == NoSlot);

    int victim = 0;
    size_t farthest = NextUse(table.At(0));

    //strict > keeps the lowest slot among equals
    for (int fi=1; fi!=FrameCount() && farthest!=NeverUsed; ++fi)
    {
        size_t const next = NextUse(table.At(fi));
        if (next > farthest)
        {
            victim = fi;
            farthest = next;
        }
    }
    return victim;
}
