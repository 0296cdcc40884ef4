#ifndef H_PAGESIM_OPTIMAL
#define H_PAGESIM_OPTIMAL

#include "policy.h"

/*
    Belady's policy: evict the resident page whose next reference is the
    farthest away, or that is never referenced again.
    Ties go to the lowest frame slot.
*/
class OptimalPolicy : public PagePolicy
{
public:
    explicit OptimalPolicy(int frameCount) : PagePolicy(frameCount) { }

protected:
    void Reset() { }
    void UseFreeFrame(int) { }
    void UpdateAfterHit(int) { }
    int PickFrameToEvict();

private:
    size_t NextUse(pageno_t page) const;
};

#endif // H_PAGESIM_OPTIMAL
