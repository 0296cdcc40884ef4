#ifndef H_PAGESIM_LRU
#define H_PAGESIM_LRU

#include "policy.h"

#include <list>//a doubly-linked list that allocates. used for lru

class LruPolicy : public PagePolicy
{
    using ListType = std::list<int>;
    using Iter = ListType::iterator;

    ListType ls;//front is more recent then back
    std::vector<Iter> accessIters;//indexed by frame slots, ls.end() if unused
public:
    explicit LruPolicy(int frameCount);//ctor
    void print();
protected:
    void Reset();
    void UseFreeFrame(int frameno);
    int PickFrameToEvict();
    void UpdateAfterHit(int frameno);
};


#endif // H_PAGESIM_LRU
