#include "lru.h"

#include <assert.h>
#include <stdio.h>

#include <iterator>

/*
    Recency is kept per frame slot, not per page: a resident page has exactly
    one slot, so the least recently used slot holds the least recently used page.

frame slots         : 0   1   2   3
list node seq       : 2   0   3   1
data in node[seq]   : 1   3   0   2
*/

/*ctor*/ LruPolicy::LruPolicy(int frameCount)
: PagePolicy(frameCount)
, accessIters(FrameCount(), ls.end())//a nullptr wrapper or some fixed sentinel node
{ }

void LruPolicy::Reset()
{
    ls.clear();
    for (Iter& rf : accessIters)//note ref
        rf = ls.end();
}

void LruPolicy::print()
{
    puts("Most recent to least recent frames used:");
    for (int const x : ls)
        printf("%3d", x);
    putchar('\n');
    puts("Pages in those frames:");
    for (int const x : ls)
        printf("%3d", table.At(x));
    putchar('\n');
}

//std::list::size is constant time in C++11
void LruPolicy::UseFreeFrame(int frameno)
{
    assert(accessIters[frameno]==ls.end());
    assert(static_cast<int>(ls.size()) < FrameCount());

    ls.push_front(frameno);
    accessIters[frameno] = ls.begin();
}

//a victim slot takes the new page straight away, so it goes to the front as well
int LruPolicy::PickFrameToEvict()
{
    assert(static_cast<int>(ls.size()) == FrameCount());

    Iter const oldest = std::prev(ls.end());
    ls.splice(ls.begin(), ls, oldest);//node moves, accessIters[*oldest] stays valid

    return *oldest;
}

void LruPolicy::UpdateAfterHit(int frameno)
{
    Iter const it = accessIters[frameno];
    assert(it != ls.end());

    if (it != ls.begin())
        ls.splice(ls.begin(), ls, it);
}
