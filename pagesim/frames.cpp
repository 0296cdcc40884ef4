#include "frames.h"
#include "history.h"

#include <assert.h>
#include <stdio.h>

/*ctor*/ FrameTable::FrameTable(int frameCount)
: frames(frameCount, EmptyFrame)
{
    assert(frameCount > 0);
}

void FrameTable::Reset()
{
    for (pageno_t& rf : frames)//note ref
        rf = EmptyFrame;
}

int FrameTable::Occupied() const
{
    int cnt = 0;
    for (pageno_t const x : frames)
        if (! IsEmpty(x)) ++cnt;
    return cnt;
}

pageno_t FrameTable::At(int index) const
{
    assert(index >= 0 && index < Size());
    return frames[index];
}

int FrameTable::SlotOf(pageno_t page) const
{
    for (int i=0; i!=Size(); ++i)
        if (frames[i] == page)
            return i;
    return NoSlot;
}

int FrameTable::FirstEmptySlot() const
{
    for (int i=0; i!=Size(); ++i)
        if (IsEmpty(frames[i]))
            return i;
    return NoSlot;
}

void FrameTable::Assign(int index, pageno_t page)
{
    assert(index >= 0 && index < Size());
    //a page never lives in two frames
    assert(IsEmpty(page) || SlotOf(page) == NoSlot || SlotOf(page) == index);

    frames[index] = page;
}

void FrameTable::print() const
{
    PrintFrames(frames);
    putchar('\n');
}
