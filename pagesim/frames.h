#ifndef H_PAGESIM_FRAMES
#define H_PAGESIM_FRAMES

#include "util.h"

/*
    What page sits in which physical frame, nothing more.
    Which page to throw out is the policy's business.
*/
class FrameTable
{
    FrameState frames;

public:
    explicit FrameTable(int frameCount);

    void Reset();//every slot back to EmptyFrame

    int Size() const { return static_cast<int>(frames.size()); }
    int Occupied() const;
    pageno_t At(int index) const;

    bool IsResident(pageno_t page) const { return SlotOf(page) != NoSlot; }
    int SlotOf(pageno_t page) const;
    int FirstEmptySlot() const;

    void Assign(int index, pageno_t page);

    //by value, later Assign calls never show through
    FrameState Snapshot() const { return frames; }

    void print() const;
};

#endif // H_PAGESIM_FRAMES
