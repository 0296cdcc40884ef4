#ifndef H_PAGESIM_REFSTRING
#define H_PAGESIM_REFSTRING

#include "util.h"

#include <random>
#include <string>

typedef std::minstd_rand Rng;

//"1, 2,3" -> {1,2,3}; empty tokens are skipped, blank text -> {}
//throws std::invalid_argument naming the first bad token
RefString ParseReferenceString(const std::string& text);

/*
    Reference string with locality for a process of the given resident size.
    Bigger processes get more pages (4 to 10) and lean harder on the hot ones
    (pages 1..5). Past step 20 it may touch pages never seen before.
    Throws std::invalid_argument if memoryMb is negative, inf or nan.
*/
RefString GenerateProcessReferences(double memoryMb, Rng& rng, int length = GenLength);

#endif // H_PAGESIM_REFSTRING
