#ifndef MEMORY_RACE_HARNESS_H
#define MEMORY_RACE_HARNESS_H

// Single writer / single reader on one unsynchronized memview::memory<int>
// variable. Exercises a documented hazard (torn views), so it is not part of
// the regular test run. Returns 0 when the run completed.
int run_memory_race_harness();

#endif // MEMORY_RACE_HARNESS_H
