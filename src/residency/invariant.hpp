#pragma once
/// @file invariant.hpp
/// @brief Fatal check for states that correct sequencing rules out
/// (over-committed node, second outstanding migration for one fragment).

#include <cstdio>
#include <cstdlib>

#define FRAG_RES_INVARIANT(cond, what)                                         \
  do {                                                                         \
    if (!(cond)) {                                                             \
      std::fprintf(stderr, "FATAL: invariant violated: %s (%s) %s:%d\n",       \
                   (what), #cond, __FILE__, __LINE__);                         \
      std::fflush(stderr);                                                     \
      std::abort();                                                            \
    }                                                                          \
  } while (0)
