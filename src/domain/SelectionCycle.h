// SelectionCycle.h
// Wraparound index stepping shared by the prompt, quality and browse lists.

#pragma once

#include <stddef.h>

namespace SelectionCycle {

// Returns the index one step in the direction of `direction`'s sign, wrapping
// at both ends. A zero direction or an empty list leaves the index unchanged.
inline size_t step(size_t index, size_t count, int direction) {
  if (count == 0 || direction == 0) return index;
  if (direction > 0) return (index + 1) % count;
  return index == 0 ? count - 1 : index - 1;
}

}  // namespace SelectionCycle
