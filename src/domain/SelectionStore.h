// SelectionStore.h
// Durable copy of the selected prompt and quality indices.

#pragma once

#include <stddef.h>

class SelectionStore {
 public:
  virtual ~SelectionStore() = default;

  // Leaves the outputs untouched and returns false when nothing is stored.
  virtual bool load(size_t& promptIndex, size_t& qualityIndex) = 0;
  virtual bool save(size_t promptIndex, size_t qualityIndex) = 0;
};
