// QualityManager.h
// Selection over the immutable quality-mode table and the size check applied
// to every delivered capture.

#pragma once

#include <stddef.h>

#include <vector>

#include "Settings.h"

enum class SizeVerdict {
  Ok,
  Oversized,  // above the global hard ceiling; fatal for this capture
};

class QualityManager {
 public:
  // `modes` must be non-empty (SettingsValidator guarantees it).
  QualityManager(const std::vector<QualityMode>& modes, size_t hardCeilingBytes, size_t initialIndex = 0);

  const QualityMode& current() const { return modes_[index_]; }
  size_t index() const { return index_; }
  size_t count() const { return modes_.size(); }

  // Moves the selection by `direction` (sign only), wrapping at both ends.
  void cycle(int direction);

  // Selects `index` if it is in range; returns false otherwise.
  bool select(size_t index);

  // Ceiling check only; the active mode does not matter here.
  SizeVerdict validate(size_t sizeBytes) const;

  // True when the capture is over the active mode's own maximum. Reported,
  // not enforced.
  bool exceedsModeBudget(size_t sizeBytes) const { return sizeBytes > current().maxBytes; }

  const std::string& label() const { return current().label; }
  size_t hardCeilingBytes() const { return hardCeilingBytes_; }

 private:
  const std::vector<QualityMode>& modes_;
  size_t hardCeilingBytes_;
  size_t index_ = 0;
};
