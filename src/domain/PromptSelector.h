// PromptSelector.h
// Selection over the ordered prompt-mode table. Wraps in both directions.

#pragma once

#include <stddef.h>

#include <vector>

#include "Settings.h"

class PromptSelector {
 public:
  explicit PromptSelector(const std::vector<PromptMode>& prompts, size_t initialIndex = 0);

  const PromptMode& current() const { return prompts_[index_]; }
  size_t index() const { return index_; }
  size_t count() const { return prompts_.size(); }

  void cycle(int direction);
  bool select(size_t index);

 private:
  const std::vector<PromptMode>& prompts_;
  size_t index_ = 0;
};
