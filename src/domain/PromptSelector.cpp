// PromptSelector.cpp

#include "PromptSelector.h"

#include "SelectionCycle.h"

PromptSelector::PromptSelector(const std::vector<PromptMode>& prompts, size_t initialIndex) : prompts_(prompts) {
  select(initialIndex);
}

void PromptSelector::cycle(int direction) {
  index_ = SelectionCycle::step(index_, prompts_.size(), direction);
}

bool PromptSelector::select(size_t index) {
  if (index >= prompts_.size()) return false;
  index_ = index;
  return true;
}
