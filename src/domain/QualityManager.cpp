// QualityManager.cpp

#include "QualityManager.h"

#include "SelectionCycle.h"

QualityManager::QualityManager(const std::vector<QualityMode>& modes, size_t hardCeilingBytes, size_t initialIndex)
    : modes_(modes), hardCeilingBytes_(hardCeilingBytes) {
  select(initialIndex);
}

void QualityManager::cycle(int direction) {
  index_ = SelectionCycle::step(index_, modes_.size(), direction);
}

bool QualityManager::select(size_t index) {
  if (index >= modes_.size()) return false;
  index_ = index;
  return true;
}

SizeVerdict QualityManager::validate(size_t sizeBytes) const {
  return sizeBytes > hardCeilingBytes_ ? SizeVerdict::Oversized : SizeVerdict::Ok;
}
