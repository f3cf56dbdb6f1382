#include "sync/UnitRuntime.h"
#include <algorithm>

std::string unitStatusToString(UnitStatus status) {
  switch (status) {
  case UnitStatus::Pending:
    return "pending";
  case UnitStatus::Running:
    return "running";
  case UnitStatus::Paused:
    return "paused";
  case UnitStatus::Completed:
    return "completed";
  case UnitStatus::Failed:
    return "failed";
  }
  return "pending";
}

double UnitRuntime::percentage() const {
  if (totalRecords == 0)
    return status == UnitStatus::Completed ? 100.0 : 0.0;
  double pct = static_cast<double>(processedRecords) /
               static_cast<double>(totalRecords) * 100.0;
  return std::clamp(pct, 0.0, 100.0);
}

void UnitRuntime::resetForRestart() {
  status = UnitStatus::Pending;
  totalRecords = 0;
  processedRecords = 0;
  failedRecords = 0;
  errorMessage.clear();
  provisioned = false;
  checkpoint = UnitCheckpoint{};
  sourceSchema.reset();
  destinationSchema.reset();
}

UnitRuntimeTable::UnitRuntimeTable(const std::vector<SyncUnit> &units) {
  slots_.reserve(units.size());
  for (const auto &unit : units) {
    auto slot = std::make_unique<Slot>();
    slot->runtime.unit = unit;
    slots_.push_back(std::move(slot));
  }
}

UnitRuntime UnitRuntimeTable::snapshot(size_t index) const {
  const Slot &slot = *slots_.at(index);
  std::shared_lock<std::shared_mutex> lock(slot.mutex);
  return slot.runtime;
}

std::vector<UnitRuntime> UnitRuntimeTable::snapshotAll() const {
  std::vector<UnitRuntime> result;
  result.reserve(slots_.size());
  for (size_t i = 0; i < slots_.size(); ++i)
    result.push_back(snapshot(i));
  return result;
}
