#ifndef UNIT_RUNTIME_H
#define UNIT_RUNTIME_H

#include "engines/database_engine.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

enum class UnitStatus { Pending, Running, Paused, Completed, Failed };

std::string unitStatusToString(UnitStatus status);

// source is "db.table" or an index name; target likewise on the other side.
struct SyncUnit {
  std::string source;
  std::string target;
};

// Last written batch boundary: the reader position of the page that was
// being consumed plus how many of its records were already written.
struct UnitCheckpoint {
  ReadCheckpoint pageStart;
  size_t consumedInPage = 0;
};

struct UnitRuntime {
  SyncUnit unit;
  UnitStatus status = UnitStatus::Pending;
  uint64_t totalRecords = 0;
  uint64_t processedRecords = 0;
  uint64_t failedRecords = 0;
  std::string errorMessage;

  // Resume state, only meaningful while paused.
  bool provisioned = false;
  UnitCheckpoint checkpoint;
  std::shared_ptr<const Schema> sourceSchema;
  std::shared_ptr<const Schema> destinationSchema;

  double percentage() const;
  void resetForRestart();
};

// Fixed set of unit slots for one task run. Each slot has its own lock:
// the worker that owns a unit takes it exclusively, observers take it
// shared. Nothing locks across units.
class UnitRuntimeTable {
  struct Slot {
    mutable std::shared_mutex mutex;
    UnitRuntime runtime;
  };
  std::vector<std::unique_ptr<Slot>> slots_;

public:
  explicit UnitRuntimeTable(const std::vector<SyncUnit> &units);

  UnitRuntimeTable(const UnitRuntimeTable &) = delete;
  UnitRuntimeTable &operator=(const UnitRuntimeTable &) = delete;

  size_t size() const { return slots_.size(); }

  UnitRuntime snapshot(size_t index) const;
  std::vector<UnitRuntime> snapshotAll() const;

  template <typename Fn> void update(size_t index, Fn &&fn) {
    Slot &slot = *slots_.at(index);
    std::unique_lock<std::shared_mutex> lock(slot.mutex);
    fn(slot.runtime);
  }

  template <typename Fn> void read(size_t index, Fn &&fn) const {
    const Slot &slot = *slots_.at(index);
    std::shared_lock<std::shared_mutex> lock(slot.mutex);
    fn(slot.runtime);
  }
};

#endif
