#pragma once

#include "tranche/domain/trade_cycle_record.hpp"
#include "tranche/eventbus/event_bus.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace tranche {

// -----------------------------------------------------------------------------
// CycleAuditLog
// -----------------------------------------------------------------------------
//
// @brief  Append-only JSON-lines file of completed trade cycles.
//
// @details
// Subscribes to CycleCompletedEvent on the given bus and appends one line
// per event:
//
//   {"book":"theo","first_fill":...,"side":"Buy",...,"pnl":-5.0}
//
// Lines are never rewritten. The parent directory is created on first
// write. A write failure is reported on std::cerr and the event is dropped;
// trading continues.
//
// Thread model:
//   Appends are serialized by an internal mutex, so the theo and actual
//   books may publish from different threads.
// -----------------------------------------------------------------------------
class CycleAuditLog {
 public:
  // @throws std::invalid_argument when path is empty.
  CycleAuditLog(EventBus& bus, std::filesystem::path path);
  ~CycleAuditLog();

  CycleAuditLog(const CycleAuditLog&) = delete;
  CycleAuditLog& operator=(const CycleAuditLog&) = delete;

  // Appends one record. Throws std::runtime_error when the file cannot be
  // opened for appending.
  void append(const std::string& book, const domain::TradeCycleRecord& record);

  // Reads every record back, in file order. Blank and unparsable lines are
  // reported and skipped. A missing file yields an empty vector.
  std::vector<domain::TradeCycleRecord> readAll() const;

  const std::filesystem::path& path() const { return path_; }
  std::size_t appendedCount() const;

 private:
  void ensureDirectory() const;

  EventBus& bus_;
  const std::filesystem::path path_;
  EventBus::SubscriptionId subscription_id_{0};

  mutable std::mutex mutex_;
  std::size_t appended_{0};
};

}  // namespace tranche
