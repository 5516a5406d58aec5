#include "tranche/audit/cycle_audit_log.hpp"
#include "tranche/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tranche {

CycleAuditLog::CycleAuditLog(EventBus& bus, std::filesystem::path path)
    : bus_(bus), path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("CycleAuditLog: path must not be empty");
  }

  subscription_id_ = bus_.subscribe<CycleCompletedEvent>(
      [this](const CycleCompletedEvent& e) {
        try {
          append(e.book, e.record);
        } catch (const std::runtime_error& err) {
          std::cerr << "[CycleAuditLog] ERROR: " << err.what()
                    << ". Cycle not recorded.\n";
        }
      });
}

CycleAuditLog::~CycleAuditLog() { bus_.unsubscribe(subscription_id_); }

void CycleAuditLog::ensureDirectory() const {
  const auto dir = path_.parent_path();
  if (!dir.empty() && !std::filesystem::exists(dir)) {
    std::filesystem::create_directories(dir);
  }
}

void CycleAuditLog::append(const std::string& book,
                           const domain::TradeCycleRecord& record) {
  nlohmann::json j = toJson(record);
  j["book"] = book;

  std::lock_guard lock(mutex_);
  ensureDirectory();

  std::ofstream output(path_, std::ios::app);
  if (!output.good()) {
    throw std::runtime_error("failed to append to cycle audit log at " +
                             path_.string());
  }
  output << j.dump() << '\n';
  ++appended_;
}

std::vector<domain::TradeCycleRecord> CycleAuditLog::readAll() const {
  std::vector<domain::TradeCycleRecord> records;

  std::lock_guard lock(mutex_);
  std::ifstream input(path_);
  if (!input.good()) {
    return records;
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }
    try {
      records.push_back(cycleRecordFromJson(nlohmann::json::parse(line)));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[CycleAuditLog] WARNING: line " << line_number << ": "
                << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
      std::cerr << "[CycleAuditLog] WARNING: line " << line_number << ": "
                << e.what() << "\n";
    }
  }
  return records;
}

std::size_t CycleAuditLog::appendedCount() const {
  std::lock_guard lock(mutex_);
  return appended_;
}

}  // namespace tranche
