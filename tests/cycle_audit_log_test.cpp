// =============================================================================
// cycle_audit_log_test.cpp
// =============================================================================
// Unit tests for tranche::CycleAuditLog.
//
// Validates:
//   - CycleCompletedEvent on the bus appends one line per cycle
//   - Records read back in file order; bad lines are skipped
//   - The parent directory is created on first write
//   - Unsubscribes on destruction
// =============================================================================

#include "tranche/audit/cycle_audit_log.hpp"
#include "tranche/events/position_update_event.hpp"
#include "tranche/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

class CycleAuditLogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          (std::string("tranche_audit_") +
           ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir);
  }

  void TearDown() override { fs::remove_all(dir); }

  static tranche::CycleCompletedEvent cycle(const std::string& book,
                                            double pnl) {
    tranche::CycleCompletedEvent e;
    e.book = book;
    e.record.first_fill = tranche::ms_to_timestamp(1'700'000'000'000);
    e.record.last_fill = tranche::ms_to_timestamp(1'700'000'300'000);
    e.record.side = tranche::domain::Side::Buy;
    e.record.max_position = 2;
    e.record.pnl = pnl;
    return e;
  }

  fs::path dir;
  tranche::EventBus bus;
};

TEST_F(CycleAuditLogTest, AppendsPublishedCycles) {
  tranche::CycleAuditLog log(bus, dir / "nested" / "cycles.jsonl");

  bus.publish(cycle("theo", 4.0));
  bus.publish(cycle("actual", -1.5));

  EXPECT_TRUE(fs::exists(dir / "nested"));
  EXPECT_EQ(log.appendedCount(), 2u);

  auto records = log.readAll();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_DOUBLE_EQ(records[0].pnl, 4.0);
  EXPECT_DOUBLE_EQ(records[1].pnl, -1.5);
  EXPECT_EQ(records[1].max_position, 2);
}

TEST_F(CycleAuditLogTest, SkipsUnparsableLines) {
  const auto path = dir / "cycles.jsonl";
  tranche::CycleAuditLog log(bus, path);
  log.append("theo", cycle("theo", 1.0).record);

  {
    std::ofstream out(path, std::ios::app);
    out << "\n{not json\n";
  }
  log.append("theo", cycle("theo", 2.0).record);

  auto records = log.readAll();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_DOUBLE_EQ(records[1].pnl, 2.0);
}

TEST_F(CycleAuditLogTest, MissingFileReadsEmpty) {
  tranche::CycleAuditLog log(bus, dir / "never_written.jsonl");
  EXPECT_TRUE(log.readAll().empty());
}

TEST_F(CycleAuditLogTest, EmptyPathThrows) {
  EXPECT_THROW({ tranche::CycleAuditLog log(bus, fs::path{}); },
               std::invalid_argument);
}

TEST_F(CycleAuditLogTest, UnsubscribesOnDestruction) {
  {
    tranche::CycleAuditLog log(bus, dir / "cycles.jsonl");
    EXPECT_EQ(bus.subscriberCount(), 1u);
  }
  EXPECT_EQ(bus.subscriberCount(), 0u);
  bus.publish(cycle("theo", 1.0));
}
