#include "internal/maintenance/maintenance.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/maintenance/maintenance_scheduler.hpp"

namespace {

using schemadb::db::Result;
using schemadb::db::StatusCode;
using schemadb::db::sqlite::SqliteDB;
using schemadb::maintenance::Maintenance;
using schemadb::maintenance::MaintenanceScheduler;
using schemadb::maintenance::ScheduleOptions;

struct Fixture {
  std::filesystem::path        dir;
  std::shared_ptr<SqliteDB>    db;
  std::unique_ptr<Maintenance> maintenance;

  explicit Fixture(const std::string& name) {
    dir = std::filesystem::temp_directory_path() / "schemadb_maintenance_tests" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    db = std::make_shared<SqliteDB>((dir / "live.db").string());
    db->Exec("CREATE TABLE items (id TEXT PRIMARY KEY, size INTEGER);");
    db->Run("INSERT INTO items VALUES (?, ?);", {std::string("a"), std::int64_t{1}});

    maintenance = std::make_unique<Maintenance>(db, (dir / "backups" / "live.db.bak").string(), nullptr);
  }

  std::filesystem::path BackupPath() const {
    return maintenance->BackupPath();
  }
};

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

void TestBackupReportsMissingPreviousFile() {
  Fixture f("first_backup");

  Result first = f.maintenance->Backup();
  assert(first.code == StatusCode::NoExistingBackup);
  assert(first.status);
  assert(std::filesystem::exists(f.BackupPath()));

  Result second = f.maintenance->Backup();
  assert(second.code == StatusCode::OK);
  assert(second.status);

  // the snapshot is a usable database
  SqliteDB copy(f.BackupPath().string());
  assert(copy.All("SELECT id FROM items;").size() == 1);
}

void TestBackupToExplicitDestination() {
  Fixture    f("explicit");
  const auto target = f.dir / "elsewhere" / "snap.db";

  Result r = f.maintenance->Backup(target.string());
  assert(r.status);
  assert(std::filesystem::exists(target));
  assert(!std::filesystem::exists(f.BackupPath()));
}

void TestBusyGuardBlocksOverlap() {
  Fixture f("busy");

  auto token = f.maintenance->Guard().TryAcquire();
  assert(token);
  assert(!f.maintenance->Guard().TryAcquire());

  Result backup = f.maintenance->Backup();
  assert(backup.code == StatusCode::Busy);
  assert(!std::filesystem::exists(f.BackupPath()));
  assert(!std::filesystem::exists(f.BackupPath().parent_path()));

  Result vacuum = f.maintenance->Vacuum();
  assert(vacuum.code == StatusCode::Busy);

  token.Release();
  assert(!f.maintenance->Guard().IsBusy());
  assert(f.maintenance->Backup().status);
  assert(!f.maintenance->Guard().IsBusy());
}

void TestVacuum() {
  Fixture f("vacuum");
  f.db->Exec("DELETE FROM items;");

  Result r = f.maintenance->Vacuum();
  assert(r);
  assert(!f.maintenance->Guard().IsBusy());
}

void TestSchedulerRunsBackups() {
  Fixture f("scheduled");

  ScheduleOptions options;
  options.backup_enabled  = true;
  options.backup_interval = std::chrono::milliseconds(20);
  options.vacuum_enabled  = true;
  options.vacuum_interval = std::chrono::milliseconds(35);

  MaintenanceScheduler scheduler(*f.maintenance, options);
  scheduler.Start();
  assert(scheduler.IsRunning());

  assert(WaitFor([&] { return std::filesystem::exists(f.BackupPath()); }, std::chrono::seconds(5)));

  scheduler.Stop();
  assert(!scheduler.IsRunning());
  assert(!f.maintenance->Guard().IsBusy());
}

void TestSchedulerSkipsTicksWhileBusy() {
  Fixture f("scheduled_busy");

  auto token = f.maintenance->Guard().TryAcquire();
  assert(token);

  ScheduleOptions options;
  options.backup_enabled  = true;
  options.backup_interval = std::chrono::milliseconds(10);

  MaintenanceScheduler scheduler(*f.maintenance, options);
  scheduler.Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  assert(!std::filesystem::exists(f.BackupPath()));

  token.Release();
  assert(WaitFor([&] { return std::filesystem::exists(f.BackupPath()); }, std::chrono::seconds(5)));
  scheduler.Stop();
}

void TestDisabledSchedulerStartsNothing() {
  Fixture              f("disabled");
  MaintenanceScheduler scheduler(*f.maintenance, ScheduleOptions{});
  scheduler.Start();
  assert(!scheduler.IsRunning());
  scheduler.Stop();
}

} // namespace

int main() {
  TestBackupReportsMissingPreviousFile();
  TestBackupToExplicitDestination();
  TestBusyGuardBlocksOverlap();
  TestVacuum();
  TestSchedulerRunsBackups();
  TestSchedulerSkipsTicksWhileBusy();
  TestDisabledSchedulerStartsNothing();

  std::cout << "schemadb_unit_maintenance: pass\n";
  return 0;
}
