#include "internal/maintenance/maintenance_scheduler.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace schemadb::maintenance {

using observability::IntField;
using observability::StringField;

// ------------------------------------------------------------------
// PeriodicTask
// ------------------------------------------------------------------

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> tick)
    : name_(std::move(name)), interval_(interval), tick_(std::move(tick)) {
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  {
    std::lock_guard lock(mutex_);
    stop_ = false;
  }
  thread_ = std::thread(&PeriodicTask::Run, this);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void PeriodicTask::Run() {
  std::unique_lock lock(mutex_);
  while (!stop_) {
    if (cv_.wait_for(lock, interval_, [&] { return stop_; })) break;

    lock.unlock();
    try {
      tick_();
    } catch (const std::exception& e) {
      SCHEMADB_LOG_ERROR("periodic task failed", {StringField("task", name_), StringField("error", e.what())});
    }
    lock.lock();
  }
}

// ------------------------------------------------------------------
// MaintenanceScheduler
// ------------------------------------------------------------------

MaintenanceScheduler::MaintenanceScheduler(Maintenance& maintenance, ScheduleOptions options)
    : maintenance_(maintenance), options_(options) {
}

MaintenanceScheduler::~MaintenanceScheduler() {
  Stop();
}

void MaintenanceScheduler::Start() {
  if (IsRunning()) return;

  if (options_.backup_enabled) {
    tasks_.push_back(std::make_unique<PeriodicTask>("backup", options_.backup_interval, [this] { RunBackup(); }));
  }
  if (options_.vacuum_enabled) {
    tasks_.push_back(std::make_unique<PeriodicTask>("vacuum", options_.vacuum_interval, [this] { RunVacuum(); }));
  }

  for (auto& task : tasks_) {
    task->Start();
    SCHEMADB_LOG_INFO("maintenance scheduled", {StringField("task", task->Name())});
  }
}

void MaintenanceScheduler::Stop() {
  for (auto& task : tasks_) {
    task->Stop();
  }
  tasks_.clear();
}

void MaintenanceScheduler::RunBackup() {
  db::Result r = maintenance_.Backup();
  if (r.code == db::StatusCode::Busy) {
    SCHEMADB_LOG_DEBUG("scheduled backup skipped, maintenance busy");
    return;
  }
  if (!r.status) {
    SCHEMADB_LOG_WARN("scheduled backup failed", {IntField("code", db::ToInt(r.code)), StringField("error", r.message)});
  }
}

void MaintenanceScheduler::RunVacuum() {
  db::Result r = maintenance_.Vacuum();
  if (r.code == db::StatusCode::Busy) {
    SCHEMADB_LOG_DEBUG("scheduled vacuum skipped, maintenance busy");
    return;
  }
  if (!r.status) {
    SCHEMADB_LOG_WARN("scheduled vacuum failed", {IntField("code", db::ToInt(r.code)), StringField("error", r.message)});
  }
}

} // namespace schemadb::maintenance
