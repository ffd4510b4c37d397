#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/maintenance/maintenance.hpp"

namespace schemadb::maintenance {

/*
  Background thread calling `tick` every `interval` until Stop().

  Fixed interval between the end of one tick and the start of the next;
  ticks never queue up.
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> tick);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();

  const std::string& Name() const {
    return name_;
  }

 private:
  void Run();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     tick_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_ = false;
  std::thread             thread_;
};

struct ScheduleOptions {
  bool                      backup_enabled = false;
  std::chrono::milliseconds backup_interval{std::chrono::hours(1)};
  bool                      vacuum_enabled = false;
  std::chrono::milliseconds vacuum_interval{std::chrono::hours(24 * 7)};
};

/*
  Runs periodic backup and vacuum against a Maintenance instance.

  Fire-and-forget: a tick that finds the guard held is skipped (logged at
  debug), failures are logged and never stop the timer.
*/
class MaintenanceScheduler {
 public:
  MaintenanceScheduler(Maintenance& maintenance, ScheduleOptions options);
  ~MaintenanceScheduler();

  MaintenanceScheduler(const MaintenanceScheduler&)            = delete;
  MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;

  void Start();
  void Stop();

  bool IsRunning() const {
    return !tasks_.empty();
  }

 private:
  void RunBackup();
  void RunVacuum();

  Maintenance&                               maintenance_;
  ScheduleOptions                            options_;
  std::vector<std::unique_ptr<PeriodicTask>> tasks_;
};

} // namespace schemadb::maintenance
