#pragma once

#include <atomic>

namespace schemadb::maintenance {

/*
  Busy signal shared by backup and vacuum.

  The only explicit mutual exclusion in the storage layer: it keeps the
  two maintenance operations from overlapping and nothing else. CRUD
  calls never look at it. Acquisition never blocks; a caller that finds
  it held reports Busy (429) and moves on.
*/
class MaintenanceGuard {
 public:
  class Token {
   public:
    Token() = default;
    explicit Token(MaintenanceGuard* guard) : guard_(guard) {
    }
    ~Token() {
      Release();
    }

    Token(const Token&)            = delete;
    Token& operator=(const Token&) = delete;

    Token(Token&& other) noexcept : guard_(other.guard_) {
      other.guard_ = nullptr;
    }
    Token& operator=(Token&& other) noexcept {
      if (this != &other) {
        Release();
        guard_       = other.guard_;
        other.guard_ = nullptr;
      }
      return *this;
    }

    explicit operator bool() const {
      return guard_ != nullptr;
    }

    void Release() {
      if (guard_) {
        guard_->busy_.store(false, std::memory_order_release);
        guard_ = nullptr;
      }
    }

   private:
    MaintenanceGuard* guard_ = nullptr;
  };

  // Empty token when another maintenance operation holds the guard.
  Token TryAcquire() {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      return Token();
    }
    return Token(this);
  }

  bool IsBusy() const {
    return busy_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> busy_{false};
};

} // namespace schemadb::maintenance
