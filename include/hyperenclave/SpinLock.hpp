//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <atomic>

namespace HyperEnclave {

/* Test-and-set lock usable from VM-exit context. Satisfies BasicLockable,
 * so std::lock_guard works with it. */
class SpinLock {
 public:
  SpinLock() { flag.clear(); }

  void lock() {
    while (flag.test_and_set(std::memory_order_acquire)) {
      __builtin_ia32_pause();
    }
  }

  bool try_lock() { return !flag.test_and_set(std::memory_order_acquire); }

  void unlock() { flag.clear(std::memory_order_release); }

 private:
  SpinLock(const SpinLock&);
  SpinLock& operator=(const SpinLock&);

  std::atomic_flag flag;
};

}  // namespace HyperEnclave
