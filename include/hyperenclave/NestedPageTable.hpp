//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>
#include "Config.hpp"
#include "Error.hpp"
#include "FrameAllocator.hpp"
#include "common.hpp"

#define NPT_LEVELS 4
#define NPT_LEVEL_BITS 9
#define NPT_ENTRIES (1 << NPT_LEVEL_BITS)

namespace HyperEnclave {

/* Intel EPT entry encoding */
struct EptFormat {
  enum : uint64_t {
    kRead      = 1ULL << 0,
    kWrite     = 1ULL << 1,
    kExec      = 1ULL << 2,
    kMemTypeWb = 6ULL << 3,
    kAddrMask  = 0x000ffffffffff000ULL,
  };

  static uint64_t tableEntry(uint64_t pa) {
    return (pa & kAddrMask) | kRead | kWrite | kExec;
  }

  static uint64_t leafEntry(uint64_t pa, unsigned perms, bool /*encrypted*/) {
    uint64_t e = (pa & kAddrMask) | kMemTypeWb;
    if (perms & Perm::Read) e |= kRead;
    if (perms & Perm::Write) e |= kWrite;
    if (perms & Perm::Exec) e |= kExec;
    return e;
  }

  static bool isPresent(uint64_t e) { return (e & (kRead | kWrite | kExec)) != 0; }
  static uint64_t entryAddr(uint64_t e) { return e & kAddrMask; }

  static unsigned entryPerms(uint64_t e) {
    unsigned perms = Perm::None;
    if (e & kRead) perms |= Perm::Read;
    if (e & kWrite) perms |= Perm::Write;
    if (e & kExec) perms |= Perm::Exec;
    return perms;
  }
};

/* AMD NPT entry encoding (long-mode page table format) */
struct NptFormat {
  enum : uint64_t {
    kPresent  = 1ULL << 0,
    kWrite    = 1ULL << 1,
    kUser     = 1ULL << 2,
    kNoExec   = 1ULL << 63,
    kAddrMask = 0x000ffffffffff000ULL & ~Config::kSmeCBit,
  };

  static uint64_t tableEntry(uint64_t pa) {
    return (pa & kAddrMask) | kPresent | kWrite | kUser;
  }

  /* NPT has no write-only or execute-only encoding: any permission
   * implies read */
  static uint64_t leafEntry(uint64_t pa, unsigned perms, bool encrypted) {
    uint64_t e = (pa & kAddrMask) | kPresent | kUser;
    if (perms & Perm::Write) e |= kWrite;
    if (!(perms & Perm::Exec)) e |= kNoExec;
    if (encrypted) e |= Config::kSmeCBit;
    return e;
  }

  static bool isPresent(uint64_t e) { return (e & kPresent) != 0; }
  static uint64_t entryAddr(uint64_t e) { return e & kAddrMask; }

  static unsigned entryPerms(uint64_t e) {
    unsigned perms = Perm::Read;
    if (e & kWrite) perms |= Perm::Write;
    if (!(e & kNoExec)) perms |= Perm::Exec;
    return perms;
  }
};

/* Four-level guest-physical to host-physical table. Intermediate
 * tables come from the frame allocator and are released with the
 * table. */
template <typename Format>
class NestedPageTable {
 public:
  explicit NestedPageTable(FrameAllocator& frameAllocator)
      : frames(frameAllocator), rootPhysAddr(0) {}

  ~NestedPageTable() { clear(); }

  Error init() {
    if (rootPhysAddr) return Error::Success;
    rootPhysAddr = frames.allocFrame();
    return rootPhysAddr ? Error::Success : Error::OutOfMemory;
  }

  void clear() {
    if (!rootPhysAddr) return;
    freeLevel(rootPhysAddr, NPT_LEVELS - 1);
    rootPhysAddr = 0;
  }

  uint64_t getRoot() const { return rootPhysAddr; }

  Error map(uint64_t gpa, uint64_t hpa, unsigned perms, bool encrypted = false) {
    if (!rootPhysAddr) return Error::InvalidState;
    if (!IS_ALIGNED(gpa, PAGE_SIZE) || !IS_ALIGNED(hpa, PAGE_SIZE))
      return Error::InvalidParameter;
    if (perms == Perm::None || (perms & ~Perm::All))
      return Error::InvalidParameter;

    uint64_t* pte = walk(gpa, true);
    if (!pte) return Error::OutOfMemory;
    if (Format::isPresent(*pte)) return Error::InvalidRange;

    *pte = Format::leafEntry(hpa, perms, encrypted);
    return Error::Success;
  }

  Error unmap(uint64_t gpa) {
    if (!rootPhysAddr) return Error::InvalidState;
    uint64_t* pte = walk(PAGE_DOWN(gpa), false);
    if (!pte || !Format::isPresent(*pte)) return Error::NotFound;
    *pte = 0;
    return Error::Success;
  }

  bool translate(uint64_t gpa, uint64_t* hpa, unsigned* perms) const {
    if (!rootPhysAddr) return false;
    const uint64_t* pte =
        const_cast<NestedPageTable*>(this)->walk(PAGE_DOWN(gpa), false);
    if (!pte || !Format::isPresent(*pte)) return false;

    if (hpa) *hpa = Format::entryAddr(*pte) | (gpa & (PAGE_SIZE - 1));
    if (perms) *perms = Format::entryPerms(*pte);
    return true;
  }

  /* raw leaf entry, 0 when unmapped */
  uint64_t getEntry(uint64_t gpa) const {
    if (!rootPhysAddr) return 0;
    const uint64_t* pte =
        const_cast<NestedPageTable*>(this)->walk(PAGE_DOWN(gpa), false);
    return pte ? *pte : 0;
  }

 private:
  NestedPageTable(const NestedPageTable&);
  NestedPageTable& operator=(const NestedPageTable&);

  static size_t pt_idx(uint64_t addr, int level) {
    size_t idx = addr >> (NPT_LEVEL_BITS * level + PAGE_BITS);
    return idx & (NPT_ENTRIES - 1);
  }

  uint64_t* table(uint64_t pa) const {
    return reinterpret_cast<uint64_t*>(frames.physToVirt(pa));
  }

  uint64_t* walk(uint64_t addr, bool create) {
    uint64_t* t = table(rootPhysAddr);

    for (int i = NPT_LEVELS - 1; i > 0; i--) {
      size_t idx = pt_idx(addr, i);
      if (!Format::isPresent(t[idx])) {
        if (!create) return NULL;
        uint64_t next = frames.allocFrame();
        if (!next) return NULL;
        t[idx] = Format::tableEntry(next);
      }
      t = table(Format::entryAddr(t[idx]));
    }
    return &t[pt_idx(addr, 0)];
  }

  void freeLevel(uint64_t tablePa, int level) {
    if (level > 0) {
      uint64_t* t = table(tablePa);
      for (size_t i = 0; i < NPT_ENTRIES; i++) {
        if (Format::isPresent(t[i])) freeLevel(Format::entryAddr(t[i]), level - 1);
      }
    }
    frames.freeFrame(tablePa);
  }

  FrameAllocator& frames;
  uint64_t rootPhysAddr;
};

}  // namespace HyperEnclave
