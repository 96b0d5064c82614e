//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "Enclave.hpp"
#include <string.h>
#include <mutex>

namespace HyperEnclave {

/* measurement record tags, zero padded to 8 bytes */
static const char kTagCreate[8] = "ECREATE";
static const char kTagAdd[8]    = "EADD";

const char*
enclaveStateString(EnclaveState state) {
  switch (state) {
    case EnclaveState::Uninitialized:
      return "Uninitialized";
    case EnclaveState::Building:
      return "Building";
    case EnclaveState::Initialized:
      return "Initialized";
    case EnclaveState::Running:
      return "Running";
    case EnclaveState::Suspended:
      return "Suspended";
    case EnclaveState::Destroyed:
      return "Destroyed";
  }
  return "Unknown";
}

Tcs::Tcs(uint64_t addr, EpcPageHandle handle, const TcsDescriptor& d)
    : ssa(d.nssa), busy(false) {
  linearAddress = addr;
  page          = handle;
  desc          = d;
  cssa          = 0;
  aep           = 0;
}

bool
Tcs::tryAcquire() {
  bool expected = false;
  return busy.compare_exchange_strong(
      expected, true, std::memory_order_acq_rel);
}

void
Tcs::release() {
  busy.store(false, std::memory_order_release);
}

Error
Tcs::pushSsa(const SsaFrame& frame) {
  if (cssa >= ssa.size()) return Error::SsaOverflow;
  ssa[cssa++] = frame;
  return Error::Success;
}

Error
Tcs::popSsa(SsaFrame* frame) {
  if (cssa == 0) return Error::InvalidState;
  cssa--;
  *frame = ssa[cssa];
  /* the frame held enclave secrets */
  memset(&ssa[cssa], 0, sizeof(SsaFrame));
  return Error::Success;
}

Enclave::Enclave(EpcAllocator& epcAllocator, FrameAllocator& frameAllocator)
    : epc(epcAllocator), pageTable(frameAllocator) {
  self         = EnclaveRef::none();
  state        = EnclaveState::Uninitialized;
  base         = 0;
  size         = 0;
  ssaFrameSize = 0;
  xfrm         = 0;
  attributes   = 0;
  secsPage     = 0;
  hasSecsPage  = false;
  busyCount    = 0;
}

Enclave::~Enclave() {
  if (state != EnclaveState::Uninitialized &&
      state != EnclaveState::Destroyed) {
    forceDestroy();
  }
  for (size_t i = 0; i < threads.size(); i++) delete threads[i];
}

void
Enclave::setState(EnclaveState next) {
  if (next == EnclaveState::Running || next == EnclaveState::Suspended) {
    HE_DEBUG(
        "enclave %#lx: %s -> %s", self.toId(),
        enclaveStateString(getState()), enclaveStateString(next));
  } else {
    HE_INFO(
        "enclave %#lx: %s -> %s", self.toId(),
        enclaveStateString(getState()), enclaveStateString(next));
  }
  state.store(next, std::memory_order_release);
}

Error
Enclave::create(EnclaveRef ref, const SecsParams& secs) {
  std::lock_guard<SpinLock> guard(lock);
  if (state != EnclaveState::Uninitialized) return Error::InvalidState;

  if (!secs.size || !IS_ALIGNED(secs.base, PAGE_SIZE) ||
      !IS_ALIGNED(secs.size, PAGE_SIZE))
    return Error::InvalidRange;
  if (secs.base >= HE_MAX_LINEAR_ADDR ||
      secs.size > HE_MAX_LINEAR_ADDR - secs.base)
    return Error::InvalidRange;
  if ((secs.xfrm & (XCR0_X87 | XCR0_SSE)) != (XCR0_X87 | XCR0_SSE))
    return Error::InvalidParameter;
  if (!secs.ssaFrameSize) return Error::InvalidParameter;

  Error ret = pageTable.init();
  if (ret != Error::Success) return ret;

  EpcPageHandle secsHandle;
  ret = epc.allocate(EpcPageType::Secs, ref, &secsHandle);
  if (ret != Error::Success) {
    pageTable.clear();
    return ret;
  }
  memcpy(epc.getPtr(secsHandle), &secs, sizeof(secs));

  self         = ref;
  base         = secs.base;
  size         = secs.size;
  ssaFrameSize = secs.ssaFrameSize;
  xfrm         = secs.xfrm;
  attributes   = secs.attributes;
  secsPage     = secsHandle;
  hasSecsPage  = true;

  /* a freshly reset digest always takes the create record */
  measurement.reset();
  if (measurement.extend(kTagCreate, sizeof(kTagCreate)) != Error::Success ||
      measurement.extend(&ssaFrameSize, sizeof(ssaFrameSize)) !=
          Error::Success ||
      measurement.extend(&size, sizeof(size)) != Error::Success) {
    HE_ERROR("enclave %#lx: cannot start measurement", self.toId());
  }

  setState(EnclaveState::Building);
  return Error::Success;
}

Error
Enclave::addPage(
    uint64_t linearAddress, const void* src, EpcPageType type,
    unsigned perms) {
  std::lock_guard<SpinLock> guard(lock);
  if (state != EnclaveState::Building) return Error::NotBuilding;

  if (!IS_ALIGNED(linearAddress, PAGE_SIZE) || !contains(linearAddress))
    return Error::InvalidRange;
  if (pages.count(linearAddress)) return Error::InvalidRange;
  if (type == EpcPageType::Secs) return Error::InvalidParameter;
  if (perms & ~Perm::All) return Error::InvalidParameter;
  /* the hypervisor owns TCS pages; the enclave cannot touch them */
  if (type == EpcPageType::Tcs) perms = Perm::None;
  else if (perms == Perm::None) return Error::InvalidParameter;

  TcsDescriptor desc;
  memset(&desc, 0, sizeof(desc));
  if (type == EpcPageType::Tcs) {
    memcpy(&desc, src, sizeof(desc));
    if (desc.nssa == 0 || desc.nssa > Config::kMaxSsaFrames ||
        desc.oentry >= size || desc.ofsbase >= size || desc.ogsbase >= size)
      return Error::InvalidParameter;
  }

  EpcPageHandle handle;
  Error ret = epc.allocate(type, self, &handle);
  if (ret != Error::Success) return ret;
  memcpy(epc.getPtr(handle), src, PAGE_SIZE);

  if (perms != Perm::None) {
    ret = VendorBackend::mapGuestPhysical(
        pageTable, linearAddress, epc.getPhysAddr(handle), perms, true);
    if (ret != Error::Success) {
      if (epc.reclaim(handle) != Error::Success ||
          epc.free(handle) != Error::Success) {
        HE_ERROR("cannot return EPC page %u after a failed map", handle);
      }
      return ret;
    }
  }

  if (type == EpcPageType::Tcs)
    threads.push_back(new Tcs(linearAddress, handle, desc));

  EnclavePage page = {handle, type, perms};
  pages[linearAddress] = page;

  /* measure the EPC copy, not the guest buffer it came from */
  uint64_t record[3] = {linearAddress - base,
                        static_cast<uint64_t>(type), perms};
  if (measurement.extend(kTagAdd, sizeof(kTagAdd)) != Error::Success ||
      measurement.extend(record, sizeof(record)) != Error::Success ||
      measurement.extendPage(epc.getPtr(handle)) != Error::Success) {
    HE_ERROR(
        "enclave %#lx: digest sealed while building", self.toId());
  }

  HE_DEBUG(
      "enclave %#lx: added %s page at %#lx", self.toId(),
      type == EpcPageType::Tcs ? "TCS" : "regular", linearAddress);
  return Error::Success;
}

Error
Enclave::checkIntegrityLocked() {
  EpcPageState expected;
  switch (getState()) {
    case EnclaveState::Building:
      expected = EpcPageState::Pending;
      break;
    case EnclaveState::Initialized:
    case EnclaveState::Running:
    case EnclaveState::Suspended:
      expected = EpcPageState::Valid;
      break;
    default:
      return Error::InvalidState;
  }

  if (!hasSecsPage || !epc.checkOwner(secsPage, self, expected))
    return Error::SecurityViolation;
  for (std::map<uint64_t, EnclavePage>::const_iterator it = pages.begin();
       it != pages.end(); ++it) {
    if (!epc.checkOwner(it->second.handle, self, expected)) {
      HE_ERROR(
          "enclave %#lx: EPC page %u at %#lx has lost its owner or state",
          self.toId(), it->second.handle, it->first);
      return Error::SecurityViolation;
    }
  }
  return Error::Success;
}

Error
Enclave::checkIntegrity() {
  std::lock_guard<SpinLock> guard(lock);
  return checkIntegrityLocked();
}

Error
Enclave::initialize(const uint8_t* expected) {
  std::lock_guard<SpinLock> guard(lock);
  if (state == EnclaveState::Initialized || state == EnclaveState::Running ||
      state == EnclaveState::Suspended)
    return Error::AlreadyInitialized;
  if (state != EnclaveState::Building) return Error::NotBuilding;

  if (checkIntegrityLocked() != Error::Success) {
    HE_ERROR("enclave %#lx: integrity check failed at init", self.toId());
    forceDestroyLocked();
    return Error::SecurityViolation;
  }

  if (expected) {
    uint8_t digest[MDSIZE];
    measurement.peek(digest);
    if (memcmp(digest, expected, MDSIZE) != 0) {
      HE_WARN("enclave %#lx: measurement mismatch", self.toId());
      return Error::InvalidMeasurement;
    }
  }

  Error ret = epc.validate(secsPage);
  for (std::map<uint64_t, EnclavePage>::const_iterator it = pages.begin();
       it != pages.end() && ret == Error::Success; ++it) {
    ret = epc.validate(it->second.handle);
  }
  if (ret != Error::Success) {
    /* a page changed state between the check and here */
    forceDestroyLocked();
    return Error::SecurityViolation;
  }

  ret = measurement.seal();
  if (ret != Error::Success) return ret;
  setState(EnclaveState::Initialized);
  return Error::Success;
}

Error
Enclave::releasePage(uint64_t linearAddress, const EnclavePage& page) {
  if (epc.getOwner(page.handle) != self) {
    /* someone else holds the frame now; never scrub it from here */
    HE_ERROR(
        "enclave %#lx: EPC page %u no longer belongs to it", self.toId(),
        page.handle);
    return Error::SecurityViolation;
  }

  Error ret = epc.block(page.handle);
  if (ret != Error::Success) return ret;
  if (page.perms != Perm::None &&
      pageTable.unmap(linearAddress) != Error::Success) {
    HE_WARN(
        "enclave %#lx: page %#lx was not mapped", self.toId(), linearAddress);
  }
  ret = epc.reclaim(page.handle);
  if (ret != Error::Success) return ret;
  return epc.free(page.handle);
}

void
Enclave::deleteThread(uint64_t linearAddress) {
  /* only reachable while Building, when no VCPU can hold a TCS */
  for (size_t i = 0; i < threads.size(); i++) {
    if (threads[i]->getLinearAddress() == linearAddress) {
      delete threads[i];
      threads.erase(threads.begin() + i);
      return;
    }
  }
}

void
Enclave::releaseResources() {
  for (std::map<uint64_t, EnclavePage>::const_iterator it = pages.begin();
       it != pages.end(); ++it) {
    Error ret = releasePage(it->first, it->second);
    if (ret != Error::Success) {
      HE_ERROR(
          "enclave %#lx: cannot release page at %#lx: %s", self.toId(),
          it->first, errorString(ret));
    }
  }
  pages.clear();
  /* TCS objects stay until the enclave object goes away: a VCPU that
   * raced with a forced destroy may still hold one */
  busyCount = 0;

  if (hasSecsPage) {
    EnclavePage secs = {secsPage, EpcPageType::Secs, Perm::None};
    Error ret        = releasePage(0, secs);
    if (ret != Error::Success) {
      HE_ERROR(
          "enclave %#lx: cannot release SECS: %s", self.toId(),
          errorString(ret));
    }
    hasSecsPage = false;
  }

  /* shared mirrors go with the table */
  pageTable.clear();
  measurement.reset();
}

Error
Enclave::removePage(uint64_t linearAddress) {
  std::lock_guard<SpinLock> guard(lock);
  if (state == EnclaveState::Uninitialized ||
      state == EnclaveState::Destroyed)
    return Error::InvalidState;

  std::map<uint64_t, EnclavePage>::iterator it =
      pages.find(PAGE_DOWN(linearAddress));
  if (it == pages.end()) return Error::NotFound;

  if (state != EnclaveState::Building) {
    /* the page is valid: pulling it out from under a live enclave
     * would hand its frame to someone else */
    HE_ERROR(
        "enclave %#lx: removal of valid page %#lx", self.toId(), it->first);
    forceDestroyLocked();
    return Error::SecurityViolation;
  }

  Error ret = releasePage(it->first, it->second);
  if (ret != Error::Success) return ret;
  if (it->second.type == EpcPageType::Tcs) deleteThread(it->first);
  pages.erase(it);
  return Error::Success;
}

Error
Enclave::destroy() {
  std::lock_guard<SpinLock> guard(lock);
  if (state == EnclaveState::Uninitialized ||
      state == EnclaveState::Destroyed)
    return Error::InvalidState;

  if (busyCount) {
    HE_WARN(
        "enclave %#lx: destroy refused, %u thread(s) busy", self.toId(),
        busyCount);
    return Error::EnclaveBusy;
  }

  releaseResources();
  setState(EnclaveState::Destroyed);
  return Error::Success;
}

void
Enclave::forceDestroy() {
  std::lock_guard<SpinLock> guard(lock);
  forceDestroyLocked();
}

void
Enclave::forceDestroyLocked() {
  if (state == EnclaveState::Destroyed) return;

  HE_ERROR(
      "enclave %#lx: forced destruction with %u busy thread(s)", self.toId(),
      busyCount);
  releaseResources();
  setState(EnclaveState::Destroyed);
}

Error
Enclave::enter(uint64_t tcsAddr, bool resume, Tcs** out) {
  std::lock_guard<SpinLock> guard(lock);
  if (state != EnclaveState::Initialized && state != EnclaveState::Running &&
      state != EnclaveState::Suspended)
    return Error::InvalidState;

  Tcs* tcs = NULL;
  if (tcsAddr) {
    Tcs* candidate = findTcsLocked(tcsAddr);
    if (!candidate) return Error::NotFound;
    if (candidate->tryAcquire()) tcs = candidate;
  } else {
    for (size_t i = 0; i < threads.size() && !tcs; i++) {
      if (threads[i]->tryAcquire()) tcs = threads[i];
    }
  }
  if (!tcs) return Error::NoIdleThread;

  if (!resume && tcs->getCssa() >= tcs->getNssa()) {
    tcs->release();
    return Error::SsaOverflow;
  }
  if (resume && tcs->getCssa() == 0) {
    tcs->release();
    return Error::InvalidState;
  }

  busyCount++;
  if (state != EnclaveState::Running) setState(EnclaveState::Running);
  *out = tcs;
  return Error::Success;
}

Error
Enclave::leave(Tcs* tcs) {
  std::lock_guard<SpinLock> guard(lock);
  if (state == EnclaveState::Destroyed) return Error::SecurityViolation;
  if (state != EnclaveState::Running || !tcs->isBusy())
    return Error::InvalidState;

  tcs->release();
  busyCount--;
  if (busyCount == 0) setState(EnclaveState::Suspended);
  return Error::Success;
}

Error
Enclave::mirrorSharedPage(uint64_t gpa, uint64_t hpa, unsigned perms) {
  std::lock_guard<SpinLock> guard(lock);
  if (state != EnclaveState::Running) return Error::InvalidState;
  if (contains(gpa)) return Error::InvalidRange;
  /* shared memory is never executable from inside */
  perms &= Perm::Read | Perm::Write;
  if (!(perms & Perm::Read)) return Error::InvalidParameter;
  return VendorBackend::mapGuestPhysical(
      pageTable, PAGE_DOWN(gpa), PAGE_DOWN(hpa), perms, false);
}

bool
Enclave::isPageMapped(uint64_t linearAddress) const {
  std::lock_guard<SpinLock> guard(lock);
  return pages.count(PAGE_DOWN(linearAddress)) != 0;
}

Tcs*
Enclave::findTcs(uint64_t linearAddress) const {
  std::lock_guard<SpinLock> guard(lock);
  return findTcsLocked(linearAddress);
}

size_t
Enclave::getPageCount() const {
  std::lock_guard<SpinLock> guard(lock);
  return pages.size();
}

size_t
Enclave::getTcsCount() const {
  std::lock_guard<SpinLock> guard(lock);
  return threads.size();
}

unsigned
Enclave::getBusyCount() const {
  std::lock_guard<SpinLock> guard(lock);
  return busyCount;
}

Tcs*
Enclave::findTcsLocked(uint64_t linearAddress) const {
  for (size_t i = 0; i < threads.size(); i++) {
    if (threads[i]->getLinearAddress() == linearAddress) return threads[i];
  }
  return NULL;
}

}  // namespace HyperEnclave
