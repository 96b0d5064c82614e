//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "EnclaveInstructions.hpp"
#include "Config.hpp"
#include "common.hpp"

namespace HyperEnclave {

EnclaveInstructions::EnclaveInstructions(
    EnclaveTable& enclaveTable, const GuestMemory& guestMemory)
    : table(enclaveTable), memory(guestMemory) {}

Error
EnclaveInstructions::create(const SecsParams& secs, EnclaveRef* ref) {
  return table.create(secs, ref);
}

Error
EnclaveInstructions::addPage(EnclaveRef ref, const PageInfo& info) {
  EpcPageType type;
  if (info.pageType == PAGE_TYPE_REG)
    type = EpcPageType::Regular;
  else if (info.pageType == PAGE_TYPE_TCS)
    type = EpcPageType::Tcs;
  else
    return Error::InvalidParameter;

  EnclaveTable::Guard enclave(table, ref);
  if (!enclave) return Error::NotFound;
  if (enclave->getState() != EnclaveState::Building) return Error::NotBuilding;

  uint8_t content[PAGE_SIZE];
  Error ret = memory.read(info.sourceAddress, content, PAGE_SIZE);
  if (ret != Error::Success) return ret;

  return enclave->addPage(
      info.linearAddress, content, type,
      static_cast<unsigned>(info.permissions));
}

Error
EnclaveInstructions::init(EnclaveRef ref, const uint8_t* expected) {
  EnclaveTable::Guard enclave(table, ref);
  if (!enclave) return Error::NotFound;
  return enclave->initialize(expected);
}

Error
EnclaveInstructions::destroy(EnclaveRef ref) {
  return table.destroy(ref);
}

Error
EnclaveInstructions::removePage(EnclaveRef ref, uint64_t linearAddress) {
  EnclaveTable::Guard enclave(table, ref);
  if (!enclave) return Error::NotFound;
  return enclave->removePage(linearAddress);
}

Error
EnclaveInstructions::enter(
    Vcpu& vcpu, EnclaveRef ref, uint64_t tcsAddr, uint64_t aep) {
  if (vcpu.getMode() == VcpuMode::InEnclave) return Error::InvalidState;

  EnclaveTable::Guard enclave(table, ref);
  if (!enclave) return Error::NotFound;

  Tcs* tcs;
  Error ret = enclave->enter(tcsAddr, false, &tcs);
  if (ret != Error::Success) return ret;
  tcs->setAep(aep);

  uint64_t base              = enclave->getBase();
  const TcsDescriptor& desc = tcs->getDescriptor();
  VendorBackend& cpu         = vcpu.getBackend();

  vcpu.enterEnclave(ref, tcs->getLinearAddress(), enclave->getPageTable());
  uint64_t returnAddress = vcpu.getHostSnapshot().get(Reg::Rip);
  uint64_t rflags        = cpu.getRegister(Reg::Rflags) & ~RFLAGS_IF;
  if (Config::kEnclaveInterrupt) rflags |= RFLAGS_IF;

  cpu.setRegister(Reg::Rax, tcs->getCssa());
  cpu.setRegister(Reg::Rcx, returnAddress);
  cpu.setRegister(Reg::Rip, base + desc.oentry);
  cpu.setRegister(Reg::Rsp, desc.stackPointer);
  cpu.setRegister(Reg::FsBase, base + desc.ofsbase);
  cpu.setRegister(Reg::GsBase, base + desc.ogsbase);
  cpu.setRegister(Reg::Rflags, rflags);
  /* no SYSCALL from inside an enclave */
  cpu.setRegister(Reg::Efer, cpu.getRegister(Reg::Efer) & ~EFER_SCE);

  HE_DEBUG(
      "CPU %u: enter enclave %#lx on TCS %#lx", vcpu.getId(), ref.toId(),
      tcs->getLinearAddress());
  return Error::Success;
}

Error
EnclaveInstructions::exit(Vcpu& vcpu, uint64_t target) {
  if (vcpu.getMode() != VcpuMode::InEnclave) return Error::NotInEnclave;

  EnclaveTable::Guard enclave(table, vcpu.getEnclave());
  Tcs* tcs = enclave ? enclave->findTcs(vcpu.getTcsAddress()) : NULL;
  if (!tcs) {
    vcpu.abandonEnclave();
    return Error::SecurityViolation;
  }

  VendorBackend& cpu = vcpu.getBackend();
  uint64_t rdi       = cpu.getRegister(Reg::Rdi);
  uint64_t rsi       = cpu.getRegister(Reg::Rsi);

  Error ret = enclave->leave(tcs);
  vcpu.leaveEnclave();
  if (ret != Error::Success) {
    cpu.setRegister(Reg::Rax, static_cast<uint64_t>(ret));
    return ret;
  }

  cpu.setRegister(Reg::Rdi, rdi);
  cpu.setRegister(Reg::Rsi, rsi);
  cpu.setRegister(Reg::Rip, target);
  cpu.setRegister(Reg::Rax, static_cast<uint64_t>(Error::Success));
  return Error::Success;
}

Error
EnclaveInstructions::resume(Vcpu& vcpu, uint64_t tcsAddr, uint64_t aep) {
  if (vcpu.getMode() == VcpuMode::InEnclave) return Error::InvalidState;

  EnclaveRef ref;
  if (!table.findByAddress(tcsAddr, &ref)) return Error::NotFound;
  EnclaveTable::Guard enclave(table, ref);
  if (!enclave) return Error::NotFound;

  Tcs* tcs;
  Error ret = enclave->enter(tcsAddr, true, &tcs);
  if (ret != Error::Success) return ret;

  SsaFrame frame;
  ret = tcs->popSsa(&frame);
  if (ret != Error::Success) {
    if (enclave->leave(tcs) != Error::Success)
      HE_WARN("enclave %#lx: cannot release TCS %#lx", ref.toId(), tcsAddr);
    return ret;
  }
  tcs->setAep(aep);

  vcpu.enterEnclave(ref, tcsAddr, enclave->getPageTable());
  vcpu.loadRegisters(frame.regs);
  HE_DEBUG(
      "CPU %u: resume enclave %#lx on TCS %#lx, cssa %u", vcpu.getId(),
      ref.toId(), tcsAddr, tcs->getCssa());
  return Error::Success;
}

void
EnclaveInstructions::emulate(Vcpu& vcpu, const ExitInfo& exit) {
  VendorBackend& cpu = vcpu.getBackend();
  uint64_t rbx       = cpu.getRegister(Reg::Rbx);
  uint64_t rcx       = cpu.getRegister(Reg::Rcx);
  uint64_t rdx       = cpu.getRegister(Reg::Rdx);
  HyperCallCode code = static_cast<HyperCallCode>(exit.hypercall);
  bool inEnclave     = vcpu.getMode() == VcpuMode::InEnclave;
  Error ret;

  switch (code) {
    case HyperCallCode::EnclaveCreate: {
      if (inEnclave) {
        ret = Error::InvalidState;
        break;
      }
      SecsParams secs;
      ret = memory.read(rbx, &secs, sizeof(secs));
      if (ret != Error::Success) break;
      EnclaveRef ref;
      ret = create(secs, &ref);
      if (ret == Error::Success) cpu.setRegister(Reg::Rbx, ref.toId());
      break;
    }
    case HyperCallCode::EnclaveAddPage: {
      if (inEnclave) {
        ret = Error::InvalidState;
        break;
      }
      PageInfo info;
      ret = memory.read(rcx, &info, sizeof(info));
      if (ret != Error::Success) break;
      ret = addPage(EnclaveRef::fromId(rbx), info);
      break;
    }
    case HyperCallCode::EnclaveInit: {
      if (inEnclave) {
        ret = Error::InvalidState;
        break;
      }
      uint8_t expected[MDSIZE];
      if (rcx) {
        ret = memory.read(rcx, expected, sizeof(expected));
        if (ret != Error::Success) break;
      }
      ret = init(EnclaveRef::fromId(rbx), rcx ? expected : NULL);
      break;
    }
    case HyperCallCode::EnclaveDestroy:
      ret = inEnclave ? Error::InvalidState : destroy(EnclaveRef::fromId(rbx));
      break;
    case HyperCallCode::EnclaveRemovePage:
      ret = inEnclave ? Error::InvalidState
                      : removePage(EnclaveRef::fromId(rbx), rcx);
      break;
    case HyperCallCode::EnclaveEnter: {
      EnclaveRef ref = EnclaveRef::fromId(rdx);
      if (rbx && !table.findByAddress(rbx, &ref)) {
        ret = Error::NotFound;
        break;
      }
      ret = enter(vcpu, ref, rbx, rcx);
      /* RAX already carries CSSA */
      if (ret == Error::Success) return;
      break;
    }
    case HyperCallCode::EnclaveExit:
      /* exit writes RAX itself */
      ret = this->exit(vcpu, rbx);
      if (ret == Error::Success || ret == Error::SecurityViolation) return;
      break;
    case HyperCallCode::EnclaveResume:
      ret = resume(vcpu, rbx, rcx);
      /* the whole register file came back from the SSA */
      if (ret == Error::Success) return;
      break;
    default:
      ret = Error::InvalidParameter;
      break;
  }

  if (ret != Error::Success) {
    HE_DEBUG(
        "CPU %u: enclave instruction %#lx failed: %s", vcpu.getId(),
        exit.hypercall, errorString(ret));
  }
  cpu.setRegister(Reg::Rax, static_cast<uint64_t>(ret));
}

}  // namespace HyperEnclave
