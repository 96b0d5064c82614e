//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include "Config.hpp"

/* Exactly one backend is compiled in. All of them expose the same
 * member set, so callers bind statically to VendorBackend. */
#if defined(HYPERENCLAVE_VENDOR_SIM)
#include "SimBackend.hpp"
#elif defined(HYPERENCLAVE_VENDOR_AMD)
#include "SvmBackend.hpp"
#else
#include "VmxBackend.hpp"
#endif

namespace HyperEnclave {

#if defined(HYPERENCLAVE_VENDOR_SIM)
typedef SimBackend VendorBackend;
#elif defined(HYPERENCLAVE_VENDOR_AMD)
typedef SvmBackend VendorBackend;
#else
typedef VmxBackend VendorBackend;
#endif

typedef VendorBackend::PageTable GuestPageTable;

}  // namespace HyperEnclave
