//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>
extern "C" {
#include "common/sha3.h"
}
#include "Error.hpp"

#define MDSIZE 64

namespace HyperEnclave {

typedef sha3_ctx_t hash_ctx_t;

void
hash_init(hash_ctx_t* hash_ctx);
void
hash_extend(hash_ctx_t* hash_ctx, const void* ptr, size_t len);
void
hash_extend_page(hash_ctx_t* hash_ctx, const void* ptr);
void
hash_finalize(void* md, hash_ctx_t* hash_ctx);

/* Running digest of an enclave's build. Extended while the enclave is
 * Building, sealed once at init; after that it is read-only. */
class Measurement {
 public:
  Measurement();

  void reset();
  Error extend(const void* ptr, size_t len);
  Error extendPage(const void* ptr);
  /* digest of everything extended so far, without sealing */
  void peek(uint8_t* md) const;
  Error seal();

  bool isSealed() const { return sealed; }
  const uint8_t* getDigest() const { return digest; }

 private:
  hash_ctx_t ctx;
  uint8_t digest[MDSIZE];
  bool sealed;
};

}  // namespace HyperEnclave
