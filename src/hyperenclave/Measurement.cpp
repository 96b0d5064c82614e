//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "Measurement.hpp"
#include <string.h>
#include "common.hpp"

namespace HyperEnclave {

void
hash_init(hash_ctx_t* hash_ctx) {
  sha3_init(hash_ctx, MDSIZE);
}

void
hash_extend(hash_ctx_t* hash_ctx, const void* ptr, size_t len) {
  sha3_update(hash_ctx, ptr, len);
}

void
hash_extend_page(hash_ctx_t* hash_ctx, const void* ptr) {
  sha3_update(hash_ctx, ptr, PAGE_SIZE);
}

void
hash_finalize(void* md, hash_ctx_t* hash_ctx) {
  sha3_final(md, hash_ctx);
}

Measurement::Measurement() { reset(); }

void
Measurement::reset() {
  hash_init(&ctx);
  memset(digest, 0, sizeof(digest));
  sealed = false;
}

Error
Measurement::extend(const void* ptr, size_t len) {
  if (sealed) return Error::AlreadyInitialized;
  hash_extend(&ctx, ptr, len);
  return Error::Success;
}

Error
Measurement::extendPage(const void* ptr) {
  if (sealed) return Error::AlreadyInitialized;
  hash_extend_page(&ctx, ptr);
  return Error::Success;
}

void
Measurement::peek(uint8_t* md) const {
  /* sha3_final destroys the context, so finalize a copy */
  hash_ctx_t copy = ctx;
  hash_finalize(md, &copy);
}

Error
Measurement::seal() {
  if (sealed) return Error::AlreadyInitialized;
  hash_finalize(digest, &ctx);
  sealed = true;
  return Error::Success;
}

}  // namespace HyperEnclave
