// src/snapshot.cpp: full VM state serialization (little-endian 16-bit words)
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "synvm/errors.hpp"
#include "synvm/internal/vm.h"
#include "synvm/vm_api.h"

/* ---- Little-endian helpers ---- */
static inline synvm_word ld_le16(const uint8_t *p)
{
  return (synvm_word)((uint16_t)p[0] | ((uint16_t)p[1] << 8));
}
static inline void st_le16(uint8_t *p, uint16_t v)
{
  p[0] = (uint8_t)(v & 0xFF);
  p[1] = (uint8_t)((v >> 8) & 0xFF);
}

extern "C" size_t vm_snapshot_size(const struct Vm *vm)
{
  if (!vm)
    return 0;
  return (SYNVM_SNAPSHOT_HEADER_WORDS + (size_t)vm->stack_depth) * 2u;
}

extern "C" synvm_err vm_snapshot_save(const struct Vm *vm, synvm_u8 *buf, size_t cap,
                                      size_t *written)
{
  if (!vm || !buf)
    return SYNVM_ERR(InvalidArg);

  const size_t need = vm_snapshot_size(vm);
  if (cap < need)
    return SYNVM_ERR(InvalidArg);

  // mem ++ regs ++ pc ++ stack (bottom to top)
  synvm_u8 *p = buf;
  for (synvm_u32 i = 0; i < SYNVM_MEM_WORDS; ++i, p += 2)
    st_le16(p, vm->mem[i]);
  for (synvm_u32 i = 0; i < SYNVM_REG_COUNT; ++i, p += 2)
    st_le16(p, vm->regs[i]);
  st_le16(p, (uint16_t)vm->pc);
  p += 2;
  for (uint32_t i = 0; i < vm->stack_depth; ++i, p += 2)
    st_le16(p, vm->stack[i]);

  if (written)
    *written = need;
  return SYNVM_ERR(OK);
}

extern "C" synvm_err vm_snapshot_restore(struct Vm *vm, const synvm_u8 *data, size_t len)
{
  if (!vm || !data)
    return SYNVM_ERR(InvalidArg);

  const size_t header = SYNVM_SNAPSHOT_HEADER_WORDS * 2u;
  if (len < header || (len & 1u))
    return SYNVM_ERR(TruncatedSnapshot);

  // Stack depth is implied by whatever follows the fixed part
  const size_t depth = (len - header) / 2u;
  if (depth > UINT32_MAX)
    return SYNVM_ERR(TruncatedSnapshot);
  if (synvm_err e = vm_stack_reserve(vm, (uint32_t)depth))
    return e;

  const synvm_u8 *p = data;
  for (synvm_u32 i = 0; i < SYNVM_MEM_WORDS; ++i, p += 2)
    vm->mem[i] = ld_le16(p);
  for (synvm_u32 i = 0; i < SYNVM_REG_COUNT; ++i, p += 2)
    vm->regs[i] = ld_le16(p);
  vm->pc = ld_le16(p);
  p += 2;
  for (size_t i = 0; i < depth; ++i, p += 2)
    vm->stack[i] = ld_le16(p);
  vm->stack_depth = (uint32_t)depth;

  vm->last_err = 0;
  vm->fault_arg = 0;
  return SYNVM_ERR(OK);
}

extern "C" struct Vm *vm_create_from_snapshot(const VmConfig *cfg, const synvm_u8 *data,
                                              size_t len, synvm_err *err)
{
  synvm_err e = SYNVM_ERR(OK);
  Vm *vm = vm_create(cfg);
  if (!vm)
    e = SYNVM_ERR(OutOfMemory);
  else if ((e = vm_snapshot_restore(vm, data, len)))
  {
    vm_destroy(vm);
    vm = nullptr;
  }
  if (err)
    *err = e;
  return vm;
}

/* ---- File helpers ---- */
extern "C" synvm_err vm_snapshot_save_file(const struct Vm *vm, const char *path)
{
  if (!vm || !path)
    return SYNVM_ERR(InvalidArg);

  const size_t size = vm_snapshot_size(vm);
  synvm_u8 *buf = (synvm_u8 *)::malloc(size);
  if (!buf)
    return SYNVM_ERR(OutOfMemory);

  synvm_err err = vm_snapshot_save(vm, buf, size, nullptr);
  if (!err)
  {
    FILE *f = fopen(path, "wb");
    if (!f)
      err = SYNVM_ERR(IoError);
    else
    {
      if (fwrite(buf, 1, size, f) != size)
        err = SYNVM_ERR(IoError);
      if (fclose(f) != 0)
        err = SYNVM_ERR(IoError);
    }
  }

  ::free(buf);
  return err;
}

extern "C" synvm_err vm_snapshot_load_file(struct Vm *vm, const char *path)
{
  if (!vm || !path)
    return SYNVM_ERR(InvalidArg);

  FILE *f = fopen(path, "rb");
  if (!f)
    return SYNVM_ERR(IoError);

  SynvmBuffer snap;
  synvm_buffer_init(&snap);

  synvm_err err = SYNVM_ERR(OK);
  synvm_u8 chunk[4096];
  size_t got;
  while (!err && (got = fread(chunk, 1, sizeof(chunk), f)) > 0)
    err = synvm_buffer_append(&snap, chunk, got);
  if (!err && ferror(f))
    err = SYNVM_ERR(IoError);
  fclose(f);

  if (!err)
    err = snap.data ? vm_snapshot_restore(vm, snap.data, snap.len)
                    : SYNVM_ERR(TruncatedSnapshot);
  synvm_buffer_free(&snap);
  return err;
}
