// src/memory.cpp: lifecycle, program image, operand addressing, state access
#include "synvm/internal/memory.hpp"  // vm_operand_load / vm_operand_set + checks

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

/* ---- Transport wiring ---- */
static synvm_err check_config(const VmConfig *cfg)
{
  if (!cfg)
    return SYNVM_ERR(OK);
  if (cfg->input_kind == SYNVM_IO_CUSTOM && !cfg->input.read)
    return SYNVM_ERR(InvalidArg);
  if (cfg->output_kind == SYNVM_IO_CUSTOM && !cfg->output.write)
    return SYNVM_ERR(InvalidArg);
  if (cfg->input_kind > SYNVM_IO_CUSTOM || cfg->output_kind > SYNVM_IO_CUSTOM)
    return SYNVM_ERR(InvalidArg);
  return SYNVM_ERR(OK);
}

// Point the endpoint descriptors at the selected transports. Buffered
// endpoints always refer to this VM's own buffers.
static void bind_transports(Vm *vm, const VmConfig *cfg)
{
  vm->input_kind = cfg ? cfg->input_kind : SYNVM_IO_BUFFER;
  vm->output_kind = cfg ? cfg->output_kind : SYNVM_IO_BUFFER;

  switch (vm->input_kind)
  {
    case SYNVM_IO_TERMINAL:
      vm->input = synvm_terminal_input(nullptr);
      break;
    case SYNVM_IO_DISCARD:
      vm->input = synvm_discard_input();
      break;
    case SYNVM_IO_CUSTOM:
      vm->input = cfg->input;
      break;
    case SYNVM_IO_BUFFER:
    default:
      vm->input = synvm_buffer_input(&vm->in_buf);
      break;
  }

  switch (vm->output_kind)
  {
    case SYNVM_IO_TERMINAL:
      vm->output = synvm_terminal_output(nullptr);
      break;
    case SYNVM_IO_DISCARD:
      vm->output = synvm_discard_output();
      break;
    case SYNVM_IO_CUSTOM:
      vm->output = cfg->output;
      break;
    case SYNVM_IO_BUFFER:
    default:
      vm->output = synvm_buffer_output(&vm->out_buf);
      break;
  }
}

/* ---- public API: lifecycle ---- */
extern "C" struct Vm *vm_create(const VmConfig *cfg)
{
  if (check_config(cfg))
    return nullptr;

  Vm *vm = (Vm *)::calloc(1, sizeof(Vm));
  if (!vm)
    return nullptr;

  synvm_buffer_init(&vm->in_buf);
  synvm_buffer_init(&vm->out_buf);
  bind_transports(vm, cfg);
  vm_reset(vm);
  return vm;
}

extern "C" struct Vm *vm_create_from_image(const VmConfig *cfg, const synvm_u8 *data,
                                           size_t len, synvm_err *err)
{
  synvm_err e = check_config(cfg);
  Vm *vm = e ? nullptr : vm_create(cfg);
  if (!e && !vm)
    e = SYNVM_ERR(OutOfMemory);
  if (vm)
  {
    e = vm_load_image(vm, data, len);
    if (e)
    {
      vm_destroy(vm);
      vm = nullptr;
    }
  }
  if (err)
    *err = e;
  return vm;
}

extern "C" void vm_reset(struct Vm *vm)
{
  if (!vm)
    return;

  ::memset(vm->regs, 0, sizeof(vm->regs));
  vm->stack_depth = 0;
  vm->pc = 0;
  vm->last_err = 0;
  vm->fault_arg = 0;
}

extern "C" struct Vm *vm_clone(const struct Vm *src)
{
  if (!src)
    return nullptr;

  VmConfig cfg;
  cfg.input_kind = src->input_kind;
  cfg.input = src->input;
  cfg.output_kind = src->output_kind;
  cfg.output = src->output;

  Vm *vm = vm_create(&cfg);
  if (!vm)
    return nullptr;

  ::memcpy(vm->mem, src->mem, sizeof(vm->mem));
  ::memcpy(vm->regs, src->regs, sizeof(vm->regs));
  vm->pc = src->pc;
  vm->last_err = src->last_err;
  vm->fault_arg = src->fault_arg;
  vm->panic_handler = src->panic_handler;
  vm->panic_user_data = src->panic_user_data;

  bool ok = vm_stack_reserve(vm, src->stack_depth) == 0;
  if (ok && src->stack_depth)
  {
    ::memcpy(vm->stack, src->stack, src->stack_depth * sizeof(synvm_word));
    vm->stack_depth = src->stack_depth;
  }
  if (ok && src->input_kind == SYNVM_IO_BUFFER)
    ok = synvm_buffer_copy(&vm->in_buf, &src->in_buf) == 0;
  if (ok && src->output_kind == SYNVM_IO_BUFFER)
    ok = synvm_buffer_copy(&vm->out_buf, &src->out_buf) == 0;

  if (!ok)
  {
    vm_destroy(vm);
    return nullptr;
  }
  return vm;
}

extern "C" void vm_destroy(struct Vm *vm)
{
  if (!vm)
    return;

  ::free(vm->stack);
  synvm_buffer_free(&vm->in_buf);
  synvm_buffer_free(&vm->out_buf);
  ::free(vm);
}

/* ---- Stack storage ---- */
extern "C" synvm_err vm_stack_reserve(Vm *vm, uint32_t count)
{
  if (count <= vm->stack_cap)
    return SYNVM_ERR(OK);

  uint32_t cap = vm->stack_cap ? vm->stack_cap : 16;
  while (cap < count)
    cap *= 2;

  synvm_word *p = (synvm_word *)::realloc(vm->stack, cap * sizeof(synvm_word));
  if (!p)
    return SYNVM_ERR(OutOfMemory);
  vm->stack = p;
  vm->stack_cap = cap;
  return SYNVM_ERR(OK);
}

extern "C" synvm_err vm_stack_push_raw(Vm *vm, synvm_word v)
{
  if (synvm_err e = vm_stack_reserve(vm, vm->stack_depth + 1))
    return e;
  vm->stack[vm->stack_depth++] = v;
  return SYNVM_ERR(OK);
}

/* ---- Operand addressing ---- */
synvm_err vm_operand_load(Vm *vm, synvm_word operand, synvm_word *out)
{
  if (operand <= SYNVM_MAX_LITERAL)
  {
    *out = operand;
    return SYNVM_ERR(OK);
  }
  if (synvm_is_register(operand))
  {
    *out = vm->regs[operand - SYNVM_REG_BASE];
    return SYNVM_ERR(OK);
  }
  vm->fault_arg = operand;
  return SYNVM_ERR(InvalidLoad);
}

synvm_err vm_operand_set(Vm *vm, synvm_word dest, synvm_word src)
{
  // Source first: an invalid source wins over an invalid destination
  synvm_word value;
  if (synvm_err e = vm_operand_load(vm, src, &value))
    return e;
  if (synvm_err e = synvm_check_dest(vm, dest))
    return e;

  vm->regs[dest - SYNVM_REG_BASE] = value;
  return SYNVM_ERR(OK);
}

synvm_err vm_fetch(Vm *vm, synvm_word *out)
{
  if (synvm_err e = synvm_check_addr(vm, vm->pc, SYNVM_ERR(InvalidLoad)))
    return e;
  *out = vm->mem[vm->pc++];
  return SYNVM_ERR(OK);
}

/* ---- public API: program image ---- */
extern "C" synvm_err vm_load_image(struct Vm *vm, const synvm_u8 *data, size_t len)
{
  if (!vm || (!data && len))
    return SYNVM_ERR(InvalidArg);
  if (len & 1u)
    return SYNVM_ERR(TruncatedImage);
  if (len / 2 > SYNVM_MEM_WORDS)
    return SYNVM_ERR(ImageTooLarge);

  for (size_t i = 0; i < len / 2; ++i)
    vm->mem[i] = ld_le16(&data[i * 2]);
  return SYNVM_ERR(OK);
}

extern "C" synvm_err vm_load_image_file(struct Vm *vm, const char *path)
{
  if (!vm || !path)
    return SYNVM_ERR(InvalidArg);

  FILE *f = fopen(path, "rb");
  if (!f)
    return SYNVM_ERR(IoError);

  SynvmBuffer image;
  synvm_buffer_init(&image);

  synvm_err err = SYNVM_ERR(OK);
  synvm_u8 chunk[4096];
  size_t got;
  while (!err && (got = fread(chunk, 1, sizeof(chunk), f)) > 0)
    err = synvm_buffer_append(&image, chunk, got);
  if (!err && ferror(f))
    err = SYNVM_ERR(IoError);
  fclose(f);

  if (!err)
    err = vm_load_image(vm, image.data, image.len);
  synvm_buffer_free(&image);
  return err;
}

/* ---- public API: fault state ---- */
extern "C" synvm_err vm_last_error(const struct Vm *vm)
{
  return vm ? vm->last_err : SYNVM_ERR(InvalidArg);
}

extern "C" synvm_u32 vm_fault_arg(const struct Vm *vm)
{
  return vm ? vm->fault_arg : 0;
}

/* ---- public API: guest I/O ---- */
extern "C" synvm_err vm_input_append(struct Vm *vm, const synvm_u8 *data, size_t len)
{
  if (!vm)
    return SYNVM_ERR(InvalidArg);
  if (vm->input_kind != SYNVM_IO_BUFFER)
    return SYNVM_ERR(NotBuffered);
  // Consumed input is never re-read
  synvm_buffer_compact(&vm->in_buf);
  return synvm_buffer_append(&vm->in_buf, data, len);
}

extern "C" synvm_err vm_input_append_str(struct Vm *vm, const char *text)
{
  if (!text)
    return SYNVM_ERR(InvalidArg);
  return vm_input_append(vm, (const synvm_u8 *)text, strlen(text));
}

extern "C" size_t vm_input_pending(const struct Vm *vm)
{
  if (!vm || vm->input_kind != SYNVM_IO_BUFFER)
    return 0;
  return synvm_buffer_pending(&vm->in_buf);
}

extern "C" const synvm_u8 *vm_output_data(const struct Vm *vm, size_t *len)
{
  if (!vm || vm->output_kind != SYNVM_IO_BUFFER || vm->out_buf.len == 0)
  {
    if (len)
      *len = 0;
    return nullptr;
  }
  if (len)
    *len = vm->out_buf.len;
  return vm->out_buf.data;
}

extern "C" size_t vm_output_size(const struct Vm *vm)
{
  if (!vm || vm->output_kind != SYNVM_IO_BUFFER)
    return 0;
  return vm->out_buf.len;
}

extern "C" int vm_output_read(struct Vm *vm, synvm_u8 *dst, int max_count)
{
  if (!vm || !dst || max_count < 0)
    return SYNVM_ERR(InvalidArg);
  if (vm->output_kind != SYNVM_IO_BUFFER)
    return SYNVM_ERR(NotBuffered);

  size_t avail = synvm_buffer_pending(&vm->out_buf);
  size_t n = avail < (size_t)max_count ? avail : (size_t)max_count;
  if (n)
    ::memcpy(dst, vm->out_buf.data + vm->out_buf.pos, n);
  vm->out_buf.pos += n;
  return (int)n;
}

extern "C" size_t vm_output_tell(const struct Vm *vm)
{
  if (!vm || vm->output_kind != SYNVM_IO_BUFFER)
    return 0;
  return vm->out_buf.pos;
}

extern "C" synvm_err vm_output_seek(struct Vm *vm, size_t pos)
{
  if (!vm)
    return SYNVM_ERR(InvalidArg);
  if (vm->output_kind != SYNVM_IO_BUFFER)
    return SYNVM_ERR(NotBuffered);
  if (pos > vm->out_buf.len)
    return SYNVM_ERR(InvalidArg);
  vm->out_buf.pos = pos;
  return SYNVM_ERR(OK);
}

extern "C" synvm_err vm_output_clear(struct Vm *vm)
{
  if (!vm)
    return SYNVM_ERR(InvalidArg);
  if (vm->output_kind != SYNVM_IO_BUFFER)
    return SYNVM_ERR(NotBuffered);
  synvm_buffer_clear(&vm->out_buf);
  return SYNVM_ERR(OK);
}

/* ---- public API: registers, memory, pc ---- */
extern "C" synvm_u32 vm_get_pc(const struct Vm *vm)
{
  return vm ? vm->pc : 0;
}

extern "C" synvm_err vm_set_pc(struct Vm *vm, synvm_u32 pc)
{
  if (!vm || pc >= SYNVM_MEM_WORDS)
    return SYNVM_ERR(InvalidArg);
  vm->pc = pc;
  return SYNVM_ERR(OK);
}

extern "C" synvm_word vm_get_reg(const struct Vm *vm, int idx)
{
  if (!vm || idx < 0 || idx >= (int)SYNVM_REG_COUNT)
    return 0;
  return vm->regs[idx];
}

extern "C" synvm_err vm_set_reg(struct Vm *vm, int idx, synvm_word value)
{
  if (!vm || idx < 0 || idx >= (int)SYNVM_REG_COUNT || value > SYNVM_MAX_LITERAL)
    return SYNVM_ERR(InvalidArg);
  vm->regs[idx] = value;
  return SYNVM_ERR(OK);
}

extern "C" synvm_err vm_mem_read(const struct Vm *vm, synvm_u32 addr, synvm_word *out)
{
  if (!vm || !out)
    return SYNVM_ERR(InvalidArg);
  if (addr >= SYNVM_MEM_WORDS)
    return SYNVM_ERR(InvalidLoad);
  *out = vm->mem[addr];
  return SYNVM_ERR(OK);
}

extern "C" synvm_err vm_mem_write(struct Vm *vm, synvm_u32 addr, synvm_word value)
{
  if (!vm)
    return SYNVM_ERR(InvalidArg);
  if (addr >= SYNVM_MEM_WORDS)
    return SYNVM_ERR(InvalidStore);
  vm->mem[addr] = value;
  return SYNVM_ERR(OK);
}

/* ---- public API: stack ---- */
extern "C" int vm_stack_depth(const struct Vm *vm)
{
  if (!vm)
    return 0;
  return (int)vm->stack_depth;
}

extern "C" synvm_word vm_stack_peek(const struct Vm *vm, int index_from_top)
{
  if (!vm || index_from_top < 0 || (uint32_t)index_from_top >= vm->stack_depth)
    return 0;  // Out of range
  return vm->stack[vm->stack_depth - 1 - (uint32_t)index_from_top];
}

extern "C" int vm_stack_copy_to_array(const struct Vm *vm, synvm_word *out_array,
                                      int max_count)
{
  if (!vm || !out_array || max_count <= 0)
    return 0;

  int depth = (int)vm->stack_depth;
  int copy_count = (depth < max_count) ? depth : max_count;

  // Copy stack from bottom to top
  if (copy_count)
    ::memcpy(out_array, vm->stack, copy_count * sizeof(synvm_word));
  return copy_count;
}

extern "C" synvm_err vm_stack_push(struct Vm *vm, synvm_word value)
{
  if (!vm || value > SYNVM_MAX_LITERAL)
    return SYNVM_ERR(InvalidArg);
  return vm_stack_push_raw(vm, value);
}

extern "C" synvm_err vm_stack_pop(struct Vm *vm, synvm_word *out_value)
{
  if (!vm)
    return SYNVM_ERR(InvalidArg);
  if (vm->stack_depth == 0)
    return SYNVM_ERR(PopFromEmptyStack);

  synvm_word v = vm->stack[--vm->stack_depth];
  if (out_value)
    *out_value = v;
  return SYNVM_ERR(OK);
}
