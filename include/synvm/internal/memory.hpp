#pragma once
#include "synvm/internal/vm.h"
#include "synvm/vm_api.h"

/**
 * Operand addressing helpers used by every opcode handler.
 *  - 0..32767      literal value
 *  - 32768..32775  register r0..r7
 *  - 32776..65535  invalid
 * A rejected operand is recorded in vm->fault_arg.
 */

synvm_err vm_operand_load(Vm *vm, synvm_word operand, synvm_word *out);
synvm_err vm_operand_set(Vm *vm, synvm_word dest, synvm_word src);

/* Fetch the word at pc and advance pc. */
synvm_err vm_fetch(Vm *vm, synvm_word *out);

static inline bool synvm_is_register(synvm_u32 operand)
{
  return operand >= SYNVM_REG_BASE && operand <= SYNVM_REG_LAST;
}

/* Destination check. Returns 0 or InvalidStore (-2). */
static inline synvm_err synvm_check_dest(Vm *vm, synvm_word dest)
{
  if (synvm_is_register(dest))
    return 0;
  vm->fault_arg = dest;
  return -2;
}

/* Range check within memory. Returns 0 or the given error code. */
static inline synvm_err synvm_check_addr(Vm *vm, synvm_u32 addr, synvm_err err)
{
  if (addr < SYNVM_MEM_WORDS)
    return 0;
  vm->fault_arg = addr;
  return err;
}
