#include <cstdint>
#include <cstdio>
#include <cstring>

#include "synvm/errors.hpp"
#include "synvm/internal/memory.hpp"
#include "synvm/internal/vm.h"
#include "synvm/opcodes.hpp"
#include "synvm/panic.h"
#include "synvm/vm_api.h"

extern "C" int synvm_vm_version(void)
{
  return 1;
}

/* ========================= Three-operand helpers ========================= */

// Operands of `op a b c`: destination register a, sources b and c resolved.
struct Ternary
{
  synvm_word a;
  synvm_word b;
  synvm_word c;
};

static inline synvm_err fetch_ternary(Vm* vm, Ternary* t)
{
  synvm_word ob, oc;
  if (synvm_err e = vm_fetch(vm, &t->a))
    return e;
  if (synvm_err e = vm_fetch(vm, &ob))
    return e;
  if (synvm_err e = vm_fetch(vm, &oc))
    return e;
  if (synvm_err e = vm_operand_load(vm, ob, &t->b))
    return e;
  if (synvm_err e = vm_operand_load(vm, oc, &t->c))
    return e;
  return SYNVM_ERR(OK);
}

// Store a literal result into register operand a.
static inline synvm_err store(Vm* vm, synvm_word a, synvm_u32 value)
{
  return vm_operand_set(vm, a, static_cast<synvm_word>(value % SYNVM_MODULUS));
}

/* ======================= Single instruction dispatch ===================== */

// Executes the instruction at pc. Every operand is validated before the
// instruction touches the stack, memory or transports.
static synvm_err exec_one(Vm* vm)
{
  synvm_word word;
  if (synvm_err e = vm_fetch(vm, &word))
    return e;

  synvm::Op op = static_cast<synvm::Op>(word);
  switch (op)
  {
    /* -------- Control -------- */
    case synvm::Op::HALT:
      return SYNVM_ERR(Halt);

    case synvm::Op::NOOP:
      return SYNVM_ERR(OK);

    /* -------- Registers and stack -------- */
    case synvm::Op::SET:
    {
      synvm_word a, b;
      if (synvm_err e = vm_fetch(vm, &a))
        return e;
      if (synvm_err e = vm_fetch(vm, &b))
        return e;
      return vm_operand_set(vm, a, b);
    }

    case synvm::Op::PUSH:
    {
      synvm_word a, v;
      if (synvm_err e = vm_fetch(vm, &a))
        return e;
      if (synvm_err e = vm_operand_load(vm, a, &v))
        return e;
      return vm_stack_push_raw(vm, v);
    }

    case synvm::Op::POP:
    {
      synvm_word a;
      if (synvm_err e = vm_fetch(vm, &a))
        return e;
      if (synvm_err e = synvm_check_dest(vm, a))
        return e;
      if (vm->stack_depth == 0)
        return SYNVM_ERR(PopFromEmptyStack);
      vm->regs[a - SYNVM_REG_BASE] = vm->stack[--vm->stack_depth];
      return SYNVM_ERR(OK);
    }

    /* -------- Comparison -------- */
    case synvm::Op::EQ:
    {
      Ternary t;
      if (synvm_err e = fetch_ternary(vm, &t))
        return e;
      return store(vm, t.a, t.b == t.c ? 1u : 0u);
    }

    case synvm::Op::GT:
    {
      Ternary t;
      if (synvm_err e = fetch_ternary(vm, &t))
        return e;
      return store(vm, t.a, t.b > t.c ? 1u : 0u);
    }

    /* -------- Jumps -------- */
    case synvm::Op::JMP:
    {
      synvm_word a, target;
      if (synvm_err e = vm_fetch(vm, &a))
        return e;
      if (synvm_err e = vm_operand_load(vm, a, &target))
        return e;
      vm->pc = target;
      return SYNVM_ERR(OK);
    }

    case synvm::Op::JT:
    case synvm::Op::JF:
    {
      synvm_word a, b, cond, target;
      if (synvm_err e = vm_fetch(vm, &a))
        return e;
      if (synvm_err e = vm_fetch(vm, &b))
        return e;
      if (synvm_err e = vm_operand_load(vm, a, &cond))
        return e;
      if (synvm_err e = vm_operand_load(vm, b, &target))
        return e;
      bool taken = (op == synvm::Op::JT) ? cond != 0 : cond == 0;
      if (taken)
        vm->pc = target;
      return SYNVM_ERR(OK);
    }

    /* -------- Arithmetic (mod 32768, full-width intermediates) -------- */
    case synvm::Op::ADD:
    {
      Ternary t;
      if (synvm_err e = fetch_ternary(vm, &t))
        return e;
      return store(vm, t.a, (synvm_u32)t.b + (synvm_u32)t.c);
    }

    case synvm::Op::MULT:
    {
      Ternary t;
      if (synvm_err e = fetch_ternary(vm, &t))
        return e;
      return store(vm, t.a, (synvm_u32)t.b * (synvm_u32)t.c);
    }

    case synvm::Op::MOD:
    {
      Ternary t;
      if (synvm_err e = fetch_ternary(vm, &t))
        return e;
      if (synvm_err e = synvm_check_dest(vm, t.a))
        return e;
      if (t.c == 0)
        return SYNVM_ERR(DivByZero);
      return store(vm, t.a, (synvm_u32)t.b % (synvm_u32)t.c);
    }

    /* -------- Bitwise -------- */
    case synvm::Op::AND:
    {
      Ternary t;
      if (synvm_err e = fetch_ternary(vm, &t))
        return e;
      return store(vm, t.a, (synvm_u32)(t.b & t.c));
    }

    case synvm::Op::OR:
    {
      Ternary t;
      if (synvm_err e = fetch_ternary(vm, &t))
        return e;
      return store(vm, t.a, (synvm_u32)(t.b | t.c));
    }

    case synvm::Op::NOT:
    {
      synvm_word a, ob, b;
      if (synvm_err e = vm_fetch(vm, &a))
        return e;
      if (synvm_err e = vm_fetch(vm, &ob))
        return e;
      if (synvm_err e = vm_operand_load(vm, ob, &b))
        return e;
      return store(vm, a, (~(synvm_u32)b) & SYNVM_WORD_MASK);
    }

    /* -------- Memory -------- */
    case synvm::Op::RMEM:
    {
      synvm_word a, ob, addr;
      if (synvm_err e = vm_fetch(vm, &a))
        return e;
      if (synvm_err e = vm_fetch(vm, &ob))
        return e;
      if (synvm_err e = vm_operand_load(vm, ob, &addr))
        return e;
      if (synvm_err e = synvm_check_addr(vm, addr, SYNVM_ERR(InvalidLoad)))
        return e;
      // The cell is an operand: register words read through that register
      return vm_operand_set(vm, a, vm->mem[addr]);
    }

    case synvm::Op::WMEM:
    {
      synvm_word oa, ob, addr, v;
      if (synvm_err e = vm_fetch(vm, &oa))
        return e;
      if (synvm_err e = vm_fetch(vm, &ob))
        return e;
      if (synvm_err e = vm_operand_load(vm, oa, &addr))
        return e;
      if (synvm_err e = vm_operand_load(vm, ob, &v))
        return e;
      if (synvm_err e = synvm_check_addr(vm, addr, SYNVM_ERR(InvalidStore)))
        return e;
      vm->mem[addr] = v;
      return SYNVM_ERR(OK);
    }

    /* -------- Call / Return -------- */
    case synvm::Op::CALL:
    {
      synvm_word a, target;
      if (synvm_err e = vm_fetch(vm, &a))
        return e;
      if (synvm_err e = vm_operand_load(vm, a, &target))
        return e;
      // pc already points past the operand; it must itself be a literal
      if (synvm_err e = synvm_check_addr(vm, vm->pc, SYNVM_ERR(InvalidLoad)))
        return e;
      if (synvm_err e = vm_stack_push_raw(vm, static_cast<synvm_word>(vm->pc)))
        return e;
      vm->pc = target;
      return SYNVM_ERR(OK);
    }

    case synvm::Op::RET:
    {
      if (vm->stack_depth == 0)
        return SYNVM_ERR(Halt);
      vm->pc = vm->stack[--vm->stack_depth];
      return SYNVM_ERR(OK);
    }

    /* -------- Guest I/O -------- */
    case synvm::Op::OUT:
    {
      synvm_word a, v;
      if (synvm_err e = vm_fetch(vm, &a))
        return e;
      if (synvm_err e = vm_operand_load(vm, a, &v))
        return e;
      return vm->output.write(vm->output.user, static_cast<synvm_u8>(v & 0xFF));
    }

    case synvm::Op::IN:
    {
      synvm_word a;
      if (synvm_err e = vm_fetch(vm, &a))
        return e;
      if (synvm_err e = synvm_check_dest(vm, a))
        return e;

      synvm_u8 ch;
      do
      {
        synvm_err e = vm->input.read(vm->input.user, &ch);
        if (e == SYNVM_ERR(EndOfInput))
          return SYNVM_ERR(Halt);
        if (e)
          return e;
      } while (ch == '\r');  // CR of a CRLF line ending

      vm->regs[a - SYNVM_REG_BASE] = ch;
      return SYNVM_ERR(OK);
    }

    default:
      vm->fault_arg = word;
      return SYNVM_ERR(UnknownOpcode);
  }
}

/* =========================== Public API entry ============================ */

extern "C" synvm_err vm_step(struct Vm* vm)
{
  if (!vm)
    return SYNVM_ERR(InvalidArg);

  const synvm_u32 start_pc = vm->pc;
  synvm_err e = exec_one(vm);
  if (e)
  {
    // The instruction was not consumed; a retry re-executes it
    vm->pc = start_pc;
    vm->last_err = e;
    if (e != SYNVM_ERR(InvalidLoad) && e != SYNVM_ERR(InvalidStore) &&
        e != SYNVM_ERR(UnknownOpcode))
      vm->fault_arg = 0;
  }
  return e;
}

extern "C" synvm_err vm_run(struct Vm* vm)
{
  if (!vm)
    return SYNVM_ERR(InvalidArg);

  synvm_err e;
  while ((e = vm_step(vm)) == SYNVM_ERR(OK))
  {
  }

  if (e < 0)
    return vm_panic(vm, e);
  return e;
}
