#include "synvm/panic.h"

#include <inttypes.h>
#include <stdio.h>

#include "synvm/errors.h"
#include "synvm/errors.hpp"
#include "synvm/internal/vm.h"  // For Vm struct definition
#include "synvm/panic.hpp"
#include "synvm/vm_api.h"

extern "C"
{
  const char *synvm_err_str(int err)
  {
    return err_str(static_cast<Err>(err));
  }

  void vm_set_panic_handler(struct Vm *vm, SynvmPanicHandler handler, void *user_data)
  {
    if (!vm)
      return;

    vm->panic_handler = handler;
    vm->panic_user_data = user_data;
  }

  void vm_panic_info(const struct Vm *vm, int error_code, SynvmPanicInfo *info)
  {
    if (!vm || !info)
      return;

    *info = SynvmPanicInfo{};
    info->error_code = error_code;
    info->pc = vm_get_pc(vm);
    info->fault_arg = vm_fault_arg(vm);
    if (info->pc < SYNVM_MEM_WORDS)
      info->opcode = vm->mem[info->pc];

    for (int i = 0; i < (int)SYNVM_REG_COUNT; ++i)
      info->regs[i] = vm_get_reg(vm, i);

    info->stack_depth = (uint32_t)vm_stack_depth(vm);
    info->has_stack_data = (info->stack_depth > 0);

    // Top 4 stack values for custom handlers
    for (uint32_t i = 0; i < 4 && i < info->stack_depth; ++i)
      info->stack[i] = vm_stack_peek(vm, (int)i);
  }

  int vm_panic(struct Vm *vm, int error_code)
  {
    if (!vm)
      return error_code;

    SynvmPanicInfo info;
    vm_panic_info(vm, error_code, &info);

    // Output diagnostic information (stdout belongs to the guest)
    fprintf(stderr, "\n");
    fprintf(stderr, "========== SYNVM PANIC ==========\n");

    // Error information
    Err err = static_cast<Err>(error_code);
    fprintf(stderr, "Error: %s: %s (code=%d)\n", err_name(err), err_str(err), error_code);
    if (err == Err::InvalidLoad || err == Err::InvalidStore || err == Err::UnknownOpcode)
      fprintf(stderr, "Operand: %" PRIu32 " (0x%04" PRIX32 ")\n", info.fault_arg,
              info.fault_arg);

    // Program Counter and the instruction it points at
    char text[64];
    if (vm_disasm(vm, info.pc, text, sizeof(text)) > 0)
      fprintf(stderr, "PC: %" PRIu32 "  %s\n", info.pc, text);
    else
      fprintf(stderr, "PC: %" PRIu32 "  <out of range>\n", info.pc);

    // Registers
    fprintf(stderr, "Registers:");
    for (int i = 0; i < (int)SYNVM_REG_COUNT; ++i)
      fprintf(stderr, " r%d=%u", i, (unsigned)info.regs[i]);
    fprintf(stderr, "\n");

    // Stack, top entries first
    fprintf(stderr, "Stack: [%" PRIu32 "]", info.stack_depth);
    if (info.has_stack_data)
    {
      fprintf(stderr, " top:");
      for (uint32_t i = 0; i < 4 && i < info.stack_depth; ++i)
        fprintf(stderr, " %u", (unsigned)info.stack[i]);
      if (info.stack_depth > 4)
        fprintf(stderr, " ... (%" PRIu32 " more entries)", info.stack_depth - 4);
    }
    fprintf(stderr, "\n");

    fprintf(stderr, "=================================\n");
    fprintf(stderr, "\n");

    // Call custom panic handler if registered
    if (vm->panic_handler)
    {
      vm->panic_handler(vm->panic_user_data, &info);
    }

    return error_code;
  }

}  // extern "C"
