#pragma once
#include <stdint.h>

#include "synvm/panic.h"
#include "synvm/transport.h"
#include "synvm/vm_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Internal VM structure (not part of the public API).
   *        Visible only for unit tests or tightly coupled components.
   */
  typedef struct Vm
  {
    synvm_word mem[SYNVM_MEM_WORDS];  /**< Memory (program image + data) */
    synvm_word regs[SYNVM_REG_COUNT]; /**< General-purpose registers */

    /* Operand stack (heap, grows on demand) */
    synvm_word *stack;    /**< Stack storage, bottom at index 0 */
    uint32_t stack_depth; /**< Number of live entries */
    uint32_t stack_cap;   /**< Allocated entries */

    synvm_u32 pc; /**< Address of the next instruction */

    /* Transports */
    SynvmIoKind input_kind;
    SynvmIoKind output_kind;
    SynvmInput input;
    SynvmOutput output;
    SynvmBuffer in_buf;  /**< Backing store for SYNVM_IO_BUFFER input */
    SynvmBuffer out_buf; /**< Backing store for SYNVM_IO_BUFFER output */

    /* Fault state */
    int last_err;        /**< Last non-OK step status (0 = none) */
    synvm_u32 fault_arg; /**< Operand/address/opcode behind last_err */

    /* Diagnostics */
    SynvmPanicHandler panic_handler; /**< Optional panic callback */
    void *panic_user_data;           /**< Passed to panic_handler */
  } Vm;

  /* Internal-only stack helpers shared by the dispatcher and the public API. */
  synvm_err vm_stack_push_raw(Vm *vm, synvm_word v);
  synvm_err vm_stack_reserve(Vm *vm, uint32_t count);

#ifdef __cplusplus
} /* extern "C" */
#endif
