#pragma once
#include <stddef.h>
#include <stdint.h>

#include "synvm/transport.h"
#include "synvm/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* VM configuration                                                          */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Transport kind for one endpoint.
   *
   * SYNVM_IO_BUFFER is zero so that a zero-initialized VmConfig gives a VM
   * that can be driven entirely from code.
   */
  typedef enum SynvmIoKind
  {
    SYNVM_IO_BUFFER = 0, /**< VM-owned in-memory buffer */
    SYNVM_IO_TERMINAL,   /**< stdin / stdout */
    SYNVM_IO_DISCARD,    /**< drop output / no input */
    SYNVM_IO_CUSTOM      /**< caller-supplied callbacks */
  } SynvmIoKind;

  /**
   * @brief Configuration structure used when creating a VM instance.
   *
   * The descriptors `input` / `output` are only read for SYNVM_IO_CUSTOM.
   * Passing NULL instead of a config is the same as a zeroed config.
   */
  typedef struct VmConfig
  {
    SynvmIoKind input_kind;  /**< Source for `in` */
    SynvmInput input;        /**< Custom source (SYNVM_IO_CUSTOM only) */
    SynvmIoKind output_kind; /**< Sink for `out` */
    SynvmOutput output;      /**< Custom sink (SYNVM_IO_CUSTOM only) */
  } VmConfig;

  /* Forward declaration for the opaque VM structure. */
  struct Vm;

  /* ------------------------------------------------------------------------- */
  /* Lifecycle                                                                 */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Create a new VM instance.
   *
   * Memory, registers and stack start zeroed and pc = 0.
   *
   * @param cfg  Configuration (NULL = buffered input and output).
   * @return Pointer to the new VM, or NULL on allocation failure or invalid
   *         config (SYNVM_IO_CUSTOM without a callback).
   */
  struct Vm *vm_create(const VmConfig *cfg);

  /**
   * @brief Create a VM and load a program image into it.
   * @param cfg   Configuration (can be NULL).
   * @param data  Image bytes (16-bit little-endian words).
   * @param len   Image length in bytes.
   * @param err   Optional output for the failure reason.
   * @return VM instance, or NULL on failure.
   */
  struct Vm *vm_create_from_image(const VmConfig *cfg, const synvm_u8 *data, size_t len,
                                  synvm_err *err);

  /**
   * @brief Create a VM from a serialized snapshot.
   * @param cfg   Configuration (transports are not part of a snapshot).
   * @param data  Snapshot bytes.
   * @param len   Snapshot length in bytes.
   * @param err   Optional output for the failure reason.
   * @return VM instance, or NULL on failure.
   */
  struct Vm *vm_create_from_snapshot(const VmConfig *cfg, const synvm_u8 *data,
                                     size_t len, synvm_err *err);

  /**
   * @brief Create an independent copy of a VM.
   *
   * Memory, registers, stack, pc, fault state, panic handler and the contents
   * of VM-owned buffers are copied. Terminal, discard and custom endpoints are
   * shared by descriptor.
   *
   * @param vm  Source VM.
   * @return New VM, or NULL on allocation failure.
   */
  struct Vm *vm_clone(const struct Vm *vm);

  /**
   * @brief Reset registers, stack, pc and fault state. Memory is preserved.
   * @param vm  VM instance.
   */
  void vm_reset(struct Vm *vm);

  /**
   * @brief Destroy a VM instance and free its resources.
   * @param vm  VM instance to destroy (NULL-safe).
   */
  void vm_destroy(struct Vm *vm);

  /* ------------------------------------------------------------------------- */
  /* Program image                                                             */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Copy a program image into memory starting at address 0.
   *
   * Each pair of bytes is one little-endian word, stored verbatim.
   * Cells past the end of the image are left untouched.
   *
   * @param vm    VM instance.
   * @param data  Image bytes (can be NULL when len == 0).
   * @param len   Image length in bytes.
   * @return 0 on success, SYNVM_ERR_TruncatedImage for an odd length,
   *         SYNVM_ERR_ImageTooLarge when it does not fit in memory.
   */
  synvm_err vm_load_image(struct Vm *vm, const synvm_u8 *data, size_t len);

  /**
   * @brief Read a program image from a file and load it.
   * @return 0 on success, SYNVM_ERR_IoError if the file cannot be read,
   *         otherwise as vm_load_image().
   */
  synvm_err vm_load_image_file(struct Vm *vm, const char *path);

  /* ------------------------------------------------------------------------- */
  /* Execution                                                                 */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Execute exactly one instruction.
   *
   * On any non-zero status pc is restored to the address of the instruction
   * that was attempted, and a failed instruction has no other effect.
   *
   * @param vm  VM instance.
   * @return 0 after a normal step, SYNVM_ERR_Halt when the program ended
   *         (halt, ret on empty stack, input exhausted), negative error code
   *         on a fault (see vm_fault_arg()).
   */
  synvm_err vm_step(struct Vm *vm);

  /**
   * @brief Step until the program halts or faults.
   *
   * A fault is reported through vm_panic() before it is returned.
   *
   * @param vm  VM instance.
   * @return SYNVM_ERR_Halt on normal termination, negative error code on a
   *         fault.
   */
  synvm_err vm_run(struct Vm *vm);

  /**
   * @brief Status of the last failed step (0 if none since creation/reset).
   */
  synvm_err vm_last_error(const struct Vm *vm);

  /**
   * @brief Operand or address that caused the last fault.
   *
   * InvalidLoad / InvalidStore: the rejected operand or address.
   * UnknownOpcode: the opcode word.  Other errors: 0.
   */
  synvm_u32 vm_fault_arg(const struct Vm *vm);

  /* ------------------------------------------------------------------------- */
  /* Guest I/O                                                                 */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Queue bytes for future `in` instructions.
   * @return 0 on success, SYNVM_ERR_NotBuffered if input is not buffered,
   *         SYNVM_ERR_OutOfMemory on allocation failure.
   */
  synvm_err vm_input_append(struct Vm *vm, const synvm_u8 *data, size_t len);

  /** Convenience wrapper for NUL-terminated text. */
  synvm_err vm_input_append_str(struct Vm *vm, const char *text);

  /** Number of queued input bytes not yet consumed (0 if not buffered). */
  size_t vm_input_pending(const struct Vm *vm);

  /**
   * @brief Entire output history.
   * @param vm   VM instance.
   * @param len  Output: number of bytes (0 if not buffered).
   * @return Pointer to the bytes (valid until the next step or clear), or
   *         NULL if empty or not buffered.
   */
  const synvm_u8 *vm_output_data(const struct Vm *vm, size_t *len);

  /** Total number of bytes ever written (0 if not buffered). */
  size_t vm_output_size(const struct Vm *vm);

  /**
   * @brief Copy unread output into dst and advance the output cursor.
   * @return Number of bytes copied (>= 0), or negative error code.
   */
  int vm_output_read(struct Vm *vm, synvm_u8 *dst, int max_count);

  /** Current output cursor (0 if not buffered). */
  size_t vm_output_tell(const struct Vm *vm);

  /**
   * @brief Move the output cursor to re-read earlier output.
   * @return 0 on success, SYNVM_ERR_InvalidArg if pos > vm_output_size(),
   *         SYNVM_ERR_NotBuffered if output is not buffered.
   */
  synvm_err vm_output_seek(struct Vm *vm, size_t pos);

  /** Drop the output history and rewind the cursor. */
  synvm_err vm_output_clear(struct Vm *vm);

  /* ------------------------------------------------------------------------- */
  /* State inspection and patching (debuggers, solvers)                        */
  /* ------------------------------------------------------------------------- */

  synvm_u32 vm_get_pc(const struct Vm *vm);

  /** @return 0, or SYNVM_ERR_InvalidArg if pc >= SYNVM_MEM_WORDS. */
  synvm_err vm_set_pc(struct Vm *vm, synvm_u32 pc);

  /** @return Register value, or 0 if idx is out of range. */
  synvm_word vm_get_reg(const struct Vm *vm, int idx);

  /** @return 0, or SYNVM_ERR_InvalidArg for a bad index or value > 32767. */
  synvm_err vm_set_reg(struct Vm *vm, int idx, synvm_word value);

  /**
   * @brief Read a memory cell.
   * @return 0, or SYNVM_ERR_InvalidLoad if addr >= SYNVM_MEM_WORDS.
   */
  synvm_err vm_mem_read(const struct Vm *vm, synvm_u32 addr, synvm_word *out);

  /**
   * @brief Write a memory cell (any 16-bit value, as a program image would).
   * @return 0, or SYNVM_ERR_InvalidStore if addr >= SYNVM_MEM_WORDS.
   */
  synvm_err vm_mem_write(struct Vm *vm, synvm_u32 addr, synvm_word value);

  /** Number of words on the stack. */
  int vm_stack_depth(const struct Vm *vm);

  /**
   * @brief Peek a stack value by index from the top.
   * @param index_from_top  0 = top, 1 = next, ...
   * @return Value, or 0 if out of range.
   */
  synvm_word vm_stack_peek(const struct Vm *vm, int index_from_top);

  /**
   * @brief Copy the stack to an array, bottom to top.
   * @return Number of elements copied (0 to max_count).
   */
  int vm_stack_copy_to_array(const struct Vm *vm, synvm_word *out_array, int max_count);

  /** @return 0, SYNVM_ERR_InvalidArg for value > 32767, or OutOfMemory. */
  synvm_err vm_stack_push(struct Vm *vm, synvm_word value);

  /**
   * @param out_value  Output pointer for popped value (can be NULL).
   * @return 0, or SYNVM_ERR_PopFromEmptyStack.
   */
  synvm_err vm_stack_pop(struct Vm *vm, synvm_word *out_value);

  /**
   * @brief Render the instruction at addr as text.
   *
   * Registers print as r0..r7, literals in decimal, `out` literals as a
   * quoted character. Words that are not opcodes print as "data <n>".
   *
   * @param vm    VM instance.
   * @param addr  Address of the instruction.
   * @param buf   Output text buffer (NUL-terminated, truncated to cap).
   * @param cap   Buffer capacity.
   * @return Number of words the instruction occupies (>= 1), or
   *         SYNVM_ERR_InvalidLoad if addr is out of range.
   */
  int vm_disasm(const struct Vm *vm, synvm_u32 addr, char *buf, size_t cap);

  /* ------------------------------------------------------------------------- */
  /* Snapshots                                                                 */
  /* ------------------------------------------------------------------------- */

  /**
   * Snapshot layout (16-bit little-endian words):
   *   mem[32768] ++ regs[8] ++ pc ++ stack[depth]
   * The stack depth is implied by the total length.
   */
#define SYNVM_SNAPSHOT_HEADER_WORDS (SYNVM_MEM_WORDS + SYNVM_REG_COUNT + 1u)

  /** Size in bytes of the snapshot vm_snapshot_save() would produce. */
  size_t vm_snapshot_size(const struct Vm *vm);

  /**
   * @brief Serialize the VM state.
   * @param vm       VM instance.
   * @param buf      Output buffer.
   * @param cap      Buffer capacity in bytes.
   * @param written  Optional output: bytes written.
   * @return 0 on success, SYNVM_ERR_InvalidArg if cap < vm_snapshot_size().
   */
  synvm_err vm_snapshot_save(const struct Vm *vm, synvm_u8 *buf, size_t cap,
                             size_t *written);

  /**
   * @brief Replace the VM state with a snapshot.
   *
   * Transports, panic handler and I/O buffers are kept. On failure the VM is
   * not modified.
   *
   * @return 0 on success, SYNVM_ERR_TruncatedSnapshot for a malformed length,
   *         SYNVM_ERR_OutOfMemory if the stack cannot be allocated.
   */
  synvm_err vm_snapshot_restore(struct Vm *vm, const synvm_u8 *data, size_t len);

  /** Write a snapshot to a file (SYNVM_ERR_IoError on failure). */
  synvm_err vm_snapshot_save_file(const struct Vm *vm, const char *path);

  /** Restore a snapshot from a file (SYNVM_ERR_IoError on failure). */
  synvm_err vm_snapshot_load_file(struct Vm *vm, const char *path);

  /* ------------------------------------------------------------------------- */
  /* Version                                                                   */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Get the current version of the VM.
   * @return Version number as an integer.
   */
  int synvm_vm_version(void);

  /* ------------------------------------------------------------------------- */
  /* Error handling notes                                                      */
  /* ------------------------------------------------------------------------- */
  /**
   * All public APIs return 0 on success, a positive status for normal
   * termination (SYNVM_ERR_Halt) and a negative synvm_err on failure.
   * Codes are defined in `errors.def`.
   *
   * Examples:
   *  - -1 = InvalidLoad (operand above r7, or address past memory)
   *  - -2 = InvalidStore (destination is not a register)
   *  - -4 = UnknownOpcode
   *
   * Exceptions are never thrown (compiled with -fno-exceptions).
   * Error propagation is done purely via return values.
   */

  /* ------------------------------------------------------------------------- */

#ifdef __cplusplus
} /* extern "C" */
#endif
