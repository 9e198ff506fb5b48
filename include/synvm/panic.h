#pragma once
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief VM panic diagnostic information
   *
   * Structure holding diagnostic information when the VM faults.
   * Collected by vm_panic() and used for diagnostic output.
   */
  typedef struct SynvmPanicInfo
  {
    int32_t error_code;   /**< Error code (Err enumeration value) */
    uint32_t pc;          /**< Address of the faulting instruction */
    uint32_t fault_arg;   /**< Offending operand, address or opcode */
    uint16_t opcode;      /**< Word at pc (0 if pc is out of range) */
    uint16_t regs[8];     /**< Register file */
    uint32_t stack_depth; /**< Operand stack depth */
    bool has_stack_data;  /**< Whether stack[] is valid */
    uint16_t stack[4];    /**< Top 4 stack values (stack[0] = top) */
  } SynvmPanicInfo;

  // Forward declaration
  struct Vm;

  /**
   * @brief Panic handler callback type
   *
   * Called when the VM reports a fault.
   *
   * @param user_data  User data pointer passed to vm_set_panic_handler
   * @param info       Panic diagnostic information
   */
  typedef void (*SynvmPanicHandler)(void *user_data, const SynvmPanicInfo *info);

  /**
   * @brief Set custom panic handler
   *
   * Registers a callback to be invoked when vm_panic() is called.
   * This allows embedders to implement custom error handling/logging.
   *
   * @param vm         VM instance
   * @param handler    Panic handler callback (NULL to disable)
   * @param user_data  User data passed to handler
   */
  void vm_set_panic_handler(struct Vm *vm, SynvmPanicHandler handler, void *user_data);

  /**
   * @brief Report a fault
   *
   * Prints a diagnostic dump to stderr and invokes the panic handler.
   *
   * @param vm          VM instance
   * @param error_code  Fault to report
   * @return error_code, so callers can `return vm_panic(vm, e);`
   */
  int vm_panic(struct Vm *vm, int error_code);

  /**
   * @brief Collect panic information without printing anything
   *
   * @param vm          VM instance
   * @param error_code  Fault to describe
   * @param info        Output structure
   */
  void vm_panic_info(const struct Vm *vm, int error_code, SynvmPanicInfo *info);

#ifdef __cplusplus
}
#endif
