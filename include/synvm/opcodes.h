#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /** @file
   *  @brief SYNVM instruction set for C.
   *
   *  One 16-bit word per opcode, followed by its operand words.
   *  Keep numeric values stable once published.
   */

  typedef enum synvm_op_t
  {
#define OP(name, val, _) SYNVM_OP_##name = val,
#include "synvm/opcodes.def"
#undef OP
  } synvm_op_t;

#ifdef __cplusplus
}  // extern "C"
#endif
