#pragma once
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Basic typedefs                                                            */
  /* ------------------------------------------------------------------------- */

  /** 16-bit cell: memory, registers, stack and raw operands. */
  typedef uint16_t synvm_word;
  /** 32-bit unsigned integer used for addresses and full-width arithmetic. */
  typedef uint32_t synvm_u32;
  /** 8-bit unsigned integer used for transports and serialized data. */
  typedef uint8_t synvm_u8;
  /** Status code type. 0 = OK, positive = status, negative = error. */
  typedef int synvm_err;

  /* ------------------------------------------------------------------------- */
  /* Machine geometry                                                          */
  /* ------------------------------------------------------------------------- */

#define SYNVM_MEM_WORDS 32768u   /**< Addressable memory cells */
#define SYNVM_REG_COUNT 8u       /**< General-purpose registers */
#define SYNVM_MAX_LITERAL 32767u /**< Largest literal operand */
#define SYNVM_REG_BASE 32768u    /**< Operand value naming register 0 */
#define SYNVM_REG_LAST 32775u    /**< Operand value naming register 7 */
#define SYNVM_MODULUS 32768u     /**< Arithmetic is reduced modulo 2^15 */
#define SYNVM_WORD_MASK 0x7FFFu  /**< 15-bit value mask */

#ifdef __cplusplus
} /* extern "C" */
#endif
