#pragma once

#include <stdio.h>

#include "synvm/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @file transport.h
   * @brief Byte transports for guest I/O
   *
   * The VM reads guest input from a byte source and writes guest output to a
   * byte sink. Both are plain callback descriptors so that the dispatcher
   * never branches on the transport kind.
   *
   * Built-in endpoints:
   * - buffer:   growable in-memory byte buffer with a read cursor
   * - terminal: stdio stream (blocking reads, flushed writes)
   * - discard:  drops all output / never yields input
   */

  /* ------------------------------------------------------------------------- */
  /* Endpoint descriptors                                                      */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Read one byte.
   * @param user  Endpoint context.
   * @param out   Output byte.
   * @return 0 on success, SYNVM_ERR_EndOfInput when exhausted,
   *         negative error code on I/O failure.
   */
  typedef synvm_err (*synvm_read_fn)(void *user, synvm_u8 *out);

  /**
   * @brief Append one byte.
   * @param user  Endpoint context.
   * @param byte  Byte to write.
   * @return 0 on success, negative error code on I/O failure.
   */
  typedef synvm_err (*synvm_write_fn)(void *user, synvm_u8 byte);

  /** Input source (guest `in`). */
  typedef struct SynvmInput
  {
    synvm_read_fn read; /**< Read callback (must not be NULL) */
    void *user;         /**< Context passed to the callback */
  } SynvmInput;

  /** Output sink (guest `out`). */
  typedef struct SynvmOutput
  {
    synvm_write_fn write; /**< Write callback (must not be NULL) */
    void *user;           /**< Context passed to the callback */
  } SynvmOutput;

  /* ------------------------------------------------------------------------- */
  /* Growable byte buffer                                                      */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Growable byte buffer with an independent read cursor.
   *
   * Bytes in [0, len) are valid; [pos, len) are still unread.
   * Appending never moves the cursor, so a driver can queue more input while
   * the VM is halfway through what it already has.
   */
  typedef struct SynvmBuffer
  {
    synvm_u8 *data; /**< Heap storage (NULL while empty) */
    size_t len;     /**< Bytes written */
    size_t cap;     /**< Bytes allocated */
    size_t pos;     /**< Read cursor */
  } SynvmBuffer;

  void synvm_buffer_init(SynvmBuffer *buf);
  void synvm_buffer_free(SynvmBuffer *buf);

  /**
   * @brief Append bytes at the end of the buffer.
   * @return 0 on success, SYNVM_ERR_OutOfMemory if growing failed.
   */
  synvm_err synvm_buffer_append(SynvmBuffer *buf, const synvm_u8 *data, size_t len);

  /**
   * @brief Replace dst with a deep copy of src (contents and cursor).
   * @return 0 on success, SYNVM_ERR_OutOfMemory on allocation failure
   *         (dst is left unchanged).
   */
  synvm_err synvm_buffer_copy(SynvmBuffer *dst, const SynvmBuffer *src);

  /** Drop all contents and rewind the cursor. Keeps the allocation. */
  void synvm_buffer_clear(SynvmBuffer *buf);

  /** Discard the bytes before the cursor; unread bytes move to the front. */
  void synvm_buffer_compact(SynvmBuffer *buf);

  /** Number of unread bytes. */
  size_t synvm_buffer_pending(const SynvmBuffer *buf);

  /* ------------------------------------------------------------------------- */
  /* Endpoint callbacks                                                        */
  /* ------------------------------------------------------------------------- */

  /* user = SynvmBuffer* */
  synvm_err synvm_buffer_getc(void *user, synvm_u8 *out);
  synvm_err synvm_buffer_putc(void *user, synvm_u8 byte);

  /* user = FILE* (NULL selects stdin / stdout) */
  synvm_err synvm_terminal_getc(void *user, synvm_u8 *out);
  synvm_err synvm_terminal_putc(void *user, synvm_u8 byte);

  /* user is ignored */
  synvm_err synvm_discard_getc(void *user, synvm_u8 *out);
  synvm_err synvm_discard_putc(void *user, synvm_u8 byte);

  /* ------------------------------------------------------------------------- */
  /* Descriptor helpers                                                        */
  /* ------------------------------------------------------------------------- */

  SynvmInput synvm_buffer_input(SynvmBuffer *buf);
  SynvmOutput synvm_buffer_output(SynvmBuffer *buf);
  SynvmInput synvm_terminal_input(FILE *in);
  SynvmOutput synvm_terminal_output(FILE *out);
  SynvmInput synvm_discard_input(void);
  SynvmOutput synvm_discard_output(void);

#ifdef __cplusplus
} /* extern "C" */
#endif
