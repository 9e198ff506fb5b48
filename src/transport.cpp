// src/transport.cpp: byte endpoints for guest I/O (buffer / terminal / discard)
#include "synvm/transport.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "synvm/errors.hpp"

/* ---- Growable buffer ---- */
extern "C" void synvm_buffer_init(SynvmBuffer *buf)
{
  if (!buf)
    return;
  buf->data = nullptr;
  buf->len = 0;
  buf->cap = 0;
  buf->pos = 0;
}

extern "C" void synvm_buffer_free(SynvmBuffer *buf)
{
  if (!buf)
    return;
  ::free(buf->data);
  synvm_buffer_init(buf);
}

static synvm_err buffer_grow(SynvmBuffer *buf, size_t need)
{
  if (need <= buf->cap)
    return SYNVM_ERR(OK);

  size_t cap = buf->cap ? buf->cap : 64;
  while (cap < need)
    cap *= 2;

  synvm_u8 *p = (synvm_u8 *)::realloc(buf->data, cap);
  if (!p)
    return SYNVM_ERR(OutOfMemory);
  buf->data = p;
  buf->cap = cap;
  return SYNVM_ERR(OK);
}

extern "C" synvm_err synvm_buffer_append(SynvmBuffer *buf, const synvm_u8 *data, size_t len)
{
  if (!buf || (!data && len))
    return SYNVM_ERR(InvalidArg);
  if (len == 0)
    return SYNVM_ERR(OK);

  if (synvm_err e = buffer_grow(buf, buf->len + len))
    return e;
  ::memcpy(buf->data + buf->len, data, len);
  buf->len += len;
  return SYNVM_ERR(OK);
}

extern "C" synvm_err synvm_buffer_copy(SynvmBuffer *dst, const SynvmBuffer *src)
{
  if (!dst || !src)
    return SYNVM_ERR(InvalidArg);

  synvm_u8 *p = nullptr;
  if (src->len)
  {
    p = (synvm_u8 *)::malloc(src->len);
    if (!p)
      return SYNVM_ERR(OutOfMemory);
    ::memcpy(p, src->data, src->len);
  }

  ::free(dst->data);
  dst->data = p;
  dst->len = src->len;
  dst->cap = src->len;
  dst->pos = src->pos;
  return SYNVM_ERR(OK);
}

extern "C" void synvm_buffer_clear(SynvmBuffer *buf)
{
  if (!buf)
    return;
  buf->len = 0;
  buf->pos = 0;
}

extern "C" void synvm_buffer_compact(SynvmBuffer *buf)
{
  if (!buf || buf->pos == 0)
    return;
  size_t rest = buf->len - buf->pos;
  if (rest)
    ::memmove(buf->data, buf->data + buf->pos, rest);
  buf->len = rest;
  buf->pos = 0;
}

extern "C" size_t synvm_buffer_pending(const SynvmBuffer *buf)
{
  if (!buf)
    return 0;
  return buf->len - buf->pos;
}

/* ---- Buffer endpoints ---- */
extern "C" synvm_err synvm_buffer_getc(void *user, synvm_u8 *out)
{
  SynvmBuffer *buf = (SynvmBuffer *)user;
  if (buf->pos >= buf->len)
    return SYNVM_ERR(EndOfInput);
  *out = buf->data[buf->pos++];
  return SYNVM_ERR(OK);
}

extern "C" synvm_err synvm_buffer_putc(void *user, synvm_u8 byte)
{
  return synvm_buffer_append((SynvmBuffer *)user, &byte, 1);
}

/* ---- Terminal endpoints ---- */
extern "C" synvm_err synvm_terminal_getc(void *user, synvm_u8 *out)
{
  FILE *f = user ? (FILE *)user : stdin;
  int c = fgetc(f);
  if (c == EOF)
    return ferror(f) ? SYNVM_ERR(IoError) : SYNVM_ERR(EndOfInput);
  *out = (synvm_u8)c;
  return SYNVM_ERR(OK);
}

extern "C" synvm_err synvm_terminal_putc(void *user, synvm_u8 byte)
{
  FILE *f = user ? (FILE *)user : stdout;
  if (fputc(byte, f) == EOF)
    return SYNVM_ERR(IoError);
  // Echo immediately: the guest prompts without a trailing newline
  if (fflush(f) != 0)
    return SYNVM_ERR(IoError);
  return SYNVM_ERR(OK);
}

/* ---- Discard endpoints ---- */
extern "C" synvm_err synvm_discard_getc(void *user, synvm_u8 *out)
{
  (void)user;
  (void)out;
  return SYNVM_ERR(EndOfInput);
}

extern "C" synvm_err synvm_discard_putc(void *user, synvm_u8 byte)
{
  (void)user;
  (void)byte;
  return SYNVM_ERR(OK);
}

/* ---- Descriptor helpers ---- */
extern "C" SynvmInput synvm_buffer_input(SynvmBuffer *buf)
{
  SynvmInput in;
  in.read = synvm_buffer_getc;
  in.user = buf;
  return in;
}

extern "C" SynvmOutput synvm_buffer_output(SynvmBuffer *buf)
{
  SynvmOutput out;
  out.write = synvm_buffer_putc;
  out.user = buf;
  return out;
}

extern "C" SynvmInput synvm_terminal_input(FILE *in)
{
  SynvmInput src;
  src.read = synvm_terminal_getc;
  src.user = in;
  return src;
}

extern "C" SynvmOutput synvm_terminal_output(FILE *out)
{
  SynvmOutput sink;
  sink.write = synvm_terminal_putc;
  sink.user = out;
  return sink;
}

extern "C" SynvmInput synvm_discard_input(void)
{
  SynvmInput in;
  in.read = synvm_discard_getc;
  in.user = nullptr;
  return in;
}

extern "C" SynvmOutput synvm_discard_output(void)
{
  SynvmOutput out;
  out.write = synvm_discard_putc;
  out.user = nullptr;
  return out;
}
