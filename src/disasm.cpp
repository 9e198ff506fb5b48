// src/disasm.cpp: single-instruction disassembler for tracing and panics
#include <ctype.h>
#include <stdio.h>
#include <string.h>

#include "synvm/errors.hpp"
#include "synvm/internal/vm.h"
#include "synvm/opcodes.hpp"
#include "synvm/vm_api.h"

// Append formatted text, truncating at cap.
static void append(char *buf, size_t cap, size_t *len, const char *text)
{
  size_t n = strlen(text);
  if (*len + 1 >= cap)
    return;
  if (n > cap - 1 - *len)
    n = cap - 1 - *len;
  memcpy(buf + *len, text, n);
  *len += n;
  buf[*len] = '\0';
}

static void format_operand(char *out, size_t cap, synvm_word w, bool as_char)
{
  if (w >= SYNVM_REG_BASE && w <= SYNVM_REG_LAST)
    snprintf(out, cap, "r%u", (unsigned)(w - SYNVM_REG_BASE));
  else if (w > SYNVM_REG_LAST)
    snprintf(out, cap, "?%u", (unsigned)w);
  else if (as_char && w == '\n')
    snprintf(out, cap, "'\\n'");
  else if (as_char && w < 0x80 && isprint(w))
    snprintf(out, cap, "'%c'", (char)w);
  else
    snprintf(out, cap, "%u", (unsigned)w);
}

extern "C" int vm_disasm(const struct Vm *vm, synvm_u32 addr, char *buf, size_t cap)
{
  if (!vm || !buf || cap == 0)
    return SYNVM_ERR(InvalidArg);
  buf[0] = '\0';
  if (addr >= SYNVM_MEM_WORDS)
    return SYNVM_ERR(InvalidLoad);

  size_t len = 0;
  char word[32];
  const synvm_word code = vm->mem[addr];
  const synvm::OpcodeEntry *entry = synvm::find_opcode(code);
  if (!entry)
  {
    snprintf(word, sizeof(word), "data %u", (unsigned)code);
    append(buf, cap, &len, word);
    return 1;
  }

  // Mnemonics print in lower case
  for (const char *p = entry->name; *p; ++p)
  {
    char c[2] = {(char)tolower((unsigned char)*p), '\0'};
    append(buf, cap, &len, c);
  }

  const bool is_out = (entry->opcode == static_cast<std::uint16_t>(synvm::Op::OUT));
  int words = 1;
  for (int i = 0; i < entry->argc; ++i)
  {
    synvm_u32 at = addr + 1 + (synvm_u32)i;
    if (at >= SYNVM_MEM_WORDS)
    {
      append(buf, cap, &len, " <eof>");
      break;
    }
    append(buf, cap, &len, " ");
    format_operand(word, sizeof(word), vm->mem[at], is_out);
    append(buf, cap, &len, word);
    ++words;
  }
  return words;
}
