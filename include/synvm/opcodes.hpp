#pragma once
#include <cstdint>

namespace synvm
{

/** Instruction set. Opcode and operands are 16-bit little-endian words. */
enum class Op : std::uint16_t
{
#define OP(name, val, _) name = val,
#include "synvm/opcodes.def"
#undef OP
};

// -----------------------------------------------------------------------------
// Opcode table entry for table-driven decoding (disassembler, tracing)
// -----------------------------------------------------------------------------
struct OpcodeEntry
{
  const char* name;
  std::uint16_t opcode;
  std::uint8_t argc;
};

// -----------------------------------------------------------------------------
// Opcode table (generated from opcodes.def, indexed by opcode)
// -----------------------------------------------------------------------------
static constexpr OpcodeEntry kOpcodeTable[] = {
#define OP(name, val, argc) {#name, val, argc},
#include "synvm/opcodes.def"
#undef OP
};

static constexpr std::uint16_t kOpcodeCount =
    static_cast<std::uint16_t>(sizeof(kOpcodeTable) / sizeof(kOpcodeTable[0]));

/** Look up an opcode entry; nullptr for words that are not opcodes. */
inline const OpcodeEntry* find_opcode(std::uint16_t word)
{
  return word < kOpcodeCount ? &kOpcodeTable[word] : nullptr;
}

}  // namespace synvm
