#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstring>
#include <initializer_list>

#include "doctest.h"
#include "synvm/errors.hpp"
#include "synvm/internal/vm.h"
#include "synvm/opcodes.hpp"
#include "synvm/vm_api.h"

// A failed step must leave the machine exactly as it was before the step,
// so the same instruction can be retried after the host fixes the cause.

static Vm *make_vm(std::initializer_list<synvm_word> words, synvm_u32 at = 0)
{
  Vm *vm = vm_create(nullptr);
  REQUIRE(vm);
  for (synvm_word w : words)
    REQUIRE(vm_mem_write(vm, at++, w) == 0);
  return vm;
}

// Snapshot-based equality covers memory, registers, pc and the stack.
struct Saved
{
  explicit Saved(const Vm *vm)
  {
    size = vm_snapshot_size(vm);
    bytes = new synvm_u8[size];
    REQUIRE(vm_snapshot_save(vm, bytes, size, nullptr) == 0);
  }
  ~Saved()
  {
    delete[] bytes;
  }
  bool same_as(const Vm *vm) const
  {
    Saved now(vm);
    return now.size == size && std::memcmp(now.bytes, bytes, size) == 0;
  }

  size_t size = 0;
  synvm_u8 *bytes = nullptr;
};

TEST_CASE("faulting instructions leave state untouched")
{
  const synvm_word kBad = 32776;

  struct Case
  {
    const char *name;
    synvm_word program[4];
    synvm_err expected;
  };
  const Case cases[] = {
      {"set bad source", {1, 32768, kBad}, SYNVM_ERR(InvalidLoad)},
      {"set literal dest", {1, 5, 7}, SYNVM_ERR(InvalidStore)},
      {"push bad", {2, kBad}, SYNVM_ERR(InvalidLoad)},
      {"pop literal dest", {3, 5}, SYNVM_ERR(InvalidStore)},
      {"eq bad c", {4, 32768, 1, kBad}, SYNVM_ERR(InvalidLoad)},
      {"gt literal dest", {5, 1, 2, 3}, SYNVM_ERR(InvalidStore)},
      {"jmp bad", {6, kBad}, SYNVM_ERR(InvalidLoad)},
      {"jt bad target", {7, 1, kBad}, SYNVM_ERR(InvalidLoad)},
      {"jf bad cond", {8, kBad, 0}, SYNVM_ERR(InvalidLoad)},
      {"add literal dest", {9, 4, 1, 2}, SYNVM_ERR(InvalidStore)},
      {"mult bad b", {10, 32768, kBad, 2}, SYNVM_ERR(InvalidLoad)},
      {"mod by zero", {11, 32768, 5, 0}, SYNVM_ERR(DivByZero)},
      {"mod literal dest by zero", {11, 1, 5, 0}, SYNVM_ERR(InvalidStore)},
      {"and literal dest", {12, 9, 1, 2}, SYNVM_ERR(InvalidStore)},
      {"or bad c", {13, 32768, 1, 65535}, SYNVM_ERR(InvalidLoad)},
      {"not literal dest", {14, 9, 1}, SYNVM_ERR(InvalidStore)},
      {"rmem literal dest", {15, 9, 0}, SYNVM_ERR(InvalidStore)},
      {"rmem bad address", {15, 32768, kBad}, SYNVM_ERR(InvalidLoad)},
      {"wmem bad value", {16, 100, kBad}, SYNVM_ERR(InvalidLoad)},
      {"call bad target", {17, kBad}, SYNVM_ERR(InvalidLoad)},
      {"out bad", {19, kBad}, SYNVM_ERR(InvalidLoad)},
      {"in literal dest", {20, 5}, SYNVM_ERR(InvalidStore)},
      {"unknown opcode", {4711}, SYNVM_ERR(UnknownOpcode)},
  };

  for (const Case &c : cases)
  {
    CAPTURE(c.name);
    Vm *vm = make_vm({}, 300);
    for (synvm_u32 i = 0; i < 4; ++i)
      REQUIRE(vm_mem_write(vm, 300 + i, c.program[i]) == 0);
    REQUIRE(vm_set_pc(vm, 300) == 0);
    vm_set_reg(vm, 0, 17);
    vm_stack_push(vm, 8);
    vm_input_append_str(vm, "q");

    Saved before(vm);
    CHECK(vm_step(vm) == c.expected);
    CHECK(vm_last_error(vm) == c.expected);
    CHECK(vm_get_pc(vm) == 300);
    CHECK(before.same_as(vm));
    CHECK(vm_input_pending(vm) == 1);
    CHECK(vm_output_size(vm) == 0);

    // The fault is sticky until the cause goes away
    CHECK(vm_step(vm) == c.expected);
    CHECK(vm_get_pc(vm) == 300);
    vm_destroy(vm);
  }
}

TEST_CASE("retry succeeds after the host patches the cause")
{
  Vm *vm = make_vm({11, 32768, 100, 32769, 0});  // mod r0 100 r1; halt

  CHECK(vm_step(vm) == SYNVM_ERR(DivByZero));
  CHECK(vm_get_pc(vm) == 0);

  REQUIRE(vm_set_reg(vm, 1, 7) == 0);
  CHECK(vm_step(vm) == 0);
  CHECK(vm_get_reg(vm, 0) == 2);
  CHECK(vm_step(vm) == SYNVM_ERR(Halt));
  vm_destroy(vm);
}

TEST_CASE("pop on empty stack leaves the stack empty")
{
  Vm *vm = make_vm({3, 32768});
  vm_set_reg(vm, 0, 5);
  CHECK(vm_step(vm) == SYNVM_ERR(PopFromEmptyStack));
  CHECK(vm_stack_depth(vm) == 0);
  CHECK(vm_get_reg(vm, 0) == 5);
  CHECK(vm_get_pc(vm) == 0);
  vm_destroy(vm);
}

TEST_CASE("in with a bad destination does not consume input")
{
  Vm *vm = make_vm({20, 9});
  vm_input_append_str(vm, "ab");
  CHECK(vm_step(vm) == SYNVM_ERR(InvalidStore));
  CHECK(vm_input_pending(vm) == 2);
  vm_destroy(vm);
}

TEST_CASE("call with a bad target does not push")
{
  Vm *vm = make_vm({17, 40000});
  CHECK(vm_step(vm) == SYNVM_ERR(InvalidLoad));
  CHECK(vm_fault_arg(vm) == 40000);
  CHECK(vm_stack_depth(vm) == 0);
  vm_destroy(vm);
}

TEST_CASE("exhausted input halts at the in instruction and resumes")
{
  // in r0; out r0; jmp 0
  Vm *vm = make_vm({20, 32768, 19, 32768, 6, 0});

  vm_input_append_str(vm, "hi");
  CHECK(vm_run(vm) == SYNVM_ERR(Halt));
  CHECK(vm_get_pc(vm) == 0);

  vm_input_append_str(vm, "!\n");
  CHECK(vm_run(vm) == SYNVM_ERR(Halt));
  CHECK(vm_get_pc(vm) == 0);

  size_t len = 0;
  const synvm_u8 *out = vm_output_data(vm, &len);
  REQUIRE(len == 4);
  CHECK(std::memcmp(out, "hi!\n", 4) == 0);
  vm_destroy(vm);
}

TEST_CASE("halt keeps pc on the halt instruction")
{
  Vm *vm = make_vm({21, 0});
  CHECK(vm_run(vm) == SYNVM_ERR(Halt));
  CHECK(vm_get_pc(vm) == 1);
  vm_destroy(vm);
}

TEST_CASE("fetching past the end of memory")
{
  SUBCASE("opcode at the last cell needs an operand")
  {
    Vm *vm = make_vm({19}, SYNVM_MEM_WORDS - 1);
    REQUIRE(vm_set_pc(vm, SYNVM_MEM_WORDS - 1) == 0);
    CHECK(vm_step(vm) == SYNVM_ERR(InvalidLoad));
    CHECK(vm_fault_arg(vm) == SYNVM_MEM_WORDS);
    CHECK(vm_get_pc(vm) == SYNVM_MEM_WORDS - 1);
    CHECK(vm_output_size(vm) == 0);
    vm_destroy(vm);
  }
  SUBCASE("noop at the last cell runs off the end")
  {
    Vm *vm = make_vm({21}, SYNVM_MEM_WORDS - 1);
    REQUIRE(vm_set_pc(vm, SYNVM_MEM_WORDS - 1) == 0);
    CHECK(vm_step(vm) == 0);
    CHECK(vm_get_pc(vm) == SYNVM_MEM_WORDS);
    CHECK(vm_step(vm) == SYNVM_ERR(InvalidLoad));
    CHECK(vm_fault_arg(vm) == SYNVM_MEM_WORDS);
    vm_destroy(vm);
  }
}

TEST_CASE("fault argument is cleared by errors without an operand")
{
  Vm *vm = make_vm({6, 40000});
  CHECK(vm_step(vm) == SYNVM_ERR(InvalidLoad));
  CHECK(vm_fault_arg(vm) == 40000);

  vm_mem_write(vm, 0, 3);  // pop r0 on an empty stack
  vm_mem_write(vm, 1, 32768);
  CHECK(vm_step(vm) == SYNVM_ERR(PopFromEmptyStack));
  CHECK(vm_fault_arg(vm) == 0);
  vm_destroy(vm);
}

TEST_CASE("call whose return address would leave memory")
{
  // Operand in the last cell: the return address would be 32768
  Vm *vm = make_vm({17, 100}, SYNVM_MEM_WORDS - 2);
  REQUIRE(vm_set_pc(vm, SYNVM_MEM_WORDS - 2) == 0);

  CHECK(vm_step(vm) == SYNVM_ERR(InvalidLoad));
  CHECK(vm_fault_arg(vm) == SYNVM_MEM_WORDS);
  CHECK(vm_stack_depth(vm) == 0);
  CHECK(vm_get_pc(vm) == SYNVM_MEM_WORDS - 2);

  // One cell earlier the return address is the last valid one
  Vm *ok = make_vm({17, 100}, SYNVM_MEM_WORDS - 3);
  REQUIRE(vm_set_pc(ok, SYNVM_MEM_WORDS - 3) == 0);
  CHECK(vm_step(ok) == 0);
  CHECK(vm_stack_peek(ok, 0) == SYNVM_MEM_WORDS - 1);
  CHECK(vm_get_pc(ok) == 100);

  vm_destroy(ok);
  vm_destroy(vm);
}
