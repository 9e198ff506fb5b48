#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstdint>
#include <cstdio>
#include <vector>

#include "doctest.h"
#include "synvm/errors.hpp"
#include "synvm/internal/memory.hpp"
#include "synvm/internal/vm.h"
#include "synvm/vm_api.h"

/* ------------------------------------------------------------------------- */
/* Operand resolution                                                        */
/* ------------------------------------------------------------------------- */
TEST_CASE("literals resolve to themselves")
{
  Vm *vm = vm_create(nullptr);
  REQUIRE(vm);

  for (synvm_u32 v = 0; v <= SYNVM_MAX_LITERAL; ++v)
  {
    synvm_word out = 0xFFFF;
    REQUIRE(vm_operand_load(vm, (synvm_word)v, &out) == 0);
    REQUIRE(out == v);
  }
  vm_destroy(vm);
}

TEST_CASE("register operands resolve to register contents")
{
  Vm *vm = vm_create(nullptr);
  REQUIRE(vm);
  for (int i = 0; i < 8; ++i)
    REQUIRE(vm_set_reg(vm, i, (synvm_word)(100 + i)) == 0);

  for (synvm_u32 i = 0; i < 8; ++i)
  {
    synvm_word out = 0;
    CHECK(vm_operand_load(vm, (synvm_word)(SYNVM_REG_BASE + i), &out) == 0);
    CHECK(out == 100 + i);
  }
  vm_destroy(vm);
}

TEST_CASE("words above the register range are invalid loads")
{
  Vm *vm = vm_create(nullptr);
  REQUIRE(vm);

  synvm_word out = 1;
  CHECK(vm_operand_load(vm, 32776, &out) == SYNVM_ERR(InvalidLoad));
  CHECK(vm_fault_arg(vm) == 32776);
  CHECK(out == 1);

  CHECK(vm_operand_load(vm, 65535, &out) == SYNVM_ERR(InvalidLoad));
  CHECK(vm_fault_arg(vm) == 65535);
  vm_destroy(vm);
}

TEST_CASE("set writes only to register operands")
{
  Vm *vm = vm_create(nullptr);
  REQUIRE(vm);

  SUBCASE("register destination")
  {
    CHECK(vm_operand_set(vm, 32770, 9) == 0);
    CHECK(vm_get_reg(vm, 2) == 9);
  }
  SUBCASE("literal destination")
  {
    CHECK(vm_operand_set(vm, 5, 9) == SYNVM_ERR(InvalidStore));
    CHECK(vm_fault_arg(vm) == 5);
  }
  SUBCASE("destination past the registers")
  {
    CHECK(vm_operand_set(vm, 32776, 9) == SYNVM_ERR(InvalidStore));
    CHECK(vm_fault_arg(vm) == 32776);
  }
  SUBCASE("invalid source reported before invalid destination")
  {
    CHECK(vm_operand_set(vm, 5, 40000) == SYNVM_ERR(InvalidLoad));
    CHECK(vm_fault_arg(vm) == 40000);
  }
  SUBCASE("register source")
  {
    vm->regs[7] = 31;
    CHECK(vm_operand_set(vm, 32768, 32775) == 0);
    CHECK(vm_get_reg(vm, 0) == 31);
  }

  for (int i = 0; i < 8; ++i)
    CHECK(vm_get_reg(vm, i) <= SYNVM_MAX_LITERAL);
  vm_destroy(vm);
}

/* ------------------------------------------------------------------------- */
/* Program images                                                            */
/* ------------------------------------------------------------------------- */
TEST_CASE("image words are little-endian")
{
  const synvm_u8 image[] = {0x13, 0x00, 0x41, 0x00, 0x34, 0x12, 0x00, 0x80};
  synvm_err err = 1;
  Vm *vm = vm_create_from_image(nullptr, image, sizeof(image), &err);
  REQUIRE(vm);
  CHECK(err == 0);

  synvm_word w = 0;
  CHECK(vm_mem_read(vm, 0, &w) == 0);
  CHECK(w == 19);
  CHECK(vm_mem_read(vm, 1, &w) == 0);
  CHECK(w == 65);
  CHECK(vm_mem_read(vm, 2, &w) == 0);
  CHECK(w == 0x1234);
  CHECK(vm_mem_read(vm, 3, &w) == 0);
  CHECK(w == 32768);
  CHECK(vm_mem_read(vm, 4, &w) == 0);
  CHECK(w == 0);
  CHECK(vm_get_pc(vm) == 0);
  vm_destroy(vm);
}

TEST_CASE("odd-length image is rejected")
{
  const synvm_u8 image[] = {0x13, 0x00, 0x41};
  synvm_err err = 0;
  CHECK(vm_create_from_image(nullptr, image, sizeof(image), &err) == nullptr);
  CHECK(err == SYNVM_ERR(TruncatedImage));
}

TEST_CASE("image larger than memory is rejected")
{
  std::vector<synvm_u8> image((SYNVM_MEM_WORDS + 1) * 2, 0);
  Vm *vm = vm_create(nullptr);
  REQUIRE(vm);
  vm->mem[0] = 77;
  CHECK(vm_load_image(vm, image.data(), image.size()) == SYNVM_ERR(ImageTooLarge));
  CHECK(vm->mem[0] == 77);

  image.resize(SYNVM_MEM_WORDS * 2);
  image[image.size() - 2] = 0x15;
  CHECK(vm_load_image(vm, image.data(), image.size()) == 0);
  CHECK(vm->mem[SYNVM_MEM_WORDS - 1] == 21);
  vm_destroy(vm);
}

TEST_CASE("empty image leaves memory zeroed")
{
  synvm_err err = 1;
  Vm *vm = vm_create_from_image(nullptr, nullptr, 0, &err);
  REQUIRE(vm);
  CHECK(err == 0);
  CHECK(vm_step(vm) == SYNVM_ERR(Halt));
  vm_destroy(vm);
}

TEST_CASE("image from file")
{
  char path[L_tmpnam];
  REQUIRE(std::tmpnam(path) != nullptr);

  FILE *f = std::fopen(path, "wb");
  REQUIRE(f);
  const synvm_u8 image[] = {0x13, 0x00, 0x48, 0x00, 0x13, 0x00, 0x69, 0x00, 0x00, 0x00};
  REQUIRE(std::fwrite(image, 1, sizeof(image), f) == sizeof(image));
  std::fclose(f);

  Vm *vm = vm_create(nullptr);
  REQUIRE(vm);
  CHECK(vm_load_image_file(vm, path) == 0);
  CHECK(vm_run(vm) == SYNVM_ERR(Halt));

  size_t len = 0;
  const synvm_u8 *out = vm_output_data(vm, &len);
  REQUIRE(len == 2);
  CHECK(out[0] == 'H');
  CHECK(out[1] == 'i');

  std::remove(path);
  CHECK(vm_load_image_file(vm, path) == SYNVM_ERR(IoError));
  vm_destroy(vm);
}

/* ------------------------------------------------------------------------- */
/* Inspection and patching                                                   */
/* ------------------------------------------------------------------------- */
TEST_CASE("pc, register and memory accessors validate their arguments")
{
  Vm *vm = vm_create(nullptr);
  REQUIRE(vm);

  CHECK(vm_set_pc(vm, 5489) == 0);
  CHECK(vm_get_pc(vm) == 5489);
  CHECK(vm_set_pc(vm, SYNVM_MEM_WORDS) == SYNVM_ERR(InvalidArg));
  CHECK(vm_get_pc(vm) == 5489);

  CHECK(vm_set_reg(vm, 7, 25734) == 0);
  CHECK(vm_get_reg(vm, 7) == 25734);
  CHECK(vm_set_reg(vm, 8, 1) == SYNVM_ERR(InvalidArg));
  CHECK(vm_set_reg(vm, -1, 1) == SYNVM_ERR(InvalidArg));
  CHECK(vm_set_reg(vm, 0, 32768) == SYNVM_ERR(InvalidArg));
  CHECK(vm_get_reg(vm, 8) == 0);

  synvm_word w = 0;
  CHECK(vm_mem_write(vm, 32767, 21) == 0);
  CHECK(vm_mem_read(vm, 32767, &w) == 0);
  CHECK(w == 21);
  CHECK(vm_mem_write(vm, 32768, 21) == SYNVM_ERR(InvalidStore));
  CHECK(vm_mem_read(vm, 32768, &w) == SYNVM_ERR(InvalidLoad));
  CHECK(vm_mem_read(vm, 0, nullptr) == SYNVM_ERR(InvalidArg));
  vm_destroy(vm);
}

TEST_CASE("stack accessors")
{
  Vm *vm = vm_create(nullptr);
  REQUIRE(vm);

  CHECK(vm_stack_push(vm, 1) == 0);
  CHECK(vm_stack_push(vm, 2) == 0);
  CHECK(vm_stack_push(vm, 3) == 0);
  CHECK(vm_stack_push(vm, 32768) == SYNVM_ERR(InvalidArg));
  CHECK(vm_stack_depth(vm) == 3);
  CHECK(vm_stack_peek(vm, 0) == 3);
  CHECK(vm_stack_peek(vm, 2) == 1);
  CHECK(vm_stack_peek(vm, 3) == 0);

  synvm_word arr[8] = {};
  CHECK(vm_stack_copy_to_array(vm, arr, 8) == 3);
  CHECK(arr[0] == 1);
  CHECK(arr[2] == 3);
  CHECK(vm_stack_copy_to_array(vm, arr, 2) == 2);

  synvm_word v = 0;
  CHECK(vm_stack_pop(vm, &v) == 0);
  CHECK(v == 3);
  CHECK(vm_stack_pop(vm, nullptr) == 0);
  CHECK(vm_stack_pop(vm, &v) == 0);
  CHECK(v == 1);
  CHECK(vm_stack_pop(vm, &v) == SYNVM_ERR(PopFromEmptyStack));
  vm_destroy(vm);
}

TEST_CASE("reset keeps memory")
{
  Vm *vm = vm_create(nullptr);
  REQUIRE(vm);
  vm_mem_write(vm, 10, 1234);
  vm_set_reg(vm, 3, 5);
  vm_stack_push(vm, 6);
  vm_set_pc(vm, 99);

  vm_reset(vm);
  CHECK(vm_get_pc(vm) == 0);
  CHECK(vm_get_reg(vm, 3) == 0);
  CHECK(vm_stack_depth(vm) == 0);
  CHECK(vm_last_error(vm) == 0);

  synvm_word w = 0;
  CHECK(vm_mem_read(vm, 10, &w) == 0);
  CHECK(w == 1234);
  vm_destroy(vm);
}

TEST_CASE("clones are independent")
{
  // out r0; halt
  const synvm_u8 image[] = {0x13, 0x00, 0x00, 0x80, 0x00, 0x00};
  Vm *a = vm_create_from_image(nullptr, image, sizeof(image), nullptr);
  REQUIRE(a);
  vm_set_reg(a, 0, 'a');
  vm_stack_push(a, 11);
  vm_input_append_str(a, "xyz");

  Vm *b = vm_clone(a);
  REQUIRE(b);
  CHECK(vm_get_reg(b, 0) == 'a');
  CHECK(vm_stack_peek(b, 0) == 11);
  CHECK(vm_input_pending(b) == 3);

  vm_set_reg(b, 0, 'b');
  vm_mem_write(b, 5, 42);
  vm_stack_push(b, 12);

  CHECK(vm_run(a) == SYNVM_ERR(Halt));
  CHECK(vm_run(b) == SYNVM_ERR(Halt));

  size_t la = 0, lb = 0;
  const synvm_u8 *oa = vm_output_data(a, &la);
  const synvm_u8 *ob = vm_output_data(b, &lb);
  REQUIRE(la == 1);
  REQUIRE(lb == 1);
  CHECK(oa[0] == 'a');
  CHECK(ob[0] == 'b');

  synvm_word w = 0;
  CHECK(vm_mem_read(a, 5, &w) == 0);
  CHECK(w == 0);
  CHECK(vm_stack_depth(a) == 1);
  CHECK(vm_stack_depth(b) == 2);

  vm_destroy(a);
  vm_destroy(b);
}

TEST_CASE("null vm is tolerated")
{
  vm_destroy(nullptr);
  vm_reset(nullptr);
  CHECK(vm_clone(nullptr) == nullptr);
  CHECK(vm_step(nullptr) == SYNVM_ERR(InvalidArg));
  CHECK(vm_last_error(nullptr) == SYNVM_ERR(InvalidArg));
  CHECK(vm_get_pc(nullptr) == 0);
  CHECK(vm_stack_depth(nullptr) == 0);
}
