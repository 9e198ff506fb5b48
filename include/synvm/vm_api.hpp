/**
 * @file vm_api.hpp
 * @brief SYNVM C++ API wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "synvm/errors.h"
#include "synvm/vm_api.h"

namespace synvm
{

/**
 * @brief Owning C++ handle for a Vm instance
 *
 * Thin RAII wrapper over the C API. Copying is explicit through clone(),
 * so each search worker can own an independent machine.
 */
class Machine
{
public:
  Machine() = default;

  /**
   * @brief Take ownership of a VM created through the C API
   * @param vm  VM instance (may be NULL)
   */
  explicit Machine(Vm *vm) : vm_(vm) {}

  ~Machine()
  {
    vm_destroy(vm_);
  }

  Machine(const Machine &) = delete;
  Machine &operator=(const Machine &) = delete;

  Machine(Machine &&other) noexcept : vm_(other.vm_)
  {
    other.vm_ = nullptr;
  }

  Machine &operator=(Machine &&other) noexcept
  {
    if (this != &other)
    {
      vm_destroy(vm_);
      vm_ = other.vm_;
      other.vm_ = nullptr;
    }
    return *this;
  }

  /**
   * @brief Create a machine from a program image
   * @param image  Image bytes
   * @param cfg    Configuration (NULL = buffered I/O)
   * @param err    Optional failure reason
   */
  static Machine from_image(const std::vector<synvm_u8> &image,
                            const VmConfig *cfg = nullptr, synvm_err *err = nullptr)
  {
    return Machine(vm_create_from_image(cfg, image.data(), image.size(), err));
  }

  /**
   * @brief Create a machine from a snapshot
   * @param snapshot  Snapshot bytes
   * @param cfg       Configuration (NULL = buffered I/O)
   * @param err       Optional failure reason
   */
  static Machine from_snapshot(const std::vector<synvm_u8> &snapshot,
                               const VmConfig *cfg = nullptr, synvm_err *err = nullptr)
  {
    return Machine(vm_create_from_snapshot(cfg, snapshot.data(), snapshot.size(), err));
  }

  /** Independent copy (empty machine on allocation failure). */
  Machine clone() const
  {
    return Machine(vm_clone(vm_));
  }

  explicit operator bool() const
  {
    return vm_ != nullptr;
  }

  Vm *get() const
  {
    return vm_;
  }

  synvm_err step()
  {
    return vm_step(vm_);
  }

  synvm_err run()
  {
    return vm_run(vm_);
  }

  synvm_err send(const std::string &text)
  {
    return vm_input_append(vm_, reinterpret_cast<const synvm_u8 *>(text.data()),
                           text.size());
  }

  /** Entire output history as text. */
  std::string output() const
  {
    std::size_t len = 0;
    const synvm_u8 *data = vm_output_data(vm_, &len);
    return data ? std::string(reinterpret_cast<const char *>(data), len) : std::string();
  }

  /** Output produced since the last call to read_output(). */
  std::string read_output()
  {
    std::string text;
    synvm_u8 chunk[256];
    int n;
    while ((n = vm_output_read(vm_, chunk, static_cast<int>(sizeof(chunk)))) > 0)
      text.append(reinterpret_cast<const char *>(chunk), static_cast<std::size_t>(n));
    return text;
  }

  /**
   * @brief Serialize the machine state
   * @param out  Snapshot bytes
   * @return 0 on success, negative error code otherwise
   */
  synvm_err save(std::vector<synvm_u8> *out) const
  {
    if (!vm_ || !out)
      return SYNVM_ERR_InvalidArg;
    out->resize(vm_snapshot_size(vm_));
    return vm_snapshot_save(vm_, out->data(), out->size(), nullptr);
  }

private:
  Vm *vm_ = nullptr;
};

}  // namespace synvm
