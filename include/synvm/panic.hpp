/**
 * @file panic.hpp
 * @brief SYNVM panic handler C++ wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "synvm/panic.h"

namespace synvm
{

/**
 * @brief C++ wrapper for SynvmPanicInfo
 */
using PanicInfo = SynvmPanicInfo;

/**
 * @brief C++ wrapper for SynvmPanicHandler
 */
using PanicHandler = SynvmPanicHandler;

/**
 * @brief Set panic handler (C++ wrapper)
 *
 * @param vm         VM instance
 * @param handler    Panic handler callback
 * @param user_data  User data passed to handler
 */
inline void set_panic_handler(Vm *vm, PanicHandler handler, void *user_data = nullptr)
{
  vm_set_panic_handler(vm, handler, user_data);
}

}  // namespace synvm
