#pragma once

/**
 * @file errors.h
 * @brief SYNVM status codes for C
 *
 * C-compatible status code definitions generated from errors.def
 */

#ifdef __cplusplus
extern "C"
{
#endif

  /* Generate status code constants from errors.def */
#define ERR(name, val, msg) static const int SYNVM_ERR_##name = val;
#include "synvm/errors.def"
#undef ERR

  /**
   * @brief Get a static message string for a status code.
   * @param err  Status code.
   * @return Message, or "unknown error" for values not in errors.def.
   */
  const char *synvm_err_str(int err);

#ifdef __cplusplus
}
#endif
