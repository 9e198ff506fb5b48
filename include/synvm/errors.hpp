#pragma once

#include "synvm/types.h"

// Status code definition using the same pattern as opcodes.def
// Define ERR(name, val, msg) before including this file if you want to extract text or
// mapping.

#ifndef ERR
#define ERR(name, val, msg) name = val,
#endif

enum class Err : int
{
#include "synvm/errors.def"
};

#undef ERR

// Shorthand for returning a status from C API functions
#define SYNVM_ERR(name) static_cast<synvm_err>(Err::name)

// Human readable message for each status
inline const char *err_str(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return msg;
#include "synvm/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

// Name of each status ("InvalidLoad", ...)
inline const char *err_name(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return #name;
#include "synvm/errors.def"
#undef ERR
    default:
      return "Unknown";
  }
}
