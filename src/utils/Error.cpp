////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include <lhl_config.hpp>
#include <lhl/utils/Error.hpp>

#include <execinfo.h>
#include <dlfcn.h>

#include <iomanip>
#include <memory>
#include <sstream>

#if __has_include(<cxxabi.h>)
#include <cxxabi.h>
#define LHL_HAS_CXXABI_H
#endif

#ifndef LHL_DEBUG_BUILD
// Only used when not in debug mode.
#include "lhl/utils/environment_vars.hpp"
#endif

bool LHLExceptionBase::should_save_backtrace()
{
#ifdef LHL_DEBUG_BUILD
  return true;  // Always save backtraces in debug mode.
#else
  return lhl::env::get<bool>("DEBUG_BACKTRACE");
#endif
}

void LHLExceptionBase::set_what_and_maybe_collect_backtrace(
  const std::string& what_arg, bool collect_bt)
{
  if (!collect_bt)
  {
    what_ = std::make_shared<std::string>(what_arg);
    return;
  }

  constexpr int max_frames = 128;
  using c_str_ptr = std::unique_ptr<char, void (*)(void*)>;
  using c_str_ptr_ptr = std::unique_ptr<char*, void (*)(void*)>;

  void* frames[max_frames];
  const int num_frames = backtrace(frames, max_frames);

  c_str_ptr_ptr symbols{backtrace_symbols(frames, num_frames), free};

  // This does not reuse the demangling in typename.cpp, which may
  // itself throw.
  std::ostringstream ss;
  ss << what_arg << "\nStack trace:\n";
  for (int i = 0; i < num_frames; ++i)
  {
    ss << std::setw(4) << i << ": ";
#ifdef LHL_HAS_CXXABI_H
    Dl_info info;
    if (dladdr(frames[i], &info) != 0 && info.dli_sname != nullptr)
    {
      c_str_ptr demangled{
        abi::__cxa_demangle(info.dli_sname, nullptr, nullptr, nullptr), free};
      if (demangled)
      {
        ss << demangled.get();
      }
      else
      {
        ss << info.dli_sname << " (demangling failed)";
      }
    }
    else
#endif  // LHL_HAS_CXXABI_H
    {
      if (symbols)
      {
        ss << symbols.get()[i] << " ";
      }
      ss << "(could not find stack frame symbol)";
    }
    ss << "\n";
  }

  what_ = std::make_shared<std::string>(ss.str());
}
