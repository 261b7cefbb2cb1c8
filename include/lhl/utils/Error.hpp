////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#ifndef LHL_UTILS_ERROR_HPP_
#define LHL_UTILS_ERROR_HPP_

#include <lhl_config.hpp>

#include <exception>
#include <memory>
#include <string>

#include "lhl/utils/strings.hpp"

/** @file Error.hpp
 *
 *  A collection of macros and other simple constructs for reporting
 *  and handling runtime errors.
 *
 *  Misusing labels or lists is always a compile-time error; these
 *  facilities cover the runtime support code (environment, logging,
 *  type names).
 */

/** @def LHL_DEFINE_FORWARDING_EXCEPTION(name, parent)
 *  @brief Define a class that forwards all arguments to its parent.
 *
 *  @param name The name of the new class.
 *  @param parent The name of the parent class.
 */
#define LHL_DEFINE_FORWARDING_EXCEPTION(name, parent)                          \
  class name : public parent                                                   \
  {                                                                            \
  public:                                                                      \
    /* @brief Constructor */                                                   \
    template <typename... Ts>                                                  \
    name(Ts&&... args) : parent(lhl::build_string(std::forward<Ts>(args)...))  \
    {}                                                                         \
  }

/** Save a backtrace when constructing an exception. */
static constexpr struct save_backtrace_t {} SaveBacktrace;
/** Do not save a backtrace when constructing an exception. */
static constexpr struct no_save_backtrace_t {} NoSaveBacktrace;

/**
 * Base class for LHList exceptions.
 *
 * A stack trace may optionally be recorded.
 *
 * @warning Do not attempt to use this in a signal handler.
 */
class LHLExceptionBase : public std::exception
{
public:
  LHLExceptionBase(const std::string& what_arg)
  {
    set_what_and_maybe_collect_backtrace(what_arg, should_save_backtrace());
  }

  LHLExceptionBase(const char* what_arg)
    : LHLExceptionBase(std::string(what_arg))
  {}

  LHLExceptionBase(const std::string& what_arg, save_backtrace_t)
  {
    set_what_and_maybe_collect_backtrace(what_arg, true);
  }

  LHLExceptionBase(const std::string& what_arg, no_save_backtrace_t)
  {
    set_what_and_maybe_collect_backtrace(what_arg, false);
  }

  LHLExceptionBase(const LHLExceptionBase& other) noexcept
    : what_(other.what_)
  {}

  LHLExceptionBase& operator=(const LHLExceptionBase& other) noexcept
  {
    what_ = other.what_;
    return *this;
  }

  virtual ~LHLExceptionBase() {}

  virtual const char* what() const noexcept { return what_->c_str(); }

private:
  /**
   * Error message, possibly with a backtrace.
   *
   * Shared so that copying the exception cannot throw.
   */
  std::shared_ptr<std::string> what_;

  /** Whether to save a backtrace if not explicitly requested. */
  static bool should_save_backtrace();

  /** Set up what_ and maybe collect a backtrace. */
  void set_what_and_maybe_collect_backtrace(const std::string& what_arg,
                                            bool collect_bt);
};

/** Any non-recoverable error. Always records a backtrace. */
class LHLFatalException : public LHLExceptionBase
{
public:
  template <typename... Args>
  LHLFatalException(Args&&... args)
    : LHLExceptionBase(lhl::build_string(std::forward<Args>(args)...),
                       SaveBacktrace)
  {}
};

/**
 * A potentially recoverable error.
 *
 * Collects a backtrace in debug mode or when the LHL_DEBUG_BACKTRACE
 * env var is set.
 */
LHL_DEFINE_FORWARDING_EXCEPTION(LHLNonfatalException, LHLExceptionBase);

/** @def LHL_ASSERT(cond, excptn, ...)
 *  @brief Check that the condition is true and throw an exception if
 *         not.
 *
 *  @param cond The condition to test. Must be a boolean value.
 *  @param excptn The exception to throw if `cond` evaluates to
 *                `false`.
 *  @param ... The arguments to pass to the exception.
 */
#define LHL_ASSERT(cond, excptn, ...)                                          \
  do                                                                           \
  {                                                                            \
    if (!(cond))                                                               \
    {                                                                          \
      throw excptn(__VA_ARGS__);                                               \
    }                                                                          \
  } while (0)

/** @def LHL_ASSERT_ALWAYS
 *  @brief Check a condition regardless of the build type.
 */
#define LHL_ASSERT_ALWAYS(cond, ...)                                           \
  LHL_ASSERT(cond, LHLFatalException, __VA_ARGS__)

#endif // LHL_UTILS_ERROR_HPP_
