/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <fmt/ostream.h>
#include <folly/Likely.h>
#include <folly/Preprocessor.h>

#include "tagrow/common/ExceptionHelper.h"
#include "tagrow/common/TagrowException.h"

// Standard errors used throughout the codebase.

namespace tagrow {

namespace detail {

// Arguments needed to throw a Tagrow exception. Kept in a function-local
// static so the throwing site only passes a pointer and a message.
struct TagrowCheckFailArgs {
  const char* file;
  size_t line;
  const char* function;
  const char* expression;
  std::string_view errorCode;
  bool isRetryable;
};

// Out-of-line throw implementations to keep the check sites small.
template <typename Exception, typename Msg>
[[noreturn]] void tagrowCheckFail(const TagrowCheckFailArgs& args, Msg msg) {
  throw Exception(
      args.file,
      args.line,
      args.function,
      args.expression,
      msg,
      args.errorCode,
      args.isRetryable);
}

template <typename Msg>
[[noreturn]] void tagrowExternalCheckFail(
    const TagrowCheckFailArgs& args,
    std::string_view externalSource,
    Msg msg) {
  throw TagrowExternalError(
      args.file,
      args.line,
      args.function,
      args.expression,
      msg,
      args.errorCode,
      args.isRetryable,
      externalSource);
}

// Picks the parameter type used to forward a message: std::string is passed
// by reference, everything else by value.
template <typename T>
struct TagrowCheckFailStringType;

template <>
struct TagrowCheckFailStringType<CompileTimeEmptyString> {
  using type = CompileTimeEmptyString;
};

template <>
struct TagrowCheckFailStringType<const char*> {
  using type = const char*;
};

template <>
struct TagrowCheckFailStringType<std::string> {
  using type = const std::string&;
};

#define TAGROW_DECLARE_CHECK_FAIL_TEMPLATES(exceptionType)                     \
  namespace detail {                                                           \
  extern template void tagrowCheckFail<exceptionType, const char*>(            \
      const TagrowCheckFailArgs&,                                              \
      const char*);                                                            \
  extern template void tagrowCheckFail<exceptionType, const std::string&>(     \
      const TagrowCheckFailArgs&,                                              \
      const std::string&);                                                     \
  extern template void tagrowCheckFail<exceptionType, CompileTimeEmptyString>( \
      const TagrowCheckFailArgs&,                                              \
      CompileTimeEmptyString);                                                 \
  }

#define TAGROW_DEFINE_CHECK_FAIL_TEMPLATES(exceptionType)               \
  namespace detail {                                                    \
  template void tagrowCheckFail<exceptionType, const char*>(            \
      const TagrowCheckFailArgs&,                                       \
      const char*);                                                     \
  template void tagrowCheckFail<exceptionType, const std::string&>(     \
      const TagrowCheckFailArgs&,                                       \
      const std::string&);                                              \
  template void tagrowCheckFail<exceptionType, CompileTimeEmptyString>( \
      const TagrowCheckFailArgs&,                                       \
      CompileTimeEmptyString);                                          \
  }
} // namespace detail

TAGROW_DECLARE_CHECK_FAIL_TEMPLATES(::tagrow::TagrowUserError);
TAGROW_DECLARE_CHECK_FAIL_TEMPLATES(::tagrow::TagrowInternalError);

#define _TAGROW_THROW_IMPL(exception, exprStr, errorCode, retryable, ...)     \
  do {                                                                        \
    static const ::tagrow::detail::TagrowCheckFailArgs tagrowCheckFailArgs = { \
        __FILE__, __LINE__, __FUNCTION__, exprStr, errorCode, retryable};     \
    auto message = ::tagrow::errorMessage(__VA_ARGS__);                       \
    ::tagrow::detail::tagrowCheckFail<                                        \
        exception,                                                            \
        typename ::tagrow::detail::TagrowCheckFailStringType<                 \
            decltype(message)>::type>(tagrowCheckFailArgs, message);          \
  } while (0)

#define TAGROW_RAISE_USER_ERROR(expression, code, retryable, ...) \
  _TAGROW_THROW_IMPL(                                             \
      ::tagrow::TagrowUserError, expression, code, retryable, ##__VA_ARGS__)

#define TAGROW_RAISE_INTERNAL_ERROR(expression, code, retryable, ...) \
  _TAGROW_THROW_IMPL(                                                 \
      ::tagrow::TagrowInternalError,                                  \
      expression,                                                     \
      code,                                                           \
      retryable,                                                      \
      ##__VA_ARGS__)

// Raised when a dependency (file system, ...) fails. External errors are
// retryable by default, the environment may recover.
#define TAGROW_RAISE_EXTERNAL_ERROR(source, ...)                              \
  do {                                                                        \
    static const ::tagrow::detail::TagrowCheckFailArgs tagrowCheckFailArgs = { \
        __FILE__,                                                             \
        __LINE__,                                                             \
        __FUNCTION__,                                                         \
        "",                                                                   \
        ::tagrow::error_code::IoError,                                        \
        /* retryable */ true};                                                \
    auto message = ::tagrow::errorMessage(__VA_ARGS__);                       \
    ::tagrow::detail::tagrowExternalCheckFail<                                \
        typename ::tagrow::detail::TagrowCheckFailStringType<                 \
            decltype(message)>::type>(tagrowCheckFailArgs, source, message);  \
  } while (0)

#define _TAGROW_CHECK_AND_THROW_IMPL(                             \
    exprStr, expr, exception, errorCode, retryable, ...)          \
  if (FOLLY_UNLIKELY(!(expr))) {                                  \
    _TAGROW_THROW_IMPL(                                           \
        exception, exprStr, errorCode, retryable, ##__VA_ARGS__); \
  }

#define _TAGROW_CHECK_IMPL(expr, exprStr, ...) \
  _TAGROW_CHECK_AND_THROW_IMPL(                \
      exprStr,                                 \
      expr,                                    \
      ::tagrow::TagrowInternalError,           \
      ::tagrow::error_code::InvalidArgument,   \
      false,                                   \
      ##__VA_ARGS__)

#define TAGROW_CHECK(expr, ...) _TAGROW_CHECK_IMPL(expr, #expr, ##__VA_ARGS__)

// Verify an expected file format condition. Failure means the input (or a
// produced blob being decoded) is corrupted. This triggers a user error.
#define TAGROW_CHECK_FILE(condition, ...)    \
  if (FOLLY_UNLIKELY(!(condition))) {        \
    TAGROW_RAISE_USER_ERROR(                 \
        #condition,                          \
        ::tagrow::error_code::CorruptedFile, \
        /* retryable */ false,               \
        __VA_ARGS__);                        \
  }

// Should be raised when we don't expect to hit a code path, but we did. This
// means a bug in Tagrow.
#define TAGROW_UNREACHABLE(...)                \
  TAGROW_RAISE_INTERNAL_ERROR(                 \
      "",                                      \
      ::tagrow::error_code::UnreachableCode,   \
      /* retryable */ false,                   \
      __VA_ARGS__);

// Should be raised in places where we don't support a functionality, and have
// no intention to support it in the future.
#define TAGROW_UNSUPPORTED(...)             \
  TAGROW_RAISE_USER_ERROR(                  \
      "",                                   \
      ::tagrow::error_code::NotSupported,   \
      /* retryable */ false,                \
      __VA_ARGS__);

#define _TAGROW_CHECK_OP_WITH_USER_FMT_HELPER(  \
    implmacro, expr1, expr2, op, user_fmt, ...) \
  implmacro(                                    \
      (expr1)op(expr2),                         \
      #expr1 " " #op " " #expr2,                \
      "({} vs. {}) " user_fmt,                  \
      expr1,                                    \
      expr2,                                    \
      ##__VA_ARGS__)

#define _TAGROW_CHECK_OP_HELPER(implmacro, expr1, expr2, op, ...) \
  do {                                                            \
    if constexpr (FOLLY_PP_DETAIL_NARGS(__VA_ARGS__) > 0) {       \
      _TAGROW_CHECK_OP_WITH_USER_FMT_HELPER(                      \
          implmacro, expr1, expr2, op, __VA_ARGS__);              \
    } else {                                                      \
      implmacro(                                                  \
          (expr1)op(expr2),                                       \
          #expr1 " " #op " " #expr2,                              \
          "({} vs. {})",                                          \
          expr1,                                                  \
          expr2);                                                 \
    }                                                             \
  } while (0)

#define _TAGROW_CHECK_OP(expr1, expr2, op, ...) \
  _TAGROW_CHECK_OP_HELPER(_TAGROW_CHECK_IMPL, expr1, expr2, op, ##__VA_ARGS__)

#define _TAGROW_USER_CHECK_IMPL(expr, exprStr, ...) \
  _TAGROW_CHECK_AND_THROW_IMPL(                     \
      exprStr,                                      \
      expr,                                         \
      ::tagrow::TagrowUserError,                    \
      ::tagrow::error_code::InvalidArgument,        \
      /* retryable */ false,                        \
      ##__VA_ARGS__)

#define TAGROW_USER_CHECK(expr, ...) \
  _TAGROW_USER_CHECK_IMPL(expr, #expr, ##__VA_ARGS__)

#define TAGROW_CHECK_GT(e1, e2, ...) _TAGROW_CHECK_OP(e1, e2, >, ##__VA_ARGS__)
#define TAGROW_CHECK_LT(e1, e2, ...) _TAGROW_CHECK_OP(e1, e2, <, ##__VA_ARGS__)
#define TAGROW_CHECK_EQ(e1, e2, ...) _TAGROW_CHECK_OP(e1, e2, ==, ##__VA_ARGS__)

#define TAGROW_FAIL(...)                     \
  TAGROW_RAISE_INTERNAL_ERROR(               \
      "",                                    \
      ::tagrow::error_code::InvalidState,    \
      /* retryable */ false,                 \
      __VA_ARGS__)

#define TAGROW_USER_FAIL(...)                \
  TAGROW_RAISE_USER_ERROR(                   \
      "",                                    \
      ::tagrow::error_code::InvalidArgument, \
      /* retryable */ false,                 \
      __VA_ARGS__)

#ifndef NDEBUG
#define TAGROW_DCHECK_LE(e1, e2, ...) \
  _TAGROW_CHECK_OP(e1, e2, <=, ##__VA_ARGS__)
#else
#define TAGROW_DCHECK_LE(e1, e2, ...) TAGROW_CHECK(true, "")
#endif

} // namespace tagrow
