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

#include "tagrow/common/TagrowException.h"

#include <folly/Conv.h>
#include <folly/Likely.h>
#include <folly/experimental/symbolizer/Symbolizer.h>
#include <glog/logging.h>

namespace tagrow {

TagrowException::TagrowException(
    std::string_view exceptionName,
    const char* fileName,
    size_t fileLine,
    const char* functionName,
    std::string_view failingExpression,
    std::string_view errorMessage,
    std::string_view errorCode,
    bool retryable)
    : exceptionName_{exceptionName},
      fileName_{fileName},
      fileLine_{fileLine},
      functionName_{functionName},
      failingExpression_{failingExpression},
      errorMessage_{errorMessage},
      errorCode_{errorCode},
      retryable_{retryable} {
  captureStackTraceFrames();
}

const char* TagrowException::what() const noexcept {
  try {
    folly::call_once(once_, [&] { finalizeMessage(); });
    return finalizedMessage_.c_str();
  } catch (...) {
    return "<unknown failure in TagrowException::what>";
  }
}

void TagrowException::captureStackTraceFrames() {
  try {
    constexpr ssize_t skipFrames = 2;
    constexpr size_t maxFrames = 200;
    uintptr_t addresses[maxFrames];
    ssize_t n = folly::symbolizer::getStackTrace(addresses, maxFrames);

    if (n < skipFrames) {
      return;
    }

    exceptionFrames_.assign(addresses + skipFrames, addresses + n);
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Unable to capture stack trace: " << ex.what();
  } catch (...) {
    LOG(WARNING) << "Unable to capture stack trace.";
  }
}

void TagrowException::finalizeMessage() const {
  finalizedMessage_ += exceptionName_;
  finalizedMessage_ += "\nError Source: ";
  finalizedMessage_ += errorSource();
  finalizedMessage_ += "\nError Code: ";
  finalizedMessage_ += errorCode_;
  if (!errorMessage_.empty()) {
    finalizedMessage_ += "\nError Message: ";
    finalizedMessage_ += errorMessage_;
  }
  finalizedMessage_ += "\n";
  appendMessage(finalizedMessage_);
  finalizedMessage_ += "Retryable: ";
  finalizedMessage_ += retryable_ ? "True" : "False";
  finalizedMessage_ += "\nLocation: ";
  finalizedMessage_ += functionName_;
  finalizedMessage_ += "@";
  finalizedMessage_ += fileName_;
  finalizedMessage_ += ":";
  finalizedMessage_ += folly::to<std::string>(fileLine_);

  if (!failingExpression_.empty()) {
    finalizedMessage_ += "\nExpression: ";
    finalizedMessage_ += failingExpression_;
  }

  if (FOLLY_LIKELY(!exceptionFrames_.empty())) {
    std::vector<folly::symbolizer::SymbolizedFrame> symbolizedFrames;
    symbolizedFrames.resize(exceptionFrames_.size());

    folly::symbolizer::Symbolizer symbolizer{
        folly::symbolizer::LocationInfoMode::FULL};
    symbolizer.symbolize(
        exceptionFrames_.data(),
        symbolizedFrames.data(),
        symbolizedFrames.size());

    folly::symbolizer::StringSymbolizePrinter printer{
        folly::symbolizer::StringSymbolizePrinter::COLOR};
    printer.println(symbolizedFrames.data(), symbolizedFrames.size());

    finalizedMessage_ += "\nStack Trace:\n";
    finalizedMessage_ += printer.str();
  }
}

TagrowUserError::TagrowUserError(
    const char* fileName,
    size_t fileLine,
    const char* functionName,
    std::string_view failingExpression,
    std::string_view errorMessage,
    std::string_view errorCode,
    bool retryable)
    : TagrowException(
          "TagrowUserError",
          fileName,
          fileLine,
          functionName,
          failingExpression,
          errorMessage,
          errorCode,
          retryable) {}

const std::string_view TagrowUserError::errorSource() const {
  return "USER";
}

TagrowInternalError::TagrowInternalError(
    const char* fileName,
    size_t fileLine,
    const char* functionName,
    std::string_view failingExpression,
    std::string_view errorMessage,
    std::string_view errorCode,
    bool retryable)
    : TagrowException(
          "TagrowInternalError",
          fileName,
          fileLine,
          functionName,
          failingExpression,
          errorMessage,
          errorCode,
          retryable) {}

const std::string_view TagrowInternalError::errorSource() const {
  return "INTERNAL";
}

TagrowExternalError::TagrowExternalError(
    const char* fileName,
    size_t fileLine,
    const char* functionName,
    std::string_view failingExpression,
    std::string_view errorMessage,
    std::string_view errorCode,
    bool retryable,
    std::string_view externalSource)
    : TagrowException(
          "TagrowExternalError",
          fileName,
          fileLine,
          functionName,
          failingExpression,
          errorMessage,
          errorCode,
          retryable),
      externalSource_{externalSource} {}

const std::string_view TagrowExternalError::errorSource() const {
  return "EXTERNAL";
}

void TagrowExternalError::appendMessage(std::string& message) const {
  message += "External Source: ";
  message += externalSource_;
  message += "\n";
}
} // namespace tagrow
