#pragma once

/// @file exception.h
/// @brief Exception type for bandprint errors.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace bandprint {

/// @brief Exception carrying an ErrorCode.
/// @details Per-file failures (decode, too-short audio) are caught by the
///          generation batch and aggregated; cache write failures and contract
///          violations reach the caller.
class BandprintException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  explicit BandprintException(ErrorCode code)
      : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  BandprintException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @def BANDPRINT_CHECK
/// @brief Throws BandprintException if condition is false.
#define BANDPRINT_CHECK(cond, code)     \
  do {                                  \
    if (!(cond)) {                      \
      throw BandprintException(code);   \
    }                                   \
  } while (0)

/// @def BANDPRINT_CHECK_MSG
/// @brief Throws BandprintException with custom message if condition is false.
#define BANDPRINT_CHECK_MSG(cond, code, msg)  \
  do {                                        \
    if (!(cond)) {                            \
      throw BandprintException(code, msg);    \
    }                                         \
  } while (0)

}  // namespace bandprint
