//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime configuration for UPER writers and readers.
///
/// Values are read from JSON settings objects, either a configuration file
/// passed to `asn1uper` or settings supplied by an embedding application.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_SUPPORT_CODEC_CONFIG_H
#define LLVMASN1_SUPPORT_CODEC_CONFIG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>

namespace llvmasn1
{

/// @brief Trace verbosity for codec logs.
enum class TraceLevel
{
    /// @brief Disable trace output.
    Off,

    /// @brief Trace container entry and exit.
    Basic,

    /// @brief Also trace extension blocks and open types.
    Verbose,
};

/// @brief Parses `off`, `basic` or `verbose`.
/// @param[in] raw Level name.
/// @param[out] level Parsed level.
/// @return True when `raw` names a level.
[[nodiscard]] bool parseTraceLevel(llvm::StringRef raw, TraceLevel& level);

/// @brief Limits and logging options of one encode or decode call.
struct CodecConfig final
{
    /// @brief Deepest container nesting accepted while decoding.
    std::uint32_t maxNestingDepth{64};

    /// @brief Largest length, in units, accepted from a decoded length determinant.
    std::uint64_t maxDecodedLength{16U * 1024U * 1024U};

    /// @brief Trace verbosity; traces go to the stream handed to the writer or reader.
    TraceLevel traceLevel{TraceLevel::Off};
};

/// @brief Applies a JSON settings object to `config`.
///
/// Recognized keys: `"trace"` (`off`, `basic`, `verbose`) and `"limits"`, an
/// object with `"maxNestingDepth"` and `"maxDecodedLength"`. Unknown keys and
/// values of the wrong type are ignored.
///
/// @param[in] settings Settings value.
/// @param[in,out] config Configuration to update.
/// @return True when any field changed.
bool applyCodecConfig(const llvm::json::Value& settings, CodecConfig& config);

/// @brief Reads a JSON settings file and applies it to the defaults.
/// @param[in] path File path.
/// @return Configuration, or an error for unreadable files and malformed JSON.
llvm::Expected<CodecConfig> loadCodecConfig(llvm::StringRef path);

}  // namespace llvmasn1

#endif  // LLVMASN1_SUPPORT_CODEC_CONFIG_H
