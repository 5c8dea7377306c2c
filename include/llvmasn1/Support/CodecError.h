//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error model shared by every layer of the UPER runtime.
///
/// All codec failures travel as `llvm::Error` values carrying a `CodecError`
/// payload. Callers that need to branch on the failure (tests, the CLI) turn
/// the error into a `CodecFailure` snapshot with `takeCodecFailure`.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_SUPPORT_CODEC_ERROR_H
#define LLVMASN1_SUPPORT_CODEC_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace llvmasn1
{

/// @brief Failure categories reported by the UPER runtime.
enum class CodecErrorKind
{
    /// @brief A read ran past the written or declared end of the input.
    EndOfStream,

    /// @brief An integer lies outside its constraint (value, lower, upper).
    ValueNotInRange,

    /// @brief A size lies outside its size constraint (size, lower, upper).
    SizeNotInRange,

    /// @brief A choice or enumeration index names no known alternative (index, count).
    InvalidChoiceIndex,

    /// @brief Extension marker disagrees with the schema (expected, actual).
    InvalidExtensionConstellation,

    /// @brief The encoding needs a capability this runtime does not have.
    UnsupportedOperation,

    /// @brief A reserved presence-bit run was used more times than its size.
    OptFlagsExhausted,

    /// @brief UTF8String content is not well-formed UTF-8.
    InvalidUtf8String,

    /// @brief A character is outside the alphabet of its string type (character, index).
    InvalidCharacter,
};

/// @brief Returns a stable lowercase name for an error kind.
/// @param[in] kind Error kind.
/// @return Kind name, e.g. `value-not-in-range`.
[[nodiscard]] llvm::StringRef codecErrorKindName(CodecErrorKind kind);

/// @brief `llvm::ErrorInfo` payload for codec failures.
class CodecError final : public llvm::ErrorInfo<CodecError>
{
public:
    /// @brief LLVM RTTI anchor.
    static char ID;

    /// @brief Constructs an error record.
    /// @param[in] kind Failure category.
    /// @param[in] detail Free-form context, used by `UnsupportedOperation` and `InvalidCharacter`.
    /// @param[in] first First numeric operand of the failure.
    /// @param[in] second Second numeric operand of the failure.
    /// @param[in] third Third numeric operand of the failure.
    CodecError(CodecErrorKind kind,
               std::string    detail = {},
               std::int64_t   first  = 0,
               std::int64_t   second = 0,
               std::int64_t   third  = 0);

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    [[nodiscard]] CodecErrorKind kind() const
    {
        return kind_;
    }

    [[nodiscard]] const std::string& detail() const
    {
        return detail_;
    }

    [[nodiscard]] std::int64_t first() const
    {
        return first_;
    }

    [[nodiscard]] std::int64_t second() const
    {
        return second_;
    }

    [[nodiscard]] std::int64_t third() const
    {
        return third_;
    }

private:
    CodecErrorKind kind_;
    std::string    detail_;
    std::int64_t   first_;
    std::int64_t   second_;
    std::int64_t   third_;
};

/// @brief Comparable snapshot of a consumed `CodecError`.
struct CodecFailure final
{
    CodecErrorKind kind{CodecErrorKind::EndOfStream};
    std::string    detail;
    std::int64_t   first{0};
    std::int64_t   second{0};
    std::int64_t   third{0};
    std::string    message;
};

/// @brief Consumes an error and returns its codec payload.
///
/// Errors of other classes are consumed as well; their text lands in
/// `message` and the kind is left unset.
///
/// @param[in] err Error to consume.
/// @return Snapshot, or `std::nullopt` when `err` was success or not a codec error.
[[nodiscard]] std::optional<CodecFailure> takeCodecFailure(llvm::Error err);

llvm::Error makeEndOfStream();
llvm::Error makeValueNotInRange(std::int64_t value, std::int64_t lower, std::int64_t upper);
llvm::Error makeSizeNotInRange(std::uint64_t size, std::uint64_t lower, std::uint64_t upper);
llvm::Error makeInvalidChoiceIndex(std::uint64_t index, std::uint64_t count);
llvm::Error makeInvalidExtensionConstellation(bool expected, bool actual);
llvm::Error makeUnsupportedOperation(llvm::StringRef what);
llvm::Error makeOptFlagsExhausted();
llvm::Error makeInvalidUtf8String();

/// @brief Builds an `InvalidCharacter` error.
/// @param[in] charset Name of the string type, e.g. `NumericString`.
/// @param[in] character Offending character code.
/// @param[in] index Character index inside the string.
/// @return Error value.
llvm::Error makeInvalidCharacter(llvm::StringRef charset, std::uint32_t character, std::uint64_t index);

}  // namespace llvmasn1

#endif  // LLVMASN1_SUPPORT_CODEC_ERROR_H
