//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the codec error payload and its factory helpers.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Support/CodecError.h"

#include <utility>

namespace llvmasn1
{

char CodecError::ID = 0;

llvm::StringRef codecErrorKindName(const CodecErrorKind kind)
{
    switch (kind)
    {
    case CodecErrorKind::EndOfStream:
        return "end-of-stream";
    case CodecErrorKind::ValueNotInRange:
        return "value-not-in-range";
    case CodecErrorKind::SizeNotInRange:
        return "size-not-in-range";
    case CodecErrorKind::InvalidChoiceIndex:
        return "invalid-choice-index";
    case CodecErrorKind::InvalidExtensionConstellation:
        return "invalid-extension-constellation";
    case CodecErrorKind::UnsupportedOperation:
        return "unsupported-operation";
    case CodecErrorKind::OptFlagsExhausted:
        return "opt-flags-exhausted";
    case CodecErrorKind::InvalidUtf8String:
        return "invalid-utf8-string";
    case CodecErrorKind::InvalidCharacter:
        return "invalid-character";
    }
    return "unknown";
}

CodecError::CodecError(const CodecErrorKind kind,
                       std::string          detail,
                       const std::int64_t   first,
                       const std::int64_t   second,
                       const std::int64_t   third)
    : kind_(kind)
    , detail_(std::move(detail))
    , first_(first)
    , second_(second)
    , third_(third)
{
}

void CodecError::log(llvm::raw_ostream& os) const
{
    switch (kind_)
    {
    case CodecErrorKind::EndOfStream:
        os << "unexpected end of stream";
        return;
    case CodecErrorKind::ValueNotInRange:
        os << "value " << first_ << " is not in range [" << second_ << ", " << third_ << "]";
        return;
    case CodecErrorKind::SizeNotInRange:
        os << "size " << static_cast<std::uint64_t>(first_) << " is not in range ["
           << static_cast<std::uint64_t>(second_) << ", " << static_cast<std::uint64_t>(third_) << "]";
        return;
    case CodecErrorKind::InvalidChoiceIndex:
        os << "choice index " << first_ << " is invalid for " << second_ << " known variants";
        return;
    case CodecErrorKind::InvalidExtensionConstellation:
        os << "invalid extension constellation: expected " << (first_ != 0 ? "present" : "absent")
           << " but found " << (second_ != 0 ? "present" : "absent");
        return;
    case CodecErrorKind::UnsupportedOperation:
        os << "unsupported operation: " << detail_;
        return;
    case CodecErrorKind::OptFlagsExhausted:
        os << "presence bit run exhausted";
        return;
    case CodecErrorKind::InvalidUtf8String:
        os << "invalid UTF-8 string";
        return;
    case CodecErrorKind::InvalidCharacter:
        os << "character 0x";
        os.write_hex(static_cast<unsigned long long>(first_));
        os << " at index " << second_ << " is not allowed in " << detail_;
        return;
    }
}

std::error_code CodecError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

std::optional<CodecFailure> takeCodecFailure(llvm::Error err)
{
    std::optional<CodecFailure> out;
    llvm::handleAllErrors(
        std::move(err),
        [&out](const CodecError& codec) {
            CodecFailure failure;
            failure.kind    = codec.kind();
            failure.detail  = codec.detail();
            failure.first   = codec.first();
            failure.second  = codec.second();
            failure.third   = codec.third();
            failure.message = codec.message();
            out             = std::move(failure);
        },
        [](const llvm::ErrorInfoBase&) {});
    return out;
}

llvm::Error makeEndOfStream()
{
    return llvm::make_error<CodecError>(CodecErrorKind::EndOfStream);
}

llvm::Error makeValueNotInRange(const std::int64_t value, const std::int64_t lower, const std::int64_t upper)
{
    return llvm::make_error<CodecError>(CodecErrorKind::ValueNotInRange, std::string{}, value, lower, upper);
}

llvm::Error makeSizeNotInRange(const std::uint64_t size, const std::uint64_t lower, const std::uint64_t upper)
{
    return llvm::make_error<CodecError>(CodecErrorKind::SizeNotInRange,
                                        std::string{},
                                        static_cast<std::int64_t>(size),
                                        static_cast<std::int64_t>(lower),
                                        static_cast<std::int64_t>(upper));
}

llvm::Error makeInvalidChoiceIndex(const std::uint64_t index, const std::uint64_t count)
{
    return llvm::make_error<CodecError>(CodecErrorKind::InvalidChoiceIndex,
                                        std::string{},
                                        static_cast<std::int64_t>(index),
                                        static_cast<std::int64_t>(count));
}

llvm::Error makeInvalidExtensionConstellation(const bool expected, const bool actual)
{
    return llvm::make_error<CodecError>(CodecErrorKind::InvalidExtensionConstellation,
                                        std::string{},
                                        expected ? 1 : 0,
                                        actual ? 1 : 0);
}

llvm::Error makeUnsupportedOperation(llvm::StringRef what)
{
    return llvm::make_error<CodecError>(CodecErrorKind::UnsupportedOperation, what.str());
}

llvm::Error makeOptFlagsExhausted()
{
    return llvm::make_error<CodecError>(CodecErrorKind::OptFlagsExhausted);
}

llvm::Error makeInvalidUtf8String()
{
    return llvm::make_error<CodecError>(CodecErrorKind::InvalidUtf8String);
}

llvm::Error makeInvalidCharacter(llvm::StringRef charset, const std::uint32_t character, const std::uint64_t index)
{
    return llvm::make_error<CodecError>(CodecErrorKind::InvalidCharacter,
                                        charset.str(),
                                        static_cast<std::int64_t>(character),
                                        static_cast<std::int64_t>(index));
}

}  // namespace llvmasn1
