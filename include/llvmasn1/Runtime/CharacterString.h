//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Restricted character string encodings (ITU-T X.691 clause 30).
///
/// UTF8String content travels as an octet string of unconstrained length.
/// NumericString uses 4-bit alphabet indices; PrintableString, IA5String and
/// VisibleString use 7-bit character codes. Size constraints of the
/// known-multiplier types count characters.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_RUNTIME_CHARACTER_STRING_H
#define LLVMASN1_RUNTIME_CHARACTER_STRING_H

#include "llvmasn1/Model/Constraint.h"
#include "llvmasn1/Runtime/BitBuffer.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <limits>
#include <string>

namespace llvmasn1::per
{

/// @brief NumericString alphabet in index order.
inline constexpr llvm::StringLiteral kNumericAlphabet = " 0123456789";

/// @brief Bits per character, or 0 for UTF8String.
[[nodiscard]] unsigned bitsPerCharacter(Charset charset);

/// @brief Tells whether a character code belongs to the charset.
[[nodiscard]] bool isPermittedCharacter(Charset charset, std::uint32_t character);

/// @brief Checks every character of `value`.
/// @return Success, `InvalidUtf8String` or `InvalidCharacter` for the first offending character.
llvm::Error validateCharacterString(Charset charset, llvm::StringRef value);

llvm::Error writeCharacterString(BitBuffer&      out,
                                 Charset         charset,
                                 SizeBound       lower,
                                 SizeBound       upper,
                                 bool            extensible,
                                 llvm::StringRef value);

llvm::Expected<std::string> readCharacterString(BitSource&    in,
                                                Charset       charset,
                                                SizeBound     lower,
                                                SizeBound     upper,
                                                bool          extensible,
                                                std::uint64_t limit = std::numeric_limits<std::uint64_t>::max());

}  // namespace llvmasn1::per

#endif  // LLVMASN1_RUNTIME_CHARACTER_STRING_H
