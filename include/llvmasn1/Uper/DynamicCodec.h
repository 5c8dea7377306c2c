//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Descriptor-driven UPER encoding and decoding of dynamic values.
///
/// The dynamic codec walks a `TypeDescriptor` and a `Value` side by side and
/// issues the same `UperWriter`/`UperReader` calls a hand-written binding for
/// the type would issue.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_UPER_DYNAMIC_CODEC_H
#define LLVMASN1_UPER_DYNAMIC_CODEC_H

#include "llvmasn1/Model/TypeDescriptor.h"
#include "llvmasn1/Model/Value.h"
#include "llvmasn1/Support/CodecConfig.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace llvmasn1
{

/// @brief Complete UPER encoding of one value.
struct Encoded final
{
    /// @brief Encoded bytes; bits past `bitLength` are zero.
    std::vector<std::uint8_t> bytes;

    /// @brief Number of meaningful bits.
    std::size_t bitLength{0};
};

/// @brief Result of decoding one value.
struct Decoded final
{
    ValuePtr value;

    /// @brief Bits consumed from the input.
    std::size_t consumedBits{0};
};

/// @brief Encodes `value` as an instance of `type`.
/// @param[in] value Value to encode.
/// @param[in] type Descriptor of the value's type.
/// @param[in] config Limits and trace level.
/// @param[in] trace Trace destination; nothing is traced when null.
/// @return Encoding, or a `CodecError`. A value that does not match the
///         descriptor fails with `UnsupportedOperation`.
llvm::Expected<Encoded> encode(const Value&          value,
                               const TypeDescriptor& type,
                               const CodecConfig&    config = {},
                               llvm::raw_ostream*    trace  = nullptr);

/// @brief Decodes one instance of `type` from the first `bitLength` bits of `bytes`.
llvm::Expected<Decoded> decode(llvm::ArrayRef<std::uint8_t> bytes,
                               std::size_t                  bitLength,
                               const TypeDescriptor&        type,
                               const CodecConfig&           config = {},
                               llvm::raw_ostream*           trace  = nullptr);

}  // namespace llvmasn1

#endif  // LLVMASN1_UPER_DYNAMIC_CODEC_H
