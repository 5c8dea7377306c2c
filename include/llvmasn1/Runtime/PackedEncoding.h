//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Unaligned PER primitives (ITU-T X.691 clauses 11, 16, 17, 19 and 23).
///
/// Writers append to a `BitBuffer`; readers consume any `BitSource`. Absent
/// bounds are passed as `std::nullopt` and only turned into numbers inside the
/// formulas that need them.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_RUNTIME_PACKED_ENCODING_H
#define LLVMASN1_RUNTIME_PACKED_ENCODING_H

#include "llvmasn1/Model/Constraint.h"
#include "llvmasn1/Runtime/BitBuffer.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace llvmasn1::per
{

/// @brief Longest length encoded in the one-octet determinant form.
inline constexpr std::uint64_t kShortLengthLimit = 127U;

/// @brief Fragment unit; lengths at or above it switch to fragmented form.
inline constexpr std::uint64_t kFragmentSize = 16U * 1024U;

/// @brief Maximum number of fragment units in one fragment.
inline constexpr std::uint64_t kMaxFragmentUnits = 4U;

/// @brief Size bounds at or above this value are not PER-visible as constrained lengths.
inline constexpr std::uint64_t kLengthLimit64K = 64U * 1024U;

/// @brief Largest value of a normally small number encoded in the short form.
inline constexpr std::uint64_t kNormallySmallLimit = 63U;

/// @brief Upper bound reported when a bound is absent.
inline constexpr std::int64_t kNoUpperBound = std::numeric_limits<std::int64_t>::max();

/// @brief Bit string content with its exact length.
struct BitStringData final
{
    std::vector<std::uint8_t> bytes;
    std::uint64_t             bitLength{0};

    bool operator==(const BitStringData&) const = default;
};

/// @brief One decoded length determinant.
struct LengthChunk final
{
    /// @brief Units covered by this determinant.
    std::uint64_t length{0};

    /// @brief True for a fragment header; another determinant follows the content.
    bool fragment{false};
};

/// @brief Emits `count` units starting at unit `offset`.
using ChunkWriter = llvm::function_ref<llvm::Error(std::uint64_t offset, std::uint64_t count)>;

/// @brief Consumes the next `count` units.
using ChunkReader = llvm::function_ref<llvm::Error(std::uint64_t count)>;

/// @brief Number of bits needed to encode any offset in `[0, range]`.
[[nodiscard]] unsigned bitWidth(std::uint64_t range);

//===----------------------------------------------------------------------===//
// Whole numbers (clause 11)
//===----------------------------------------------------------------------===//

/// @brief Encodes a non-negative binary integer.
///
/// With either bound present `value - lower` is written in the bit width of
/// the range (a missing lower bound is 0, a missing upper bound is INT64_MAX).
/// Without bounds the minimal big-endian magnitude, at least one octet, is
/// written after a length determinant.
///
/// @return Success, or `ValueNotInRange` for a value outside present bounds.
llvm::Error writeNonNegativeBinaryInteger(BitBuffer&    out,
                                          std::uint64_t value,
                                          SizeBound     lower = std::nullopt,
                                          SizeBound     upper = std::nullopt);
llvm::Expected<std::uint64_t> readNonNegativeBinaryInteger(BitSource& in,
                                                           SizeBound  lower = std::nullopt,
                                                           SizeBound  upper = std::nullopt);

/// @brief Encodes the low `bitLength` bits of `value` (two's complement).
/// @return Success, or `UnsupportedOperation` for widths above 64.
llvm::Error writeTwosComplementBinaryInteger(BitBuffer& out, std::int64_t value, unsigned bitLength);

/// @brief Decodes a `bitLength`-bit two's complement integer with sign extension.
llvm::Expected<std::int64_t> readTwosComplementBinaryInteger(BitSource& in, unsigned bitLength);

llvm::Error                  writeConstrainedWholeNumber(BitBuffer& out,
                                                         std::int64_t lower,
                                                         std::int64_t upper,
                                                         std::int64_t value);
llvm::Expected<std::int64_t> readConstrainedWholeNumber(BitSource& in, std::int64_t lower, std::int64_t upper);

llvm::Error                  writeSemiConstrainedWholeNumber(BitBuffer& out, std::int64_t lower, std::int64_t value);
llvm::Expected<std::int64_t> readSemiConstrainedWholeNumber(BitSource& in, std::int64_t lower);

llvm::Error                  writeUnconstrainedWholeNumber(BitBuffer& out, std::int64_t value);
llvm::Expected<std::int64_t> readUnconstrainedWholeNumber(BitSource& in);

llvm::Error                   writeNormallySmallNonNegativeWholeNumber(BitBuffer& out, std::uint64_t value);
llvm::Expected<std::uint64_t> readNormallySmallNonNegativeWholeNumber(BitSource& in);

/// @brief Encodes an INTEGER under its PER-visible constraint.
///
/// Both bounds select the constrained form, a lower bound alone the
/// semi-constrained form, anything else the unconstrained form. Extensible
/// constraints prefix a bit that is set when the value is outside the root
/// range; such values use the unconstrained form.
llvm::Error writeInteger(BitBuffer&                  out,
                         std::optional<std::int64_t> lower,
                         std::optional<std::int64_t> upper,
                         bool                        extensible,
                         std::int64_t                value);
llvm::Expected<std::int64_t> readInteger(BitSource&                  in,
                                         std::optional<std::int64_t> lower,
                                         std::optional<std::int64_t> upper,
                                         bool                        extensible);

//===----------------------------------------------------------------------===//
// Length determinants (clause 11.9)
//===----------------------------------------------------------------------===//

/// @brief Writes one length determinant.
///
/// Constrained lengths (upper bound below 64K) are written as a bounded
/// integer, or not at all for a fixed size. Other lengths use the one-octet,
/// two-octet or fragment-header forms.
///
/// @return Units covered by this determinant: `length`, or a multiple of
///         `kFragmentSize` for a fragment header. `SizeNotInRange` when a
///         constrained length is out of bounds.
llvm::Expected<std::uint64_t> writeLengthDeterminant(BitBuffer& out,
                                                     SizeBound  lower,
                                                     SizeBound  upper,
                                                     std::uint64_t length);
llvm::Expected<LengthChunk> readLengthDeterminant(BitSource& in, SizeBound lower, SizeBound upper);

/// @brief Writes `count` units of size-constrained content.
///
/// Selects between the extension bit, the empty, the fixed-size and the
/// length-prefixed forms and fragments content of 16K units or more.
/// `emit` is called once per chunk.
llvm::Error writeSizedContent(BitBuffer&    out,
                              SizeBound     lower,
                              SizeBound     upper,
                              bool          extensible,
                              std::uint64_t count,
                              ChunkWriter   emit);

/// @brief Reads size-constrained content written by `writeSizedContent`.
///
/// @param[in] unitBits Bits per unit when known, used to reject lengths that
///            exceed the remaining input before anything is allocated; 0 to
///            skip the check.
/// @param[in] limit Largest total unit count accepted.
llvm::Error readSizedContent(BitSource&    in,
                             SizeBound     lower,
                             SizeBound     upper,
                             bool          extensible,
                             std::uint64_t unitBits,
                             std::uint64_t limit,
                             ChunkReader   consume);

//===----------------------------------------------------------------------===//
// Octet strings, bit strings and open types (clauses 16, 17, 11.2)
//===----------------------------------------------------------------------===//

llvm::Error writeOctetString(BitBuffer&                   out,
                             SizeBound                    lower,
                             SizeBound                    upper,
                             bool                         extensible,
                             llvm::ArrayRef<std::uint8_t> value);
llvm::Expected<std::vector<std::uint8_t>> readOctetString(BitSource& in,
                                                          SizeBound  lower,
                                                          SizeBound  upper,
                                                          bool       extensible,
                                                          std::uint64_t limit = std::numeric_limits<std::uint64_t>::max());

/// @brief Writes the first `bitLength` bits of `value`.
llvm::Error writeBitString(BitBuffer&                   out,
                           SizeBound                    lower,
                           SizeBound                    upper,
                           bool                         extensible,
                           llvm::ArrayRef<std::uint8_t> value,
                           std::uint64_t                bitLength);
llvm::Expected<BitStringData> readBitString(BitSource&    in,
                                            SizeBound     lower,
                                            SizeBound     upper,
                                            bool          extensible,
                                            std::uint64_t limit = std::numeric_limits<std::uint64_t>::max());

/// @brief Writes a complete encoding as an open type (length-prefixed octets).
llvm::Error writeOpenType(BitBuffer& out, llvm::ArrayRef<std::uint8_t> encoding);

/// @brief Skips an open type without decoding it.
llvm::Error skipOpenType(BitSource& in);

//===----------------------------------------------------------------------===//
// Choice and enumeration indices (clauses 19 and 23)
//===----------------------------------------------------------------------===//

/// @brief Writes the index of a CHOICE alternative or ENUMERATED item.
/// @param[in] standardCount Alternatives in the extension root.
/// @param[in] extensible Whether the type carries an extension marker.
/// @param[in] index Selected alternative.
/// @return Success, or `InvalidChoiceIndex` for an extension index on a closed type.
llvm::Error writeChoiceIndex(BitBuffer& out, std::uint64_t standardCount, bool extensible, std::uint64_t index);

/// @brief Reads an index written by `writeChoiceIndex`.
/// @return Index, or `InvalidChoiceIndex` when a root index is beyond `standardCount`.
llvm::Expected<std::uint64_t> readChoiceIndex(BitSource& in, std::uint64_t standardCount, bool extensible);

}  // namespace llvmasn1::per

#endif  // LLVMASN1_RUNTIME_PACKED_ENCODING_H
