//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Positioned bit access over raw byte storage.
///
/// Bit 0 of a buffer is the most significant bit of its first byte, which is
/// the order X.691 places bits on the wire.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_RUNTIME_BIT_COPY_H
#define LLVMASN1_RUNTIME_BIT_COPY_H

#include <cstddef>
#include <cstdint>

namespace llvmasn1
{

/// @brief Number of bits in one storage byte.
inline constexpr std::size_t kBitsPerByte = 8U;

/// @brief Copies below this length always take the bit-by-bit path.
inline constexpr std::size_t kBulkCopyThresholdBits = 16U;

/// @brief Returns the number of bytes needed to hold `bits` bits.
[[nodiscard]] constexpr std::size_t bytesForBits(const std::size_t bits)
{
    return (bits + kBitsPerByte - 1U) / kBitsPerByte;
}

/// @brief Reads one bit.
/// @param[in] data Byte storage.
/// @param[in] bit Absolute bit position.
/// @return Bit value.
[[nodiscard]] bool getBit(const std::uint8_t* data, std::size_t bit);

/// @brief Writes one bit, leaving the other bits of its byte untouched.
/// @param[in,out] data Byte storage.
/// @param[in] bit Absolute bit position.
/// @param[in] value Bit value.
void setBit(std::uint8_t* data, std::size_t bit, bool value);

/// @brief Copies `lengthBits` bits between arbitrary bit offsets.
///
/// Runs longer than `kBulkCopyThresholdBits` copy the ragged head bit by bit
/// until the destination is byte aligned, then move whole bytes (directly when
/// the source is aligned as well, otherwise by merging two neighbouring source
/// bytes with a shift), and finish the tail bit by bit. The result does not
/// depend on which path was taken. Storage must not overlap.
///
/// @param[out] dst Destination storage.
/// @param[in] dstOffsetBits Destination bit offset.
/// @param[in] src Source storage.
/// @param[in] srcOffsetBits Source bit offset.
/// @param[in] lengthBits Number of bits to copy.
void copyBits(std::uint8_t*       dst,
              std::size_t         dstOffsetBits,
              const std::uint8_t* src,
              std::size_t         srcOffsetBits,
              std::size_t         lengthBits);

}  // namespace llvmasn1

#endif  // LLVMASN1_RUNTIME_BIT_COPY_H
