//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements MSB-first bit copy helpers.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Runtime/BitCopy.h"

#include <cstring>

namespace llvmasn1
{
namespace
{

void copyBitByBit(std::uint8_t*       dst,
                  std::size_t         dstOffsetBits,
                  const std::uint8_t* src,
                  std::size_t         srcOffsetBits,
                  std::size_t         lengthBits)
{
    for (std::size_t i = 0; i < lengthBits; ++i)
    {
        setBit(dst, dstOffsetBits + i, getBit(src, srcOffsetBits + i));
    }
}

}  // namespace

bool getBit(const std::uint8_t* const data, const std::size_t bit)
{
    const auto mask = static_cast<std::uint8_t>(0x80U >> (bit % kBitsPerByte));
    return (data[bit / kBitsPerByte] & mask) != 0U;
}

void setBit(std::uint8_t* const data, const std::size_t bit, const bool value)
{
    const auto mask = static_cast<std::uint8_t>(0x80U >> (bit % kBitsPerByte));
    if (value)
    {
        data[bit / kBitsPerByte] |= mask;
    }
    else
    {
        data[bit / kBitsPerByte] &= static_cast<std::uint8_t>(~mask);
    }
}

void copyBits(std::uint8_t* const       dst,
              std::size_t               dstOffsetBits,
              const std::uint8_t* const src,
              std::size_t               srcOffsetBits,
              std::size_t               lengthBits)
{
    if (lengthBits <= kBulkCopyThresholdBits)
    {
        copyBitByBit(dst, dstOffsetBits, src, srcOffsetBits, lengthBits);
        return;
    }

    // Head: align the destination.
    const std::size_t dstMisalignment = dstOffsetBits % kBitsPerByte;
    if (dstMisalignment != 0U)
    {
        const std::size_t head = kBitsPerByte - dstMisalignment;
        copyBitByBit(dst, dstOffsetBits, src, srcOffsetBits, head);
        dstOffsetBits += head;
        srcOffsetBits += head;
        lengthBits -= head;
    }

    const std::size_t wholeBytes = lengthBits / kBitsPerByte;
    std::uint8_t*     out        = dst + (dstOffsetBits / kBitsPerByte);
    const auto*       in         = src + (srcOffsetBits / kBitsPerByte);
    const auto        shift      = static_cast<unsigned>(srcOffsetBits % kBitsPerByte);
    if (shift == 0U)
    {
        if (wholeBytes > 0U)
        {
            std::memcpy(out, in, wholeBytes);
        }
    }
    else
    {
        // Every merged byte uses at least one bit of in[i + 1], so it is in range.
        for (std::size_t i = 0; i < wholeBytes; ++i)
        {
            out[i] = static_cast<std::uint8_t>((in[i] << shift) | (in[i + 1U] >> (kBitsPerByte - shift)));
        }
    }

    const std::size_t moved = wholeBytes * kBitsPerByte;
    copyBitByBit(dst, dstOffsetBits + moved, src, srcOffsetBits + moved, lengthBits - moved);
}

}  // namespace llvmasn1
