//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the owning bit buffer and the borrowed bit view.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Runtime/BitBuffer.h"

#include "llvmasn1/Runtime/BitCopy.h"
#include "llvmasn1/Support/CodecError.h"

#include <algorithm>
#include <utility>

namespace llvmasn1
{

llvm::Error BitSource::readBits(llvm::MutableArrayRef<std::uint8_t> dst)
{
    return readBitsWithOffsetLen(dst, 0, dst.size() * kBitsPerByte);
}

llvm::Error BitSource::readBitsWithOffset(llvm::MutableArrayRef<std::uint8_t> dst, const std::size_t dstOffsetBits)
{
    const std::size_t total = dst.size() * kBitsPerByte;
    if (dstOffsetBits > total)
    {
        return makeEndOfStream();
    }
    return readBitsWithOffsetLen(dst, dstOffsetBits, total - dstOffsetBits);
}

llvm::Error BitSource::readBitsWithLen(llvm::MutableArrayRef<std::uint8_t> dst, const std::size_t lengthBits)
{
    return readBitsWithOffsetLen(dst, 0, lengthBits);
}

llvm::Expected<BitBuffer> BitBuffer::fromBits(std::vector<std::uint8_t> bytes, const std::size_t bitLength)
{
    if (bitLength > bytes.size() * kBitsPerByte)
    {
        return makeEndOfStream();
    }
    BitBuffer buffer;
    buffer.bytes_         = std::move(bytes);
    buffer.writePosition_ = bitLength;
    return buffer;
}

void BitBuffer::reserveBits(const std::size_t totalBits)
{
    const std::size_t needed = bytesForBits(totalBits);
    if (needed > bytes_.size())
    {
        bytes_.resize(std::max(needed, bytes_.size() * 2U), 0U);
    }
}

void BitBuffer::writeBit(const bool bit)
{
    reserveBits(writePosition_ + 1U);
    setBit(bytes_.data(), writePosition_, bit);
    ++writePosition_;
}

llvm::Error BitBuffer::writeBits(llvm::ArrayRef<std::uint8_t> src)
{
    return writeBitsWithOffsetLen(src, 0, src.size() * kBitsPerByte);
}

llvm::Error BitBuffer::writeBitsWithOffset(llvm::ArrayRef<std::uint8_t> src, const std::size_t srcOffsetBits)
{
    const std::size_t total = src.size() * kBitsPerByte;
    if (srcOffsetBits > total)
    {
        return makeEndOfStream();
    }
    return writeBitsWithOffsetLen(src, srcOffsetBits, total - srcOffsetBits);
}

llvm::Error BitBuffer::writeBitsWithLen(llvm::ArrayRef<std::uint8_t> src, const std::size_t lengthBits)
{
    return writeBitsWithOffsetLen(src, 0, lengthBits);
}

llvm::Error BitBuffer::writeBitsWithOffsetLen(llvm::ArrayRef<std::uint8_t> src,
                                              const std::size_t            srcOffsetBits,
                                              const std::size_t            lengthBits)
{
    if (srcOffsetBits + lengthBits > src.size() * kBitsPerByte)
    {
        return makeEndOfStream();
    }
    if (lengthBits == 0U)
    {
        return llvm::Error::success();
    }
    reserveBits(writePosition_ + lengthBits);
    copyBits(bytes_.data(), writePosition_, src.data(), srcOffsetBits, lengthBits);
    writePosition_ += lengthBits;
    return llvm::Error::success();
}

llvm::Error BitBuffer::setBitAt(const std::size_t position, const bool bit)
{
    if (position >= writePosition_)
    {
        return makeEndOfStream();
    }
    setBit(bytes_.data(), position, bit);
    return llvm::Error::success();
}

llvm::Expected<bool> BitBuffer::bitAt(const std::size_t position) const
{
    if (position >= writePosition_)
    {
        return makeEndOfStream();
    }
    return getBit(bytes_.data(), position);
}

void BitBuffer::truncate(const std::size_t bitLength)
{
    if (bitLength >= writePosition_)
    {
        return;
    }
    // Clear the dropped bits so later writes and content() see zeros.
    for (std::size_t bit = bitLength; bit < bytesForBits(writePosition_) * kBitsPerByte; ++bit)
    {
        setBit(bytes_.data(), bit, false);
    }
    writePosition_ = bitLength;
    readPosition_  = std::min(readPosition_, writePosition_);
}

void BitBuffer::clear()
{
    bytes_.clear();
    writePosition_ = 0;
    readPosition_  = 0;
}

llvm::Expected<bool> BitBuffer::readBit()
{
    if (readPosition_ >= writePosition_)
    {
        return makeEndOfStream();
    }
    return getBit(bytes_.data(), readPosition_++);
}

llvm::Error BitBuffer::readBitsWithOffsetLen(llvm::MutableArrayRef<std::uint8_t> dst,
                                             const std::size_t                   dstOffsetBits,
                                             const std::size_t                   lengthBits)
{
    if (lengthBits > bitsRemaining() || dstOffsetBits + lengthBits > dst.size() * kBitsPerByte)
    {
        return makeEndOfStream();
    }
    if (lengthBits == 0U)
    {
        return llvm::Error::success();
    }
    copyBits(dst.data(), dstOffsetBits, bytes_.data(), readPosition_, lengthBits);
    readPosition_ += lengthBits;
    return llvm::Error::success();
}

std::size_t BitBuffer::bitsRemaining() const
{
    return writePosition_ - readPosition_;
}

llvm::ArrayRef<std::uint8_t> BitBuffer::content() const
{
    return llvm::ArrayRef<std::uint8_t>(bytes_).take_front(bytesForBits(writePosition_));
}

std::vector<std::uint8_t> BitBuffer::takeContent()
{
    std::vector<std::uint8_t> out = std::move(bytes_);
    out.resize(bytesForBits(writePosition_));
    clear();
    return out;
}

Bits::Bits(llvm::ArrayRef<std::uint8_t> data, const std::size_t bitLength)
    : data_(data)
    , position_(0)
    , end_(std::min(bitLength, data.size() * kBitsPerByte))
{
}

llvm::Expected<bool> Bits::readBit()
{
    if (position_ >= end_)
    {
        return makeEndOfStream();
    }
    return getBit(data_.data(), position_++);
}

llvm::Error Bits::readBitsWithOffsetLen(llvm::MutableArrayRef<std::uint8_t> dst,
                                        const std::size_t                   dstOffsetBits,
                                        const std::size_t                   lengthBits)
{
    if (lengthBits > bitsRemaining() || dstOffsetBits + lengthBits > dst.size() * kBitsPerByte)
    {
        return makeEndOfStream();
    }
    if (lengthBits == 0U)
    {
        return llvm::Error::success();
    }
    copyBits(dst.data(), dstOffsetBits, data_.data(), position_, lengthBits);
    position_ += lengthBits;
    return llvm::Error::success();
}

llvm::Expected<bool> Bits::peekBit(const std::size_t position) const
{
    if (position >= end_)
    {
        return makeEndOfStream();
    }
    return getBit(data_.data(), position);
}

llvm::Expected<Bits> Bits::subView(const std::size_t lengthBits) const
{
    if (lengthBits > bitsRemaining())
    {
        return makeEndOfStream();
    }
    Bits view;
    view.data_     = data_;
    view.position_ = position_;
    view.end_      = position_ + lengthBits;
    return view;
}

llvm::Error Bits::advance(const std::size_t lengthBits)
{
    if (lengthBits > bitsRemaining())
    {
        return makeEndOfStream();
    }
    position_ += lengthBits;
    return llvm::Error::success();
}

}  // namespace llvmasn1
