//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Bit-granular storage used by the UPER writer and reader.
///
/// `BitBuffer` owns growable storage with independent read and write cursors.
/// `Bits` is a borrowed read-only window used for zero-copy decoding. Both
/// implement `BitSource`, the read interface the packed primitives consume.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_RUNTIME_BIT_BUFFER_H
#define LLVMASN1_RUNTIME_BIT_BUFFER_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace llvmasn1
{

/// @brief Sequential bit reader interface.
class BitSource
{
public:
    virtual ~BitSource() = default;

    /// @brief Reads the next bit.
    /// @return Bit value or `EndOfStream`.
    virtual llvm::Expected<bool> readBit() = 0;

    /// @brief Reads `lengthBits` bits into `dst` starting at bit `dstOffsetBits`.
    ///
    /// Bits of `dst` outside the written window are preserved. On failure the
    /// cursor does not move.
    ///
    /// @param[out] dst Destination storage.
    /// @param[in] dstOffsetBits First destination bit.
    /// @param[in] lengthBits Number of bits to read.
    /// @return Success, or `EndOfStream` when the source or `dst` is too short.
    virtual llvm::Error readBitsWithOffsetLen(llvm::MutableArrayRef<std::uint8_t> dst,
                                              std::size_t                         dstOffsetBits,
                                              std::size_t                         lengthBits) = 0;

    /// @brief Returns the number of bits left before the end of the input.
    [[nodiscard]] virtual std::size_t bitsRemaining() const = 0;

    /// @brief Fills all of `dst`.
    llvm::Error readBits(llvm::MutableArrayRef<std::uint8_t> dst);

    /// @brief Fills `dst` from bit `dstOffsetBits` to its end.
    llvm::Error readBitsWithOffset(llvm::MutableArrayRef<std::uint8_t> dst, std::size_t dstOffsetBits);

    /// @brief Reads `lengthBits` bits into the front of `dst`.
    llvm::Error readBitsWithLen(llvm::MutableArrayRef<std::uint8_t> dst, std::size_t lengthBits);
};

/// @brief Owning, growable bit buffer.
///
/// Invariant: `readPosition() <= writePosition() <= capacityBits()`.
class BitBuffer final : public BitSource
{
public:
    BitBuffer() = default;

    /// @brief Adopts encoded bytes for reading.
    /// @param[in] bytes Encoded content.
    /// @param[in] bitLength Number of meaningful bits in `bytes`.
    /// @return Buffer whose write position is `bitLength`, or `EndOfStream` when `bytes` is too short.
    static llvm::Expected<BitBuffer> fromBits(std::vector<std::uint8_t> bytes, std::size_t bitLength);

    void        writeBit(bool bit);
    llvm::Error writeBits(llvm::ArrayRef<std::uint8_t> src);
    llvm::Error writeBitsWithOffset(llvm::ArrayRef<std::uint8_t> src, std::size_t srcOffsetBits);
    llvm::Error writeBitsWithLen(llvm::ArrayRef<std::uint8_t> src, std::size_t lengthBits);

    /// @brief Appends `lengthBits` bits of `src` starting at `srcOffsetBits`.
    /// @return Success, or `EndOfStream` when `src` holds fewer bits than requested.
    llvm::Error writeBitsWithOffsetLen(llvm::ArrayRef<std::uint8_t> src,
                                       std::size_t                  srcOffsetBits,
                                       std::size_t                  lengthBits);

    /// @brief Overwrites an already written bit.
    /// @param[in] position Bit position below `writePosition()`.
    /// @param[in] bit New value.
    /// @return Success, or `EndOfStream` for a position that was never written.
    llvm::Error setBitAt(std::size_t position, bool bit);

    /// @brief Returns an already written bit.
    [[nodiscard]] llvm::Expected<bool> bitAt(std::size_t position) const;

    /// @brief Discards everything written at or after `bitLength`.
    void truncate(std::size_t bitLength);

    /// @brief Drops all content and rewinds both cursors.
    void clear();

    llvm::Expected<bool> readBit() override;
    llvm::Error          readBitsWithOffsetLen(llvm::MutableArrayRef<std::uint8_t> dst,
                                               std::size_t                         dstOffsetBits,
                                               std::size_t                         lengthBits) override;
    [[nodiscard]] std::size_t bitsRemaining() const override;

    [[nodiscard]] std::size_t writePosition() const
    {
        return writePosition_;
    }

    [[nodiscard]] std::size_t readPosition() const
    {
        return readPosition_;
    }

    [[nodiscard]] std::size_t capacityBits() const
    {
        return bytes_.size() * 8U;
    }

    /// @brief Returns the written bytes; bits after `writePosition()` in the last byte are zero.
    [[nodiscard]] llvm::ArrayRef<std::uint8_t> content() const;

    /// @brief Moves the written bytes out and resets the buffer.
    [[nodiscard]] std::vector<std::uint8_t> takeContent();

    void resetReadPosition()
    {
        readPosition_ = 0;
    }

private:
    void reserveBits(std::size_t totalBits);

    std::vector<std::uint8_t> bytes_;
    std::size_t               writePosition_{0};
    std::size_t               readPosition_{0};
};

/// @brief Borrowed read-only bit window over external bytes.
///
/// Positions are absolute bit offsets into the borrowed bytes, so a sub-view
/// reports the same positions as the view it was cut from.
class Bits final : public BitSource
{
public:
    Bits() = default;

    /// @brief Creates a view over the first `bitLength` bits of `data`.
    ///
    /// A `bitLength` larger than the storage is clamped to it.
    Bits(llvm::ArrayRef<std::uint8_t> data, std::size_t bitLength);

    llvm::Expected<bool> readBit() override;
    llvm::Error          readBitsWithOffsetLen(llvm::MutableArrayRef<std::uint8_t> dst,
                                               std::size_t                         dstOffsetBits,
                                               std::size_t                         lengthBits) override;

    [[nodiscard]] std::size_t bitsRemaining() const override
    {
        return end_ - position_;
    }

    /// @brief Returns the bit at an absolute position inside the view.
    [[nodiscard]] llvm::Expected<bool> peekBit(std::size_t position) const;

    /// @brief Returns a view over the next `lengthBits` bits without moving this view.
    [[nodiscard]] llvm::Expected<Bits> subView(std::size_t lengthBits) const;

    /// @brief Skips `lengthBits` bits.
    llvm::Error advance(std::size_t lengthBits);

    [[nodiscard]] std::size_t position() const
    {
        return position_;
    }

    [[nodiscard]] std::size_t end() const
    {
        return end_;
    }

private:
    llvm::ArrayRef<std::uint8_t> data_;
    std::size_t                  position_{0};
    std::size_t                  end_{0};
};

}  // namespace llvmasn1

#endif  // LLVMASN1_RUNTIME_BIT_BUFFER_H
