//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the unaligned PER numeric, length, string and index primitives.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Runtime/PackedEncoding.h"

#include "llvmasn1/Runtime/BitCopy.h"
#include "llvmasn1/Support/CodecError.h"

#include "llvm/Support/MathExtras.h"

#include <algorithm>
#include <array>
#include <memory>
#include <utility>

namespace llvmasn1::per
{
namespace
{

constexpr unsigned kWordBits = 64U;

/// @brief Writes the low `width` bits of `value`, most significant first.
void writeUnsignedBits(BitBuffer& out, const std::uint64_t value, const unsigned width)
{
    for (unsigned i = width; i > 0U; --i)
    {
        out.writeBit(((value >> (i - 1U)) & 1U) != 0U);
    }
}

llvm::Expected<std::uint64_t> readUnsignedBits(BitSource& in, const unsigned width)
{
    if (width > kWordBits)
    {
        return makeUnsupportedOperation("integer wider than 64 bits");
    }
    if (width > in.bitsRemaining())
    {
        return makeEndOfStream();
    }
    std::array<std::uint8_t, 8> word{};
    if (llvm::Error err = in.readBitsWithOffsetLen(word, kWordBits - width, width))
    {
        return std::move(err);
    }
    std::uint64_t value = 0;
    for (const std::uint8_t byte : word)
    {
        value = (value << 8U) | byte;
    }
    return value;
}

/// @brief Octets needed for the big-endian magnitude of `value`, at least one.
unsigned magnitudeOctets(const std::uint64_t value)
{
    const unsigned bits = kWordBits - llvm::countLeadingZeros(value);
    return std::max(1U, (bits + 7U) / 8U);
}

/// @brief Octets needed to hold `value` in two's complement, at least one.
unsigned twosComplementOctets(const std::int64_t value)
{
    const auto     raw       = static_cast<std::uint64_t>(value);
    const unsigned redundant = value < 0 ? llvm::countLeadingOnes(raw) : llvm::countLeadingZeros(raw);
    // One copy of the sign bit must stay.
    const unsigned bits = kWordBits - redundant + 1U;
    return std::min(8U, std::max(1U, (bits + 7U) / 8U));
}

/// @brief Reads a length determinant that must announce an integer's octet count.
llvm::Expected<unsigned> readIntegerOctets(BitSource& in)
{
    llvm::Expected<LengthChunk> chunk = readLengthDeterminant(in, std::nullopt, std::nullopt);
    if (!chunk)
    {
        return chunk.takeError();
    }
    if (chunk->fragment || chunk->length > 8U)
    {
        return makeUnsupportedOperation("integer wider than 64 bits");
    }
    if (chunk->length == 0U)
    {
        return makeUnsupportedOperation("integer encoded with zero octets");
    }
    return static_cast<unsigned>(chunk->length);
}

llvm::Error writeFragmented(BitBuffer&          out,
                            const SizeBound     lower,
                            const SizeBound     upper,
                            const std::uint64_t count,
                            const ChunkWriter   emit)
{
    if (upper && *upper < kLengthLimit64K)
    {
        llvm::Expected<std::uint64_t> covered = writeLengthDeterminant(out, lower, upper, count);
        if (!covered)
        {
            return covered.takeError();
        }
        return emit(0, count);
    }

    std::uint64_t offset = 0;
    while (true)
    {
        llvm::Expected<std::uint64_t> covered = writeLengthDeterminant(out, std::nullopt, std::nullopt, count - offset);
        if (!covered)
        {
            return covered.takeError();
        }
        if (llvm::Error err = emit(offset, *covered))
        {
            return err;
        }
        offset += *covered;
        if (*covered < kFragmentSize)
        {
            return llvm::Error::success();
        }
    }
}

llvm::Error readFragmented(BitSource&          in,
                           const SizeBound     lower,
                           const SizeBound     upper,
                           const std::uint64_t unitBits,
                           const std::uint64_t limit,
                           const ChunkReader   consume)
{
    const bool    constrained = upper && *upper < kLengthLimit64K;
    std::uint64_t total       = 0;
    while (true)
    {
        llvm::Expected<LengthChunk> chunk =
            readLengthDeterminant(in, constrained ? lower : std::nullopt, constrained ? upper : std::nullopt);
        if (!chunk)
        {
            return chunk.takeError();
        }
        total += chunk->length;
        if (total > limit)
        {
            return makeUnsupportedOperation("decoded length exceeds the configured limit");
        }
        if (unitBits != 0U && chunk->length * unitBits > in.bitsRemaining())
        {
            return makeEndOfStream();
        }
        if (llvm::Error err = consume(chunk->length))
        {
            return err;
        }
        if (!chunk->fragment)
        {
            break;
        }
    }

    const std::uint64_t lowerBound = lower.value_or(0U);
    if (total < lowerBound || (upper && total > *upper))
    {
        return makeSizeNotInRange(total, lowerBound, upper ? *upper : kNoUpperBound);
    }
    return llvm::Error::success();
}

}  // namespace

unsigned bitWidth(const std::uint64_t range)
{
    return kWordBits - llvm::countLeadingZeros(range);
}

llvm::Error writeNonNegativeBinaryInteger(BitBuffer&          out,
                                          const std::uint64_t value,
                                          const SizeBound     lower,
                                          const SizeBound     upper)
{
    if (lower || upper)
    {
        const std::uint64_t lo = lower.value_or(0U);
        const std::uint64_t hi = upper.value_or(static_cast<std::uint64_t>(kNoUpperBound));
        if (value < lo || value > hi)
        {
            return makeValueNotInRange(static_cast<std::int64_t>(value),
                                       static_cast<std::int64_t>(lo),
                                       static_cast<std::int64_t>(hi));
        }
        writeUnsignedBits(out, value - lo, bitWidth(hi - lo));
        return llvm::Error::success();
    }

    const unsigned                octets  = magnitudeOctets(value);
    llvm::Expected<std::uint64_t> covered = writeLengthDeterminant(out, std::nullopt, std::nullopt, octets);
    if (!covered)
    {
        return covered.takeError();
    }
    writeUnsignedBits(out, value, octets * 8U);
    return llvm::Error::success();
}

llvm::Expected<std::uint64_t> readNonNegativeBinaryInteger(BitSource& in, const SizeBound lower, const SizeBound upper)
{
    if (lower || upper)
    {
        const std::uint64_t           lo     = lower.value_or(0U);
        const std::uint64_t           hi     = upper.value_or(static_cast<std::uint64_t>(kNoUpperBound));
        llvm::Expected<std::uint64_t> offset = readUnsignedBits(in, bitWidth(hi - lo));
        if (!offset)
        {
            return offset.takeError();
        }
        if (*offset > hi - lo)
        {
            return makeValueNotInRange(static_cast<std::int64_t>(lo + *offset),
                                       static_cast<std::int64_t>(lo),
                                       static_cast<std::int64_t>(hi));
        }
        return lo + *offset;
    }

    llvm::Expected<unsigned> octets = readIntegerOctets(in);
    if (!octets)
    {
        return octets.takeError();
    }
    return readUnsignedBits(in, *octets * 8U);
}

llvm::Error writeTwosComplementBinaryInteger(BitBuffer& out, const std::int64_t value, const unsigned bitLength)
{
    if (bitLength > kWordBits)
    {
        return makeUnsupportedOperation("integer wider than 64 bits");
    }
    writeUnsignedBits(out, static_cast<std::uint64_t>(value), bitLength);
    return llvm::Error::success();
}

llvm::Expected<std::int64_t> readTwosComplementBinaryInteger(BitSource& in, const unsigned bitLength)
{
    llvm::Expected<std::uint64_t> raw = readUnsignedBits(in, bitLength);
    if (!raw)
    {
        return raw.takeError();
    }
    if (bitLength == 0U)
    {
        return 0;
    }
    return llvm::SignExtend64(*raw, bitLength);
}

llvm::Error writeConstrainedWholeNumber(BitBuffer&         out,
                                        const std::int64_t lower,
                                        const std::int64_t upper,
                                        const std::int64_t value)
{
    if (value < lower || value > upper)
    {
        return makeValueNotInRange(value, lower, upper);
    }
    const std::uint64_t range = static_cast<std::uint64_t>(upper) - static_cast<std::uint64_t>(lower);
    writeUnsignedBits(out, static_cast<std::uint64_t>(value) - static_cast<std::uint64_t>(lower), bitWidth(range));
    return llvm::Error::success();
}

llvm::Expected<std::int64_t> readConstrainedWholeNumber(BitSource& in, const std::int64_t lower, const std::int64_t upper)
{
    if (lower > upper)
    {
        return makeValueNotInRange(lower, lower, upper);
    }
    const std::uint64_t           range  = static_cast<std::uint64_t>(upper) - static_cast<std::uint64_t>(lower);
    llvm::Expected<std::uint64_t> offset = readUnsignedBits(in, bitWidth(range));
    if (!offset)
    {
        return offset.takeError();
    }
    const auto value = static_cast<std::int64_t>(static_cast<std::uint64_t>(lower) + *offset);
    if (*offset > range)
    {
        return makeValueNotInRange(value, lower, upper);
    }
    return value;
}

llvm::Error writeSemiConstrainedWholeNumber(BitBuffer& out, const std::int64_t lower, const std::int64_t value)
{
    if (value < lower)
    {
        return makeValueNotInRange(value, lower, kNoUpperBound);
    }
    return writeNonNegativeBinaryInteger(out, static_cast<std::uint64_t>(value) - static_cast<std::uint64_t>(lower));
}

llvm::Expected<std::int64_t> readSemiConstrainedWholeNumber(BitSource& in, const std::int64_t lower)
{
    llvm::Expected<std::uint64_t> offset = readNonNegativeBinaryInteger(in);
    if (!offset)
    {
        return offset.takeError();
    }
    const std::uint64_t headroom = static_cast<std::uint64_t>(kNoUpperBound) - static_cast<std::uint64_t>(lower);
    if (*offset > headroom)
    {
        return makeUnsupportedOperation("semi-constrained value exceeds 64 bits");
    }
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(lower) + *offset);
}

llvm::Error writeUnconstrainedWholeNumber(BitBuffer& out, const std::int64_t value)
{
    const unsigned                octets  = twosComplementOctets(value);
    llvm::Expected<std::uint64_t> covered = writeLengthDeterminant(out, std::nullopt, std::nullopt, octets);
    if (!covered)
    {
        return covered.takeError();
    }
    return writeTwosComplementBinaryInteger(out, value, octets * 8U);
}

llvm::Expected<std::int64_t> readUnconstrainedWholeNumber(BitSource& in)
{
    llvm::Expected<unsigned> octets = readIntegerOctets(in);
    if (!octets)
    {
        return octets.takeError();
    }
    return readTwosComplementBinaryInteger(in, *octets * 8U);
}

llvm::Error writeNormallySmallNonNegativeWholeNumber(BitBuffer& out, const std::uint64_t value)
{
    if (value <= kNormallySmallLimit)
    {
        out.writeBit(false);
        writeUnsignedBits(out, value, 6U);
        return llvm::Error::success();
    }
    out.writeBit(true);
    return writeNonNegativeBinaryInteger(out, value);
}

llvm::Expected<std::uint64_t> readNormallySmallNonNegativeWholeNumber(BitSource& in)
{
    llvm::Expected<bool> large = in.readBit();
    if (!large)
    {
        return large.takeError();
    }
    if (!*large)
    {
        return readUnsignedBits(in, 6U);
    }
    return readNonNegativeBinaryInteger(in);
}

llvm::Error writeInteger(BitBuffer&                        out,
                         const std::optional<std::int64_t> lower,
                         const std::optional<std::int64_t> upper,
                         const bool                        extensible,
                         const std::int64_t                value)
{
    if (extensible)
    {
        const bool inRoot = (!lower || value >= *lower) && (!upper || value <= *upper);
        out.writeBit(!inRoot);
        if (!inRoot)
        {
            return writeUnconstrainedWholeNumber(out, value);
        }
    }
    if (lower && upper)
    {
        return writeConstrainedWholeNumber(out, *lower, *upper, value);
    }
    if (lower)
    {
        return writeSemiConstrainedWholeNumber(out, *lower, value);
    }
    if (upper && value > *upper)
    {
        return makeValueNotInRange(value, std::numeric_limits<std::int64_t>::min(), *upper);
    }
    return writeUnconstrainedWholeNumber(out, value);
}

llvm::Expected<std::int64_t> readInteger(BitSource&                        in,
                                         const std::optional<std::int64_t> lower,
                                         const std::optional<std::int64_t> upper,
                                         const bool                        extensible)
{
    if (extensible)
    {
        llvm::Expected<bool> outsideRoot = in.readBit();
        if (!outsideRoot)
        {
            return outsideRoot.takeError();
        }
        if (*outsideRoot)
        {
            return readUnconstrainedWholeNumber(in);
        }
    }
    if (lower && upper)
    {
        return readConstrainedWholeNumber(in, *lower, *upper);
    }
    if (lower)
    {
        return readSemiConstrainedWholeNumber(in, *lower);
    }
    return readUnconstrainedWholeNumber(in);
}

llvm::Expected<std::uint64_t> writeLengthDeterminant(BitBuffer&          out,
                                                     const SizeBound     lower,
                                                     const SizeBound     upper,
                                                     const std::uint64_t length)
{
    if (upper && *upper < kLengthLimit64K)
    {
        const std::uint64_t lo = lower.value_or(0U);
        if (length < lo || length > *upper)
        {
            return makeSizeNotInRange(length, lo, *upper);
        }
        writeUnsignedBits(out, length - lo, bitWidth(*upper - lo));
        return length;
    }
    if (lower && length < *lower)
    {
        return makeSizeNotInRange(length, *lower, upper ? *upper : kNoUpperBound);
    }

    if (length <= kShortLengthLimit)
    {
        out.writeBit(false);
        writeUnsignedBits(out, length, 7U);
        return length;
    }
    if (length < kFragmentSize)
    {
        out.writeBit(true);
        out.writeBit(false);
        writeUnsignedBits(out, length, 14U);
        return length;
    }
    const std::uint64_t units = std::min(length / kFragmentSize, kMaxFragmentUnits);
    out.writeBit(true);
    out.writeBit(true);
    writeUnsignedBits(out, units, 6U);
    return units * kFragmentSize;
}

llvm::Expected<LengthChunk> readLengthDeterminant(BitSource& in, const SizeBound lower, const SizeBound upper)
{
    if (upper && *upper < kLengthLimit64K)
    {
        const std::uint64_t lo = lower.value_or(0U);
        if (lo > *upper)
        {
            return makeSizeNotInRange(lo, lo, *upper);
        }
        llvm::Expected<std::uint64_t> offset = readUnsignedBits(in, bitWidth(*upper - lo));
        if (!offset)
        {
            return offset.takeError();
        }
        const std::uint64_t length = lo + *offset;
        if (length > *upper)
        {
            return makeSizeNotInRange(length, lo, *upper);
        }
        return LengthChunk{length, false};
    }

    llvm::Expected<bool> longForm = in.readBit();
    if (!longForm)
    {
        return longForm.takeError();
    }
    if (!*longForm)
    {
        llvm::Expected<std::uint64_t> length = readUnsignedBits(in, 7U);
        if (!length)
        {
            return length.takeError();
        }
        return LengthChunk{*length, false};
    }

    llvm::Expected<bool> fragmented = in.readBit();
    if (!fragmented)
    {
        return fragmented.takeError();
    }
    if (!*fragmented)
    {
        llvm::Expected<std::uint64_t> length = readUnsignedBits(in, 14U);
        if (!length)
        {
            return length.takeError();
        }
        return LengthChunk{*length, false};
    }

    llvm::Expected<std::uint64_t> units = readUnsignedBits(in, 6U);
    if (!units)
    {
        return units.takeError();
    }
    if (*units < 1U || *units > kMaxFragmentUnits)
    {
        return makeUnsupportedOperation("fragment header with an invalid unit count");
    }
    return LengthChunk{*units * kFragmentSize, true};
}

llvm::Error writeSizedContent(BitBuffer&          out,
                              const SizeBound     lower,
                              const SizeBound     upper,
                              const bool          extensible,
                              const std::uint64_t count,
                              const ChunkWriter   emit)
{
    const std::uint64_t lowerBound = lower.value_or(0U);
    const bool          outOfRoot  = count < lowerBound || (upper && count > *upper);
    if (extensible)
    {
        out.writeBit(outOfRoot);
    }
    if (outOfRoot)
    {
        if (!extensible)
        {
            return makeSizeNotInRange(count, lowerBound, upper ? *upper : kNoUpperBound);
        }
        return writeFragmented(out, std::nullopt, std::nullopt, count, emit);
    }
    if (upper && *upper == 0U)
    {
        return llvm::Error::success();
    }
    if (upper && lower && *lower == *upper && *upper < kLengthLimit64K)
    {
        return emit(0, count);
    }
    return writeFragmented(out, lower, upper, count, emit);
}

llvm::Error readSizedContent(BitSource&          in,
                             const SizeBound     lower,
                             const SizeBound     upper,
                             const bool          extensible,
                             const std::uint64_t unitBits,
                             const std::uint64_t limit,
                             const ChunkReader   consume)
{
    if (extensible)
    {
        llvm::Expected<bool> outOfRoot = in.readBit();
        if (!outOfRoot)
        {
            return outOfRoot.takeError();
        }
        if (*outOfRoot)
        {
            return readFragmented(in, std::nullopt, std::nullopt, unitBits, limit, consume);
        }
    }
    if (upper && *upper == 0U)
    {
        return llvm::Error::success();
    }
    if (upper && lower && *lower == *upper && *upper < kLengthLimit64K)
    {
        if (*upper > limit)
        {
            return makeUnsupportedOperation("decoded length exceeds the configured limit");
        }
        if (unitBits != 0U && *upper * unitBits > in.bitsRemaining())
        {
            return makeEndOfStream();
        }
        return consume(*upper);
    }
    return readFragmented(in, lower, upper, unitBits, limit, consume);
}

llvm::Error writeOctetString(BitBuffer&                   out,
                             const SizeBound              lower,
                             const SizeBound              upper,
                             const bool                   extensible,
                             llvm::ArrayRef<std::uint8_t> value)
{
    return writeSizedContent(out,
                             lower,
                             upper,
                             extensible,
                             value.size(),
                             [&out, value](const std::uint64_t offset, const std::uint64_t count) {
                                 return out.writeBits(value.slice(offset, count));
                             });
}

llvm::Expected<std::vector<std::uint8_t>> readOctetString(BitSource&          in,
                                                          const SizeBound     lower,
                                                          const SizeBound     upper,
                                                          const bool          extensible,
                                                          const std::uint64_t limit)
{
    std::vector<std::uint8_t> out;
    if (llvm::Error err = readSizedContent(in,
                                           lower,
                                           upper,
                                           extensible,
                                           kBitsPerByte,
                                           limit,
                                           [&in, &out](const std::uint64_t count) {
                                               const std::size_t offset = out.size();
                                               out.resize(offset + count, 0U);
                                               return in.readBits(
                                                   llvm::MutableArrayRef<std::uint8_t>(out).slice(offset, count));
                                           }))
    {
        return std::move(err);
    }
    return out;
}

llvm::Error writeBitString(BitBuffer&                   out,
                           const SizeBound              lower,
                           const SizeBound              upper,
                           const bool                   extensible,
                           llvm::ArrayRef<std::uint8_t> value,
                           const std::uint64_t          bitLength)
{
    if (bitLength > value.size() * kBitsPerByte)
    {
        return makeEndOfStream();
    }
    return writeSizedContent(out,
                             lower,
                             upper,
                             extensible,
                             bitLength,
                             [&out, value](const std::uint64_t offset, const std::uint64_t count) {
                                 return out.writeBitsWithOffsetLen(value, offset, count);
                             });
}

llvm::Expected<BitStringData> readBitString(BitSource&          in,
                                            const SizeBound     lower,
                                            const SizeBound     upper,
                                            const bool          extensible,
                                            const std::uint64_t limit)
{
    BitStringData out;
    if (llvm::Error err = readSizedContent(in,
                                           lower,
                                           upper,
                                           extensible,
                                           1U,
                                           limit,
                                           [&in, &out](const std::uint64_t count) {
                                               const std::uint64_t offset = out.bitLength;
                                               out.bitLength += count;
                                               out.bytes.resize(bytesForBits(out.bitLength), 0U);
                                               return in.readBitsWithOffsetLen(out.bytes, offset, count);
                                           }))
    {
        return std::move(err);
    }
    return out;
}

llvm::Error writeOpenType(BitBuffer& out, llvm::ArrayRef<std::uint8_t> encoding)
{
    return writeOctetString(out, std::nullopt, std::nullopt, false, encoding);
}

llvm::Error skipOpenType(BitSource& in)
{
    std::array<std::uint8_t, 64> sink{};
    return readSizedContent(in,
                            std::nullopt,
                            std::nullopt,
                            false,
                            kBitsPerByte,
                            std::numeric_limits<std::uint64_t>::max(),
                            [&in, &sink](std::uint64_t count) -> llvm::Error {
                                while (count > 0U)
                                {
                                    const std::uint64_t step = std::min<std::uint64_t>(count, sink.size());
                                    if (llvm::Error err = in.readBitsWithLen(sink, step * kBitsPerByte))
                                    {
                                        return err;
                                    }
                                    count -= step;
                                }
                                return llvm::Error::success();
                            });
}

llvm::Error writeChoiceIndex(BitBuffer&          out,
                             const std::uint64_t standardCount,
                             const bool          extensible,
                             const std::uint64_t index)
{
    if (index >= standardCount)
    {
        if (!extensible)
        {
            return makeInvalidChoiceIndex(index, standardCount);
        }
        out.writeBit(true);
        return writeNormallySmallNonNegativeWholeNumber(out, index - standardCount);
    }
    if (extensible)
    {
        out.writeBit(false);
    }
    return writeNonNegativeBinaryInteger(out, index, 0U, standardCount - 1U);
}

llvm::Expected<std::uint64_t> readChoiceIndex(BitSource& in, const std::uint64_t standardCount, const bool extensible)
{
    if (extensible)
    {
        llvm::Expected<bool> extension = in.readBit();
        if (!extension)
        {
            return extension.takeError();
        }
        if (*extension)
        {
            llvm::Expected<std::uint64_t> offset = readNormallySmallNonNegativeWholeNumber(in);
            if (!offset)
            {
                return offset.takeError();
            }
            if (*offset > std::numeric_limits<std::uint64_t>::max() - standardCount)
            {
                return makeInvalidChoiceIndex(*offset, standardCount);
            }
            return standardCount + *offset;
        }
    }
    if (standardCount == 0U)
    {
        return makeInvalidChoiceIndex(0U, 0U);
    }

    llvm::Expected<std::uint64_t> index = readNonNegativeBinaryInteger(in, 0U, standardCount - 1U);
    if (!index)
    {
        return llvm::handleErrors(index.takeError(), [standardCount](std::unique_ptr<CodecError> err) -> llvm::Error {
            if (err->kind() == CodecErrorKind::ValueNotInRange)
            {
                return makeInvalidChoiceIndex(static_cast<std::uint64_t>(err->first()), standardCount);
            }
            return llvm::Error(std::move(err));
        });
    }
    return *index;
}

}  // namespace llvmasn1::per
