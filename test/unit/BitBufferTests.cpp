//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <array>
#include <cstdint>
#include <iostream>
#include <utility>
#include <vector>

#include "llvmasn1/Runtime/BitBuffer.h"
#include "llvmasn1/Runtime/BitCopy.h"
#include "llvmasn1/Support/CodecError.h"

namespace
{

bool isEndOfStream(llvm::Error err)
{
    const auto failure = llvmasn1::takeCodecFailure(std::move(err));
    return failure && failure->kind == llvmasn1::CodecErrorKind::EndOfStream;
}

}  // namespace

bool runBitBufferTests()
{
    using llvmasn1::BitBuffer;
    using llvmasn1::Bits;

    {
        if (llvmasn1::bytesForBits(0) != 0 || llvmasn1::bytesForBits(1) != 1 || llvmasn1::bytesForBits(8) != 1 ||
            llvmasn1::bytesForBits(9) != 2)
        {
            std::cerr << "bytesForBits mismatch\n";
            return false;
        }
    }

    {
        const std::array<std::uint8_t, 2> src = {0xABU, 0xCDU};
        std::array<std::uint8_t, 3>       dst = {0xFFU, 0xFFU, 0xFFU};
        llvmasn1::copyBits(dst.data(), 3, src.data(), 2, 12);
        for (std::size_t i = 0; i < 12; ++i)
        {
            if (llvmasn1::getBit(dst.data(), 3 + i) != llvmasn1::getBit(src.data(), 2 + i))
            {
                std::cerr << "unaligned copyBits mismatch at bit " << i << "\n";
                return false;
            }
        }
        for (const std::size_t kept : {0U, 1U, 2U, 15U, 16U, 23U})
        {
            if (!llvmasn1::getBit(dst.data(), kept))
            {
                std::cerr << "copyBits touched bit " << kept << " outside the window\n";
                return false;
            }
        }
    }

    {
        std::array<std::uint8_t, 4> src{};
        std::array<std::uint8_t, 4> dst{};
        for (std::size_t i = 0; i < src.size(); ++i)
        {
            src[i] = static_cast<std::uint8_t>(0x11U * (i + 1U));
        }
        llvmasn1::copyBits(dst.data(), 0, src.data(), 0, 32);
        if (dst != src)
        {
            std::cerr << "aligned bulk copyBits mismatch\n";
            return false;
        }
    }

    {
        std::uint8_t byte = 0;
        llvmasn1::setBit(&byte, 0, true);
        llvmasn1::setBit(&byte, 7, true);
        if (byte != 0x81U)
        {
            std::cerr << "setBit is not most-significant-bit first\n";
            return false;
        }
    }

    {
        BitBuffer buffer;
        buffer.writeBit(true);
        const std::array<std::uint8_t, 1> payload = {0xA5U};
        if (auto err = buffer.writeBits(payload))
        {
            std::cerr << "writeBits failed unexpectedly: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (buffer.writePosition() != 9 || buffer.content().size() != 2 || buffer.content()[0] != 0xD2U ||
            buffer.content()[1] != 0x80U)
        {
            std::cerr << "unaligned write layout mismatch\n";
            return false;
        }

        auto first = buffer.readBit();
        if (!first || !*first)
        {
            llvm::consumeError(first.takeError());
            std::cerr << "first bit read mismatch\n";
            return false;
        }
        std::array<std::uint8_t, 1> back{};
        if (auto err = buffer.readBitsWithLen(back, 8))
        {
            std::cerr << "readBitsWithLen failed unexpectedly: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (back[0] != 0xA5U || buffer.bitsRemaining() != 0)
        {
            std::cerr << "unaligned read mismatch\n";
            return false;
        }
        auto past = buffer.readBit();
        if (past || !isEndOfStream(past.takeError()))
        {
            std::cerr << "reading past the write position did not report end of stream\n";
            return false;
        }

        if (!isEndOfStream(buffer.setBitAt(9, true)))
        {
            std::cerr << "setBitAt accepted an unwritten position\n";
            return false;
        }
        if (auto err = buffer.setBitAt(1, false))
        {
            std::cerr << "setBitAt failed unexpectedly: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (buffer.content()[0] != 0x92U)
        {
            std::cerr << "setBitAt did not clear the bit\n";
            return false;
        }

        buffer.truncate(1);
        if (buffer.writePosition() != 1 || buffer.content().size() != 1 || buffer.content()[0] != 0x80U)
        {
            std::cerr << "truncate did not drop the tail bits\n";
            return false;
        }
        buffer.writeBit(false);
        buffer.writeBit(true);
        if (buffer.content()[0] != 0xA0U)
        {
            std::cerr << "writes after truncate saw stale bits\n";
            return false;
        }
    }

    {
        BitBuffer                         buffer;
        const std::array<std::uint8_t, 1> src = {0xF0U};
        if (!isEndOfStream(buffer.writeBitsWithOffsetLen(src, 4, 8)))
        {
            std::cerr << "oversized source window was accepted\n";
            return false;
        }
        if (buffer.writePosition() != 0)
        {
            std::cerr << "failed write moved the cursor\n";
            return false;
        }
        if (auto err = buffer.writeBitsWithOffset(src, 4))
        {
            std::cerr << "writeBitsWithOffset failed unexpectedly: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        const std::vector<std::uint8_t> bytes = buffer.takeContent();
        if (bytes.size() != 1 || bytes[0] != 0x00U || buffer.writePosition() != 0)
        {
            std::cerr << "takeContent mismatch\n";
            return false;
        }
    }

    {
        auto shortInput = BitBuffer::fromBits({0x00U}, 9);
        if (shortInput || !isEndOfStream(shortInput.takeError()))
        {
            std::cerr << "fromBits accepted a bit length beyond the storage\n";
            return false;
        }
        auto adopted = BitBuffer::fromBits({0xC0U}, 2);
        if (!adopted)
        {
            std::cerr << "fromBits failed unexpectedly: " << llvm::toString(adopted.takeError()) << "\n";
            return false;
        }
        if (adopted->bitsRemaining() != 2)
        {
            std::cerr << "fromBits bit length mismatch\n";
            return false;
        }
    }

    {
        const std::array<std::uint8_t, 2> data = {0xF0U, 0x0FU};
        Bits                              view(data, 12);
        if (view.end() != 12 || view.bitsRemaining() != 12)
        {
            std::cerr << "Bits view length mismatch\n";
            return false;
        }
        auto peeked = view.peekBit(12);
        if (peeked || !isEndOfStream(peeked.takeError()))
        {
            std::cerr << "peekBit past the view end did not fail\n";
            return false;
        }
        auto tooLong = view.subView(13);
        if (tooLong || !isEndOfStream(tooLong.takeError()))
        {
            std::cerr << "subView beyond the view end did not fail\n";
            return false;
        }
        auto head = view.subView(4);
        if (!head)
        {
            std::cerr << "subView failed unexpectedly: " << llvm::toString(head.takeError()) << "\n";
            return false;
        }
        if (head->bitsRemaining() != 4 || view.position() != 0)
        {
            std::cerr << "subView moved the parent or has the wrong size\n";
            return false;
        }
        if (auto err = view.advance(4))
        {
            std::cerr << "advance failed unexpectedly: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        auto next = view.readBit();
        if (!next || *next || view.position() != 5)
        {
            llvm::consumeError(next.takeError());
            std::cerr << "Bits readBit after advance mismatch\n";
            return false;
        }
        if (!isEndOfStream(view.advance(8)))
        {
            std::cerr << "advance past the view end did not fail\n";
            return false;
        }

        Bits clamped(data, 100);
        if (clamped.end() != 16)
        {
            std::cerr << "Bits view did not clamp to its storage\n";
            return false;
        }
    }

    return true;
}
