//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "llvmasn1/Model/Constraint.h"
#include "llvmasn1/Runtime/BitBuffer.h"
#include "llvmasn1/Runtime/CharacterString.h"
#include "llvmasn1/Support/CodecError.h"

namespace
{

using llvmasn1::BitBuffer;
using llvmasn1::Charset;
using llvmasn1::CodecErrorKind;
using llvmasn1::SizeBound;

struct StringCase final
{
    SizeBound                 lower;
    SizeBound                 upper;
    bool                      extensible;
    std::string               text;
    std::vector<std::uint8_t> bytes;
    std::size_t               bits;
};

/// Encodes one case, compares the exact bits and decodes it back.
bool expectString(const Charset charset, const StringCase& c)
{
    const std::string name = llvmasn1::charsetName(charset).str() + " \"" + c.text + "\"";
    BitBuffer         buffer;
    if (auto err = llvmasn1::per::writeCharacterString(buffer, charset, c.lower, c.upper, c.extensible, c.text))
    {
        std::cerr << name << " failed to encode: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    const auto content = buffer.content();
    if (buffer.writePosition() != c.bits || std::vector<std::uint8_t>(content.begin(), content.end()) != c.bytes)
    {
        std::cerr << name << " encoding mismatch (" << buffer.writePosition() << " bits)\n";
        return false;
    }
    auto decoded = llvmasn1::per::readCharacterString(buffer, charset, c.lower, c.upper, c.extensible);
    if (!decoded)
    {
        std::cerr << name << " failed to decode: " << llvm::toString(decoded.takeError()) << "\n";
        return false;
    }
    if (*decoded != c.text || buffer.bitsRemaining() != 0U)
    {
        std::cerr << name << " decoded as \"" << *decoded << "\"\n";
        return false;
    }
    return true;
}

bool expectKind(llvm::Error err, const CodecErrorKind kind, const std::string& what)
{
    const auto failure = llvmasn1::takeCodecFailure(std::move(err));
    if (!failure || failure->kind != kind)
    {
        std::cerr << what << " did not fail with " << llvmasn1::codecErrorKindName(kind).str() << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runCharacterStringTests()
{
    namespace per = llvmasn1::per;

    {
        if (per::bitsPerCharacter(Charset::Numeric) != 4U || per::bitsPerCharacter(Charset::Printable) != 7U ||
            per::bitsPerCharacter(Charset::Ia5) != 7U || per::bitsPerCharacter(Charset::Visible) != 7U ||
            per::bitsPerCharacter(Charset::Utf8) != 0U)
        {
            std::cerr << "bitsPerCharacter mismatch\n";
            return false;
        }
        if (!per::isPermittedCharacter(Charset::Printable, '?') || per::isPermittedCharacter(Charset::Printable, '@') ||
            !per::isPermittedCharacter(Charset::Ia5, 0x00U) || per::isPermittedCharacter(Charset::Visible, 0x7FU) ||
            per::isPermittedCharacter(Charset::Numeric, 'a'))
        {
            std::cerr << "isPermittedCharacter mismatch\n";
            return false;
        }
    }

    {
        const std::vector<StringCase> numeric = {
            {std::nullopt, std::nullopt, false, " 0123456789", {0x0BU, 0x01U, 0x23U, 0x45U, 0x67U, 0x89U, 0xA0U}, 52},
            {8U, 8U, false, "12345678", {0x23U, 0x45U, 0x67U, 0x89U}, 32},
            {4U, 6U, false, "1234", {0x08U, 0xD1U, 0x40U}, 18},
            {4U, 6U, false, "123456", {0x88U, 0xD1U, 0x59U, 0xC0U}, 26},
            {4U, 6U, true, "1234", {0x04U, 0x68U, 0xA0U}, 19},
            {4U, 6U, true, "1234567", {0x83U, 0x91U, 0xA2U, 0xB3U, 0xC0U}, 37},
        };
        for (const StringCase& c : numeric)
        {
            if (!expectString(Charset::Numeric, c))
            {
                return false;
            }
        }
    }

    {
        // PrintableString, IA5String and VisibleString share the 7-bit layout.
        const std::vector<StringCase> sevenBit = {
            {8U, 8U, false, "12345678", {0x62U, 0xC9U, 0x9BU, 0x46U, 0xADU, 0x9BU, 0xB8U}, 56},
            {4U, 6U, false, "1234", {0x18U, 0xB2U, 0x66U, 0xD0U}, 30},
            {4U, 6U, false, "123456", {0x98U, 0xB2U, 0x66U, 0xD1U, 0xABU, 0x60U}, 44},
            {4U, 6U, true, "1234", {0x0CU, 0x59U, 0x33U, 0x68U}, 31},
            {4U, 6U, true, "1234567", {0x83U, 0xB1U, 0x64U, 0xCDU, 0xA3U, 0x56U, 0xCDU, 0xC0U}, 58},
        };
        for (const Charset charset : {Charset::Printable, Charset::Ia5, Charset::Visible})
        {
            for (const StringCase& c : sevenBit)
            {
                if (!expectString(charset, c))
                {
                    return false;
                }
            }
        }
    }

    {
        const StringCase hello = {std::nullopt,
                                  std::nullopt,
                                  false,
                                  "h\xC3\xA9llo",
                                  {0x06U, 'h', 0xC3U, 0xA9U, 'l', 'l', 'o'},
                                  56};
        if (!expectString(Charset::Utf8, hello))
        {
            return false;
        }
        // Size constraints on UTF8String do not change the encoding.
        const StringCase constrained = {1U, 2U, false, "Hi!", {0x03U, 'H', 'i', '!'}, 32};
        if (!expectString(Charset::Utf8, constrained))
        {
            return false;
        }
    }

    {
        BitBuffer  buffer;
        const auto failure = llvmasn1::takeCodecFailure(
            per::writeCharacterString(buffer, Charset::Numeric, std::nullopt, std::nullopt, false, "12a"));
        if (!failure || failure->kind != CodecErrorKind::InvalidCharacter || failure->first != 'a' ||
            failure->second != 2 || failure->detail != "NumericString")
        {
            std::cerr << "invalid NumericString character was not reported\n";
            return false;
        }
        if (buffer.writePosition() != 0U)
        {
            std::cerr << "rejected string left bits behind\n";
            return false;
        }

        const auto sizeFailure = llvmasn1::takeCodecFailure(
            per::writeCharacterString(buffer, Charset::Numeric, 4U, 6U, false, "12345678"));
        if (!sizeFailure || sizeFailure->kind != CodecErrorKind::SizeNotInRange || sizeFailure->first != 8 ||
            sizeFailure->second != 4 || sizeFailure->third != 6)
        {
            std::cerr << "NumericString size violation was not reported\n";
            return false;
        }

        if (!expectKind(per::writeCharacterString(buffer, Charset::Printable, std::nullopt, std::nullopt, false, "a@b"),
                        CodecErrorKind::InvalidCharacter,
                        "PrintableString with '@'") ||
            !expectKind(per::writeCharacterString(buffer, Charset::Visible, std::nullopt, std::nullopt, false, "tab\t"),
                        CodecErrorKind::InvalidCharacter,
                        "VisibleString with a tab") ||
            !expectKind(per::writeCharacterString(buffer, Charset::Ia5, std::nullopt, std::nullopt, false, "\xC3\xA9"),
                        CodecErrorKind::InvalidCharacter,
                        "IA5String with a non-ASCII character") ||
            !expectKind(per::writeCharacterString(buffer, Charset::Utf8, std::nullopt, std::nullopt, false, "\xC3\x28"),
                        CodecErrorKind::InvalidUtf8String,
                        "malformed UTF-8"))
        {
            return false;
        }
    }

    {
        BitBuffer badNumeric;
        if (auto err = badNumeric.writeBitsWithLen(std::vector<std::uint8_t>{0x01U, 0xF0U}, 12))
        {
            std::cerr << "raw write failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        auto numeric = per::readCharacterString(badNumeric, Charset::Numeric, std::nullopt, std::nullopt, false);
        if (numeric ||
            !expectKind(numeric.takeError(), CodecErrorKind::InvalidCharacter, "NumericString code outside the alphabet"))
        {
            return false;
        }

        BitBuffer badUtf8;
        if (auto err = badUtf8.writeBits(std::vector<std::uint8_t>{0x02U, 0xC3U, 0x28U}))
        {
            std::cerr << "raw write failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        auto utf8 = per::readCharacterString(badUtf8, Charset::Utf8, std::nullopt, std::nullopt, false);
        if (utf8 || !expectKind(utf8.takeError(), CodecErrorKind::InvalidUtf8String, "decoded malformed UTF-8"))
        {
            return false;
        }

        BitBuffer badPrintable;
        // Length 1 followed by '@' in seven bits.
        if (auto err = badPrintable.writeBitsWithLen(std::vector<std::uint8_t>{0x01U, 0x80U}, 15))
        {
            std::cerr << "raw write failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        auto printable = per::readCharacterString(badPrintable, Charset::Printable, std::nullopt, std::nullopt, false);
        if (printable ||
            !expectKind(printable.takeError(), CodecErrorKind::InvalidCharacter, "decoded PrintableString with '@'"))
        {
            return false;
        }
    }

    return true;
}
