//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements restricted character string encoding and validation.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Runtime/CharacterString.h"

#include "llvmasn1/Runtime/PackedEncoding.h"
#include "llvmasn1/Support/CodecError.h"

#include "llvm/Support/ConvertUTF.h"

#include <utility>
#include <vector>

namespace llvmasn1::per
{
namespace
{

constexpr std::uint32_t kAsciiLimit = 0x80U;

bool isPrintableCharacter(const std::uint32_t c)
{
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))
    {
        return true;
    }
    return llvm::StringRef(" '()+,-./:=?").contains(static_cast<char>(c));
}

bool isUtf8(llvm::StringRef value)
{
    const auto* begin = reinterpret_cast<const llvm::UTF8*>(value.data());
    return llvm::isLegalUTF8String(&begin, begin + value.size());
}

/// @brief Decodes the code point starting at `bytes[offset]` for error reporting.
std::uint32_t codePointAt(llvm::StringRef bytes, const std::size_t offset)
{
    const auto*    source = reinterpret_cast<const llvm::UTF8*>(bytes.data() + offset);
    llvm::UTF32    target = 0;
    const unsigned size   = llvm::getNumBytesForUTF8(*source);
    if (offset + size <= bytes.size() &&
        llvm::convertUTF8Sequence(&source, source + size, &target, llvm::strictConversion) == llvm::conversionOK)
    {
        return target;
    }
    return static_cast<unsigned char>(bytes[offset]);
}

std::uint32_t encodeCharacter(const Charset charset, const char c)
{
    if (charset == Charset::Numeric)
    {
        return static_cast<std::uint32_t>(kNumericAlphabet.find(c));
    }
    return static_cast<unsigned char>(c);
}

}  // namespace

unsigned bitsPerCharacter(const Charset charset)
{
    switch (charset)
    {
    case Charset::Utf8:
        return 0U;
    case Charset::Numeric:
        return 4U;
    case Charset::Printable:
    case Charset::Ia5:
    case Charset::Visible:
        return 7U;
    }
    return 0U;
}

bool isPermittedCharacter(const Charset charset, const std::uint32_t character)
{
    switch (charset)
    {
    case Charset::Utf8:
        return character <= 0x10FFFFU;
    case Charset::Numeric:
        return character == ' ' || (character >= '0' && character <= '9');
    case Charset::Printable:
        return isPrintableCharacter(character);
    case Charset::Ia5:
        return character < kAsciiLimit;
    case Charset::Visible:
        return character >= 0x20U && character <= 0x7EU;
    }
    return false;
}

llvm::Error validateCharacterString(const Charset charset, llvm::StringRef value)
{
    if (charset == Charset::Utf8)
    {
        return isUtf8(value) ? llvm::Error::success() : makeInvalidUtf8String();
    }
    // Every permitted character is ASCII, so byte and character indices agree
    // up to the first offending one.
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        const auto byte = static_cast<unsigned char>(value[i]);
        if (byte >= kAsciiLimit || !isPermittedCharacter(charset, byte))
        {
            return makeInvalidCharacter(charsetName(charset), codePointAt(value, i), i);
        }
    }
    return llvm::Error::success();
}

llvm::Error writeCharacterString(BitBuffer&      out,
                                 const Charset   charset,
                                 const SizeBound lower,
                                 const SizeBound upper,
                                 const bool      extensible,
                                 llvm::StringRef value)
{
    if (llvm::Error err = validateCharacterString(charset, value))
    {
        return err;
    }
    const llvm::ArrayRef<std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(value.data()), value.size());
    if (charset == Charset::Utf8)
    {
        // Size constraints on UTF8String are not PER-visible.
        return writeOctetString(out, std::nullopt, std::nullopt, false, bytes);
    }

    const unsigned width = bitsPerCharacter(charset);
    return writeSizedContent(out,
                             lower,
                             upper,
                             extensible,
                             value.size(),
                             [&out, charset, value, width](const std::uint64_t offset, const std::uint64_t count) {
                                 for (std::uint64_t i = offset; i < offset + count; ++i)
                                 {
                                     const std::uint32_t code = encodeCharacter(charset, value[i]);
                                     for (unsigned bit = width; bit > 0U; --bit)
                                     {
                                         out.writeBit(((code >> (bit - 1U)) & 1U) != 0U);
                                     }
                                 }
                                 return llvm::Error::success();
                             });
}

llvm::Expected<std::string> readCharacterString(BitSource&          in,
                                                const Charset       charset,
                                                const SizeBound     lower,
                                                const SizeBound     upper,
                                                const bool          extensible,
                                                const std::uint64_t limit)
{
    if (charset == Charset::Utf8)
    {
        llvm::Expected<std::vector<std::uint8_t>> bytes =
            readOctetString(in, std::nullopt, std::nullopt, false, limit);
        if (!bytes)
        {
            return bytes.takeError();
        }
        std::string text(bytes->begin(), bytes->end());
        if (!isUtf8(text))
        {
            return makeInvalidUtf8String();
        }
        return text;
    }

    const unsigned width = bitsPerCharacter(charset);
    std::string    out;
    if (llvm::Error err = readSizedContent(
            in,
            lower,
            upper,
            extensible,
            width,
            limit,
            [&in, &out, charset, width](const std::uint64_t count) -> llvm::Error {
                for (std::uint64_t i = 0; i < count; ++i)
                {
                    std::uint32_t code = 0;
                    for (unsigned bit = 0; bit < width; ++bit)
                    {
                        llvm::Expected<bool> next = in.readBit();
                        if (!next)
                        {
                            return next.takeError();
                        }
                        code = (code << 1U) | (*next ? 1U : 0U);
                    }
                    std::uint32_t character = code;
                    if (charset == Charset::Numeric)
                    {
                        if (code >= kNumericAlphabet.size())
                        {
                            return makeInvalidCharacter(charsetName(charset), code, out.size());
                        }
                        character = static_cast<unsigned char>(kNumericAlphabet[code]);
                    }
                    if (!isPermittedCharacter(charset, character))
                    {
                        return makeInvalidCharacter(charsetName(charset), character, out.size());
                    }
                    out.push_back(static_cast<char>(character));
                }
                return llvm::Error::success();
            }))
    {
        return std::move(err);
    }
    return out;
}

}  // namespace llvmasn1::per
