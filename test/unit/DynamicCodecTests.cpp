//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "llvmasn1/Model/Constraint.h"
#include "llvmasn1/Model/TypeDescriptor.h"
#include "llvmasn1/Model/Value.h"
#include "llvmasn1/Support/CodecConfig.h"
#include "llvmasn1/Support/CodecError.h"
#include "llvmasn1/Uper/DynamicCodec.h"

namespace
{

using llvmasn1::Charset;
using llvmasn1::CodecErrorKind;
using llvmasn1::Constraint;
using llvmasn1::TypeDescriptor;
using llvmasn1::TypeDescriptorPtr;
using llvmasn1::Value;
using llvmasn1::ValuePtr;

/// SEQUENCE {
///   id INTEGER (0..1000), flag BOOLEAN, nothing NULL OPTIONAL,
///   colour ENUMERATED { red, green, blue, ..., purple },
///   payload OCTET STRING (SIZE (0..8)), mask BIT STRING (SIZE (12)),
///   label PrintableString (SIZE (1..16)), tags SEQUENCE (SIZE (0..4)) OF IA5String,
///   pick CHOICE { n INTEGER, s VisibleString, ... } OPTIONAL,
///   ...,
///   note UTF8String OPTIONAL }
TypeDescriptorPtr recordType()
{
    using llvmasn1::makeLeafType;
    const TypeDescriptorPtr colour = llvmasn1::makeEnumeratedType("Colour", {"red", "green", "blue", "purple"}, 3);
    const TypeDescriptorPtr pick   = llvmasn1::makeChoiceType(
        "Pick",
        {{"n", false, makeLeafType("", Constraint::integer())},
         {"s", false, makeLeafType("", Constraint::characterString(Charset::Visible))}},
        2);
    const TypeDescriptorPtr tags = llvmasn1::makeSequenceOfType(
        "Tags", makeLeafType("", Constraint::characterString(Charset::Ia5)), 0, 4);
    return llvmasn1::makeSequenceType(
        "Record",
        {
            {"id", false, makeLeafType("", Constraint::integer(0, 1000))},
            {"flag", false, makeLeafType("", Constraint::boolean())},
            {"nothing", true, makeLeafType("", Constraint::null())},
            {"colour", false, colour},
            {"payload", false, makeLeafType("", Constraint::octetString(0, 8))},
            {"mask", false, makeLeafType("", Constraint::bitString(12, 12))},
            {"label", false, makeLeafType("", Constraint::characterString(Charset::Printable, 1, 16))},
            {"tags", false, tags},
            {"pick", true, pick},
            {"note", true, makeLeafType("", Constraint::characterString(Charset::Utf8))},
        },
        9);
}

ValuePtr recordValue(const bool withOptionals)
{
    return Value::sequence({
        Value::integer(999),
        Value::boolean(true),
        withOptionals ? Value::null() : nullptr,
        Value::enumerated(withOptionals ? 3 : 2),
        Value::octetString({0xDEU, 0xADU, 0xBEU, 0xEFU}),
        Value::bitString({0xABU, 0xC0U}, 12),
        Value::characterString("Label (1)"),
        Value::sequenceOf({Value::characterString("a"), Value::characterString("bc")}),
        withOptionals ? Value::choice(1, Value::characterString("visible!")) : nullptr,
        withOptionals ? Value::characterString("\xE2\x9C\x93 done") : nullptr,
    });
}

bool roundTrip(const ValuePtr& value, const TypeDescriptor& type, const std::string& what)
{
    auto encoded = llvmasn1::encode(*value, type);
    if (!encoded)
    {
        std::cerr << what << " failed to encode: " << llvm::toString(encoded.takeError()) << "\n";
        return false;
    }
    auto decoded = llvmasn1::decode(encoded->bytes, encoded->bitLength, type);
    if (!decoded)
    {
        std::cerr << what << " failed to decode: " << llvm::toString(decoded.takeError()) << "\n";
        return false;
    }
    if (!llvmasn1::sameValue(decoded->value, value) || decoded->consumedBits != encoded->bitLength)
    {
        std::cerr << what << " round-trip mismatch: " << value->str() << " vs "
                  << (decoded->value ? decoded->value->str() : "<null>") << "\n";
        return false;
    }
    return true;
}

bool expectEncodeFailure(const ValuePtr&       value,
                         const TypeDescriptor& type,
                         const CodecErrorKind  kind,
                         const std::string&    what)
{
    auto encoded = llvmasn1::encode(*value, type);
    if (encoded)
    {
        std::cerr << what << " encoded unexpectedly\n";
        return false;
    }
    const auto failure = llvmasn1::takeCodecFailure(encoded.takeError());
    if (!failure || failure->kind != kind)
    {
        std::cerr << what << " did not fail with " << llvmasn1::codecErrorKindName(kind).str() << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runDynamicCodecTests()
{
    const TypeDescriptorPtr record = recordType();

    {
        if (record->constraint.standardCount() != 9 || record->constraint.extensionCount() != 1 ||
            record->constraint.optionalStandardFields != 2 || !record->constraint.extensible)
        {
            std::cerr << "record constraint shape mismatch\n";
            return false;
        }
        if (record->findField("tags") != std::optional<std::size_t>(7) || record->findField("missing"))
        {
            std::cerr << "findField mismatch\n";
            return false;
        }
        if (record->fields[3].type->findItem("purple") != std::optional<std::size_t>(3))
        {
            std::cerr << "findItem mismatch\n";
            return false;
        }
    }

    if (!roundTrip(recordValue(true), *record, "record with optionals") ||
        !roundTrip(recordValue(false), *record, "record without optionals"))
    {
        return false;
    }

    {
        // Without optionals and extensions the record starts with a clear marker and two clear presence bits.
        auto encoded = llvmasn1::encode(*recordValue(false), *record);
        if (!encoded || encoded->bytes.empty() || (encoded->bytes[0] & 0xE0U) != 0x00U)
        {
            llvm::consumeError(encoded.takeError());
            std::cerr << "record preamble mismatch\n";
            return false;
        }
    }

    {
        auto first  = llvmasn1::encode(*recordValue(true), *record);
        auto second = llvmasn1::encode(*recordValue(true), *record);
        if (!first || !second || first->bytes != second->bytes || first->bitLength != second->bitLength)
        {
            llvm::consumeError(first.takeError());
            llvm::consumeError(second.takeError());
            std::cerr << "encoding is not deterministic\n";
            return false;
        }
    }

    {
        const TypeDescriptorPtr ranged = llvmasn1::makeLeafType("Ranged", Constraint::integer(-5, 1000));
        if (!roundTrip(Value::integer(-5), *ranged, "lower bound") ||
            !roundTrip(Value::integer(1000), *ranged, "upper bound"))
        {
            return false;
        }
        for (const std::int64_t outside : {std::int64_t{-6}, std::int64_t{1001}})
        {
            auto       encoded = llvmasn1::encode(*Value::integer(outside), *ranged);
            const auto failure = llvmasn1::takeCodecFailure(encoded.takeError());
            if (!failure || failure->kind != CodecErrorKind::ValueNotInRange || failure->first != outside ||
                failure->second != -5 || failure->third != 1000)
            {
                std::cerr << "value " << outside << " outside -5..1000 was not rejected\n";
                return false;
            }
        }
    }

    {
        // 16384 octets: one full fragment followed by an empty terminating length.
        const TypeDescriptorPtr blob = llvmasn1::makeLeafType("Blob", Constraint::octetString());
        const ValuePtr          value = Value::octetString(std::vector<std::uint8_t>(16384U, 0x5AU));
        auto                    encoded = llvmasn1::encode(*value, *blob);
        if (!encoded)
        {
            std::cerr << "16384 octets failed to encode: " << llvm::toString(encoded.takeError()) << "\n";
            return false;
        }
        if (encoded->bitLength != (1U + 16384U + 1U) * 8U || encoded->bytes.front() != 0xC1U ||
            encoded->bytes[1] != 0x5AU || encoded->bytes.back() != 0x00U)
        {
            std::cerr << "16384 octets fragment layout mismatch\n";
            return false;
        }
        if (!roundTrip(value, *blob, "16384 octets"))
        {
            return false;
        }
    }

    {
        if (Value::choice(1, Value::characterString("x"))->str() != "1: \"x\"" ||
            Value::sequence({Value::integer(-3), nullptr})->str() != "{-3, <absent>}" ||
            Value::bitString({0xA0U}, 3)->str() != "'101'B" || Value::octetString({0x0FU})->str() != "'0F'H")
        {
            std::cerr << "Value::str mismatch\n";
            return false;
        }
        if (*Value::bitString({0xF0U}, 4) != *Value::bitString({0xFFU}, 4) ||
            *Value::bitString({0xF0U}, 4) == *Value::bitString({0xF0U}, 5) ||
            *Value::integer(1) == *Value::boolean(true))
        {
            std::cerr << "Value equality mismatch\n";
            return false;
        }
        if (!llvmasn1::sameValue(nullptr, nullptr) || llvmasn1::sameValue(Value::null(), nullptr))
        {
            std::cerr << "sameValue mismatch for absent values\n";
            return false;
        }
    }

    {
        const TypeDescriptorPtr boolean = llvmasn1::makeLeafType("Flag", Constraint::boolean());
        if (!expectEncodeFailure(Value::integer(1), *boolean, CodecErrorKind::UnsupportedOperation, "kind mismatch"))
        {
            return false;
        }

        if (!expectEncodeFailure(Value::sequence({Value::integer(1)}),
                                 *record,
                                 CodecErrorKind::UnsupportedOperation,
                                 "short field list"))
        {
            return false;
        }

        auto fields = std::get<Value::Sequence>(recordValue(false)->value).fields;
        fields[0]   = nullptr;
        if (!expectEncodeFailure(Value::sequence(fields),
                                 *record,
                                 CodecErrorKind::UnsupportedOperation,
                                 "absent mandatory field"))
        {
            return false;
        }

        fields    = std::get<Value::Sequence>(recordValue(false)->value).fields;
        fields[0] = Value::integer(1001);
        if (!expectEncodeFailure(Value::sequence(fields), *record, CodecErrorKind::ValueNotInRange, "id above 1000"))
        {
            return false;
        }

        fields    = std::get<Value::Sequence>(recordValue(false)->value).fields;
        fields[7] = Value::sequenceOf({Value::characterString("a"), nullptr});
        if (!expectEncodeFailure(Value::sequence(fields),
                                 *record,
                                 CodecErrorKind::UnsupportedOperation,
                                 "absent sequence-of element"))
        {
            return false;
        }

        fields    = std::get<Value::Sequence>(recordValue(false)->value).fields;
        fields[3] = Value::enumerated(4);
        if (!expectEncodeFailure(Value::sequence(fields),
                                 *record,
                                 CodecErrorKind::InvalidChoiceIndex,
                                 "enumerated index beyond every item"))
        {
            return false;
        }

        const TypeDescriptorPtr pick = record->fields[8].type;
        if (!expectEncodeFailure(Value::choice(0, nullptr), *pick, CodecErrorKind::UnsupportedOperation,
                                 "absent choice payload") ||
            !expectEncodeFailure(Value::choice(2, Value::integer(0)),
                                 *pick,
                                 CodecErrorKind::InvalidChoiceIndex,
                                 "choice index beyond every variant"))
        {
            return false;
        }
    }

    {
        auto encoded = llvmasn1::encode(*recordValue(true), *record);
        if (!encoded)
        {
            std::cerr << "record failed to encode: " << llvm::toString(encoded.takeError()) << "\n";
            return false;
        }
        auto truncated = llvmasn1::decode(encoded->bytes, encoded->bitLength - 9U, *record);
        const auto failure = llvmasn1::takeCodecFailure(truncated.takeError());
        if (!failure || failure->kind != CodecErrorKind::EndOfStream)
        {
            std::cerr << "truncated record did not report end of stream\n";
            return false;
        }

        std::vector<std::uint8_t> padded = encoded->bytes;
        padded.push_back(0xFFU);
        auto trailing = llvmasn1::decode(padded, encoded->bitLength + 8U, *record);
        if (!trailing || trailing->consumedBits != encoded->bitLength)
        {
            llvm::consumeError(trailing.takeError());
            std::cerr << "trailing bits were consumed\n";
            return false;
        }
    }

    {
        TypeDescriptorPtr nested = llvmasn1::makeLeafType("", Constraint::boolean());
        ValuePtr          value  = Value::boolean(false);
        for (int depth = 0; depth < 4; ++depth)
        {
            nested = llvmasn1::makeSequenceType("", {{"inner", false, nested}});
            value  = Value::sequence({value});
        }
        llvmasn1::CodecConfig shallow;
        shallow.maxNestingDepth = 3;
        auto encoded            = llvmasn1::encode(*value, *nested, shallow);
        const auto failure      = llvmasn1::takeCodecFailure(encoded.takeError());
        if (!failure || failure->kind != CodecErrorKind::UnsupportedOperation)
        {
            std::cerr << "encode ignored the nesting limit\n";
            return false;
        }
        if (!roundTrip(value, *nested, "four nested sequences"))
        {
            return false;
        }
        const std::vector<std::uint8_t> bytes = {0x00U};
        auto                            decoded = llvmasn1::decode(bytes, 1, *nested, shallow);
        const auto decodeFailure                = llvmasn1::takeCodecFailure(decoded.takeError());
        if (!decodeFailure || decodeFailure->kind != CodecErrorKind::UnsupportedOperation)
        {
            std::cerr << "decode ignored the nesting limit\n";
            return false;
        }
    }

    {
        llvmasn1::CodecConfig verbose;
        verbose.traceLevel = llvmasn1::TraceLevel::Verbose;
        std::string              log;
        llvm::raw_string_ostream os(log);
        auto                     encoded = llvmasn1::encode(*recordValue(true), *record, verbose, &os);
        if (!encoded)
        {
            std::cerr << "traced encode failed: " << llvm::toString(encoded.takeError()) << "\n";
            return false;
        }
        auto decoded = llvmasn1::decode(encoded->bytes, encoded->bitLength, *record, verbose, &os);
        if (!decoded)
        {
            std::cerr << "traced decode failed: " << llvm::toString(decoded.takeError()) << "\n";
            return false;
        }
        os.flush();
        if (log.find("[asn1uper] write") == std::string::npos || log.find("[asn1uper] read") == std::string::npos ||
            log.find("open type") == std::string::npos || log.find("extension block") == std::string::npos)
        {
            std::cerr << "verbose trace is missing expected lines:\n" << log;
            return false;
        }
    }

    return true;
}
