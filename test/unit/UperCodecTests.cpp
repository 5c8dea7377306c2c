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
#include "llvmasn1/Support/CodecConfig.h"
#include "llvmasn1/Support/CodecError.h"
#include "llvmasn1/Uper/UperReader.h"
#include "llvmasn1/Uper/UperWriter.h"

namespace
{

using llvmasn1::CodecErrorKind;
using llvmasn1::Constraint;
using llvmasn1::UperReader;
using llvmasn1::UperWriter;

bool expectWritten(UperWriter&                      writer,
                   const std::vector<std::uint8_t>& bytes,
                   const std::size_t                bits,
                   const std::string&               what)
{
    const std::size_t               written = writer.bitLength();
    const std::vector<std::uint8_t> content = writer.takeBytes();
    if (written != bits || content != bytes)
    {
        std::cerr << what << " encoding mismatch (" << written << " bits)\n";
        return false;
    }
    return true;
}

bool checked(llvm::Error err, const std::string& what)
{
    if (err)
    {
        std::cerr << what << " failed unexpectedly: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    return true;
}

std::optional<llvmasn1::CodecFailure> failureOf(llvm::Error err)
{
    return llvmasn1::takeCodecFailure(std::move(err));
}

/// SEQUENCE { a INTEGER (0..255), b BOOLEAN OPTIONAL, ..., c INTEGER (0..255) OPTIONAL }
const Constraint kScenarioSequence = Constraint::sequence(3, 1, 1);
const Constraint kByte             = Constraint::integer(0, 255);

llvm::Error writeScenarioSequence(UperWriter&                       writer,
                                  const std::int64_t                a,
                                  const std::optional<bool>         b,
                                  const std::optional<std::int64_t> c)
{
    return writer.writeSequence(kScenarioSequence, [&](UperWriter& inner) -> llvm::Error {
        if (llvm::Error err = inner.writeInteger(kByte, a))
        {
            return err;
        }
        if (llvm::Error err = inner.writeOpt(b.has_value(), [&](UperWriter& opt) { return opt.writeBoolean(*b); }))
        {
            return err;
        }
        return inner.writeOpt(c.has_value(), [&](UperWriter& opt) { return opt.writeInteger(kByte, *c); });
    });
}

struct ScenarioValue final
{
    std::int64_t                a{0};
    std::optional<bool>         b;
    std::optional<std::int64_t> c;
};

llvm::Expected<ScenarioValue> readScenarioSequence(UperReader& reader)
{
    return reader.readSequence(kScenarioSequence, [](UperReader& inner) -> llvm::Expected<ScenarioValue> {
        ScenarioValue value;
        auto          a = inner.readInteger(kByte);
        if (!a)
        {
            return a.takeError();
        }
        value.a = *a;
        auto b  = inner.readOpt([](UperReader& opt) { return opt.readBoolean(); });
        if (!b)
        {
            return b.takeError();
        }
        value.b = *b;
        auto c  = inner.readOpt([](UperReader& opt) { return opt.readInteger(kByte); });
        if (!c)
        {
            return c.takeError();
        }
        value.c = *c;
        return value;
    });
}

}  // namespace

bool runUperCodecTests()
{
    // Two optional flags, first set.
    {
        const Constraint flags = Constraint::sequence(2, 2);
        UperWriter       writer;
        if (!checked(writer.writeSequence(flags,
                                          [](UperWriter& inner) -> llvm::Error {
                                              if (llvm::Error err = inner.writeOpt(true, [](UperWriter& opt) {
                                                      return opt.writeNull();
                                                  }))
                                              {
                                                  return err;
                                              }
                                              return inner.writeOpt(false, [](UperWriter& opt) {
                                                  return opt.writeNull();
                                              });
                                          }),
                     "optional flags write") ||
            !expectWritten(writer, {0x80U}, 2, "optional flags"))
        {
            return false;
        }

        const std::vector<std::uint8_t> bytes = {0x80U};
        UperReader                      reader(bytes, 2);
        bool                            first  = false;
        bool                            second = true;
        if (!checked(reader.visitSequence(flags,
                                          [&](UperReader& inner) -> llvm::Error {
                                              if (llvm::Error err = inner.visitOpt(
                                                      [](UperReader& opt) { return opt.readNull(); }, first))
                                              {
                                                  return err;
                                              }
                                              return inner.visitOpt([](UperReader& opt) { return opt.readNull(); },
                                                                    second);
                                          }),
                     "optional flags read"))
        {
            return false;
        }
        if (!first || second || reader.position() != 2)
        {
            std::cerr << "optional flags decode mismatch\n";
            return false;
        }
    }

    // Unconstrained signed integer.
    {
        UperWriter writer;
        if (!checked(writer.writeInteger(Constraint::integer(), -12), "integer write") ||
            !expectWritten(writer, {0x01U, 0xF4U}, 16, "unconstrained -12"))
        {
            return false;
        }
        const std::vector<std::uint8_t> bytes = {0x01U, 0xF4U};
        UperReader                      reader(bytes, 16);
        auto                            value = reader.readInteger(Constraint::integer());
        if (!value || *value != -12)
        {
            llvm::consumeError(value.takeError());
            std::cerr << "unconstrained -12 decode mismatch\n";
            return false;
        }
    }

    // Extensible CHOICE with two standard variants, selecting the extension variant.
    {
        const Constraint choice = Constraint::choice(3, 1);
        UperWriter       writer;
        if (!checked(writer.writeChoice(choice, 2, [](UperWriter& inner) { return inner.writeInteger(kByte, 5); }),
                     "extension variant write") ||
            !expectWritten(writer, {0x80U, 0x01U, 0x05U}, 24, "extension variant"))
        {
            return false;
        }

        const std::vector<std::uint8_t> bytes = {0x80U, 0x01U, 0x05U};
        UperReader                      reader(bytes, 24);
        std::uint64_t                   selected = 0;
        auto payload = reader.readChoice(choice, [&](UperReader& inner, const std::uint64_t index) {
            selected = index;
            return inner.readInteger(kByte);
        });
        if (!payload || *payload != 5 || selected != 2 || reader.position() != 24)
        {
            llvm::consumeError(payload.takeError());
            std::cerr << "extension variant decode mismatch\n";
            return false;
        }

        UperWriter standard;
        if (!checked(standard.writeChoice(choice, 1, [](UperWriter& inner) { return inner.writeBoolean(true); }),
                     "standard variant write") ||
            !expectWritten(standard, {0x60U}, 3, "standard variant"))
        {
            return false;
        }

        UperWriter outOfRange;
        const auto failure = failureOf(
            outOfRange.writeChoice(choice, 3, [](UperWriter& inner) { return inner.writeBoolean(true); }));
        if (!failure || failure->kind != CodecErrorKind::InvalidChoiceIndex || failure->first != 3 ||
            failure->second != 3)
        {
            std::cerr << "choice index beyond every variant was not reported\n";
            return false;
        }
    }

    // Extensible SEQUENCE with and without its extension field.
    {
        UperWriter standardOnly;
        if (!checked(writeScenarioSequence(standardOnly, 42, std::nullopt, std::nullopt), "standard-only write") ||
            !expectWritten(standardOnly, {0x0AU, 0x80U}, 10, "standard-only sequence"))
        {
            return false;
        }

        UperWriter extended;
        if (!checked(writeScenarioSequence(extended, 42, true, 7), "extended write") ||
            !expectWritten(extended, {0xCAU, 0xA0U, 0x20U, 0x20U, 0xE0U}, 35, "extended sequence"))
        {
            return false;
        }

        const std::vector<std::uint8_t> bytes = {0xCAU, 0xA0U, 0x20U, 0x20U, 0xE0U};
        UperReader                      reader(bytes, 35);
        auto                            value = readScenarioSequence(reader);
        if (!value)
        {
            std::cerr << "extended sequence decode failed: " << llvm::toString(value.takeError()) << "\n";
            return false;
        }
        if (value->a != 42 || value->b != std::optional<bool>(true) || value->c != std::optional<std::int64_t>(7) ||
            reader.position() != 35)
        {
            std::cerr << "extended sequence decode mismatch\n";
            return false;
        }

        const std::vector<std::uint8_t> shortBytes = {0x0AU, 0x80U};
        UperReader                      shortReader(shortBytes, 10);
        auto                            shortValue = readScenarioSequence(shortReader);
        if (!shortValue)
        {
            std::cerr << "standard-only decode failed: " << llvm::toString(shortValue.takeError()) << "\n";
            return false;
        }
        if (shortValue->a != 42 || shortValue->b || shortValue->c || shortReader.position() != 10)
        {
            std::cerr << "standard-only decode mismatch\n";
            return false;
        }
    }

    // Extension additions unknown to the decoder are skipped.
    {
        const Constraint newer = Constraint::sequence(3, 0, 0);
        const Constraint older = Constraint::sequence(2, 0, 0);
        const Constraint small = Constraint::integer(0, 7);
        UperWriter       writer;
        if (!checked(writer.writeSequence(newer,
                                          [&](UperWriter& inner) -> llvm::Error {
                                              if (llvm::Error err = inner.writeInteger(small, 1))
                                              {
                                                  return err;
                                              }
                                              if (llvm::Error err = inner.writeOpt(false, [&](UperWriter& opt) {
                                                      return opt.writeInteger(kByte, 0);
                                                  }))
                                              {
                                                  return err;
                                              }
                                              return inner.writeOpt(true, [&](UperWriter& opt) {
                                                  return opt.writeInteger(kByte, 5);
                                              });
                                          }),
                     "newer sequence write"))
        {
            return false;
        }
        const std::size_t               bits  = writer.bitLength();
        const std::vector<std::uint8_t> bytes = writer.takeBytes();
        if (bits != 29)
        {
            std::cerr << "newer sequence length mismatch: " << bits << "\n";
            return false;
        }

        UperReader   reader(bytes, bits);
        std::int64_t a       = 0;
        bool         present = true;
        if (!checked(reader.visitSequence(older,
                                          [&](UperReader& inner) -> llvm::Error {
                                              auto value = inner.readInteger(small);
                                              if (!value)
                                              {
                                                  return value.takeError();
                                              }
                                              a = *value;
                                              return inner.visitOpt(
                                                  [](UperReader& opt) { return opt.readInteger(kByte).takeError(); },
                                                  present);
                                          }),
                     "older sequence read"))
        {
            return false;
        }
        if (a != 1 || present || reader.position() != bits)
        {
            std::cerr << "unknown extension was not skipped\n";
            return false;
        }
    }

    // A marker set on a type without extension fields is a broken constellation.
    {
        const Constraint                closed = Constraint::sequence(1, 0, 0);
        const std::vector<std::uint8_t> bytes  = {0x80U, 0x00U};
        UperReader                      reader(bytes, 9);
        const auto                      failure = failureOf(reader.visitSequence(closed, [](UperReader& inner) {
            return inner.readInteger(kByte).takeError();
        }));
        if (!failure || failure->kind != CodecErrorKind::InvalidExtensionConstellation || failure->first != 0 ||
            failure->second != 1)
        {
            std::cerr << "marker without extension fields was not rejected\n";
            return false;
        }
    }

    // A mandatory extension field missing from an older encoding.
    {
        const Constraint                mandatory = Constraint::sequence(2, 0, 0);
        const std::vector<std::uint8_t> bytes     = {0x00U, 0x80U};
        UperReader                      reader(bytes, 9);
        const auto                      failure = failureOf(reader.visitSequence(mandatory, [](UperReader& inner) {
            if (llvm::Error err = inner.readInteger(kByte).takeError())
            {
                return err;
            }
            return inner.readInteger(kByte).takeError();
        }));
        if (!failure || failure->kind != CodecErrorKind::InvalidExtensionConstellation || failure->first != 1 ||
            failure->second != 0)
        {
            std::cerr << "absent mandatory extension field was not rejected\n";
            return false;
        }
    }

    // Presence bits used more often than reserved.
    {
        UperWriter writer;
        const auto failure = failureOf(writer.writeSequence(Constraint::sequence(1, 1), [](UperWriter& inner) {
            if (llvm::Error err = inner.writeOpt(true, [](UperWriter& opt) { return opt.writeNull(); }))
            {
                return err;
            }
            return inner.writeOpt(true, [](UperWriter& opt) { return opt.writeNull(); });
        }));
        if (!failure || failure->kind != CodecErrorKind::OptFlagsExhausted)
        {
            std::cerr << "overused presence bits were not reported\n";
            return false;
        }
    }

    // SEQUENCE OF with a size constraint.
    {
        const Constraint list = Constraint::sequenceOf(0, 3);
        UperWriter       writer;
        if (!checked(writer.writeSequenceOf(list,
                                            2,
                                            [](UperWriter& inner, const std::uint64_t index) {
                                                return inner.writeInteger(kByte, static_cast<std::int64_t>(index + 1));
                                            }),
                     "sequence-of write") ||
            !expectWritten(writer, {0x80U, 0x40U, 0x80U}, 18, "sequence-of"))
        {
            return false;
        }

        const std::vector<std::uint8_t> bytes = {0x80U, 0x40U, 0x80U};
        UperReader                      reader(bytes, 18);
        auto elements = reader.readSequenceOf(list, [](UperReader& inner) { return inner.readInteger(kByte); });
        if (!elements || *elements != std::vector<std::int64_t>{1, 2})
        {
            llvm::consumeError(elements.takeError());
            std::cerr << "sequence-of decode mismatch\n";
            return false;
        }

        UperWriter tooMany;
        const auto failure = failureOf(tooMany.writeSequenceOf(list, 4, [](UperWriter& inner, std::uint64_t) {
            return inner.writeNull();
        }));
        if (!failure || failure->kind != CodecErrorKind::SizeNotInRange)
        {
            std::cerr << "sequence-of size violation was not reported\n";
            return false;
        }
    }

    // Enumerated values follow the choice index rule without a payload.
    {
        const Constraint colours = Constraint::enumerated(4, 2);
        UperWriter       writer;
        if (!checked(writer.writeEnumerated(colours, 1), "enumerated write") ||
            !checked(writer.writeEnumerated(colours, 3), "enumerated write") ||
            !expectWritten(writer, {0x30U, 0x00U}, 11, "enumerated"))
        {
            return false;
        }
        const std::vector<std::uint8_t> bytes = {0x30U, 0x00U};
        UperReader                      reader(bytes, 11);
        auto                            first  = reader.readEnumerated(colours);
        auto                            second = reader.readEnumerated(colours);
        if (!first || !second || *first != 1U || *second != 3U)
        {
            llvm::consumeError(first.takeError());
            llvm::consumeError(second.takeError());
            std::cerr << "enumerated decode mismatch\n";
            return false;
        }
    }

    // Truncated input.
    {
        const std::vector<std::uint8_t> bytes = {0x80U, 0x81U};
        UperReader                      reader(bytes, 16);
        const Constraint                choice = Constraint::choice(3);
        auto payload = reader.readChoice(choice, [](UperReader& inner, std::uint64_t) {
            return inner.readInteger(Constraint::integer());
        });
        const auto failure = failureOf(payload.takeError());
        if (!failure || failure->kind != CodecErrorKind::EndOfStream)
        {
            std::cerr << "truncated payload did not report end of stream\n";
            return false;
        }
    }

    // Configured limits.
    {
        llvmasn1::CodecConfig config;
        config.maxNestingDepth = 1;
        UperWriter writer(config);
        const auto failure = failureOf(writer.writeSequence(Constraint::sequence(1, 0), [](UperWriter& inner) {
            return inner.writeSequence(Constraint::sequence(0, 0), [](UperWriter&) { return llvm::Error::success(); });
        }));
        if (!failure || failure->kind != CodecErrorKind::UnsupportedOperation)
        {
            std::cerr << "nesting depth limit was not enforced on write\n";
            return false;
        }

        config.maxNestingDepth  = 64;
        config.maxDecodedLength = 4;
        std::vector<std::uint8_t> encoded(11U, 0x00U);
        encoded[0] = 0x0AU;
        UperReader reader(encoded, encoded.size() * 8U, config);
        auto       octets = reader.readOctetString(Constraint::octetString());
        const auto limit  = failureOf(octets.takeError());
        if (!limit || limit->kind != CodecErrorKind::UnsupportedOperation)
        {
            std::cerr << "decoded length limit was not enforced\n";
            return false;
        }
    }

    // Tracing.
    {
        llvmasn1::CodecConfig config;
        config.traceLevel = llvmasn1::TraceLevel::Basic;
        std::string              log;
        llvm::raw_string_ostream os(log);
        UperWriter               writer(config, &os);
        if (!checked(writer.writeSequence(Constraint::sequence(1, 0),
                                          [](UperWriter& inner) { return inner.writeBoolean(true); }),
                     "traced write"))
        {
            return false;
        }
        os.flush();
        if (log.find("[asn1uper] write @0: enter sequence") == std::string::npos ||
            log.find("leave sequence") == std::string::npos)
        {
            std::cerr << "trace output mismatch: " << log << "\n";
            return false;
        }

        std::string              quiet;
        llvm::raw_string_ostream quietOs(quiet);
        UperWriter               silent(llvmasn1::CodecConfig{}, &quietOs);
        if (!checked(silent.writeBoolean(true), "untraced write"))
        {
            return false;
        }
        quietOs.flush();
        if (!quiet.empty())
        {
            std::cerr << "trace output written with tracing off\n";
            return false;
        }
    }

    return true;
}
