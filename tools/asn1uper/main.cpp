//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `asn1uper` command-line codec.
///
/// This tool loads a JSON schema, then encodes JSON values to UPER, decodes
/// UPER hex back to JSON, or lists the schema's types.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Runtime/BitCopy.h"
#include "llvmasn1/Schema/SchemaJson.h"
#include "llvmasn1/Support/CodecConfig.h"
#include "llvmasn1/Support/Diagnostics.h"
#include "llvmasn1/Uper/DynamicCodec.h"
#include "llvmasn1/Version.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{

/// @brief Checks whether a command token is implemented by `asn1uper`.
///
/// @param[in] command Command token from argv.
/// @return `true` if the command is one of the supported subcommands.
bool isKnownCommand(llvm::StringRef command)
{
    return command == "encode" || command == "decode" || command == "types";
}

/// @brief Checks whether a token is a help switch.
///
/// @param[in] arg Argument token from argv.
/// @return `true` when the argument is `--help` or `-h`.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: asn1uper <encode|decode|types> --schema <file> [options]\n"
                 << "Try: asn1uper --help\n";
}

/// @brief Prints the full help text and optional command-focused details.
///
/// @param[in] selectedCommand Optional command name used for focused help.
void printHelp(const std::string& selectedCommand = "")
{
    llvm::errs() << "NAME\n"
                 << "  asn1uper - ASN.1 Unaligned Packed Encoding Rules (ITU-T X.691) codec\n\n"
                 << "SYNOPSIS\n"
                 << "  asn1uper encode --schema <file> --type <name> --value <file|->\n"
                 << "  asn1uper decode --schema <file> --type <name> --hex <hex> [--bits <N>]\n"
                 << "  asn1uper types --schema <file>\n"
                 << "  asn1uper --help | --version\n\n"
                 << "DESCRIPTION\n"
                 << "  asn1uper reads type definitions from a JSON schema document and converts\n"
                 << "  between JSON values and their UPER encoding.\n\n"
                 << "COMMANDS\n"
                 << "  encode  Encode a JSON value; prints the bit length and the hex encoding.\n"
                 << "  decode  Decode a hex encoding; prints the JSON value.\n"
                 << "  types   List the schema's types with their constraint summaries.\n\n"
                 << "COMMON OPTIONS\n"
                 << "  --schema <file>\n"
                 << "      JSON schema document. Required for all commands.\n"
                 << "  --config <file>\n"
                 << "      JSON codec settings: {\"trace\": ..., \"limits\": {\"maxNestingDepth\": N,\n"
                 << "      \"maxDecodedLength\": N}}.\n"
                 << "  --trace <off|basic|verbose>\n"
                 << "      Trace codec events to stderr. Overrides the config file.\n"
                 << "  --help, -h\n"
                 << "      Print this help text. With a command, prints command-focused guidance.\n"
                 << "  --version, -V\n"
                 << "      Print the version and exit.\n\n"
                 << "ENCODE/DECODE OPTIONS\n"
                 << "  --type <name>\n"
                 << "      Schema type to encode or decode.\n"
                 << "  --value <file|->\n"
                 << "      JSON value to encode; '-' reads stdin.\n"
                 << "  --hex <hex>\n"
                 << "      Encoding to decode, two hex digits per octet.\n"
                 << "  --bits <N>\n"
                 << "      Meaningful bits of the encoding (default: all octets).\n\n"
                 << "EXAMPLES\n"
                 << "  asn1uper types --schema person.json\n"
                 << "  echo '{\"ghi\": 1337}' | asn1uper encode --schema basic.json --type Basic --value -\n"
                 << "  asn1uper decode --schema basic.json --type Basic --hex 80814e40 --bits 26\n\n"
                 << "EXIT STATUS\n"
                 << "  0 on success, 1 on invalid CLI usage, schema or value errors, and codec failures.\n";

    if (!selectedCommand.empty() && isKnownCommand(selectedCommand))
    {
        llvm::errs() << "\nCOMMAND FOCUS (" << selectedCommand << ")\n";
        if (selectedCommand == "encode")
        {
            llvm::errs() << "  Requires --type and --value. Prints 'bits: N' and 'hex: ..' to stdout.\n";
        }
        else if (selectedCommand == "decode")
        {
            llvm::errs() << "  Requires --type and --hex. Honors --bits. Prints the JSON value to stdout.\n";
        }
        else if (selectedCommand == "types")
        {
            llvm::errs() << "  Prints one 'name: summary' line per type, sorted by name.\n";
        }
    }
}

/// @brief Prints an error and consumes it.
///
/// @return Exit status 1.
int fail(llvm::Error err)
{
    llvm::errs() << "[asn1uper] error: " << llvm::toString(std::move(err)) << "\n";
    return 1;
}

/// @brief Prints the diagnostics of a failed load followed by its summary error.
int failWithDiagnostics(const llvmasn1::DiagnosticEngine& diag, llvm::Error err)
{
    llvmasn1::printDiagnostics(diag, llvm::errs(), "[asn1uper] ");
    return fail(std::move(err));
}

int runTypes(const llvmasn1::Schema& schema)
{
    for (const llvmasn1::TypeDescriptorPtr& type : schema.types())
    {
        llvm::outs() << type->str() << "\n";
    }
    return 0;
}

int runEncode(const llvmasn1::TypeDescriptor& type,
              const std::string&              valuePath,
              const llvmasn1::CodecConfig&    config,
              llvmasn1::DiagnosticEngine&     diag)
{
    auto buffer = llvm::MemoryBuffer::getFileOrSTDIN(valuePath);
    if (!buffer)
    {
        return fail(llvm::createStringError(buffer.getError(),
                                            "failed to read value '%s': %s",
                                            valuePath.c_str(),
                                            buffer.getError().message().c_str()));
    }
    llvm::Expected<llvm::json::Value> json = llvm::json::parse((*buffer)->getBuffer());
    if (!json)
    {
        return fail(json.takeError());
    }

    const std::string                  source = valuePath == "-" ? std::string("<stdin>") : valuePath;
    llvm::Expected<llvmasn1::ValuePtr> value =
        llvmasn1::valueFromJson(*json, type, diag, llvmasn1::SchemaLocation{source, ""});
    if (!value)
    {
        return failWithDiagnostics(diag, value.takeError());
    }

    llvm::Expected<llvmasn1::Encoded> encoded = llvmasn1::encode(**value, type, config, &llvm::errs());
    if (!encoded)
    {
        return fail(encoded.takeError());
    }
    llvm::outs() << "bits: " << encoded->bitLength << "\n"
                 << "hex: " << llvm::toHex(encoded->bytes, true) << "\n";
    return 0;
}

int runDecode(const llvmasn1::TypeDescriptor&    type,
              const std::string&                 hex,
              const std::optional<std::uint64_t> bits,
              const llvmasn1::CodecConfig&       config)
{
    std::optional<std::vector<std::uint8_t>> bytes = llvmasn1::parseHexBytes(hex);
    if (!bytes)
    {
        llvm::errs() << "[asn1uper] error: --hex needs an even number of hex digits\n";
        return 1;
    }
    const std::uint64_t available = static_cast<std::uint64_t>(bytes->size()) * llvmasn1::kBitsPerByte;
    if (bits && *bits > available)
    {
        llvm::errs() << "[asn1uper] error: --bits " << *bits << " exceeds the " << available << " bits given\n";
        return 1;
    }
    const std::size_t bitLength = static_cast<std::size_t>(bits.value_or(available));

    llvm::Expected<llvmasn1::Decoded> decoded = llvmasn1::decode(*bytes, bitLength, type, config, &llvm::errs());
    if (!decoded)
    {
        return fail(decoded.takeError());
    }
    if (bitLength - decoded->consumedBits >= (bits ? 1U : llvmasn1::kBitsPerByte))
    {
        llvm::errs() << "[asn1uper] warning: " << (bitLength - decoded->consumedBits) << " trailing bits ignored\n";
    }

    llvm::Expected<llvm::json::Value> json = llvmasn1::valueToJson(*decoded->value, type);
    if (!json)
    {
        return fail(json.takeError());
    }
    llvm::outs() << llvm::formatv("{0:2}", *json) << "\n";
    return 0;
}

}  // namespace

/// @brief Program entry point for `asn1uper`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, non-zero on CLI, schema, value or codec failure.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (isHelpToken(command) || command == "help")
    {
        printHelp();
        return 0;
    }
    if (command == "--version" || command == "-V")
    {
        llvm::outs() << "asn1uper " << llvmasn1::kVersionString << "\n";
        return 0;
    }
    if (!isKnownCommand(command))
    {
        llvm::errs() << "Unknown command: " << command << "\n";
        printUsage();
        return 1;
    }

    std::string                  schemaPath;
    std::string                  configPath;
    std::string                  typeName;
    std::string                  valuePath;
    std::string                  hex;
    std::optional<std::uint64_t> bits;
    std::optional<std::string>   traceOverride;
    bool                         helpRequested = false;

    for (int i = 2; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--schema")
        {
            schemaPath = requireValue(arg);
        }
        else if (arg == "--config")
        {
            configPath = requireValue(arg);
        }
        else if (arg == "--trace")
        {
            traceOverride = requireValue(arg);
        }
        else if (arg == "--type")
        {
            typeName = requireValue(arg);
        }
        else if (arg == "--value")
        {
            valuePath = requireValue(arg);
        }
        else if (arg == "--hex")
        {
            hex = requireValue(arg);
        }
        else if (arg == "--bits")
        {
            const auto    value = requireValue(arg);
            std::uint64_t parsed = 0;
            if (llvm::StringRef(value).getAsInteger(10, parsed))
            {
                llvm::errs() << "Invalid --bits value: " << value << "\n";
                printUsage();
                return 1;
            }
            bits = parsed;
        }
        else if (isHelpToken(arg))
        {
            helpRequested = true;
        }
        else
        {
            llvm::errs() << "Unknown option: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (helpRequested)
    {
        printHelp(command);
        return 0;
    }

    if (schemaPath.empty())
    {
        llvm::errs() << "--schema is required\n";
        return 1;
    }

    llvmasn1::CodecConfig config;
    if (!configPath.empty())
    {
        llvm::Expected<llvmasn1::CodecConfig> loaded = llvmasn1::loadCodecConfig(configPath);
        if (!loaded)
        {
            return fail(loaded.takeError());
        }
        config = *loaded;
    }
    if (traceOverride && !llvmasn1::parseTraceLevel(*traceOverride, config.traceLevel))
    {
        llvm::errs() << "Invalid --trace value: " << *traceOverride << "\n";
        printUsage();
        return 1;
    }

    llvmasn1::DiagnosticEngine       diagnostics;
    llvm::Expected<llvmasn1::Schema> schema = llvmasn1::loadSchema(schemaPath, diagnostics);
    if (!schema)
    {
        return failWithDiagnostics(diagnostics, schema.takeError());
    }
    llvmasn1::printDiagnostics(diagnostics, llvm::errs(), "[asn1uper] ");

    if (command == "types")
    {
        return runTypes(*schema);
    }

    if (typeName.empty())
    {
        llvm::errs() << "--type is required for '" << command << "' command\n";
        return 1;
    }
    const llvmasn1::TypeDescriptorPtr type = schema->lookup(typeName);
    if (!type)
    {
        llvm::errs() << "[asn1uper] error: schema has no type named '" << typeName << "'\n";
        return 1;
    }

    llvmasn1::DiagnosticEngine valueDiagnostics;
    if (command == "encode")
    {
        if (valuePath.empty())
        {
            llvm::errs() << "--value is required for 'encode' command\n";
            return 1;
        }
        return runEncode(*type, valuePath, config, valueDiagnostics);
    }

    if (hex.empty())
    {
        llvm::errs() << "--hex is required for 'decode' command\n";
        return 1;
    }
    return runDecode(*type, hex, bits, config);
}
