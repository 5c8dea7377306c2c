//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements codec configuration updates from JSON settings.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Support/CodecConfig.h"

#include "llvm/Support/MemoryBuffer.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace llvmasn1
{
namespace
{

bool applyTraceLevel(const llvm::json::Object& settings, CodecConfig& config)
{
    const auto rawTrace = settings.getString("trace");
    if (!rawTrace)
    {
        return false;
    }
    std::string normalized(rawTrace->str());
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](const unsigned char value) {
        return static_cast<char>(std::tolower(value));
    });
    // Unrecognized names fall back to basic tracing.
    TraceLevel level = TraceLevel::Basic;
    (void) parseTraceLevel(normalized, level);
    const bool changed = level != config.traceLevel;
    config.traceLevel  = level;
    return changed;
}

bool applyLimits(const llvm::json::Object& settings, CodecConfig& config)
{
    const llvm::json::Object* limits = settings.getObject("limits");
    if (!limits)
    {
        return false;
    }

    bool changed = false;
    if (const auto depth = limits->getInteger("maxNestingDepth"))
    {
        if (*depth > 0 && static_cast<std::uint64_t>(*depth) != config.maxNestingDepth)
        {
            config.maxNestingDepth = static_cast<std::uint32_t>(std::min<std::int64_t>(*depth, UINT32_MAX));
            changed                = true;
        }
    }
    if (const auto length = limits->getInteger("maxDecodedLength"))
    {
        if (*length > 0 && static_cast<std::uint64_t>(*length) != config.maxDecodedLength)
        {
            config.maxDecodedLength = static_cast<std::uint64_t>(*length);
            changed                 = true;
        }
    }
    return changed;
}

}  // namespace

bool parseTraceLevel(llvm::StringRef raw, TraceLevel& level)
{
    if (raw == "off")
    {
        level = TraceLevel::Off;
        return true;
    }
    if (raw == "basic")
    {
        level = TraceLevel::Basic;
        return true;
    }
    if (raw == "verbose")
    {
        level = TraceLevel::Verbose;
        return true;
    }
    return false;
}

bool applyCodecConfig(const llvm::json::Value& settings, CodecConfig& config)
{
    const auto* object = settings.getAsObject();
    if (!object)
    {
        return false;
    }
    bool changed = applyTraceLevel(*object, config);
    changed      = applyLimits(*object, config) || changed;
    return changed;
}

llvm::Expected<CodecConfig> loadCodecConfig(llvm::StringRef path)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(),
                                       "failed to read config file '%s': %s",
                                       path.str().c_str(),
                                       buffer.getError().message().c_str());
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse((*buffer)->getBuffer());
    if (!parsed)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid JSON in config file '%s': %s",
                                       path.str().c_str(),
                                       llvm::toString(parsed.takeError()).c_str());
    }

    CodecConfig config;
    (void) applyCodecConfig(*parsed, config);
    return config;
}

}  // namespace llvmasn1
