//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// JSON schema loading and JSON value conversion.
///
/// A schema document has the shape
///
/// @code
/// {"types": {
///     "Person": {"kind": "sequence", "extensible": true, "extensionAfter": "age",
///                "fields": [{"name": "name", "type": {"kind": "string", "charset": "visible"}},
///                           {"name": "age", "type": {"ref": "Age"}, "optional": true},
///                           {"name": "email", "type": {"kind": "string"}, "optional": true}]},
///     "Age": {"kind": "integer", "min": 0, "max": 150}}}
/// @endcode
///
/// References are resolved while loading, so every descriptor handed out is
/// complete. Cyclic references are reported as errors.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_SCHEMA_SCHEMA_JSON_H
#define LLVMASN1_SCHEMA_SCHEMA_JSON_H

#include "llvmasn1/Model/TypeDescriptor.h"
#include "llvmasn1/Model/Value.h"
#include "llvmasn1/Schema/SchemaLocation.h"
#include "llvmasn1/Support/Diagnostics.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace llvmasn1
{

/// @brief Named types of one schema document.
class Schema final
{
public:
    /// @brief Registers a named type; a later type with the same name replaces it.
    void add(TypeDescriptorPtr type);

    /// @brief Looks a type up by name.
    /// @return The descriptor, or null when the schema has no such type.
    [[nodiscard]] TypeDescriptorPtr lookup(llvm::StringRef name) const;

    /// @brief All named types, sorted by name.
    [[nodiscard]] std::vector<TypeDescriptorPtr> types() const;

    [[nodiscard]] std::size_t size() const
    {
        return types_.size();
    }

private:
    llvm::StringMap<TypeDescriptorPtr> types_;
};

/// @brief Builds a schema from a parsed document.
/// @param[in] document Parsed schema JSON.
/// @param[in,out] diag Receives one diagnostic per problem found.
/// @param[in] file Document name used in diagnostic locations.
/// @return Schema, or an error summarizing the diagnostics.
llvm::Expected<Schema> parseSchema(const llvm::json::Value& document,
                                   DiagnosticEngine&        diag,
                                   llvm::StringRef          file = "<input>");

/// @brief Reads and parses a schema file.
llvm::Expected<Schema> loadSchema(llvm::StringRef path, DiagnosticEngine& diag);

/// @brief Converts a JSON value into a value of `type`.
/// @param[in] json JSON representation.
/// @param[in] type Target type.
/// @param[in,out] diag Receives one diagnostic per problem found.
/// @param[in] location Location of `json`, used in diagnostics.
llvm::Expected<ValuePtr> valueFromJson(const llvm::json::Value& json,
                                       const TypeDescriptor&    type,
                                       DiagnosticEngine&        diag,
                                       const SchemaLocation&    location = SchemaLocation{"<value>", ""});

/// @brief Converts a value of `type` into its JSON representation.
/// @return JSON, or `UnsupportedOperation` when the value does not match `type`.
llvm::Expected<llvm::json::Value> valueToJson(const Value& value, const TypeDescriptor& type);

/// @brief Parses an even-length hexadecimal string.
/// @return Bytes, or `std::nullopt` for malformed input.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> parseHexBytes(llvm::StringRef hex);

}  // namespace llvmasn1

#endif  // LLVMASN1_SCHEMA_SCHEMA_JSON_H
