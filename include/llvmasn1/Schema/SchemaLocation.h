//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Location of an element inside a JSON schema or value document.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_SCHEMA_SCHEMA_LOCATION_H
#define LLVMASN1_SCHEMA_SCHEMA_LOCATION_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <string>

namespace llvmasn1
{

/// @brief Identifies a node of a JSON document by file and JSON path.
struct SchemaLocation
{
    /// @brief Path to the document, or `<input>` for in-memory text.
    std::string file;

    /// @brief Slash-separated JSON path, e.g. `/types/Person/fields/1`.
    std::string path;

    /// @brief Location of a member of this node.
    [[nodiscard]] SchemaLocation child(const llvm::Twine& key) const;

    /// @brief Formats this location as `file:path`.
    [[nodiscard]] std::string str() const;
};

}  // namespace llvmasn1

#endif  // LLVMASN1_SCHEMA_SCHEMA_LOCATION_H
