//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements schema location formatting.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Schema/SchemaLocation.h"

namespace llvmasn1
{

SchemaLocation SchemaLocation::child(const llvm::Twine& key) const
{
    return SchemaLocation{file, (llvm::Twine(path) + "/" + key).str()};
}

std::string SchemaLocation::str() const
{
    return file + ":" + (path.empty() ? std::string("/") : path);
}

}  // namespace llvmasn1
