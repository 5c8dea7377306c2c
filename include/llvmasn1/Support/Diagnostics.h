//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting used while loading schemas and values.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_SUPPORT_DIAGNOSTICS_H
#define LLVMASN1_SUPPORT_DIAGNOSTICS_H

#include "llvmasn1/Schema/SchemaLocation.h"

#include "llvm/Support/raw_ostream.h"

#include <cstddef>
#include <string>
#include <vector>

namespace llvmasn1
{

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Context attached to another diagnostic.
    Note,

    /// @brief Ignored input; loading continues.
    Warning,

    /// @brief The document is rejected.
    Error,
};

/// @brief One problem found in a schema or value document.
struct Diagnostic
{
    DiagnosticLevel level;

    /// @brief Document node the message refers to.
    SchemaLocation location;

    /// @brief Message without location or level prefix.
    std::string message;
};

/// @brief Accumulates diagnostics emitted while loading a document.
class DiagnosticEngine final
{
public:
    /// @brief Records one diagnostic.
    /// @param[in] level Severity.
    /// @param[in] location Document node associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const SchemaLocation& location, std::string message);

    void note(const SchemaLocation& location, std::string message);
    void warning(const SchemaLocation& location, std::string message);
    void error(const SchemaLocation& location, std::string message);

    [[nodiscard]] bool hasErrors() const;

    /// @brief Number of error diagnostics recorded so far.
    [[nodiscard]] std::size_t errorCount() const;

    /// @brief Recorded diagnostics, oldest first.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

private:
    std::vector<Diagnostic> diagnostics_;
};

/// @brief Returns `note`, `warning` or `error`.
[[nodiscard]] llvm::StringRef diagnosticLevelName(DiagnosticLevel level);

/// @brief Prints one `location: level: message` line per diagnostic.
/// @param[in] prefix Text printed at the start of every line.
void printDiagnostics(const DiagnosticEngine& diag, llvm::raw_ostream& os, llvm::StringRef prefix = "");

}  // namespace llvmasn1

#endif  // LLVMASN1_SUPPORT_DIAGNOSTICS_H
