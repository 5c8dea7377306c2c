//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection and formatting helpers.
///
/// The diagnostic engine records location-aware notes, warnings, and errors
/// produced while loading schema and value documents.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Support/Diagnostics.h"

#include <algorithm>
#include <utility>

namespace llvmasn1
{

void DiagnosticEngine::report(DiagnosticLevel level, const SchemaLocation& location, std::string message)
{
    diagnostics_.push_back(Diagnostic{level, location, std::move(message)});
}

void DiagnosticEngine::note(const SchemaLocation& location, std::string message)
{
    report(DiagnosticLevel::Note, location, std::move(message));
}

void DiagnosticEngine::warning(const SchemaLocation& location, std::string message)
{
    report(DiagnosticLevel::Warning, location, std::move(message));
}

void DiagnosticEngine::error(const SchemaLocation& location, std::string message)
{
    report(DiagnosticLevel::Error, location, std::move(message));
}

bool DiagnosticEngine::hasErrors() const
{
    return errorCount() != 0U;
}

std::size_t DiagnosticEngine::errorCount() const
{
    return static_cast<std::size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic& d) {
        return d.level == DiagnosticLevel::Error;
    }));
}

llvm::StringRef diagnosticLevelName(const DiagnosticLevel level)
{
    switch (level)
    {
    case DiagnosticLevel::Note:
        return "note";
    case DiagnosticLevel::Warning:
        return "warning";
    case DiagnosticLevel::Error:
        return "error";
    }
    return "note";
}

void printDiagnostics(const DiagnosticEngine& diag, llvm::raw_ostream& os, llvm::StringRef prefix)
{
    for (const Diagnostic& d : diag.diagnostics())
    {
        os << prefix << d.location.str() << ": " << diagnosticLevelName(d.level) << ": " << d.message << "\n";
    }
}

}  // namespace llvmasn1
