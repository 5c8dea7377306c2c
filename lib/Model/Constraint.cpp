//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements constraint descriptor helpers.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Model/Constraint.h"

#include "llvm/Support/raw_ostream.h"

#include <algorithm>

namespace llvmasn1
{
namespace
{

SizeBound toSizeBound(const std::optional<std::int64_t> bound)
{
    if (!bound)
    {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(std::max<std::int64_t>(*bound, 0));
}

Constraint bounded(const TypeKind                    kind,
                   const std::optional<std::int64_t> lower,
                   const std::optional<std::int64_t> upper,
                   const bool                        extensible)
{
    Constraint c;
    c.kind       = kind;
    c.lower      = lower;
    c.upper      = upper;
    c.extensible = extensible;
    return c;
}

Constraint indexed(const TypeKind kind, const std::uint64_t count, const std::optional<std::uint64_t> lastStandardIndex)
{
    Constraint c;
    c.kind              = kind;
    c.count             = count;
    c.lastStandardIndex = lastStandardIndex;
    c.extensible        = lastStandardIndex.has_value();
    return c;
}

}  // namespace

llvm::StringRef typeKindName(const TypeKind kind)
{
    switch (kind)
    {
    case TypeKind::Null:
        return "null";
    case TypeKind::Boolean:
        return "boolean";
    case TypeKind::Integer:
        return "integer";
    case TypeKind::Enumerated:
        return "enumerated";
    case TypeKind::OctetString:
        return "octet-string";
    case TypeKind::BitString:
        return "bit-string";
    case TypeKind::CharacterString:
        return "string";
    case TypeKind::Sequence:
        return "sequence";
    case TypeKind::SequenceOf:
        return "sequence-of";
    case TypeKind::Choice:
        return "choice";
    }
    return "unknown";
}

llvm::StringRef charsetName(const Charset charset)
{
    switch (charset)
    {
    case Charset::Utf8:
        return "UTF8String";
    case Charset::Numeric:
        return "NumericString";
    case Charset::Printable:
        return "PrintableString";
    case Charset::Ia5:
        return "IA5String";
    case Charset::Visible:
        return "VisibleString";
    }
    return "UnknownString";
}

std::uint64_t Constraint::standardCount() const
{
    if (!extensible)
    {
        return count;
    }
    // An extensible type without standard members has nothing before the marker.
    return lastStandardIndex ? std::min<std::uint64_t>(*lastStandardIndex + 1U, count) : 0U;
}

std::uint64_t Constraint::extensionCount() const
{
    return count - standardCount();
}

SizeBound Constraint::lowerSize() const
{
    return toSizeBound(lower);
}

SizeBound Constraint::upperSize() const
{
    return toSizeBound(upper);
}

std::string Constraint::str() const
{
    std::string              out;
    llvm::raw_string_ostream os(out);
    os << (kind == TypeKind::CharacterString ? charsetName(charset) : typeKindName(kind));
    if (lower || upper)
    {
        os << " (";
        if (kind != TypeKind::Integer)
        {
            os << "SIZE ";
        }
        if (lower)
        {
            os << *lower;
        }
        else
        {
            os << "MIN";
        }
        os << "..";
        if (upper)
        {
            os << *upper;
        }
        else
        {
            os << "MAX";
        }
        os << ")";
    }
    if (kind == TypeKind::Sequence || kind == TypeKind::Choice || kind == TypeKind::Enumerated)
    {
        os << " {" << standardCount();
        if (extensible)
        {
            os << ", ..., " << extensionCount();
        }
        os << "}";
    }
    else if (extensible)
    {
        os << " ...";
    }
    return os.str();
}

Constraint Constraint::null()
{
    Constraint c;
    c.kind = TypeKind::Null;
    return c;
}

Constraint Constraint::boolean()
{
    Constraint c;
    c.kind = TypeKind::Boolean;
    return c;
}

Constraint Constraint::integer(const std::optional<std::int64_t> lower,
                               const std::optional<std::int64_t> upper,
                               const bool                        extensible)
{
    return bounded(TypeKind::Integer, lower, upper, extensible);
}

Constraint Constraint::enumerated(const std::uint64_t count, const std::optional<std::uint64_t> lastStandardIndex)
{
    return indexed(TypeKind::Enumerated, count, lastStandardIndex);
}

Constraint Constraint::octetString(const std::optional<std::int64_t> lower,
                                   const std::optional<std::int64_t> upper,
                                   const bool                        extensible)
{
    return bounded(TypeKind::OctetString, lower, upper, extensible);
}

Constraint Constraint::bitString(const std::optional<std::int64_t> lower,
                                 const std::optional<std::int64_t> upper,
                                 const bool                        extensible)
{
    return bounded(TypeKind::BitString, lower, upper, extensible);
}

Constraint Constraint::characterString(const Charset                     charset,
                                       const std::optional<std::int64_t> lower,
                                       const std::optional<std::int64_t> upper,
                                       const bool                        extensible)
{
    Constraint c = bounded(TypeKind::CharacterString, lower, upper, extensible);
    c.charset    = charset;
    return c;
}

Constraint Constraint::sequence(const std::uint64_t                fields,
                                const std::uint64_t                optionalStandardFields,
                                const std::optional<std::uint64_t> lastStandardIndex)
{
    Constraint c             = indexed(TypeKind::Sequence, fields, lastStandardIndex);
    c.optionalStandardFields = optionalStandardFields;
    return c;
}

Constraint Constraint::sequenceOf(const std::optional<std::int64_t> lower,
                                  const std::optional<std::int64_t> upper,
                                  const bool                        extensible)
{
    return bounded(TypeKind::SequenceOf, lower, upper, extensible);
}

Constraint Constraint::choice(const std::uint64_t variants, const std::optional<std::uint64_t> lastStandardIndex)
{
    return indexed(TypeKind::Choice, variants, lastStandardIndex);
}

}  // namespace llvmasn1
