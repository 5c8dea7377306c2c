//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements value construction, comparison and rendering.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Model/Value.h"

#include "llvmasn1/Runtime/BitCopy.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/raw_ostream.h"

#include <type_traits>
#include <utility>

namespace llvmasn1
{
namespace
{

ValuePtr wrap(Value value)
{
    return std::make_shared<const Value>(std::move(value));
}

/// Compares the first `bitLength` bits only; padding bits may differ.
bool sameBits(const per::BitStringData& lhs, const per::BitStringData& rhs)
{
    if (lhs.bitLength != rhs.bitLength)
    {
        return false;
    }
    const std::size_t bytes = bytesForBits(static_cast<std::size_t>(lhs.bitLength));
    if (lhs.bytes.size() < bytes || rhs.bytes.size() < bytes)
    {
        return false;
    }
    for (std::uint64_t bit = 0; bit < lhs.bitLength; ++bit)
    {
        if (getBit(lhs.bytes.data(), bit) != getBit(rhs.bytes.data(), bit))
        {
            return false;
        }
    }
    return true;
}

bool sameList(const std::vector<ValuePtr>& lhs, const std::vector<ValuePtr>& rhs)
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        if (!sameValue(lhs[i], rhs[i]))
        {
            return false;
        }
    }
    return true;
}

void render(llvm::raw_ostream& os, const Value* value);

void renderList(llvm::raw_ostream& os, const std::vector<ValuePtr>& values, const char open, const char close)
{
    os << open;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (i != 0U)
        {
            os << ", ";
        }
        render(os, values[i].get());
    }
    os << close;
}

void render(llvm::raw_ostream& os, const Value* value)
{
    if (!value)
    {
        os << "<absent>";
        return;
    }
    std::visit(
        [&os](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Value::Null>)
            {
                os << "NULL";
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
                os << (v ? "TRUE" : "FALSE");
            }
            else if constexpr (std::is_same_v<T, std::int64_t>)
            {
                os << v;
            }
            else if constexpr (std::is_same_v<T, Value::Enumerated>)
            {
                os << "#" << v.index;
            }
            else if constexpr (std::is_same_v<T, Value::OctetString>)
            {
                os << "'" << llvm::toHex(v.bytes) << "'H";
            }
            else if constexpr (std::is_same_v<T, per::BitStringData>)
            {
                os << "'";
                for (std::uint64_t bit = 0; bit < v.bitLength; ++bit)
                {
                    os << (getBit(v.bytes.data(), bit) ? '1' : '0');
                }
                os << "'B";
            }
            else if constexpr (std::is_same_v<T, std::string>)
            {
                os << '"';
                os.write_escaped(v);
                os << '"';
            }
            else if constexpr (std::is_same_v<T, Value::Sequence>)
            {
                renderList(os, v.fields, '{', '}');
            }
            else if constexpr (std::is_same_v<T, Value::SequenceOf>)
            {
                renderList(os, v.elements, '[', ']');
            }
            else
            {
                os << v.index << ": ";
                render(os, v.payload.get());
            }
        },
        value->value);
}

}  // namespace

TypeKind Value::kind() const
{
    switch (value.index())
    {
    case 0:
        return TypeKind::Null;
    case 1:
        return TypeKind::Boolean;
    case 2:
        return TypeKind::Integer;
    case 3:
        return TypeKind::Enumerated;
    case 4:
        return TypeKind::OctetString;
    case 5:
        return TypeKind::BitString;
    case 6:
        return TypeKind::CharacterString;
    case 7:
        return TypeKind::Sequence;
    case 8:
        return TypeKind::SequenceOf;
    default:
        return TypeKind::Choice;
    }
}

std::string Value::str() const
{
    std::string              out;
    llvm::raw_string_ostream os(out);
    render(os, this);
    return os.str();
}

ValuePtr Value::null()
{
    return wrap(Value{Null{}});
}

ValuePtr Value::boolean(const bool v)
{
    return wrap(Value{v});
}

ValuePtr Value::integer(const std::int64_t v)
{
    return wrap(Value{v});
}

ValuePtr Value::enumerated(const std::uint64_t index)
{
    return wrap(Value{Enumerated{index}});
}

ValuePtr Value::octetString(std::vector<std::uint8_t> bytes)
{
    return wrap(Value{OctetString{std::move(bytes)}});
}

ValuePtr Value::bitString(std::vector<std::uint8_t> bytes, const std::uint64_t bitLength)
{
    return wrap(Value{per::BitStringData{std::move(bytes), bitLength}});
}

ValuePtr Value::characterString(std::string text)
{
    return wrap(Value{std::move(text)});
}

ValuePtr Value::sequence(std::vector<ValuePtr> fields)
{
    return wrap(Value{Sequence{std::move(fields)}});
}

ValuePtr Value::sequenceOf(std::vector<ValuePtr> elements)
{
    return wrap(Value{SequenceOf{std::move(elements)}});
}

ValuePtr Value::choice(const std::uint64_t index, ValuePtr payload)
{
    return wrap(Value{Choice{index, std::move(payload)}});
}

bool operator==(const Value& lhs, const Value& rhs)
{
    if (lhs.value.index() != rhs.value.index())
    {
        return false;
    }
    return std::visit(
        [&rhs](const auto& l) -> bool {
            using T    = std::decay_t<decltype(l)>;
            const T& r = std::get<T>(rhs.value);
            if constexpr (std::is_same_v<T, Value::Null>)
            {
                static_cast<void>(r);
                return true;
            }
            else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t> ||
                               std::is_same_v<T, std::string>)
            {
                return l == r;
            }
            else if constexpr (std::is_same_v<T, Value::Enumerated>)
            {
                return l.index == r.index;
            }
            else if constexpr (std::is_same_v<T, Value::OctetString>)
            {
                return l.bytes == r.bytes;
            }
            else if constexpr (std::is_same_v<T, per::BitStringData>)
            {
                return sameBits(l, r);
            }
            else if constexpr (std::is_same_v<T, Value::Sequence>)
            {
                return sameList(l.fields, r.fields);
            }
            else if constexpr (std::is_same_v<T, Value::SequenceOf>)
            {
                return sameList(l.elements, r.elements);
            }
            else
            {
                return l.index == r.index && sameValue(l.payload, r.payload);
            }
        },
        lhs.value);
}

bool sameValue(const ValuePtr& lhs, const ValuePtr& rhs)
{
    if (!lhs || !rhs)
    {
        return !lhs && !rhs;
    }
    return *lhs == *rhs;
}

}  // namespace llvmasn1
