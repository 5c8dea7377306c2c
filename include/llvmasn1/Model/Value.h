//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Dynamically typed ASN.1 values handled by the dynamic codec.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_MODEL_VALUE_H
#define LLVMASN1_MODEL_VALUE_H

#include "llvmasn1/Model/Constraint.h"
#include "llvmasn1/Runtime/PackedEncoding.h"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace llvmasn1
{

struct Value;

/// @brief Shared handle to an immutable value.
using ValuePtr = std::shared_ptr<const Value>;

/// @brief One value of any supported kind.
///
/// Equality is structural and compares children by value.
struct Value final
{
    struct Null
    {
    };

    struct Enumerated
    {
        std::uint64_t index{0};
    };

    struct OctetString
    {
        std::vector<std::uint8_t> bytes;
    };

    struct Sequence
    {
        /// @brief One entry per declared field; null marks an absent OPTIONAL field.
        std::vector<ValuePtr> fields;
    };

    struct SequenceOf
    {
        std::vector<ValuePtr> elements;
    };

    struct Choice
    {
        std::uint64_t index{0};
        ValuePtr      payload;
    };

    std::variant<Null,
                 bool,
                 std::int64_t,
                 Enumerated,
                 OctetString,
                 per::BitStringData,
                 std::string,
                 Sequence,
                 SequenceOf,
                 Choice>
        value;

    /// @brief Kind of the held alternative.
    [[nodiscard]] TypeKind kind() const;

    /// @brief Renders a compact debug form, e.g. `{1, "abc", <absent>}`.
    [[nodiscard]] std::string str() const;

    static ValuePtr null();
    static ValuePtr boolean(bool v);
    static ValuePtr integer(std::int64_t v);
    static ValuePtr enumerated(std::uint64_t index);
    static ValuePtr octetString(std::vector<std::uint8_t> bytes);
    static ValuePtr bitString(std::vector<std::uint8_t> bytes, std::uint64_t bitLength);
    static ValuePtr characterString(std::string text);
    static ValuePtr sequence(std::vector<ValuePtr> fields);
    static ValuePtr sequenceOf(std::vector<ValuePtr> elements);
    static ValuePtr choice(std::uint64_t index, ValuePtr payload);
};

bool operator==(const Value& lhs, const Value& rhs);

inline bool operator!=(const Value& lhs, const Value& rhs)
{
    return !(lhs == rhs);
}

/// @brief Deep equality of two handles; two null handles are equal.
[[nodiscard]] bool sameValue(const ValuePtr& lhs, const ValuePtr& rhs);

}  // namespace llvmasn1

#endif  // LLVMASN1_MODEL_VALUE_H
