//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Constraint descriptors supplied by bindings for every encoded value.
///
/// A descriptor is read-only input to the codec. It carries the PER-visible
/// constraints of one type: its kind, value or size bounds, extensibility and
/// the field/variant counts of constructed types.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_MODEL_CONSTRAINT_H
#define LLVMASN1_MODEL_CONSTRAINT_H

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <optional>
#include <string>

namespace llvmasn1
{

/// @brief Semantic kind of an encoded value.
enum class TypeKind
{
    Null,
    Boolean,
    Integer,
    Enumerated,
    OctetString,
    BitString,
    CharacterString,
    Sequence,
    SequenceOf,
    Choice,
};

/// @brief Restricted character string types.
enum class Charset
{
    Utf8,
    Numeric,
    Printable,
    Ia5,
    Visible,
};

[[nodiscard]] llvm::StringRef typeKindName(TypeKind kind);

/// @brief Returns the ASN.1 type name of a charset, e.g. `NumericString`.
[[nodiscard]] llvm::StringRef charsetName(Charset charset);

/// @brief Size bound in units of the constrained type; absent means unbounded.
using SizeBound = std::optional<std::uint64_t>;

/// @brief PER-visible constraints of a single type.
struct Constraint final
{
    /// @brief Semantic kind.
    TypeKind kind{TypeKind::Null};

    /// @brief Lower bound: value bound for integers, size bound otherwise.
    std::optional<std::int64_t> lower;

    /// @brief Upper bound: value bound for integers, size bound otherwise.
    std::optional<std::int64_t> upper;

    /// @brief Extension marker (`...`) present in the type or its constraint.
    bool extensible{false};

    /// @brief Declared fields, variants or items, extensions included.
    std::uint64_t count{0};

    /// @brief Index of the last field/variant/item before the extension marker.
    std::optional<std::uint64_t> lastStandardIndex;

    /// @brief OPTIONAL or DEFAULT fields among the standard fields of a SEQUENCE/SET.
    std::uint64_t optionalStandardFields{0};

    /// @brief Alphabet of a character string.
    Charset charset{Charset::Utf8};

    /// @brief Number of fields/variants/items in the extension root.
    [[nodiscard]] std::uint64_t standardCount() const;

    /// @brief Number of fields/variants/items added after the extension marker.
    [[nodiscard]] std::uint64_t extensionCount() const;

    [[nodiscard]] bool hasExtensionFields() const
    {
        return extensionCount() > 0U;
    }

    /// @brief Lower size bound, negative values clamped to zero.
    [[nodiscard]] SizeBound lowerSize() const;

    /// @brief Upper size bound, negative values clamped to zero.
    [[nodiscard]] SizeBound upperSize() const;

    /// @brief Renders a compact summary, e.g. `integer (0..255)`.
    [[nodiscard]] std::string str() const;

    static Constraint null();
    static Constraint boolean();
    static Constraint integer(std::optional<std::int64_t> lower = std::nullopt,
                              std::optional<std::int64_t> upper = std::nullopt,
                              bool                        extensible = false);
    static Constraint enumerated(std::uint64_t                count,
                                 std::optional<std::uint64_t> lastStandardIndex = std::nullopt);
    static Constraint octetString(std::optional<std::int64_t> lower = std::nullopt,
                                  std::optional<std::int64_t> upper = std::nullopt,
                                  bool                        extensible = false);
    static Constraint bitString(std::optional<std::int64_t> lower = std::nullopt,
                                std::optional<std::int64_t> upper = std::nullopt,
                                bool                        extensible = false);
    static Constraint characterString(Charset                     charset,
                                      std::optional<std::int64_t> lower = std::nullopt,
                                      std::optional<std::int64_t> upper = std::nullopt,
                                      bool                        extensible = false);

    /// @brief SEQUENCE or SET.
    /// @param[in] fields Total field count.
    /// @param[in] optionalStandardFields OPTIONAL fields before the extension marker.
    /// @param[in] lastStandardIndex Last standard field for extensible types.
    static Constraint sequence(std::uint64_t                fields,
                               std::uint64_t                optionalStandardFields,
                               std::optional<std::uint64_t> lastStandardIndex = std::nullopt);
    static Constraint sequenceOf(std::optional<std::int64_t> lower = std::nullopt,
                                 std::optional<std::int64_t> upper = std::nullopt,
                                 bool                        extensible = false);
    static Constraint choice(std::uint64_t variants, std::optional<std::uint64_t> lastStandardIndex = std::nullopt);
};

}  // namespace llvmasn1

#endif  // LLVMASN1_MODEL_CONSTRAINT_H
