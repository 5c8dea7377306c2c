//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Named type descriptors consumed by the dynamic codec.
///
/// A descriptor pairs a `Constraint` with the children of constructed types.
/// Descriptors are immutable once built and shared between the types that
/// reference them.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_MODEL_TYPE_DESCRIPTOR_H
#define LLVMASN1_MODEL_TYPE_DESCRIPTOR_H

#include "llvmasn1/Model/Constraint.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace llvmasn1
{

struct TypeDescriptor;

/// @brief Shared handle to an immutable descriptor.
using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;

/// @brief SEQUENCE field or CHOICE alternative.
struct FieldDescriptor final
{
    /// @brief Field or alternative name.
    std::string name;

    /// @brief OPTIONAL (or DEFAULT) field; always false for alternatives.
    bool optional{false};

    /// @brief Field type.
    TypeDescriptorPtr type;
};

/// @brief Constraint plus children of one schema type.
struct TypeDescriptor final
{
    /// @brief Schema name; empty for anonymous inline types.
    std::string name;

    /// @brief PER-visible constraint; counts agree with the children below.
    Constraint constraint;

    /// @brief SEQUENCE/SET fields or CHOICE alternatives, extensions last.
    std::vector<FieldDescriptor> fields;

    /// @brief ENUMERATED item names, extensions last.
    std::vector<std::string> items;

    /// @brief SEQUENCE OF/SET OF element type.
    TypeDescriptorPtr element;

    [[nodiscard]] TypeKind kind() const
    {
        return constraint.kind;
    }

    /// @brief Finds a field or alternative by name.
    /// @return Index into `fields`, or `std::nullopt`.
    [[nodiscard]] std::optional<std::size_t> findField(llvm::StringRef fieldName) const;

    /// @brief Finds an enumeration item by name.
    [[nodiscard]] std::optional<std::size_t> findItem(llvm::StringRef itemName) const;

    /// @brief Renders the name (or kind) followed by the constraint summary.
    [[nodiscard]] std::string str() const;
};

/// @brief Wraps a leaf constraint (no children).
TypeDescriptorPtr makeLeafType(std::string name, Constraint constraint);

/// @brief Builds a SEQUENCE or SET descriptor.
/// @param[in] fields All fields in declaration order.
/// @param[in] standardFields Fields before the extension marker, or `std::nullopt` for a closed type.
TypeDescriptorPtr makeSequenceType(std::string                  name,
                                   std::vector<FieldDescriptor> fields,
                                   std::optional<std::size_t>   standardFields = std::nullopt);

/// @brief Builds a CHOICE descriptor.
/// @param[in] standardVariants Alternatives before the extension marker, or `std::nullopt` for a closed type.
TypeDescriptorPtr makeChoiceType(std::string                  name,
                                 std::vector<FieldDescriptor> variants,
                                 std::optional<std::size_t>   standardVariants = std::nullopt);

/// @brief Builds an ENUMERATED descriptor.
TypeDescriptorPtr makeEnumeratedType(std::string                name,
                                     std::vector<std::string>   items,
                                     std::optional<std::size_t> standardItems = std::nullopt);

/// @brief Builds a SEQUENCE OF or SET OF descriptor.
TypeDescriptorPtr makeSequenceOfType(std::string                 name,
                                     TypeDescriptorPtr           element,
                                     std::optional<std::int64_t> lower      = std::nullopt,
                                     std::optional<std::int64_t> upper      = std::nullopt,
                                     bool                        extensible = false);

}  // namespace llvmasn1

#endif  // LLVMASN1_MODEL_TYPE_DESCRIPTOR_H
