//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements type descriptor builders and lookups.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Model/TypeDescriptor.h"

#include <algorithm>
#include <utility>

namespace llvmasn1
{
namespace
{

/// Converts a standard-member count into the last standard index of an extensible type.
std::optional<std::uint64_t> lastStandardIndexFor(const std::optional<std::size_t> standard)
{
    if (!standard || *standard == 0U)
    {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(*standard - 1U);
}

}  // namespace

std::optional<std::size_t> TypeDescriptor::findField(llvm::StringRef fieldName) const
{
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        if (fields[i].name == fieldName)
        {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> TypeDescriptor::findItem(llvm::StringRef itemName) const
{
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (items[i] == itemName)
        {
            return i;
        }
    }
    return std::nullopt;
}

std::string TypeDescriptor::str() const
{
    if (name.empty())
    {
        return constraint.str();
    }
    return name + ": " + constraint.str();
}

TypeDescriptorPtr makeLeafType(std::string name, Constraint constraint)
{
    auto type        = std::make_shared<TypeDescriptor>();
    type->name       = std::move(name);
    type->constraint = constraint;
    return type;
}

TypeDescriptorPtr makeSequenceType(std::string                      name,
                                   std::vector<FieldDescriptor>     fields,
                                   const std::optional<std::size_t> standardFields)
{
    const std::size_t standard = standardFields ? std::min(*standardFields, fields.size()) : fields.size();
    std::uint64_t     optionalStandard = 0;
    for (std::size_t i = 0; i < standard; ++i)
    {
        if (fields[i].optional)
        {
            ++optionalStandard;
        }
    }

    auto type        = std::make_shared<TypeDescriptor>();
    type->name       = std::move(name);
    type->constraint = Constraint::sequence(fields.size(), optionalStandard, lastStandardIndexFor(standardFields));
    type->constraint.extensible = standardFields.has_value();
    type->fields                = std::move(fields);
    return type;
}

TypeDescriptorPtr makeChoiceType(std::string                      name,
                                 std::vector<FieldDescriptor>     variants,
                                 const std::optional<std::size_t> standardVariants)
{
    auto type                   = std::make_shared<TypeDescriptor>();
    type->name                  = std::move(name);
    type->constraint            = Constraint::choice(variants.size(), lastStandardIndexFor(standardVariants));
    type->constraint.extensible = standardVariants.has_value();
    type->fields                = std::move(variants);
    for (FieldDescriptor& variant : type->fields)
    {
        variant.optional = false;
    }
    return type;
}

TypeDescriptorPtr makeEnumeratedType(std::string                      name,
                                     std::vector<std::string>         items,
                                     const std::optional<std::size_t> standardItems)
{
    auto type                   = std::make_shared<TypeDescriptor>();
    type->name                  = std::move(name);
    type->constraint            = Constraint::enumerated(items.size(), lastStandardIndexFor(standardItems));
    type->constraint.extensible = standardItems.has_value();
    type->items                 = std::move(items);
    return type;
}

TypeDescriptorPtr makeSequenceOfType(std::string                       name,
                                     TypeDescriptorPtr                 element,
                                     const std::optional<std::int64_t> lower,
                                     const std::optional<std::int64_t> upper,
                                     const bool                        extensible)
{
    auto type        = std::make_shared<TypeDescriptor>();
    type->name       = std::move(name);
    type->constraint = Constraint::sequenceOf(lower, upper, extensible);
    type->element    = std::move(element);
    return type;
}

}  // namespace llvmasn1
