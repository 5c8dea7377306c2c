//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON schema loading and JSON value conversion.
///
/// Schema problems are collected in a `DiagnosticEngine` so that one pass
/// reports every malformed type instead of stopping at the first.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Schema/SchemaJson.h"

#include "llvmasn1/Runtime/BitCopy.h"
#include "llvmasn1/Support/CodecError.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/MemoryBuffer.h"

#include <algorithm>
#include <string>
#include <utility>

namespace llvmasn1
{
namespace
{

const llvm::StringRef kBoundKeys[]   = {"kind", "min", "max", "extensible"};
const llvm::StringRef kStringKeys[]  = {"kind", "min", "max", "extensible", "charset"};
const llvm::StringRef kPlainKeys[]   = {"kind"};
const llvm::StringRef kEnumKeys[]    = {"kind", "items", "extensible", "extensionAfter"};
const llvm::StringRef kFieldsKeys[]  = {"kind", "fields", "extensible", "extensionAfter"};
const llvm::StringRef kChoiceKeys[]  = {"kind", "variants", "extensible", "extensionAfter"};
const llvm::StringRef kElementKeys[] = {"kind", "element", "min", "max", "extensible"};
const llvm::StringRef kMemberKeys[]  = {"name", "type", "optional"};

std::optional<TypeKind> parseTypeKind(llvm::StringRef name)
{
    return llvm::StringSwitch<std::optional<TypeKind>>(name)
        .Case("null", TypeKind::Null)
        .Case("boolean", TypeKind::Boolean)
        .Case("integer", TypeKind::Integer)
        .Case("enumerated", TypeKind::Enumerated)
        .Case("octet-string", TypeKind::OctetString)
        .Case("bit-string", TypeKind::BitString)
        .Case("string", TypeKind::CharacterString)
        .Cases("sequence", "set", TypeKind::Sequence)
        .Cases("sequence-of", "set-of", TypeKind::SequenceOf)
        .Case("choice", TypeKind::Choice)
        .Default(std::nullopt);
}

std::optional<Charset> parseCharset(llvm::StringRef name)
{
    return llvm::StringSwitch<std::optional<Charset>>(name)
        .Case("utf8", Charset::Utf8)
        .Case("numeric", Charset::Numeric)
        .Case("printable", Charset::Printable)
        .Case("ia5", Charset::Ia5)
        .Case("visible", Charset::Visible)
        .Default(std::nullopt);
}

llvm::ArrayRef<llvm::StringRef> allowedKeys(const TypeKind kind)
{
    switch (kind)
    {
    case TypeKind::Null:
    case TypeKind::Boolean:
        return kPlainKeys;
    case TypeKind::Integer:
    case TypeKind::OctetString:
    case TypeKind::BitString:
        return kBoundKeys;
    case TypeKind::CharacterString:
        return kStringKeys;
    case TypeKind::Enumerated:
        return kEnumKeys;
    case TypeKind::Sequence:
        return kFieldsKeys;
    case TypeKind::SequenceOf:
        return kElementKeys;
    case TypeKind::Choice:
        return kChoiceKeys;
    }
    return kPlainKeys;
}

void warnUnknownKeys(const llvm::json::Object&       object,
                     llvm::ArrayRef<llvm::StringRef> allowed,
                     const SchemaLocation&           location,
                     DiagnosticEngine&               diag)
{
    std::vector<std::string> unknown;
    for (const auto& entry : object)
    {
        if (!llvm::is_contained(allowed, llvm::StringRef(entry.first)))
        {
            unknown.push_back(entry.first.str());
        }
    }
    llvm::sort(unknown);
    for (const std::string& key : unknown)
    {
        diag.warning(location.child(key), "unknown key '" + key + "' ignored");
    }
}

/// Converts structural JSON into descriptors, resolving references on demand.
class SchemaParser final
{
public:
    SchemaParser(const llvm::json::Object& types, DiagnosticEngine& diag, SchemaLocation root)
        : types_(types)
        , diag_(diag)
        , root_(std::move(root))
    {
    }

    Schema run()
    {
        std::vector<std::string> names;
        for (const auto& entry : types_)
        {
            names.push_back(entry.first.str());
        }
        llvm::sort(names);

        Schema schema;
        for (const std::string& name : names)
        {
            if (TypeDescriptorPtr type = resolveNamed(name, root_.child(name)))
            {
                if (type->name != name)
                {
                    // Aliases get their own name; the constraint and children are shared.
                    auto alias  = std::make_shared<TypeDescriptor>(*type);
                    alias->name = name;
                    type        = std::move(alias);
                }
                schema.add(std::move(type));
            }
        }
        return schema;
    }

private:
    TypeDescriptorPtr resolveNamed(llvm::StringRef name, const SchemaLocation& referrer)
    {
        if (auto it = resolved_.find(name); it != resolved_.end())
        {
            return it->second;
        }
        if (failed_.contains(name))
        {
            return nullptr;
        }
        if (inProgress_.contains(name))
        {
            diag_.error(referrer, "cyclic reference to type '" + name.str() + "'");
            failed_.insert(name);
            return nullptr;
        }
        const llvm::json::Value* node = types_.get(name);
        if (!node)
        {
            diag_.error(referrer, "unknown type '" + name.str() + "'");
            return nullptr;
        }

        inProgress_.insert(name);
        TypeDescriptorPtr type = parseType(*node, root_.child(name), name.str());
        inProgress_.erase(name);
        if (!type || failed_.contains(name))
        {
            failed_.insert(name);
            return nullptr;
        }
        resolved_[name] = type;
        return type;
    }

    TypeDescriptorPtr parseType(const llvm::json::Value& node, const SchemaLocation& location, std::string name)
    {
        const llvm::json::Object* object = node.getAsObject();
        if (!object)
        {
            diag_.error(location, "type must be an object");
            return nullptr;
        }

        if (const auto ref = object->getString("ref"))
        {
            if (object->size() != 1U)
            {
                diag_.warning(location, "keys next to 'ref' are ignored");
            }
            return resolveNamed(*ref, location.child("ref"));
        }

        const auto kindName = object->getString("kind");
        if (!kindName)
        {
            diag_.error(location, "type needs a string 'kind' or a 'ref'");
            return nullptr;
        }
        const std::optional<TypeKind> kind = parseTypeKind(*kindName);
        if (!kind)
        {
            diag_.error(location.child("kind"), "unknown kind '" + kindName->str() + "'");
            return nullptr;
        }
        warnUnknownKeys(*object, allowedKeys(*kind), location, diag_);

        switch (*kind)
        {
        case TypeKind::Null:
            return makeLeafType(std::move(name), Constraint::null());
        case TypeKind::Boolean:
            return makeLeafType(std::move(name), Constraint::boolean());
        case TypeKind::Integer:
        case TypeKind::OctetString:
        case TypeKind::BitString:
        case TypeKind::CharacterString:
            return parseBounded(*object, location, std::move(name), *kind);
        case TypeKind::Enumerated:
            return parseEnumerated(*object, location, std::move(name));
        case TypeKind::Sequence:
            return parseMembers(*object, location, std::move(name), "fields", true);
        case TypeKind::Choice:
            return parseMembers(*object, location, std::move(name), "variants", false);
        case TypeKind::SequenceOf:
            return parseSequenceOf(*object, location, std::move(name));
        }
        return nullptr;
    }

    /// Reads `min`, `max` and `extensible`; false when any of them is malformed.
    bool parseBounds(const llvm::json::Object&    object,
                     const SchemaLocation&        location,
                     const bool                   sizeBounds,
                     std::optional<std::int64_t>& lower,
                     std::optional<std::int64_t>& upper,
                     bool&                        extensible)
    {
        bool ok = true;
        for (const llvm::StringRef key : {llvm::StringRef("min"), llvm::StringRef("max")})
        {
            const llvm::json::Value* bound = object.get(key);
            if (!bound)
            {
                continue;
            }
            const auto number = bound->getAsInteger();
            if (!number)
            {
                diag_.error(location.child(key), "'" + key.str() + "' must be an integer");
                ok = false;
                continue;
            }
            if (sizeBounds && *number < 0)
            {
                diag_.error(location.child(key), "size bound must not be negative");
                ok = false;
                continue;
            }
            (key == "min" ? lower : upper) = *number;
        }
        if (lower && upper && *lower > *upper)
        {
            diag_.error(location, "'min' " + std::to_string(*lower) + " exceeds 'max' " + std::to_string(*upper));
            ok = false;
        }
        extensible = readExtensible(object, location);
        return ok;
    }

    bool readExtensible(const llvm::json::Object& object, const SchemaLocation& location)
    {
        const llvm::json::Value* flag = object.get("extensible");
        if (!flag)
        {
            return false;
        }
        const auto value = flag->getAsBoolean();
        if (!value)
        {
            diag_.error(location.child("extensible"), "'extensible' must be a boolean");
            return false;
        }
        return *value;
    }

    TypeDescriptorPtr parseBounded(const llvm::json::Object& object,
                                   const SchemaLocation&     location,
                                   std::string               name,
                                   const TypeKind            kind)
    {
        std::optional<std::int64_t> lower;
        std::optional<std::int64_t> upper;
        bool                        extensible = false;
        if (!parseBounds(object, location, kind != TypeKind::Integer, lower, upper, extensible))
        {
            return nullptr;
        }

        switch (kind)
        {
        case TypeKind::Integer:
            return makeLeafType(std::move(name), Constraint::integer(lower, upper, extensible));
        case TypeKind::OctetString:
            return makeLeafType(std::move(name), Constraint::octetString(lower, upper, extensible));
        case TypeKind::BitString:
            return makeLeafType(std::move(name), Constraint::bitString(lower, upper, extensible));
        default:
            break;
        }

        Charset charset = Charset::Utf8;
        if (const llvm::json::Value* raw = object.get("charset"))
        {
            const auto                   charsetName = raw->getAsString();
            const std::optional<Charset> parsed      = charsetName ? parseCharset(*charsetName) : std::nullopt;
            if (!parsed)
            {
                diag_.error(location.child("charset"),
                            "'charset' must be one of utf8, numeric, printable, ia5, visible");
                return nullptr;
            }
            charset = *parsed;
        }
        return makeLeafType(std::move(name), Constraint::characterString(charset, lower, upper, extensible));
    }

    /// Resolves `extensionAfter` against `names`; false when it names nothing.
    bool parseStandardCount(const llvm::json::Object&       object,
                            const SchemaLocation&           location,
                            llvm::ArrayRef<std::string>     names,
                            std::optional<std::size_t>&     standard)
    {
        const bool               extensible = readExtensible(object, location);
        const llvm::json::Value* after      = object.get("extensionAfter");
        if (!after)
        {
            standard = extensible ? std::optional<std::size_t>(names.size()) : std::nullopt;
            return true;
        }
        if (object.get("extensible") && !extensible)
        {
            diag_.error(location.child("extensionAfter"), "'extensionAfter' requires an extensible type");
            return false;
        }
        const auto lastName = after->getAsString();
        if (!lastName)
        {
            diag_.error(location.child("extensionAfter"), "'extensionAfter' must be a member name");
            return false;
        }
        const auto* found = llvm::find(names, lastName->str());
        if (found == names.end())
        {
            diag_.error(location.child("extensionAfter"), "no member named '" + lastName->str() + "'");
            return false;
        }
        standard = static_cast<std::size_t>(found - names.begin()) + 1U;
        return true;
    }

    TypeDescriptorPtr parseEnumerated(const llvm::json::Object& object, const SchemaLocation& location, std::string name)
    {
        const llvm::json::Array* rawItems = object.getArray("items");
        if (!rawItems || rawItems->empty())
        {
            diag_.error(location.child("items"), "enumerated type needs a non-empty 'items' array");
            return nullptr;
        }

        std::vector<std::string> items;
        llvm::StringSet<>        seen;
        bool                     ok = true;
        for (std::size_t i = 0; i < rawItems->size(); ++i)
        {
            const auto item = (*rawItems)[i].getAsString();
            if (!item || item->empty())
            {
                diag_.error(location.child("items").child(llvm::Twine(i)), "item must be a non-empty string");
                ok = false;
                continue;
            }
            if (!seen.insert(*item).second)
            {
                diag_.error(location.child("items").child(llvm::Twine(i)), "duplicate item '" + item->str() + "'");
                ok = false;
                continue;
            }
            items.push_back(item->str());
        }

        std::optional<std::size_t> standard;
        if (!ok || !parseStandardCount(object, location, items, standard))
        {
            return nullptr;
        }
        return makeEnumeratedType(std::move(name), std::move(items), standard);
    }

    TypeDescriptorPtr parseMembers(const llvm::json::Object& object,
                                   const SchemaLocation&     location,
                                   std::string               name,
                                   llvm::StringRef           key,
                                   const bool                allowOptional)
    {
        const llvm::json::Array* rawMembers = object.getArray(key);
        const SchemaLocation     membersLocation = location.child(key);
        if (!rawMembers)
        {
            diag_.error(membersLocation, "'" + key.str() + "' must be an array");
            return nullptr;
        }
        if (!allowOptional && rawMembers->empty())
        {
            diag_.error(membersLocation, "choice type needs at least one variant");
            return nullptr;
        }

        std::vector<FieldDescriptor> members;
        std::vector<std::string>     names;
        llvm::StringSet<>            seen;
        bool                         ok = true;
        for (std::size_t i = 0; i < rawMembers->size(); ++i)
        {
            const SchemaLocation      memberLocation = membersLocation.child(llvm::Twine(i));
            const llvm::json::Object* member         = (*rawMembers)[i].getAsObject();
            if (!member)
            {
                diag_.error(memberLocation, "member must be an object");
                ok = false;
                continue;
            }
            warnUnknownKeys(*member, kMemberKeys, memberLocation, diag_);

            const auto memberName = member->getString("name");
            if (!memberName || memberName->empty())
            {
                diag_.error(memberLocation, "member needs a non-empty 'name'");
                ok = false;
                continue;
            }
            if (!seen.insert(*memberName).second)
            {
                diag_.error(memberLocation.child("name"), "duplicate member '" + memberName->str() + "'");
                ok = false;
                continue;
            }

            FieldDescriptor field;
            field.name = memberName->str();
            if (const llvm::json::Value* optional = member->get("optional"))
            {
                const auto flag = optional->getAsBoolean();
                if (!flag)
                {
                    diag_.error(memberLocation.child("optional"), "'optional' must be a boolean");
                    ok = false;
                }
                else if (*flag && !allowOptional)
                {
                    diag_.error(memberLocation.child("optional"), "choice variants cannot be optional");
                    ok = false;
                }
                else
                {
                    field.optional = *flag;
                }
            }

            const llvm::json::Value* memberType = member->get("type");
            if (!memberType)
            {
                diag_.error(memberLocation, "member '" + field.name + "' needs a 'type'");
                ok = false;
                continue;
            }
            field.type = parseType(*memberType, memberLocation.child("type"), "");
            if (!field.type)
            {
                ok = false;
                continue;
            }
            names.push_back(field.name);
            members.push_back(std::move(field));
        }

        std::optional<std::size_t> standard;
        if (!ok || !parseStandardCount(object, location, names, standard))
        {
            return nullptr;
        }
        if (allowOptional)
        {
            return makeSequenceType(std::move(name), std::move(members), standard);
        }
        return makeChoiceType(std::move(name), std::move(members), standard);
    }

    TypeDescriptorPtr parseSequenceOf(const llvm::json::Object& object, const SchemaLocation& location, std::string name)
    {
        std::optional<std::int64_t> lower;
        std::optional<std::int64_t> upper;
        bool                        extensible = false;
        const bool                  bounds     = parseBounds(object, location, true, lower, upper, extensible);

        const llvm::json::Value* rawElement = object.get("element");
        if (!rawElement)
        {
            diag_.error(location, "sequence-of type needs an 'element'");
            return nullptr;
        }
        TypeDescriptorPtr element = parseType(*rawElement, location.child("element"), "");
        if (!element || !bounds)
        {
            return nullptr;
        }
        return makeSequenceOfType(std::move(name), std::move(element), lower, upper, extensible);
    }

    const llvm::json::Object&          types_;
    DiagnosticEngine&                  diag_;
    SchemaLocation                     root_;
    llvm::StringMap<TypeDescriptorPtr> resolved_;
    llvm::StringSet<>                  inProgress_;
    llvm::StringSet<>                  failed_;
};

llvm::Error summarize(const DiagnosticEngine& diag, const std::size_t before, llvm::StringRef what, llvm::StringRef file)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "%s '%s' has %zu error(s)",
                                   what.str().c_str(),
                                   file.str().c_str(),
                                   diag.errorCount() - before);
}

/// Converts JSON to values, reporting every mismatch it finds.
class ValueParser final
{
public:
    explicit ValueParser(DiagnosticEngine& diag)
        : diag_(diag)
    {
    }

    ValuePtr parse(const llvm::json::Value& json, const TypeDescriptor& type, const SchemaLocation& location)
    {
        switch (type.kind())
        {
        case TypeKind::Null:
            if (!json.getAsNull())
            {
                return expected(location, type, "null");
            }
            return Value::null();
        case TypeKind::Boolean:
            if (const auto flag = json.getAsBoolean())
            {
                return Value::boolean(*flag);
            }
            return expected(location, type, "a boolean");
        case TypeKind::Integer:
            if (const auto number = json.getAsInteger())
            {
                return Value::integer(*number);
            }
            return expected(location, type, "an integer");
        case TypeKind::Enumerated:
            return parseEnumerated(json, type, location);
        case TypeKind::OctetString:
            return parseOctetString(json, type, location);
        case TypeKind::BitString:
            return parseBitString(json, type, location);
        case TypeKind::CharacterString:
            if (const auto text = json.getAsString())
            {
                return Value::characterString(text->str());
            }
            return expected(location, type, "a string");
        case TypeKind::Sequence:
            return parseSequence(json, type, location);
        case TypeKind::SequenceOf:
            return parseSequenceOf(json, type, location);
        case TypeKind::Choice:
            return parseChoice(json, type, location);
        }
        return nullptr;
    }

private:
    ValuePtr expected(const SchemaLocation& location, const TypeDescriptor& type, llvm::StringRef what)
    {
        diag_.error(location, "expected " + what.str() + " for " + type.str());
        return nullptr;
    }

    ValuePtr parseEnumerated(const llvm::json::Value& json, const TypeDescriptor& type, const SchemaLocation& location)
    {
        const auto item = json.getAsString();
        if (!item)
        {
            return expected(location, type, "an item name");
        }
        const std::optional<std::size_t> index = type.findItem(*item);
        if (!index)
        {
            diag_.error(location, "'" + item->str() + "' is not an item of " + type.str());
            return nullptr;
        }
        return Value::enumerated(*index);
    }

    ValuePtr parseOctetString(const llvm::json::Value& json, const TypeDescriptor& type, const SchemaLocation& location)
    {
        const auto hex = json.getAsString();
        if (!hex)
        {
            return expected(location, type, "a hex string");
        }
        std::optional<std::vector<std::uint8_t>> bytes = parseHexBytes(*hex);
        if (!bytes)
        {
            diag_.error(location, "malformed hex string");
            return nullptr;
        }
        return Value::octetString(std::move(*bytes));
    }

    ValuePtr parseBitString(const llvm::json::Value& json, const TypeDescriptor& type, const SchemaLocation& location)
    {
        const llvm::json::Object*       object = json.getAsObject();
        llvm::Optional<llvm::StringRef> hex;
        if (object)
        {
            hex = object->getString("hex");
        }
        if (!hex)
        {
            return expected(location, type, "an object with 'hex' and 'bits'");
        }
        std::optional<std::vector<std::uint8_t>> bytes = parseHexBytes(*hex);
        if (!bytes)
        {
            diag_.error(location.child("hex"), "malformed hex string");
            return nullptr;
        }
        std::uint64_t bits = static_cast<std::uint64_t>(bytes->size()) * kBitsPerByte;
        if (const llvm::json::Value* rawBits = object->get("bits"))
        {
            const auto count = rawBits->getAsInteger();
            if (!count || *count < 0 || static_cast<std::uint64_t>(*count) > bits)
            {
                diag_.error(location.child("bits"), "'bits' must be between 0 and " + std::to_string(bits));
                return nullptr;
            }
            bits = static_cast<std::uint64_t>(*count);
        }
        bytes->resize(bytesForBits(static_cast<std::size_t>(bits)));
        return Value::bitString(std::move(*bytes), bits);
    }

    ValuePtr parseSequence(const llvm::json::Value& json, const TypeDescriptor& type, const SchemaLocation& location)
    {
        const llvm::json::Object* object = json.getAsObject();
        if (!object)
        {
            return expected(location, type, "an object");
        }

        bool ok = true;
        for (const auto& entry : *object)
        {
            if (!type.findField(entry.first))
            {
                diag_.error(location.child(llvm::StringRef(entry.first)), "unknown field '" + entry.first.str() + "'");
                ok = false;
            }
        }

        std::vector<ValuePtr> fields;
        for (const FieldDescriptor& field : type.fields)
        {
            const llvm::json::Value* raw = object->get(field.name);
            if (!raw)
            {
                if (!field.optional)
                {
                    diag_.error(location, "missing mandatory field '" + field.name + "'");
                    ok = false;
                }
                fields.emplace_back();
                continue;
            }
            ValuePtr value = parse(*raw, *field.type, location.child(field.name));
            ok             = ok && value != nullptr;
            fields.push_back(std::move(value));
        }
        return ok ? Value::sequence(std::move(fields)) : nullptr;
    }

    ValuePtr parseSequenceOf(const llvm::json::Value& json, const TypeDescriptor& type, const SchemaLocation& location)
    {
        const llvm::json::Array* array = json.getAsArray();
        if (!array)
        {
            return expected(location, type, "an array");
        }
        std::vector<ValuePtr> elements;
        bool                  ok = true;
        for (std::size_t i = 0; i < array->size(); ++i)
        {
            ValuePtr element = parse((*array)[i], *type.element, location.child(llvm::Twine(i)));
            ok               = ok && element != nullptr;
            elements.push_back(std::move(element));
        }
        return ok ? Value::sequenceOf(std::move(elements)) : nullptr;
    }

    ValuePtr parseChoice(const llvm::json::Value& json, const TypeDescriptor& type, const SchemaLocation& location)
    {
        const llvm::json::Object* object = json.getAsObject();
        if (!object || object->size() != 1U)
        {
            return expected(location, type, "an object with exactly one variant");
        }
        const auto&                      entry = *object->begin();
        const std::optional<std::size_t> index = type.findField(entry.first);
        if (!index)
        {
            diag_.error(location.child(llvm::StringRef(entry.first)), "unknown variant '" + entry.first.str() + "'");
            return nullptr;
        }
        ValuePtr payload = parse(entry.second, *type.fields[*index].type, location.child(llvm::StringRef(entry.first)));
        if (!payload)
        {
            return nullptr;
        }
        return Value::choice(*index, std::move(payload));
    }

    DiagnosticEngine& diag_;
};

llvm::Error makeJsonMismatch(const Value& value, const TypeDescriptor& type)
{
    return makeUnsupportedOperation("value " + value.str() + " does not match type " + type.str());
}

}  // namespace

void Schema::add(TypeDescriptorPtr type)
{
    const std::string name = type->name;
    types_[name]           = std::move(type);
}

TypeDescriptorPtr Schema::lookup(llvm::StringRef name) const
{
    const auto it = types_.find(name);
    return it == types_.end() ? nullptr : it->second;
}

std::vector<TypeDescriptorPtr> Schema::types() const
{
    std::vector<TypeDescriptorPtr> out;
    out.reserve(types_.size());
    for (const auto& entry : types_)
    {
        out.push_back(entry.second);
    }
    llvm::sort(out, [](const TypeDescriptorPtr& lhs, const TypeDescriptorPtr& rhs) { return lhs->name < rhs->name; });
    return out;
}

llvm::Expected<Schema> parseSchema(const llvm::json::Value& document, DiagnosticEngine& diag, llvm::StringRef file)
{
    const std::size_t    before = diag.errorCount();
    const SchemaLocation root{file.str(), ""};

    const llvm::json::Object* object = document.getAsObject();
    const llvm::json::Object* types  = object ? object->getObject("types") : nullptr;
    if (!types)
    {
        diag.error(root, "schema must be an object with a 'types' object");
        return summarize(diag, before, "schema", file);
    }
    for (const auto& entry : *object)
    {
        if (llvm::StringRef(entry.first) != "types")
        {
            diag.warning(root.child(llvm::StringRef(entry.first)), "unknown key '" + entry.first.str() + "' ignored");
        }
    }

    SchemaParser parser(*types, diag, root.child("types"));
    Schema       schema = parser.run();
    if (diag.errorCount() != before)
    {
        return summarize(diag, before, "schema", file);
    }
    return schema;
}

llvm::Expected<Schema> loadSchema(llvm::StringRef path, DiagnosticEngine& diag)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(),
                                       "failed to read schema file '%s': %s",
                                       path.str().c_str(),
                                       buffer.getError().message().c_str());
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse((*buffer)->getBuffer());
    if (!parsed)
    {
        const std::string message = llvm::toString(parsed.takeError());
        diag.error(SchemaLocation{path.str(), ""}, message);
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid JSON in schema file '%s': %s",
                                       path.str().c_str(),
                                       message.c_str());
    }
    return parseSchema(*parsed, diag, path);
}

llvm::Expected<ValuePtr> valueFromJson(const llvm::json::Value& json,
                                       const TypeDescriptor&    type,
                                       DiagnosticEngine&        diag,
                                       const SchemaLocation&    location)
{
    const std::size_t before = diag.errorCount();
    ValueParser       parser(diag);
    ValuePtr          value = parser.parse(json, type, location);
    if (!value || diag.errorCount() != before)
    {
        return summarize(diag, before, "value", location.file);
    }
    return value;
}

llvm::Expected<llvm::json::Value> valueToJson(const Value& value, const TypeDescriptor& type)
{
    if (value.kind() != type.kind())
    {
        return makeJsonMismatch(value, type);
    }

    switch (type.kind())
    {
    case TypeKind::Null:
        return llvm::json::Value(nullptr);
    case TypeKind::Boolean:
        return llvm::json::Value(std::get<bool>(value.value));
    case TypeKind::Integer:
        return llvm::json::Value(std::get<std::int64_t>(value.value));
    case TypeKind::Enumerated: {
        const std::uint64_t index = std::get<Value::Enumerated>(value.value).index;
        if (index >= type.items.size())
        {
            return makeJsonMismatch(value, type);
        }
        return llvm::json::Value(type.items[index]);
    }
    case TypeKind::OctetString:
        return llvm::json::Value(llvm::toHex(std::get<Value::OctetString>(value.value).bytes, true));
    case TypeKind::BitString: {
        const auto& bits = std::get<per::BitStringData>(value.value);
        return llvm::json::Value(llvm::json::Object{
            {"hex", llvm::toHex(bits.bytes, true)},
            {"bits", static_cast<std::int64_t>(bits.bitLength)},
        });
    }
    case TypeKind::CharacterString:
        return llvm::json::Value(std::get<std::string>(value.value));
    case TypeKind::Sequence: {
        const auto& sequence = std::get<Value::Sequence>(value.value);
        if (sequence.fields.size() != type.fields.size())
        {
            return makeJsonMismatch(value, type);
        }
        llvm::json::Object out;
        for (std::size_t i = 0; i < type.fields.size(); ++i)
        {
            if (!sequence.fields[i])
            {
                continue;
            }
            llvm::Expected<llvm::json::Value> field = valueToJson(*sequence.fields[i], *type.fields[i].type);
            if (!field)
            {
                return field.takeError();
            }
            out[type.fields[i].name] = std::move(*field);
        }
        return llvm::json::Value(std::move(out));
    }
    case TypeKind::SequenceOf: {
        llvm::json::Array out;
        for (const ValuePtr& element : std::get<Value::SequenceOf>(value.value).elements)
        {
            if (!element)
            {
                return makeJsonMismatch(value, type);
            }
            llvm::Expected<llvm::json::Value> converted = valueToJson(*element, *type.element);
            if (!converted)
            {
                return converted.takeError();
            }
            out.push_back(std::move(*converted));
        }
        return llvm::json::Value(std::move(out));
    }
    case TypeKind::Choice: {
        const auto& choice = std::get<Value::Choice>(value.value);
        if (choice.index >= type.fields.size() || !choice.payload)
        {
            return makeJsonMismatch(value, type);
        }
        llvm::Expected<llvm::json::Value> payload = valueToJson(*choice.payload, *type.fields[choice.index].type);
        if (!payload)
        {
            return payload.takeError();
        }
        llvm::json::Object out;
        out[type.fields[choice.index].name] = std::move(*payload);
        return llvm::json::Value(std::move(out));
    }
    }
    return makeJsonMismatch(value, type);
}

std::optional<std::vector<std::uint8_t>> parseHexBytes(llvm::StringRef hex)
{
    if (hex.size() % 2U != 0U || !llvm::all_of(hex, llvm::isHexDigit))
    {
        return std::nullopt;
    }
    std::string decoded;
    if (!llvm::tryGetFromHex(hex, decoded))
    {
        return std::nullopt;
    }
    return std::vector<std::uint8_t>(decoded.begin(), decoded.end());
}

}  // namespace llvmasn1
