//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements descriptor-driven encoding and decoding.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Uper/DynamicCodec.h"

#include "llvmasn1/Runtime/BitCopy.h"
#include "llvmasn1/Support/CodecError.h"
#include "llvmasn1/Uper/UperReader.h"
#include "llvmasn1/Uper/UperWriter.h"

#include "llvm/ADT/Twine.h"

#include <string>
#include <utility>

namespace llvmasn1
{
namespace
{

llvm::Error makeMismatch(const Value& value, const TypeDescriptor& type)
{
    return makeUnsupportedOperation(
        (llvm::Twine("value of kind ") + typeKindName(value.kind()) + " does not match type " + type.str()).str());
}

llvm::Error encodeValue(UperWriter& writer, const Value& value, const TypeDescriptor& type);

llvm::Error encodeSequence(UperWriter& writer, const Value::Sequence& sequence, const TypeDescriptor& type)
{
    if (sequence.fields.size() != type.fields.size())
    {
        return makeUnsupportedOperation((llvm::Twine("sequence value has ") + llvm::Twine(sequence.fields.size()) +
                                         " fields, type " + type.str() + " declares " +
                                         llvm::Twine(type.fields.size()))
                                            .str());
    }
    return writer.writeSequence(type.constraint, [&](UperWriter& inner) -> llvm::Error {
        for (std::size_t i = 0; i < type.fields.size(); ++i)
        {
            const FieldDescriptor& field = type.fields[i];
            const ValuePtr&        fieldValue = sequence.fields[i];
            if (field.optional)
            {
                if (llvm::Error err = inner.writeOpt(static_cast<bool>(fieldValue), [&](UperWriter& opt) {
                        return encodeValue(opt, *fieldValue, *field.type);
                    }))
                {
                    return err;
                }
                continue;
            }
            if (!fieldValue)
            {
                return makeUnsupportedOperation("mandatory field '" + field.name + "' is absent");
            }
            if (llvm::Error err = encodeValue(inner, *fieldValue, *field.type))
            {
                return err;
            }
        }
        return llvm::Error::success();
    });
}

llvm::Error encodeSequenceOf(UperWriter& writer, const Value::SequenceOf& sequenceOf, const TypeDescriptor& type)
{
    return writer.writeSequenceOf(type.constraint,
                                  sequenceOf.elements.size(),
                                  [&](UperWriter& inner, const std::uint64_t index) -> llvm::Error {
                                      const ValuePtr& element = sequenceOf.elements[index];
                                      if (!element)
                                      {
                                          return makeUnsupportedOperation("sequence-of element is absent");
                                      }
                                      return encodeValue(inner, *element, *type.element);
                                  });
}

llvm::Error encodeChoice(UperWriter& writer, const Value::Choice& choice, const TypeDescriptor& type)
{
    if (!choice.payload)
    {
        return makeUnsupportedOperation("choice payload is absent");
    }
    return writer.writeChoice(type.constraint, choice.index, [&](UperWriter& inner) {
        return encodeValue(inner, *choice.payload, *type.fields[choice.index].type);
    });
}

llvm::Error encodeValue(UperWriter& writer, const Value& value, const TypeDescriptor& type)
{
    if (value.kind() != type.kind())
    {
        return makeMismatch(value, type);
    }

    const Constraint& c = type.constraint;
    switch (type.kind())
    {
    case TypeKind::Null:
        return writer.writeNull();
    case TypeKind::Boolean:
        return writer.writeBoolean(std::get<bool>(value.value));
    case TypeKind::Integer:
        return writer.writeInteger(c, std::get<std::int64_t>(value.value));
    case TypeKind::Enumerated:
        return writer.writeEnumerated(c, std::get<Value::Enumerated>(value.value).index);
    case TypeKind::OctetString:
        return writer.writeOctetString(c, std::get<Value::OctetString>(value.value).bytes);
    case TypeKind::BitString: {
        const auto& bits = std::get<per::BitStringData>(value.value);
        return writer.writeBitString(c, bits.bytes, bits.bitLength);
    }
    case TypeKind::CharacterString:
        return writer.writeCharacterString(c, std::get<std::string>(value.value));
    case TypeKind::Sequence:
        return encodeSequence(writer, std::get<Value::Sequence>(value.value), type);
    case TypeKind::SequenceOf:
        return encodeSequenceOf(writer, std::get<Value::SequenceOf>(value.value), type);
    case TypeKind::Choice:
        return encodeChoice(writer, std::get<Value::Choice>(value.value), type);
    }
    return makeMismatch(value, type);
}

llvm::Expected<ValuePtr> decodeValue(UperReader& reader, const TypeDescriptor& type);

/// Decodes one field into `out`, the shape shared by every container visitor.
llvm::Error decodeInto(UperReader& reader, const TypeDescriptor& type, ValuePtr& out)
{
    llvm::Expected<ValuePtr> decoded = decodeValue(reader, type);
    if (!decoded)
    {
        return decoded.takeError();
    }
    out = std::move(*decoded);
    return llvm::Error::success();
}

llvm::Expected<ValuePtr> decodeSequence(UperReader& reader, const TypeDescriptor& type)
{
    std::vector<ValuePtr> fields(type.fields.size());
    if (llvm::Error err = reader.visitSequence(type.constraint, [&](UperReader& inner) -> llvm::Error {
            for (std::size_t i = 0; i < type.fields.size(); ++i)
            {
                const FieldDescriptor& field = type.fields[i];
                if (!field.optional)
                {
                    if (llvm::Error failure = decodeInto(inner, *field.type, fields[i]))
                    {
                        return failure;
                    }
                    continue;
                }
                bool present = false;
                if (llvm::Error failure = inner.visitOpt(
                        [&](UperReader& opt) {
                            return decodeInto(opt, *field.type, fields[i]);
                        },
                        present))
                {
                    return failure;
                }
            }
            return llvm::Error::success();
        }))
    {
        return std::move(err);
    }
    return Value::sequence(std::move(fields));
}

llvm::Expected<ValuePtr> decodeSequenceOf(UperReader& reader, const TypeDescriptor& type)
{
    std::vector<ValuePtr> elements;
    if (llvm::Error err = reader.visitSequenceOf(type.constraint, [&](UperReader& inner, std::uint64_t) {
            elements.emplace_back();
            return decodeInto(inner, *type.element, elements.back());
        }))
    {
        return std::move(err);
    }
    return Value::sequenceOf(std::move(elements));
}

llvm::Expected<ValuePtr> decodeChoice(UperReader& reader, const TypeDescriptor& type)
{
    std::uint64_t selected = 0;
    ValuePtr      payload;
    if (llvm::Error err = reader.visitChoice(type.constraint, [&](UperReader& inner, const std::uint64_t index) {
            selected = index;
            return decodeInto(inner, *type.fields[index].type, payload);
        }))
    {
        return std::move(err);
    }
    return Value::choice(selected, std::move(payload));
}

/// Wraps a primitive read into a value handle.
template <typename T, typename Make>
llvm::Expected<ValuePtr> wrapRead(llvm::Expected<T> read, Make make)
{
    if (!read)
    {
        return read.takeError();
    }
    return make(std::move(*read));
}

llvm::Expected<ValuePtr> decodeValue(UperReader& reader, const TypeDescriptor& type)
{
    const Constraint& c = type.constraint;
    switch (type.kind())
    {
    case TypeKind::Null:
        if (llvm::Error err = reader.readNull())
        {
            return std::move(err);
        }
        return Value::null();
    case TypeKind::Boolean:
        return wrapRead(reader.readBoolean(), Value::boolean);
    case TypeKind::Integer:
        return wrapRead(reader.readInteger(c), Value::integer);
    case TypeKind::Enumerated:
        return wrapRead(reader.readEnumerated(c), Value::enumerated);
    case TypeKind::OctetString:
        return wrapRead(reader.readOctetString(c), Value::octetString);
    case TypeKind::BitString:
        return wrapRead(reader.readBitString(c), [](per::BitStringData bits) {
            return Value::bitString(std::move(bits.bytes), bits.bitLength);
        });
    case TypeKind::CharacterString:
        return wrapRead(reader.readCharacterString(c), Value::characterString);
    case TypeKind::Sequence:
        return decodeSequence(reader, type);
    case TypeKind::SequenceOf:
        return decodeSequenceOf(reader, type);
    case TypeKind::Choice:
        return decodeChoice(reader, type);
    }
    return makeUnsupportedOperation("unknown type kind");
}

}  // namespace

llvm::Expected<Encoded> encode(const Value&          value,
                               const TypeDescriptor& type,
                               const CodecConfig&    config,
                               llvm::raw_ostream*    trace)
{
    UperWriter writer(config, trace);
    if (llvm::Error err = encodeValue(writer, value, type))
    {
        return std::move(err);
    }
    Encoded out;
    out.bitLength = writer.bitLength();
    out.bytes     = writer.takeBytes();
    out.bytes.resize(bytesForBits(out.bitLength));
    return out;
}

llvm::Expected<Decoded> decode(llvm::ArrayRef<std::uint8_t> bytes,
                               const std::size_t            bitLength,
                               const TypeDescriptor&        type,
                               const CodecConfig&           config,
                               llvm::raw_ostream*           trace)
{
    UperReader               reader(bytes, bitLength, config, trace);
    llvm::Expected<ValuePtr> value = decodeValue(reader, type);
    if (!value)
    {
        return value.takeError();
    }
    return Decoded{std::move(*value), reader.position()};
}

}  // namespace llvmasn1
