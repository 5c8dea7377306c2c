//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// UPER encoder facade consumed by per-type bindings.
///
/// Bindings call one `write*` method per value in schema order. Constructed
/// types take a callback that writes their fields, elements or payload
/// through the same writer. OPTIONAL fields are written through `writeOpt`,
/// which records the presence bit before delegating.
///
/// @code
/// UperWriter writer;
/// auto err = writer.writeSequence(kPersonConstraint, [&](UperWriter& w) -> llvm::Error {
///     if (auto e = w.writeCharacterString(kNameConstraint, person.name))
///         return e;
///     return w.writeOpt(person.age.has_value(), [&](UperWriter& inner) {
///         return inner.writeInteger(kAgeConstraint, *person.age);
///     });
/// });
/// @endcode
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_UPER_UPER_WRITER_H
#define LLVMASN1_UPER_UPER_WRITER_H

#include "llvmasn1/Model/Constraint.h"
#include "llvmasn1/Runtime/BitBuffer.h"
#include "llvmasn1/Support/CodecConfig.h"
#include "llvmasn1/Uper/Scope.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace llvmasn1
{

class UperWriter;

/// @brief Writes the fields of a SEQUENCE or the payload of a CHOICE.
using FieldWriter = llvm::function_ref<llvm::Error(UperWriter&)>;

/// @brief Writes element `index` of a SEQUENCE OF.
using ElementWriter = llvm::function_ref<llvm::Error(UperWriter&, std::uint64_t index)>;

/// @brief Encoder for one UPER message.
class UperWriter final
{
public:
    /// @brief Creates a writer with an empty buffer.
    /// @param[in] config Limits and trace level.
    /// @param[in] trace Trace destination; nothing is traced when null.
    explicit UperWriter(CodecConfig config = {}, llvm::raw_ostream* trace = nullptr);

    llvm::Error writeNull();
    llvm::Error writeBoolean(bool value);
    llvm::Error writeInteger(const Constraint& constraint, std::int64_t value);
    llvm::Error writeEnumerated(const Constraint& constraint, std::uint64_t index);
    llvm::Error writeOctetString(const Constraint& constraint, llvm::ArrayRef<std::uint8_t> value);

    /// @brief Writes the first `bitLength` bits of `value`.
    llvm::Error writeBitString(const Constraint& constraint, llvm::ArrayRef<std::uint8_t> value, std::uint64_t bitLength);

    llvm::Error writeCharacterString(const Constraint& constraint, llvm::StringRef value);

    /// @brief Writes a SEQUENCE or SET.
    ///
    /// Emits the extension marker and the presence bits of the OPTIONAL
    /// standard fields, then runs `body`, which must write every field in
    /// schema order. The extension block is opened when the first extension
    /// field is visited and dropped again if no extension field was present.
    llvm::Error writeSequence(const Constraint& constraint, FieldWriter body);

    /// @brief Writes a SEQUENCE OF or SET OF with `count` elements.
    llvm::Error writeSequenceOf(const Constraint& constraint, std::uint64_t count, ElementWriter element);

    /// @brief Writes the index of a CHOICE alternative followed by its payload.
    ///
    /// Payloads of extension alternatives are wrapped as open types.
    llvm::Error writeChoice(const Constraint& constraint, std::uint64_t index, FieldWriter payload);

    /// @brief Writes an OPTIONAL field.
    /// @param[in] present Whether the field is present.
    /// @param[in] value Writes the field through a single `write*` call; not called when absent.
    llvm::Error writeOpt(bool present, FieldWriter value);

    [[nodiscard]] const BitBuffer& buffer() const
    {
        return buffer_;
    }

    [[nodiscard]] std::size_t bitLength() const
    {
        return buffer_.writePosition();
    }

    /// @brief Moves the encoded bytes out; the writer is empty afterwards.
    [[nodiscard]] std::vector<std::uint8_t> takeBytes();

private:
    /// @brief Consumes the slot of a mandatory field, or the one `writeOpt` claimed.
    /// @return Whether the content is open-type wrapped.
    llvm::Expected<bool> enterField();

    llvm::Expected<bool> claimSlot(bool optional, bool present);
    llvm::Error          openExtensions();
    llvm::Error          closeSequence(std::optional<std::size_t> marker);

    /// @brief Runs `body`, routing its output through a scratch buffer for open types.
    llvm::Error encodeContent(bool openType, llvm::function_ref<llvm::Error()> body);

    llvm::Error enterNested();
    void        trace(TraceLevel level, const llvm::Twine& message) const;

    BitBuffer            buffer_;
    std::optional<Scope> scope_;
    std::optional<bool>  claimedSlot_;
    CodecConfig          config_;
    llvm::raw_ostream*   trace_;
    std::uint32_t        depth_{0};
};

}  // namespace llvmasn1

#endif  // LLVMASN1_UPER_UPER_WRITER_H
