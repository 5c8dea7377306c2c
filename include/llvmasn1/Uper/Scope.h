//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-container presence-bit bookkeeping for SEQUENCE and SET encodings.
///
/// A `Scope` is a small state machine owned by the UPER writer or reader.
/// Each field visit is one step: it may hand out the position of a presence
/// bit, request that the extension block be opened, or do nothing. The scope
/// never touches the buffer itself; the writer and reader perform the I/O the
/// returned step asks for.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_UPER_SCOPE_H
#define LLVMASN1_UPER_SCOPE_H

#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace llvmasn1
{

/// @brief Half-open range of absolute bit positions.
struct BitRange final
{
    std::size_t begin{0};
    std::size_t end{0};

    [[nodiscard]] std::size_t size() const
    {
        return end - begin;
    }

    [[nodiscard]] bool empty() const
    {
        return begin >= end;
    }
};

/// @brief Active scope variant.
enum class ScopeKind
{
    /// @brief Every field consumes a presence bit and is open-type wrapped.
    AllBitField,

    /// @brief Only OPTIONAL fields consume a presence bit.
    OptBitField,

    /// @brief Standard-field prefix of an extensible container.
    ExtensibleSequence,
};

/// @brief Result of visiting one field.
struct SlotStep final
{
    enum class Action
    {
        /// @brief Mandatory field without a presence bit.
        None,

        /// @brief The field's presence bit is at `bitPosition`.
        PresenceBit,

        /// @brief The field lies past the extension marker and the
        /// presence bit run was exhausted (reader only): the field is absent.
        Absent,

        /// @brief The extension block must be opened before the field is visited again.
        OpenExtensions,
    };

    Action      action{Action::None};
    std::size_t bitPosition{0};

    /// @brief The field content is wrapped as an open type.
    bool openType{false};
};

/// @brief Presence-bit state machine of one SEQUENCE or SET.
class Scope final
{
public:
    /// @brief Scope where only OPTIONAL fields own a bit of `presence`.
    static Scope optBitField(BitRange presence);

    /// @brief Scope where every field owns a bit of `presence`.
    /// @param[in] presence Reserved presence bits.
    /// @param[in] lenient Report fields beyond the run as absent instead of failing.
    static Scope allBitField(BitRange presence, bool lenient = false);

    /// @brief Scope for the standard fields of an extensible container.
    /// @param[in] presence Presence bits of the OPTIONAL standard fields.
    /// @param[in] callsUntilExtBitfield Number of standard fields.
    /// @param[in] numberOfExtFields Number of extension fields known to the schema.
    static Scope extensibleSequence(BitRange presence, std::uint64_t callsUntilExtBitfield, std::uint64_t numberOfExtFields);

    /// @brief Advances the state machine by one field visit.
    /// @param[in] optional Whether the visited field is OPTIONAL.
    /// @return Step to perform, or `OptFlagsExhausted` when the reserved run is used up.
    llvm::Expected<SlotStep> visit(bool optional);

    /// @brief Switches to `AllBitField` over the extension presence bits.
    ///
    /// Called after an `OpenExtensions` step once the caller has written or
    /// read the extension count and reserved the presence bits.
    ///
    /// @param[in] header Bit position where the extension block starts.
    /// @param[in] presence Extension presence bits.
    /// @param[in] lenient Report fields beyond the run as absent instead of failing.
    void enterExtensions(std::size_t header, BitRange presence, bool lenient);

    [[nodiscard]] ScopeKind kind() const
    {
        return kind_;
    }

    /// @brief Presence bits not handed out yet.
    [[nodiscard]] BitRange remaining() const
    {
        return presence_;
    }

    /// @brief Presence bits as reserved, before any visit.
    [[nodiscard]] BitRange reserved() const
    {
        return BitRange{first_, presence_.end};
    }

    [[nodiscard]] std::uint64_t callsUntilExtBitfield() const
    {
        return callsUntilExtBitfield_;
    }

    [[nodiscard]] std::uint64_t numberOfExtFields() const
    {
        return numberOfExtFields_;
    }

    /// @brief Start of the extension block once it was opened.
    [[nodiscard]] std::optional<std::size_t> extensionHeader() const
    {
        return extensionHeader_;
    }

private:
    Scope(ScopeKind kind, BitRange presence);

    SlotStep takeBit(bool openType);

    ScopeKind                  kind_;
    BitRange                   presence_;
    std::size_t                first_;
    std::uint64_t              callsUntilExtBitfield_{0};
    std::uint64_t              numberOfExtFields_{0};
    std::optional<std::size_t> extensionHeader_;
    bool                       lenient_{false};
};

}  // namespace llvmasn1

#endif  // LLVMASN1_UPER_SCOPE_H
