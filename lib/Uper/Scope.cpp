//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the presence-bit state machine.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Uper/Scope.h"

#include "llvmasn1/Support/CodecError.h"

namespace llvmasn1
{

Scope::Scope(const ScopeKind kind, const BitRange presence)
    : kind_(kind)
    , presence_(presence)
    , first_(presence.begin)
{
}

Scope Scope::optBitField(const BitRange presence)
{
    return Scope(ScopeKind::OptBitField, presence);
}

Scope Scope::allBitField(const BitRange presence, const bool lenient)
{
    Scope scope(ScopeKind::AllBitField, presence);
    scope.lenient_ = lenient;
    return scope;
}

Scope Scope::extensibleSequence(const BitRange      presence,
                                const std::uint64_t callsUntilExtBitfield,
                                const std::uint64_t numberOfExtFields)
{
    Scope scope(ScopeKind::ExtensibleSequence, presence);
    scope.callsUntilExtBitfield_ = callsUntilExtBitfield;
    scope.numberOfExtFields_     = numberOfExtFields;
    return scope;
}

SlotStep Scope::takeBit(const bool openType)
{
    SlotStep step;
    step.action      = SlotStep::Action::PresenceBit;
    step.bitPosition = presence_.begin++;
    step.openType    = openType;
    return step;
}

llvm::Expected<SlotStep> Scope::visit(const bool optional)
{
    switch (kind_)
    {
    case ScopeKind::AllBitField:
        if (presence_.empty())
        {
            if (lenient_)
            {
                return SlotStep{SlotStep::Action::Absent, 0, true};
            }
            return makeOptFlagsExhausted();
        }
        return takeBit(true);

    case ScopeKind::ExtensibleSequence:
        if (callsUntilExtBitfield_ == 0U)
        {
            if (numberOfExtFields_ == 0U)
            {
                return makeOptFlagsExhausted();
            }
            return SlotStep{SlotStep::Action::OpenExtensions, 0, false};
        }
        --callsUntilExtBitfield_;
        [[fallthrough]];

    case ScopeKind::OptBitField:
        if (!optional)
        {
            return SlotStep{};
        }
        if (presence_.empty())
        {
            return makeOptFlagsExhausted();
        }
        return takeBit(false);
    }
    return SlotStep{};
}

void Scope::enterExtensions(const std::size_t header, const BitRange presence, const bool lenient)
{
    kind_            = ScopeKind::AllBitField;
    presence_        = presence;
    first_           = presence.begin;
    extensionHeader_ = header;
    lenient_         = lenient;
}

}  // namespace llvmasn1
