//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the UPER decoder facade.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Uper/UperReader.h"

#include "llvmasn1/Runtime/BitCopy.h"
#include "llvmasn1/Runtime/CharacterString.h"
#include "llvmasn1/Support/CodecError.h"

#include "NestingGuard.h"

#include <utility>
#include <vector>

namespace llvmasn1
{

UperReader::UperReader(llvm::ArrayRef<std::uint8_t> bytes,
                       const std::size_t            bitLength,
                       CodecConfig                  config,
                       llvm::raw_ostream*           trace)
    : view_(bytes, bitLength)
    , config_(config)
    , trace_(trace)
{
}

void UperReader::trace(const TraceLevel level, const llvm::Twine& message) const
{
    if (trace_ == nullptr || config_.traceLevel == TraceLevel::Off || level > config_.traceLevel)
    {
        return;
    }
    *trace_ << "[asn1uper] read @" << view_.position() << ": " << message << "\n";
}

llvm::Error UperReader::enterNested()
{
    if (depth_ >= config_.maxNestingDepth)
    {
        return makeUnsupportedOperation("container nesting exceeds the configured depth");
    }
    return llvm::Error::success();
}

llvm::Expected<UperReader::SlotRead> UperReader::claimSlot(const bool optional)
{
    if (!scope_)
    {
        return SlotRead{};
    }

    llvm::Expected<SlotStep> step = scope_->visit(optional);
    if (!step)
    {
        return step.takeError();
    }
    if (step->action == SlotStep::Action::OpenExtensions)
    {
        if (llvm::Error err = openExtensions())
        {
            return std::move(err);
        }
        step = scope_->visit(optional);
        if (!step)
        {
            return step.takeError();
        }
    }

    switch (step->action)
    {
    case SlotStep::Action::PresenceBit: {
        llvm::Expected<bool> present = view_.peekBit(step->bitPosition);
        if (!present)
        {
            return present.takeError();
        }
        return SlotRead{*present, step->openType};
    }
    case SlotStep::Action::Absent:
        return SlotRead{false, true};
    case SlotStep::Action::None:
    case SlotStep::Action::OpenExtensions:
        break;
    }
    return SlotRead{};
}

llvm::Expected<bool> UperReader::enterField()
{
    if (claimedSlot_)
    {
        const bool openType = *claimedSlot_;
        claimedSlot_.reset();
        return openType;
    }
    llvm::Expected<SlotRead> slot = claimSlot(false);
    if (!slot)
    {
        return slot.takeError();
    }
    if (!slot->present)
    {
        return makeInvalidExtensionConstellation(true, false);
    }
    return slot->openType;
}

llvm::Error UperReader::openExtensions()
{
    const std::size_t header = view_.position();
    if (!extensionMarker_)
    {
        scope_->enterExtensions(header, BitRange{header, header}, true);
        trace(TraceLevel::Verbose, "no extension block");
        return llvm::Error::success();
    }

    llvm::Expected<std::uint64_t> last = per::readNormallySmallNonNegativeWholeNumber(view_);
    if (!last)
    {
        return last.takeError();
    }
    if (*last >= view_.bitsRemaining())
    {
        return makeEndOfStream();
    }
    const std::size_t count = static_cast<std::size_t>(*last) + 1U;
    const BitRange    presence{view_.position(), view_.position() + count};
    if (llvm::Error err = view_.advance(count))
    {
        return err;
    }
    scope_->enterExtensions(header, presence, true);
    trace(TraceLevel::Verbose,
          "extension block with " + llvm::Twine(count) + " presence bits, " +
              llvm::Twine(scope_->numberOfExtFields()) + " known");
    return llvm::Error::success();
}

llvm::Error UperReader::closeSequence()
{
    if (scope_->kind() == ScopeKind::ExtensibleSequence)
    {
        if (!extensionMarker_ || scope_->callsUntilExtBitfield() != 0U)
        {
            return llvm::Error::success();
        }
        // The binding stopped at the extension marker; skip the whole block.
        if (llvm::Error err = openExtensions())
        {
            return err;
        }
    }
    if (!scope_->extensionHeader())
    {
        return llvm::Error::success();
    }

    const BitRange unknown = scope_->remaining();
    for (std::size_t bit = unknown.begin; bit < unknown.end; ++bit)
    {
        llvm::Expected<bool> present = view_.peekBit(bit);
        if (!present)
        {
            return present.takeError();
        }
        if (*present)
        {
            trace(TraceLevel::Verbose, "skipping unknown extension");
            if (llvm::Error err = per::skipOpenType(view_))
            {
                return err;
            }
        }
    }
    return llvm::Error::success();
}

llvm::Error UperReader::decodeContent(const bool openType, llvm::function_ref<llvm::Error()> body)
{
    if (!openType)
    {
        return body();
    }

    std::optional<Scope> stashedScope  = std::exchange(scope_, std::nullopt);
    const bool           stashedMarker = extensionMarker_;
    const auto           restore       = [&] {
        scope_           = std::move(stashedScope);
        extensionMarker_ = stashedMarker;
    };

    llvm::Expected<per::LengthChunk> chunk = per::readLengthDeterminant(view_, std::nullopt, std::nullopt);
    if (!chunk)
    {
        restore();
        return chunk.takeError();
    }
    trace(TraceLevel::Verbose, "open type of " + llvm::Twine(chunk->length) + " octets");

    if (!chunk->fragment)
    {
        llvm::Expected<Bits> content = view_.subView(chunk->length * kBitsPerByte);
        if (!content)
        {
            restore();
            return content.takeError();
        }
        Bits parent = view_;
        view_       = *content;
        llvm::Error err = body();
        view_           = parent;
        restore();
        if (err)
        {
            return err;
        }
        // Trailing content the payload did not consume is skipped.
        return view_.advance(chunk->length * kBitsPerByte);
    }

    std::vector<std::uint8_t> assembled;
    per::LengthChunk          current = *chunk;
    while (true)
    {
        if (assembled.size() + current.length > config_.maxDecodedLength)
        {
            restore();
            return makeUnsupportedOperation("decoded length exceeds the configured limit");
        }
        if (current.length * kBitsPerByte > view_.bitsRemaining())
        {
            restore();
            return makeEndOfStream();
        }
        const std::size_t offset = assembled.size();
        assembled.resize(offset + current.length, 0U);
        if (llvm::Error err = view_.readBits(llvm::MutableArrayRef<std::uint8_t>(assembled).slice(offset, current.length)))
        {
            restore();
            return err;
        }
        if (!current.fragment)
        {
            break;
        }
        llvm::Expected<per::LengthChunk> next = per::readLengthDeterminant(view_, std::nullopt, std::nullopt);
        if (!next)
        {
            restore();
            return next.takeError();
        }
        current = *next;
    }

    Bits parent     = view_;
    view_           = Bits(assembled, assembled.size() * kBitsPerByte);
    llvm::Error err = body();
    view_           = parent;
    restore();
    return err;
}

llvm::Error UperReader::readNull()
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    return decodeContent(*openType, [] { return llvm::Error::success(); });
}

llvm::Expected<bool> UperReader::readBoolean()
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    bool result = false;
    if (llvm::Error err = decodeContent(*openType, [&]() -> llvm::Error {
            llvm::Expected<bool> bit = view_.readBit();
            if (!bit)
            {
                return bit.takeError();
            }
            result = *bit;
            return llvm::Error::success();
        }))
    {
        return std::move(err);
    }
    return result;
}

llvm::Expected<std::int64_t> UperReader::readInteger(const Constraint& constraint)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    std::int64_t result = 0;
    if (llvm::Error err = decodeContent(*openType, [&]() -> llvm::Error {
            llvm::Expected<std::int64_t> value =
                per::readInteger(view_, constraint.lower, constraint.upper, constraint.extensible);
            if (!value)
            {
                return value.takeError();
            }
            result = *value;
            return llvm::Error::success();
        }))
    {
        return std::move(err);
    }
    return result;
}

llvm::Expected<std::uint64_t> UperReader::readEnumerated(const Constraint& constraint)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    std::uint64_t result = 0;
    if (llvm::Error err = decodeContent(*openType, [&]() -> llvm::Error {
            llvm::Expected<std::uint64_t> index =
                per::readChoiceIndex(view_, constraint.standardCount(), constraint.extensible);
            if (!index)
            {
                return index.takeError();
            }
            if (*index >= constraint.count)
            {
                return makeInvalidChoiceIndex(*index, constraint.count);
            }
            result = *index;
            return llvm::Error::success();
        }))
    {
        return std::move(err);
    }
    return result;
}

llvm::Expected<std::vector<std::uint8_t>> UperReader::readOctetString(const Constraint& constraint)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    std::vector<std::uint8_t> result;
    if (llvm::Error err = decodeContent(*openType, [&]() -> llvm::Error {
            llvm::Expected<std::vector<std::uint8_t>> value = per::readOctetString(view_,
                                                                                    constraint.lowerSize(),
                                                                                    constraint.upperSize(),
                                                                                    constraint.extensible,
                                                                                    config_.maxDecodedLength);
            if (!value)
            {
                return value.takeError();
            }
            result = std::move(*value);
            return llvm::Error::success();
        }))
    {
        return std::move(err);
    }
    return result;
}

llvm::Expected<per::BitStringData> UperReader::readBitString(const Constraint& constraint)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    per::BitStringData result;
    if (llvm::Error err = decodeContent(*openType, [&]() -> llvm::Error {
            llvm::Expected<per::BitStringData> value = per::readBitString(view_,
                                                                          constraint.lowerSize(),
                                                                          constraint.upperSize(),
                                                                          constraint.extensible,
                                                                          config_.maxDecodedLength);
            if (!value)
            {
                return value.takeError();
            }
            result = std::move(*value);
            return llvm::Error::success();
        }))
    {
        return std::move(err);
    }
    return result;
}

llvm::Expected<std::string> UperReader::readCharacterString(const Constraint& constraint)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    std::string result;
    if (llvm::Error err = decodeContent(*openType, [&]() -> llvm::Error {
            llvm::Expected<std::string> value = per::readCharacterString(view_,
                                                                         constraint.charset,
                                                                         constraint.lowerSize(),
                                                                         constraint.upperSize(),
                                                                         constraint.extensible,
                                                                         config_.maxDecodedLength);
            if (!value)
            {
                return value.takeError();
            }
            result = std::move(*value);
            return llvm::Error::success();
        }))
    {
        return std::move(err);
    }
    return result;
}

llvm::Error UperReader::visitSequence(const Constraint& constraint, FieldReader body)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    if (llvm::Error err = enterNested())
    {
        return err;
    }
    NestingGuard nesting(depth_);

    return decodeContent(*openType, [&]() -> llvm::Error {
        trace(TraceLevel::Basic, "enter " + llvm::Twine(constraint.str()));
        bool marker = false;
        if (constraint.extensible)
        {
            llvm::Expected<bool> bit = view_.readBit();
            if (!bit)
            {
                return bit.takeError();
            }
            marker = *bit;
        }
        if (marker && !constraint.hasExtensionFields())
        {
            return makeInvalidExtensionConstellation(false, true);
        }

        const BitRange presence{view_.position(), view_.position() + constraint.optionalStandardFields};
        if (llvm::Error err = view_.advance(constraint.optionalStandardFields))
        {
            return err;
        }

        std::optional<Scope> parentScope  = std::exchange(scope_, std::nullopt);
        const bool           parentMarker = extensionMarker_;
        if (constraint.extensible)
        {
            scope_ = Scope::extensibleSequence(presence, constraint.standardCount(), constraint.extensionCount());
        }
        else
        {
            scope_ = Scope::optBitField(presence);
        }
        extensionMarker_ = marker;

        llvm::Error err = body(*this);
        if (!err)
        {
            err = closeSequence();
        }
        scope_           = std::move(parentScope);
        extensionMarker_ = parentMarker;
        trace(TraceLevel::Basic, "leave " + llvm::Twine(constraint.str()));
        return err;
    });
}

llvm::Error UperReader::visitSequenceOf(const Constraint& constraint, IndexedReader element)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    if (llvm::Error err = enterNested())
    {
        return err;
    }
    NestingGuard nesting(depth_);

    return decodeContent(*openType, [&]() -> llvm::Error {
        trace(TraceLevel::Basic, "enter " + llvm::Twine(constraint.str()));
        std::optional<Scope> parentScope = std::exchange(scope_, std::nullopt);
        std::uint64_t        index       = 0;
        const auto           consume     = [&](const std::uint64_t count) -> llvm::Error {
            for (std::uint64_t i = 0; i < count; ++i)
            {
                if (llvm::Error failure = element(*this, index++))
                {
                    return failure;
                }
            }
            return llvm::Error::success();
        };
        llvm::Error err = per::readSizedContent(view_,
                                                constraint.lowerSize(),
                                                constraint.upperSize(),
                                                constraint.extensible,
                                                0U,
                                                config_.maxDecodedLength,
                                                consume);
        scope_          = std::move(parentScope);
        return err;
    });
}

llvm::Error UperReader::visitChoice(const Constraint& constraint, IndexedReader payload)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    if (llvm::Error err = enterNested())
    {
        return err;
    }
    NestingGuard nesting(depth_);

    return decodeContent(*openType, [&]() -> llvm::Error {
        const std::uint64_t           standard = constraint.standardCount();
        llvm::Expected<std::uint64_t> index    = per::readChoiceIndex(view_, standard, constraint.extensible);
        if (!index)
        {
            return index.takeError();
        }
        if (*index >= constraint.count)
        {
            return makeInvalidChoiceIndex(*index, constraint.count);
        }
        trace(TraceLevel::Basic, "choice " + llvm::Twine(constraint.str()) + " alternative " + llvm::Twine(*index));

        std::optional<Scope> parentScope  = std::exchange(scope_, std::nullopt);
        const std::uint64_t  alternative  = *index;
        llvm::Error          err          = decodeContent(alternative >= standard, [&] { return payload(*this, alternative); });
        scope_                            = std::move(parentScope);
        return err;
    });
}

llvm::Error UperReader::visitOpt(FieldReader value, bool& present)
{
    llvm::Expected<SlotRead> slot = claimSlot(true);
    if (!slot)
    {
        return slot.takeError();
    }
    present = slot->present;
    if (!present)
    {
        return llvm::Error::success();
    }
    claimedSlot_    = slot->openType;
    llvm::Error err = value(*this);
    claimedSlot_.reset();
    return err;
}

}  // namespace llvmasn1
