//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the UPER encoder facade.
///
//===----------------------------------------------------------------------===//

#include "llvmasn1/Uper/UperWriter.h"

#include "llvmasn1/Runtime/CharacterString.h"
#include "llvmasn1/Runtime/PackedEncoding.h"
#include "llvmasn1/Support/CodecError.h"

#include "NestingGuard.h"

#include <utility>

namespace llvmasn1
{

UperWriter::UperWriter(CodecConfig config, llvm::raw_ostream* trace)
    : config_(config)
    , trace_(trace)
{
}

std::vector<std::uint8_t> UperWriter::takeBytes()
{
    scope_.reset();
    claimedSlot_.reset();
    return buffer_.takeContent();
}

void UperWriter::trace(const TraceLevel level, const llvm::Twine& message) const
{
    if (trace_ == nullptr || config_.traceLevel == TraceLevel::Off || level > config_.traceLevel)
    {
        return;
    }
    *trace_ << "[asn1uper] write @" << buffer_.writePosition() << ": " << message << "\n";
}

llvm::Error UperWriter::enterNested()
{
    if (depth_ >= config_.maxNestingDepth)
    {
        return makeUnsupportedOperation("container nesting exceeds the configured depth");
    }
    return llvm::Error::success();
}

llvm::Expected<bool> UperWriter::claimSlot(const bool optional, const bool present)
{
    if (!scope_)
    {
        return false;
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
    if (step->action == SlotStep::Action::PresenceBit)
    {
        if (llvm::Error err = buffer_.setBitAt(step->bitPosition, present))
        {
            return std::move(err);
        }
    }
    return step->openType;
}

llvm::Expected<bool> UperWriter::enterField()
{
    if (claimedSlot_)
    {
        const bool openType = *claimedSlot_;
        claimedSlot_.reset();
        return openType;
    }
    return claimSlot(false, true);
}

llvm::Error UperWriter::openExtensions()
{
    const std::size_t   header = buffer_.writePosition();
    const std::uint64_t count  = scope_->numberOfExtFields();
    if (llvm::Error err = per::writeNormallySmallNonNegativeWholeNumber(buffer_, count - 1U))
    {
        return err;
    }
    const BitRange presence{buffer_.writePosition(), buffer_.writePosition() + count};
    for (std::uint64_t i = 0; i < count; ++i)
    {
        buffer_.writeBit(false);
    }
    scope_->enterExtensions(header, presence, false);
    trace(TraceLevel::Verbose, "extension block with " + llvm::Twine(count) + " presence bits");
    return llvm::Error::success();
}

llvm::Error UperWriter::closeSequence(const std::optional<std::size_t> marker)
{
    const std::optional<std::size_t> header = scope_->extensionHeader();
    if (!marker || !header)
    {
        return llvm::Error::success();
    }

    const BitRange reserved = scope_->reserved();
    bool           any      = false;
    for (std::size_t bit = reserved.begin; bit < reserved.end && !any; ++bit)
    {
        llvm::Expected<bool> present = buffer_.bitAt(bit);
        if (!present)
        {
            return present.takeError();
        }
        any = *present;
    }
    if (!any)
    {
        // No extension was present: encode as if the block did not exist.
        buffer_.truncate(*header);
        trace(TraceLevel::Verbose, "extension block dropped");
        return llvm::Error::success();
    }
    return buffer_.setBitAt(*marker, true);
}

llvm::Error UperWriter::encodeContent(const bool openType, llvm::function_ref<llvm::Error()> body)
{
    if (!openType)
    {
        return body();
    }

    std::optional<Scope> stashedScope = std::exchange(scope_, std::nullopt);
    BitBuffer            parent       = std::move(buffer_);
    buffer_                           = BitBuffer();

    llvm::Error err = body();

    BitBuffer scratch = std::move(buffer_);
    buffer_           = std::move(parent);
    scope_            = std::move(stashedScope);
    if (err)
    {
        return err;
    }

    trace(TraceLevel::Verbose, "open type of " + llvm::Twine(scratch.writePosition()) + " bits");
    if (scratch.writePosition() == 0U)
    {
        // An empty encoding still occupies one octet.
        const std::uint8_t zero = 0U;
        return per::writeOpenType(buffer_, llvm::ArrayRef<std::uint8_t>(zero));
    }
    return per::writeOpenType(buffer_, scratch.content());
}

llvm::Error UperWriter::writeNull()
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    return encodeContent(*openType, [] { return llvm::Error::success(); });
}

llvm::Error UperWriter::writeBoolean(const bool value)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    return encodeContent(*openType, [this, value] {
        buffer_.writeBit(value);
        return llvm::Error::success();
    });
}

llvm::Error UperWriter::writeInteger(const Constraint& constraint, const std::int64_t value)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    return encodeContent(*openType, [&] {
        return per::writeInteger(buffer_, constraint.lower, constraint.upper, constraint.extensible, value);
    });
}

llvm::Error UperWriter::writeEnumerated(const Constraint& constraint, const std::uint64_t index)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    return encodeContent(*openType, [&]() -> llvm::Error {
        if (index >= constraint.count)
        {
            return makeInvalidChoiceIndex(index, constraint.count);
        }
        return per::writeChoiceIndex(buffer_, constraint.standardCount(), constraint.extensible, index);
    });
}

llvm::Error UperWriter::writeOctetString(const Constraint& constraint, llvm::ArrayRef<std::uint8_t> value)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    return encodeContent(*openType, [&] {
        return per::writeOctetString(buffer_, constraint.lowerSize(), constraint.upperSize(), constraint.extensible, value);
    });
}

llvm::Error UperWriter::writeBitString(const Constraint&            constraint,
                                       llvm::ArrayRef<std::uint8_t> value,
                                       const std::uint64_t          bitLength)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    return encodeContent(*openType, [&] {
        return per::writeBitString(buffer_,
                                   constraint.lowerSize(),
                                   constraint.upperSize(),
                                   constraint.extensible,
                                   value,
                                   bitLength);
    });
}

llvm::Error UperWriter::writeCharacterString(const Constraint& constraint, llvm::StringRef value)
{
    llvm::Expected<bool> openType = enterField();
    if (!openType)
    {
        return openType.takeError();
    }
    return encodeContent(*openType, [&] {
        return per::writeCharacterString(buffer_,
                                         constraint.charset,
                                         constraint.lowerSize(),
                                         constraint.upperSize(),
                                         constraint.extensible,
                                         value);
    });
}

llvm::Error UperWriter::writeSequence(const Constraint& constraint, FieldWriter body)
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

    return encodeContent(*openType, [&]() -> llvm::Error {
        trace(TraceLevel::Basic, "enter " + llvm::Twine(constraint.str()));
        std::optional<Scope> parentScope = std::exchange(scope_, std::nullopt);

        std::optional<std::size_t> marker;
        if (constraint.extensible)
        {
            marker = buffer_.writePosition();
            buffer_.writeBit(false);
        }
        const BitRange presence{buffer_.writePosition(), buffer_.writePosition() + constraint.optionalStandardFields};
        for (std::uint64_t i = 0; i < constraint.optionalStandardFields; ++i)
        {
            buffer_.writeBit(false);
        }
        if (constraint.extensible)
        {
            scope_ = Scope::extensibleSequence(presence, constraint.standardCount(), constraint.extensionCount());
        }
        else
        {
            scope_ = Scope::optBitField(presence);
        }

        llvm::Error err = body(*this);
        if (!err)
        {
            err = closeSequence(marker);
        }
        scope_ = std::move(parentScope);
        trace(TraceLevel::Basic, "leave " + llvm::Twine(constraint.str()));
        return err;
    });
}

llvm::Error UperWriter::writeSequenceOf(const Constraint& constraint, const std::uint64_t count, ElementWriter element)
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

    return encodeContent(*openType, [&]() -> llvm::Error {
        trace(TraceLevel::Basic, "enter " + llvm::Twine(constraint.str()) + " with " + llvm::Twine(count) + " elements");
        std::optional<Scope> parentScope = std::exchange(scope_, std::nullopt);
        const auto emit = [&](const std::uint64_t offset, const std::uint64_t chunk) -> llvm::Error {
            for (std::uint64_t i = offset; i < offset + chunk; ++i)
            {
                if (llvm::Error failure = element(*this, i))
                {
                    return failure;
                }
            }
            return llvm::Error::success();
        };
        llvm::Error err = per::writeSizedContent(buffer_,
                                                 constraint.lowerSize(),
                                                 constraint.upperSize(),
                                                 constraint.extensible,
                                                 count,
                                                 emit);
        scope_ = std::move(parentScope);
        return err;
    });
}

llvm::Error UperWriter::writeChoice(const Constraint& constraint, const std::uint64_t index, FieldWriter payload)
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

    return encodeContent(*openType, [&]() -> llvm::Error {
        if (index >= constraint.count)
        {
            return makeInvalidChoiceIndex(index, constraint.count);
        }
        const std::uint64_t standard = constraint.standardCount();
        if (llvm::Error err = per::writeChoiceIndex(buffer_, standard, constraint.extensible, index))
        {
            return err;
        }
        trace(TraceLevel::Basic, "choice " + llvm::Twine(constraint.str()) + " alternative " + llvm::Twine(index));

        std::optional<Scope> parentScope = std::exchange(scope_, std::nullopt);
        llvm::Error err = encodeContent(index >= standard, [&] { return payload(*this); });
        scope_          = std::move(parentScope);
        return err;
    });
}

llvm::Error UperWriter::writeOpt(const bool present, FieldWriter value)
{
    llvm::Expected<bool> openType = claimSlot(true, present);
    if (!openType)
    {
        return openType.takeError();
    }
    if (!present)
    {
        return llvm::Error::success();
    }
    claimedSlot_    = *openType;
    llvm::Error err = value(*this);
    claimedSlot_.reset();
    return err;
}

}  // namespace llvmasn1
