//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// UPER decoder facade consumed by per-type bindings.
///
/// The reader mirrors `UperWriter`: bindings call one `read*` method per
/// value in schema order. It borrows the encoded bytes and never copies
/// them, except to reassemble fragmented open types.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_UPER_UPER_READER_H
#define LLVMASN1_UPER_UPER_READER_H

#include "llvmasn1/Model/Constraint.h"
#include "llvmasn1/Runtime/BitBuffer.h"
#include "llvmasn1/Runtime/PackedEncoding.h"
#include "llvmasn1/Support/CodecConfig.h"
#include "llvmasn1/Uper/Scope.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace llvmasn1
{

/// @brief Extracts `T` from `llvm::Expected<T>`.
template <typename T>
struct ExpectedValue;

template <typename T>
struct ExpectedValue<llvm::Expected<T>>
{
    using type = T;
};

class UperReader;

/// @brief Reads the fields of a SEQUENCE.
using FieldReader = llvm::function_ref<llvm::Error(UperReader&)>;

/// @brief Reads element `index` of a SEQUENCE OF, or the payload of CHOICE alternative `index`.
using IndexedReader = llvm::function_ref<llvm::Error(UperReader&, std::uint64_t index)>;

/// @brief Decoder for one UPER message.
class UperReader final
{
public:
    /// @brief Creates a reader over `bitLength` bits of `bytes`.
    /// @param[in] bytes Encoded message; must outlive the reader.
    /// @param[in] bitLength Meaningful bits; trailing padding is not read.
    /// @param[in] config Limits and trace level.
    /// @param[in] trace Trace destination; nothing is traced when null.
    UperReader(llvm::ArrayRef<std::uint8_t> bytes,
               std::size_t                  bitLength,
               CodecConfig                  config = {},
               llvm::raw_ostream*           trace  = nullptr);

    llvm::Error                               readNull();
    llvm::Expected<bool>                      readBoolean();
    llvm::Expected<std::int64_t>              readInteger(const Constraint& constraint);
    llvm::Expected<std::uint64_t>             readEnumerated(const Constraint& constraint);
    llvm::Expected<std::vector<std::uint8_t>> readOctetString(const Constraint& constraint);
    llvm::Expected<per::BitStringData>        readBitString(const Constraint& constraint);
    llvm::Expected<std::string>               readCharacterString(const Constraint& constraint);

    /// @brief Reads a SEQUENCE or SET, running `body` once for its fields.
    ///
    /// Unknown extension fields present in the encoding are skipped after
    /// `body` returns.
    llvm::Error visitSequence(const Constraint& constraint, FieldReader body);

    /// @brief Reads a SEQUENCE OF or SET OF, running `element` once per element.
    llvm::Error visitSequenceOf(const Constraint& constraint, IndexedReader element);

    /// @brief Reads a CHOICE index and runs `payload` with it.
    llvm::Error visitChoice(const Constraint& constraint, IndexedReader payload);

    /// @brief Reads an OPTIONAL field, running `value` only when it is present.
    llvm::Error visitOpt(FieldReader value, bool& present);

    /// @brief Typed form of `visitSequence`; `body` returns `llvm::Expected<T>`.
    template <typename F>
    auto readSequence(const Constraint& constraint, F&& body) -> std::invoke_result_t<F&, UperReader&>
    {
        using Result = std::invoke_result_t<F&, UperReader&>;
        std::optional<typename ExpectedValue<Result>::type> result;
        if (llvm::Error err = visitSequence(constraint, [&](UperReader& reader) -> llvm::Error {
                Result value = body(reader);
                if (!value)
                {
                    return value.takeError();
                }
                result.emplace(std::move(*value));
                return llvm::Error::success();
            }))
        {
            return std::move(err);
        }
        return std::move(*result);
    }

    /// @brief Typed form of `visitSequenceOf`; `element` returns `llvm::Expected<T>`.
    template <typename F>
    auto readSequenceOf(const Constraint& constraint, F&& element)
        -> llvm::Expected<std::vector<typename ExpectedValue<std::invoke_result_t<F&, UperReader&>>::type>>
    {
        using Result = std::invoke_result_t<F&, UperReader&>;
        std::vector<typename ExpectedValue<Result>::type> out;
        if (llvm::Error err = visitSequenceOf(constraint, [&](UperReader& reader, std::uint64_t) -> llvm::Error {
                Result value = element(reader);
                if (!value)
                {
                    return value.takeError();
                }
                out.push_back(std::move(*value));
                return llvm::Error::success();
            }))
        {
            return std::move(err);
        }
        return std::move(out);
    }

    /// @brief Typed form of `visitChoice`; `payload(reader, index)` returns `llvm::Expected<T>`.
    template <typename F>
    auto readChoice(const Constraint& constraint, F&& payload) -> std::invoke_result_t<F&, UperReader&, std::uint64_t>
    {
        using Result = std::invoke_result_t<F&, UperReader&, std::uint64_t>;
        std::optional<typename ExpectedValue<Result>::type> result;
        if (llvm::Error err = visitChoice(constraint, [&](UperReader& reader, const std::uint64_t index) -> llvm::Error {
                Result value = payload(reader, index);
                if (!value)
                {
                    return value.takeError();
                }
                result.emplace(std::move(*value));
                return llvm::Error::success();
            }))
        {
            return std::move(err);
        }
        return std::move(*result);
    }

    /// @brief Typed form of `visitOpt`; yields `std::nullopt` for an absent field.
    template <typename F>
    auto readOpt(F&& value)
        -> llvm::Expected<std::optional<typename ExpectedValue<std::invoke_result_t<F&, UperReader&>>::type>>
    {
        using Result = std::invoke_result_t<F&, UperReader&>;
        std::optional<typename ExpectedValue<Result>::type> result;
        bool                                                present = false;
        if (llvm::Error err = visitOpt(
                [&](UperReader& reader) -> llvm::Error {
                    Result decoded = value(reader);
                    if (!decoded)
                    {
                        return decoded.takeError();
                    }
                    result.emplace(std::move(*decoded));
                    return llvm::Error::success();
                },
                present))
        {
            return std::move(err);
        }
        return std::move(result);
    }

    /// @brief Absolute position of the next bit to read.
    [[nodiscard]] std::size_t position() const
    {
        return view_.position();
    }

    [[nodiscard]] std::size_t bitsRemaining() const
    {
        return view_.bitsRemaining();
    }

private:
    struct SlotRead final
    {
        bool present{true};
        bool openType{false};
    };

    llvm::Expected<SlotRead> claimSlot(bool optional);

    /// @brief Consumes the slot of a mandatory field, or the one `visitOpt` claimed.
    /// @return Whether the content is open-type wrapped.
    llvm::Expected<bool> enterField();

    llvm::Error openExtensions();
    llvm::Error closeSequence();

    /// @brief Runs `body` on the content, inside a bounded sub-view for open types.
    llvm::Error decodeContent(bool openType, llvm::function_ref<llvm::Error()> body);

    llvm::Error enterNested();
    void        trace(TraceLevel level, const llvm::Twine& message) const;

    Bits                 view_;
    std::optional<Scope> scope_;
    bool                 extensionMarker_{false};
    std::optional<bool>  claimedSlot_;
    CodecConfig          config_;
    llvm::raw_ostream*   trace_;
    std::uint32_t        depth_{0};
};

}  // namespace llvmasn1

#endif  // LLVMASN1_UPER_UPER_READER_H
