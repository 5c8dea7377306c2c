//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Scoped container depth counter shared by the UPER writer and reader.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMASN1_LIB_UPER_NESTING_GUARD_H
#define LLVMASN1_LIB_UPER_NESTING_GUARD_H

#include <cstdint>

namespace llvmasn1
{

/// @brief Increments a depth counter for the lifetime of one container.
class NestingGuard final
{
public:
    explicit NestingGuard(std::uint32_t& depth)
        : depth_(depth)
    {
        ++depth_;
    }

    ~NestingGuard()
    {
        --depth_;
    }

    NestingGuard(const NestingGuard&)            = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

private:
    std::uint32_t& depth_;
};

}  // namespace llvmasn1

#endif  // LLVMASN1_LIB_UPER_NESTING_GUARD_H
