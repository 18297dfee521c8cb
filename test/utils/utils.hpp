// ecrec: Ethereum ECRECOVER precompile
// Copyright 2026 The ecrec Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace ecrec::test
{
using evmc::bytes;
using evmc::bytes_view;
using evmc::hex;

/// Decodes hex encoded string allowing whitespace between the bytes.
inline std::optional<bytes> from_spaced_hex(std::string_view s)
{
    std::string stripped;
    std::ranges::copy_if(s, std::back_inserter(stripped),
        [](char c) { return std::isspace(static_cast<unsigned char>(c)) == 0; });
    return evmc::from_hex(stripped);
}
}  // namespace ecrec::test
