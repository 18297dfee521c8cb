// ecrec: Ethereum ECRECOVER precompile
// Copyright 2026 The ecrec Authors.
// SPDX-License-Identifier: Apache-2.0

#include <ecrec/recoverer.hpp>
#include <ecrec/libsecp256k1.hpp>
#include <ethash/keccak.hpp>
#include <cstring>

namespace ecrec
{
const SignatureRecoverer& default_recoverer() noexcept
{
#if ECREC_LOW_S_NORMALIZATION
    static const NormalizingRecoverer recoverer;
#else
    static const Libsecp256k1Recoverer recoverer;
#endif
    return recoverer;
}

evmc::address to_address(std::span<const uint8_t, 64> pubkey) noexcept
{
    // This performs Ethereum's address hashing on an uncompressed pubkey.
    const auto hashed = ethash::keccak256(pubkey.data(), pubkey.size());
    evmc::address ret{};
    std::memcpy(ret.bytes, hashed.bytes + 12, sizeof(ret.bytes));
    return ret;
}

std::optional<evmc::bytes32> ecrecover(std::span<const uint8_t, 64> signature,
    uint8_t recovery_id, std::span<const uint8_t, 32> hash) noexcept
{
    const auto result = default_recoverer().recover(signature, recovery_id, hash);
    const auto* const address = std::get_if<evmc::address>(&result);
    if (address == nullptr)
        return std::nullopt;

    evmc::bytes32 word{};
    std::memcpy(&word.bytes[12], address->bytes, sizeof(address->bytes));
    return word;
}
}  // namespace ecrec
