// ecrec: Ethereum ECRECOVER precompile
// Copyright 2026 The ecrec Authors.
// SPDX-License-Identifier: Apache-2.0

#include <ecrec/libsecp256k1.hpp>
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <algorithm>
#include <cassert>

namespace ecrec
{
namespace
{
bool is_zero(std::span<const uint8_t, 32> word) noexcept
{
    return std::ranges::all_of(word, [](auto b) { return b == 0; });
}

/// Rejects the zero r and s values, the library does the range checks on parsing.
bool has_zero_component(std::span<const uint8_t, 64> sig_bytes) noexcept
{
    return is_zero(sig_bytes.subspan<0, 32>()) || is_zero(sig_bytes.subspan<32, 32>());
}

RecoveryResult recover_address(std::span<const uint8_t, 64> sig_bytes, uint8_t recovery_id,
    std::span<const uint8_t, 32> hash) noexcept
{
    if (recovery_id > 1)
        return RecoveryError::recovery_failed;

    secp256k1_ecdsa_recoverable_signature sig;
    if (secp256k1_ecdsa_recoverable_signature_parse_compact(
            secp256k1_context_static, &sig, sig_bytes.data(), recovery_id) != 1)
        return RecoveryError::invalid_signature;

    secp256k1_pubkey pk;
    if (secp256k1_ecdsa_recover(secp256k1_context_static, &pk, &sig, hash.data()) != 1)
        return RecoveryError::recovery_failed;

    uint8_t pubkey_prefixed[65];
    auto output_length = sizeof(pubkey_prefixed);
    [[maybe_unused]] const auto serialized_ok = secp256k1_ec_pubkey_serialize(
        secp256k1_context_static, pubkey_prefixed, &output_length, &pk, SECP256K1_EC_UNCOMPRESSED);
    assert(serialized_ok == 1);
    assert(output_length == sizeof(pubkey_prefixed));
    return to_address(std::span<const uint8_t, 64>{&pubkey_prefixed[1], 64});
}
}  // namespace

RecoveryResult Libsecp256k1Recoverer::recover(std::span<const uint8_t, 64> signature,
    uint8_t recovery_id, std::span<const uint8_t, 32> hash) const noexcept
{
    if (has_zero_component(signature))
        return RecoveryError::invalid_signature;
    return recover_address(signature, recovery_id, hash);
}

RecoveryResult NormalizingRecoverer::recover(std::span<const uint8_t, 64> signature,
    uint8_t recovery_id, std::span<const uint8_t, 32> hash) const noexcept
{
    if (has_zero_component(signature))
        return RecoveryError::invalid_signature;

    secp256k1_ecdsa_signature sig;
    if (secp256k1_ecdsa_signature_parse_compact(
            secp256k1_context_static, &sig, signature.data()) != 1)
        return RecoveryError::invalid_signature;

    // Returns 1 if the input had high s, i.e. the R point parity of the result is flipped.
    secp256k1_ecdsa_signature normalized;
    const auto normalized_s =
        secp256k1_ecdsa_signature_normalize(secp256k1_context_static, &normalized, &sig) == 1;
    if (normalized_s)
        recovery_id ^= 1;

    uint8_t normalized_bytes[64];
    [[maybe_unused]] const auto serialized_ok = secp256k1_ecdsa_signature_serialize_compact(
        secp256k1_context_static, normalized_bytes, &normalized);
    assert(serialized_ok == 1);
    return recover_address(normalized_bytes, recovery_id, hash);
}
}  // namespace ecrec
