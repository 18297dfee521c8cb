// ecrec: Ethereum ECRECOVER precompile
// Copyright 2026 The ecrec Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <optional>
#include <span>
#include <variant>

namespace ecrec
{
/// The reasons the ECDSA public key recovery can fail.
enum class RecoveryError
{
    /// The r or s value is zero, not less than the curve order or otherwise malformed.
    invalid_signature,

    /// No public key exists for the given signature, recovery id and hash.
    recovery_failed,
};

using RecoveryResult = std::variant<evmc::address, RecoveryError>;

/// The secp256k1 ECDSA public key recovery backend.
///
/// Implementations must produce identical results for identical inputs. In particular,
/// a backend normalizing the signature to the low-s form must flip the recovery id parity
/// so that the recovered key is the same as without the normalization.
class SignatureRecoverer
{
public:
    virtual ~SignatureRecoverer() = default;

    /// Recovers the address of the signer of the message hash.
    ///
    /// @param signature    The r and s values as 32-byte big-endian words.
    /// @param recovery_id  The y parity of the R point, 0 or 1.
    /// @param hash         The signed message hash.
    /// @return The address or the recovery error.
    [[nodiscard]] virtual RecoveryResult recover(std::span<const uint8_t, 64> signature,
        uint8_t recovery_id, std::span<const uint8_t, 32> hash) const noexcept = 0;
};

/// Returns the backend selected at build time (see ECREC_LOW_S_NORMALIZATION).
const SignatureRecoverer& default_recoverer() noexcept;

/// Converts the uncompressed public key (without the 0x04 prefix) to the Ethereum address.
evmc::address to_address(std::span<const uint8_t, 64> pubkey) noexcept;

/// Recovers the signer with the default backend.
///
/// @return The address as the 32-byte word with 12 leading zero bytes,
///         or std::nullopt if the recovery fails.
std::optional<evmc::bytes32> ecrecover(std::span<const uint8_t, 64> signature,
    uint8_t recovery_id, std::span<const uint8_t, 32> hash) noexcept;
}  // namespace ecrec
