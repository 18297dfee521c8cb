// ecrec: Ethereum ECRECOVER precompile
// Copyright 2026 The ecrec Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ecrec/recoverer.hpp>

namespace ecrec
{
/// The recovery backend using libsecp256k1 directly. High s values are accepted.
class Libsecp256k1Recoverer final : public SignatureRecoverer
{
public:
    [[nodiscard]] RecoveryResult recover(std::span<const uint8_t, 64> signature,
        uint8_t recovery_id, std::span<const uint8_t, 32> hash) const noexcept override;
};

/// The recovery backend normalizing signatures to the low-s form before the recovery.
///
/// The recovery id parity is flipped when the normalization changes s.
class NormalizingRecoverer final : public SignatureRecoverer
{
public:
    [[nodiscard]] RecoveryResult recover(std::span<const uint8_t, 64> signature,
        uint8_t recovery_id, std::span<const uint8_t, 32> hash) const noexcept override;
};
}  // namespace ecrec
