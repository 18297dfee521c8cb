// ecrec: Ethereum ECRECOVER precompile
// Copyright 2026 The ecrec Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ecrec/recoverer.hpp>
#include <evmc/evmc.hpp>
#include <cstdint>

namespace ecrec
{
using evmc::bytes;
using evmc::bytes_view;
using namespace evmc::literals;

/// The address of the ECRECOVER precompiled contract.
constexpr auto ECRECOVER_ADDRESS = 0x0000000000000000000000000000000000000001_address;

/// The fixed gas cost of a single ECRECOVER call.
constexpr uint64_t ECRECOVER_BASE_COST = 3000;

/// The width of the interpreted input: hash, v, r and s as 32-byte words.
constexpr size_t ECRECOVER_INPUT_SIZE = 128;

/// The width of the non-empty output: the address left-padded to a 32-byte word.
constexpr size_t ECRECOVER_OUTPUT_SIZE = 32;

/// The result of the ECRECOVER precompile.
struct PrecompileOutput
{
    /// EVMC_SUCCESS or EVMC_OUT_OF_GAS. Invalid signatures are reported as success
    /// with empty output.
    evmc_status_code status_code = EVMC_SUCCESS;

    /// The gas charged. Zero when the call ran out of gas.
    uint64_t gas_used = 0;

    /// Either empty or ECRECOVER_OUTPUT_SIZE bytes.
    bytes output;
};

/// Executes ECRECOVER with the default signature recovery backend.
PrecompileOutput ecrecover_run(bytes_view input, uint64_t gas_limit);

/// Executes ECRECOVER with the given signature recovery backend.
PrecompileOutput ecrecover_run(
    bytes_view input, uint64_t gas_limit, const SignatureRecoverer& recoverer);

/// Executes the EVMC message addressed to the ECRECOVER precompile.
///
/// The base cost is charged against msg.gas. Running out of gas consumes all gas.
evmc::Result call_ecrecover(const evmc_message& msg) noexcept;
}  // namespace ecrec
