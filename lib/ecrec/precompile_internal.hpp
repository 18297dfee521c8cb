// ecrec: Ethereum ECRECOVER precompile
// Copyright 2026 The ecrec Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ecrec/ecrec.hpp>

namespace ecrec
{
/// The gas cost and the output buffer requirement of a precompile call.
struct PrecompileAnalysis
{
    int64_t gas_cost;
    size_t max_output_size;
};

/// The status code and the output size produced by a precompile execution.
struct ExecutionResult
{
    evmc_status_code status_code;
    size_t output_size;
};

PrecompileAnalysis ecrecover_analyze(bytes_view input) noexcept;

/// Executes ECRECOVER with the given backend. The gas must have already been charged.
///
/// The @p output buffer must have at least ECRECOVER_OUTPUT_SIZE bytes.
ExecutionResult ecrecover_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    size_t output_size, const SignatureRecoverer& recoverer) noexcept;

/// Executes ECRECOVER with the default backend.
ExecutionResult ecrecover_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
}  // namespace ecrec
