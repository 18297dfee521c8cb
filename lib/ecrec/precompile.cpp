// ecrec: Ethereum ECRECOVER precompile
// Copyright 2026 The ecrec Authors.
// SPDX-License-Identifier: Apache-2.0

#include "precompile_internal.hpp"
#include <intx/intx.hpp>
#include <algorithm>
#include <array>
#include <cassert>
#include <cstring>

namespace ecrec
{
namespace
{
/// Copies the input to the fixed-size buffer. Shorter input is padded with zeros,
/// longer input is truncated.
template <size_t N>
std::array<uint8_t, N> right_pad(const uint8_t* data, size_t size) noexcept
{
    std::array<uint8_t, N> buffer{};
    if (size != 0)
        std::memcpy(buffer.data(), data, std::min(size, N));
    return buffer;
}
}  // namespace

PrecompileAnalysis ecrecover_analyze(bytes_view /*input*/) noexcept
{
    return {static_cast<int64_t>(ECRECOVER_BASE_COST), ECRECOVER_OUTPUT_SIZE};
}

ExecutionResult ecrecover_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size, const SignatureRecoverer& recoverer) noexcept
{
    assert(output_size >= ECRECOVER_OUTPUT_SIZE);

    const auto input_buffer = right_pad<ECRECOVER_INPUT_SIZE>(input, input_size);
    const std::span<const uint8_t, ECRECOVER_INPUT_SIZE> in{input_buffer};

    // The v must be the 32-byte big-endian word equal to 27 or 28.
    const auto v = intx::be::unsafe::load<intx::uint256>(&input_buffer[32]);
    if (v != 27 && v != 28)
        return {EVMC_SUCCESS, 0};

    const auto hash = in.subspan<0, 32>();
    const auto recovery_id = static_cast<uint8_t>(input_buffer[63] - 27);
    const auto signature = in.subspan<64, 64>();

    // Any recovery failure is a successful execution with empty output.
    const auto result = recoverer.recover(signature, recovery_id, hash);
    const auto* const address = std::get_if<evmc::address>(&result);
    if (address == nullptr)
        return {EVMC_SUCCESS, 0};

    std::memset(output, 0, 12);
    std::memcpy(output + 12, address->bytes, sizeof(address->bytes));
    return {EVMC_SUCCESS, ECRECOVER_OUTPUT_SIZE};
}

ExecutionResult ecrecover_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept
{
    return ecrecover_execute(input, input_size, output, output_size, default_recoverer());
}

PrecompileOutput ecrecover_run(bytes_view input, uint64_t gas_limit)
{
    return ecrecover_run(input, gas_limit, default_recoverer());
}

PrecompileOutput ecrecover_run(
    bytes_view input, uint64_t gas_limit, const SignatureRecoverer& recoverer)
{
    const auto [gas_cost, max_output_size] = ecrecover_analyze(input);
    if (gas_limit < static_cast<uint64_t>(gas_cost))
        return {EVMC_OUT_OF_GAS, 0, {}};

    uint8_t output_buf[ECRECOVER_OUTPUT_SIZE];
    const auto [status_code, output_size] =
        ecrecover_execute(input.data(), input.size(), output_buf, max_output_size, recoverer);
    return {status_code, static_cast<uint64_t>(gas_cost), bytes(output_buf, output_size)};
}

evmc::Result call_ecrecover(const evmc_message& msg) noexcept
{
    const bytes_view input{msg.input_data, msg.input_size};
    const auto [gas_cost, max_output_size] = ecrecover_analyze(input);
    const auto gas_left = msg.gas - gas_cost;
    if (gas_left < 0)
        return evmc::Result{EVMC_OUT_OF_GAS};

    uint8_t output_buf[ECRECOVER_OUTPUT_SIZE];
    const auto [status_code, output_size] =
        ecrecover_execute(msg.input_data, msg.input_size, output_buf, max_output_size);
    return evmc::Result{
        status_code, status_code == EVMC_SUCCESS ? gas_left : 0, 0, output_buf, output_size};
}
}  // namespace ecrec
