// ecrec: Ethereum ECRECOVER precompile
// Copyright 2026 The ecrec Authors.
// SPDX-License-Identifier: Apache-2.0

// Built against the installed-style include path only: no internal headers are visible here.

#include <ecrec/ecrec.hpp>
#include <ecrec/libsecp256k1.hpp>
#include <gtest/gtest.h>
#include <test/utils/utils.hpp>
#include <algorithm>
#include <span>

using namespace ecrec;
using namespace ecrec::test;

namespace
{
const auto VALID_INPUT =
    from_spaced_hex(
        "18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c "
        "000000000000000000000000000000000000000000000000000000000000001c "
        "73b1693892219d736caba55bdb67216e485557ea6b6af75f37096c9aa6a5a75f "
        "eeb940b1d03b21e36b0e47e79769f095fe2ab855bd91e3a38756b7d75a9c4549")
        .value();

constexpr auto EXPECTED_SIGNER = 0xa94f5374fce5edbc8e2a8697c15331677e6ebf0b_address;

/// A caller-defined backend returning a fixed address.
class FixedRecoverer final : public SignatureRecoverer
{
public:
    RecoveryResult recover(std::span<const uint8_t, 64> /*signature*/, uint8_t /*recovery_id*/,
        std::span<const uint8_t, 32> /*hash*/) const noexcept override
    {
        return 0x00000000000000000000000000000000000000ff_address;
    }
};
}  // namespace

TEST(api, explicit_backend)
{
    const auto expected =
        from_spaced_hex("000000000000000000000000 a94f5374fce5edbc8e2a8697c15331677e6ebf0b").value();

    const auto by_default = ecrecover_run(VALID_INPUT, ECRECOVER_BASE_COST, default_recoverer());
    EXPECT_EQ(by_default.status_code, EVMC_SUCCESS);
    EXPECT_EQ(hex(by_default.output), hex(expected));

    const auto plain = ecrecover_run(VALID_INPUT, ECRECOVER_BASE_COST, Libsecp256k1Recoverer{});
    EXPECT_EQ(hex(plain.output), hex(expected));

    const auto normalizing = ecrecover_run(VALID_INPUT, ECRECOVER_BASE_COST, NormalizingRecoverer{});
    EXPECT_EQ(normalizing.status_code, EVMC_SUCCESS);
    EXPECT_EQ(normalizing.gas_used, ECRECOVER_BASE_COST);
    EXPECT_EQ(hex(normalizing.output), hex(expected));
}

TEST(api, custom_backend)
{
    const auto result = ecrecover_run(VALID_INPUT, ECRECOVER_BASE_COST, FixedRecoverer{});
    EXPECT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(hex(result.output),
        "00000000000000000000000000000000000000000000000000000000000000ff");
}

TEST(api, ecrecover_function)
{
    const std::span<const uint8_t, ECRECOVER_INPUT_SIZE> in{VALID_INPUT.data(), VALID_INPUT.size()};
    const auto word = ecrecover(in.subspan<64, 64>(), 1, in.subspan<0, 32>());
    ASSERT_TRUE(word.has_value());

    evmc::address address;
    std::copy_n(&word->bytes[12], sizeof(address.bytes), address.bytes);
    EXPECT_EQ(address, EXPECTED_SIGNER);
}
