// SPDX-License-Identifier: Apache-2.0
// ----------------------------------------------------------------------------
// Copyright 2021 Arm Limited
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not
// use this file except in compliance with the License. You may obtain a copy
// of the License at:
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
// WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
// License for the specific language governing permissions and limitations
// under the License.
// ----------------------------------------------------------------------------

/**
 * @brief Unit tests for the numeric quantizer.
 */

#include <cmath>
#include <limits>

#include "gtest/gtest.h"

#include "../bcenc_internal.h"

namespace bcenc
{

/** @brief Test every UNORM code survives a round trip, for common widths. */
TEST(quantization, UNormRoundTrip)
{
	const unsigned int widths[] { 1, 2, 4, 5, 6, 8, 10, 16 };
	for (unsigned int bits : widths)
	{
		uint32_t mask = (1u << bits) - 1;
		for (uint32_t code = 0; code <= mask; code++)
		{
			float value = bcn::unorm_to_float(code, mask);
			EXPECT_EQ(bcn::float_to_unorm(value, mask), code) << bits << "-bit code " << code;
		}
	}
}

/** @brief Test UNORM encoding is within half a step of the input. */
TEST(quantization, UNormErrorBound)
{
	uint32_t mask = 0x1F;
	for (int i = 0; i <= 1000; i++)
	{
		float value = static_cast<float>(i) / 1000.0f;
		uint32_t code = bcn::float_to_unorm(value, mask);
		float decoded = bcn::unorm_to_float(code, mask);
		EXPECT_LE(std::fabs(decoded - value), 0.5f / 31.0f + 1e-6f);
	}
}

/** @brief Test UNORM encoding clamps out of range values. */
TEST(quantization, UNormClamp)
{
	EXPECT_EQ(bcn::float_to_unorm(-0.5f, 0xFF), 0u);
	EXPECT_EQ(bcn::float_to_unorm(2.0f, 0xFF), 255u);
	EXPECT_EQ(bcn::float_to_unorm(std::numeric_limits<float>::infinity(), 0xFF), 255u);
	EXPECT_EQ(bcn::float_to_unorm(-std::numeric_limits<float>::infinity(), 0xFF), 0u);
}

/** @brief Test UNORM rounding is to nearest, with ties away from zero. */
TEST(quantization, UNormRounding)
{
	EXPECT_EQ(bcn::float_to_unorm(0.5f, 0x1), 1u);
	EXPECT_EQ(bcn::float_to_unorm(0.5f, 0x3), 2u);
	EXPECT_EQ(bcn::float_to_unorm(1.4f / 255.0f, 0xFF), 1u);
	EXPECT_EQ(bcn::float_to_unorm(1.6f / 255.0f, 0xFF), 2u);
}

/** @brief Test 32-bit UNORM codes cover the full range. */
TEST(quantization, UNorm32Bit)
{
	EXPECT_EQ(bcn::float_to_unorm(1.0f, 0xFFFFFFFFu), 0xFFFFFFFFu);
	EXPECT_EQ(bcn::float_to_unorm(0.0f, 0xFFFFFFFFu), 0u);
	EXPECT_EQ(bcn::unorm_to_float(0xFFFFFFFFu, 0xFFFFFFFFu), 1.0f);
}

/** @brief Test NaN converts to a zero code. */
TEST(quantization, NaNIsZero)
{
	float nan = std::numeric_limits<float>::quiet_NaN();
	EXPECT_EQ(bcn::float_to_unorm(nan, 0xFF), 0u);
	EXPECT_EQ(bcn::float_to_snorm(nan, 0xFF), 0u);
	EXPECT_EQ(bcn::float_to_uint(nan, 0xFFFF), 0u);
	EXPECT_EQ(bcn::float_to_sint(nan, 0xFFFF), 0u);
}

/** @brief Test SNORM uses a symmetric code range. */
TEST(quantization, SNormSymmetry)
{
	// 5-bit codes: +1 is 0x0F, -1 is 0x11, and 0x10 is never produced
	EXPECT_EQ(bcn::float_to_snorm(1.0f, 0x1F), 0x0Fu);
	EXPECT_EQ(bcn::float_to_snorm(-1.0f, 0x1F), 0x11u);
	EXPECT_EQ(bcn::float_to_snorm(-2.0f, 0x1F), 0x11u);
	EXPECT_EQ(bcn::float_to_snorm(0.0f, 0x1F), 0x00u);
}

/** @brief Test both of the most negative SNORM codes decode to -1. */
TEST(quantization, SNormNegativeOne)
{
	EXPECT_EQ(bcn::snorm_to_float(0x11, 0x1F), -1.0f);
	EXPECT_EQ(bcn::snorm_to_float(0x10, 0x1F), -1.0f);
	EXPECT_EQ(bcn::snorm_to_float(0x80, 0xFF), -1.0f);
	EXPECT_EQ(bcn::snorm_to_float(0x81, 0xFF), -1.0f);
	EXPECT_EQ(bcn::snorm_to_float(0x7F, 0xFF), 1.0f);
}

/** @brief Test every valid SNORM code survives a round trip. */
TEST(quantization, SNormRoundTrip)
{
	const unsigned int widths[] { 5, 8, 16 };
	for (unsigned int bits : widths)
	{
		uint32_t mask = (1u << bits) - 1;
		uint32_t reserved = (mask + 1) >> 1;
		for (uint32_t code = 0; code <= mask; code++)
		{
			if (code == reserved)
			{
				continue;
			}

			float value = bcn::snorm_to_float(code, mask);
			EXPECT_EQ(bcn::float_to_snorm(value, mask), code) << bits << "-bit code " << code;
		}
	}
}

/** @brief Test UINT conversion saturates and rounds ties to even. */
TEST(quantization, UIntConversion)
{
	EXPECT_EQ(bcn::float_to_uint(-5.0f, 0xFF), 0u);
	EXPECT_EQ(bcn::float_to_uint(300.0f, 0xFF), 255u);
	EXPECT_EQ(bcn::float_to_uint(2.5f, 0xFF), 2u);
	EXPECT_EQ(bcn::float_to_uint(3.5f, 0xFF), 4u);
	EXPECT_EQ(bcn::uint_to_float(0x1FF, 0xFF), 255.0f);
}

/** @brief Test SINT conversion saturates, and sign extends on decode. */
TEST(quantization, SIntConversion)
{
	EXPECT_EQ(bcn::float_to_sint(-200.0f, 0xFF), 0x80u);
	EXPECT_EQ(bcn::float_to_sint(200.0f, 0xFF), 0x7Fu);
	EXPECT_EQ(bcn::float_to_sint(-1.0f, 0xFF), 0xFFu);
	EXPECT_EQ(bcn::sint_to_float(0xFF, 0xFF), -1.0f);
	EXPECT_EQ(bcn::sint_to_float(0x80, 0xFF), -128.0f);
	EXPECT_EQ(bcn::sint_to_float(0x80000000u, 0xFFFFFFFFu), -2147483648.0f);
}

/** @brief Test UNORM widening uses bit replication. */
TEST(quantization, UNormWiden)
{
	for (uint32_t c = 0; c < 32; c++)
	{
		EXPECT_EQ(bcn::unorm_widen(c, 5, 8), (c << 3) | (c >> 2));
	}

	for (uint32_t c = 0; c < 64; c++)
	{
		EXPECT_EQ(bcn::unorm_widen(c, 6, 8), (c << 2) | (c >> 4));
	}

	EXPECT_EQ(bcn::unorm_widen(1, 1, 8), 0xFFu);
	EXPECT_EQ(bcn::unorm_widen(0xA, 4, 8), 0xAAu);
	EXPECT_EQ(bcn::unorm_widen(0x2, 2, 10), 0x2AAu);
	EXPECT_EQ(bcn::unorm_widen(0x5A, 8, 8), 0x5Au);
}

}
