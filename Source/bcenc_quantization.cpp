// SPDX-License-Identifier: Apache-2.0
// ----------------------------------------------------------------------------
// Copyright 2011-2021 Arm Limited
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
 * @brief Functions for converting between floats and integer codes.
 *
 * All intermediate arithmetic uses doubles, which represent every 32-bit code
 * exactly and so avoid overflow when clamping to the full 32-bit range.
 */

#include <cmath>

#include "bcenc_mathlib.h"

/**
 * @brief The midpoint rounding modes used by the quantizer.
 */
enum round_mode
{
	ROUND_TIES_EVEN = 0,
	ROUND_TIES_AWAY
};

/**
 * @brief Round a value to the nearest integer.
 *
 * @param value   The value to round; must be finite.
 * @param mode    The tie breaking rule.
 *
 * @return The rounded value.
 */
static double round_nearest(double value, round_mode mode)
{
	double lo = std::floor(value);
	double diff = value - lo;

	if (diff > 0.5)
	{
		return lo + 1.0;
	}

	if (diff < 0.5)
	{
		return lo;
	}

	if (mode == ROUND_TIES_AWAY)
	{
		return value < 0.0 ? lo : lo + 1.0;
	}

	return std::fmod(lo, 2.0) == 0.0 ? lo : lo + 1.0;
}

/**
 * @brief Clamp a value to a range, and round it to an integer.
 *
 * NaN returns zero, and infinities saturate to the range limits.
 */
static double clamp_and_round(double value, double mn, double mx, round_mode mode)
{
	if (std::isnan(value))
	{
		return 0.0;
	}

	if (value <= mn)
	{
		return mn;
	}

	if (value >= mx)
	{
		return mx;
	}

	return round_nearest(value, mode);
}

/**
 * @brief Get the code value of the sign bit for a bitmask.
 */
static uint64_t sign_bit(uint32_t bitmask)
{
	return (static_cast<uint64_t>(bitmask) + 1) >> 1;
}

/**
 * @brief Sign extend a two's complement code of the bitmask width.
 */
static int64_t sign_extend(uint32_t value, uint32_t bitmask)
{
	int64_t code = value & bitmask;
	if (static_cast<uint64_t>(code) & sign_bit(bitmask))
	{
		code -= static_cast<int64_t>(bitmask) + 1;
	}

	return code;
}

/* Public function, see header file for detailed documentation */
uint32_t bcn::float_to_sint(float value, uint32_t bitmask)
{
	double mx = static_cast<double>(bitmask >> 1);
	double mn = -mx - 1.0;
	double code = clamp_and_round(value, mn, mx, ROUND_TIES_EVEN);
	return static_cast<uint32_t>(static_cast<int64_t>(code)) & bitmask;
}

/* Public function, see header file for detailed documentation */
float bcn::sint_to_float(uint32_t value, uint32_t bitmask)
{
	return static_cast<float>(sign_extend(value, bitmask));
}

/* Public function, see header file for detailed documentation */
uint32_t bcn::float_to_uint(float value, uint32_t bitmask)
{
	double code = clamp_and_round(value, 0.0, static_cast<double>(bitmask), ROUND_TIES_EVEN);
	return static_cast<uint32_t>(code);
}

/* Public function, see header file for detailed documentation */
float bcn::uint_to_float(uint32_t value, uint32_t bitmask)
{
	return static_cast<float>(value & bitmask);
}

/* Public function, see header file for detailed documentation */
uint32_t bcn::float_to_snorm(float value, uint32_t bitmask)
{
	double mx = static_cast<double>(bitmask >> 1);
	double code = clamp_and_round(value * mx, -mx, mx, ROUND_TIES_AWAY);
	return static_cast<uint32_t>(static_cast<int64_t>(code)) & bitmask;
}

/* Public function, see header file for detailed documentation */
float bcn::snorm_to_float(uint32_t value, uint32_t bitmask)
{
	// The most negative code is a duplicate encoding of -1
	if ((value & bitmask) == sign_bit(bitmask))
	{
		return -1.0f;
	}

	double mx = static_cast<double>(bitmask >> 1);
	return static_cast<float>(static_cast<double>(sign_extend(value, bitmask)) / mx);
}

/* Public function, see header file for detailed documentation */
uint32_t bcn::float_to_unorm(float value, uint32_t bitmask)
{
	double mx = static_cast<double>(bitmask);
	double code = clamp_and_round(value * mx, 0.0, mx, ROUND_TIES_AWAY);
	return static_cast<uint32_t>(code);
}

/* Public function, see header file for detailed documentation */
float bcn::unorm_to_float(uint32_t value, uint32_t bitmask)
{
	return static_cast<float>(static_cast<double>(value & bitmask) / static_cast<double>(bitmask));
}

/* Public function, see header file for detailed documentation */
uint32_t bcn::unorm_widen(uint32_t value, unsigned int src_bits, unsigned int dst_bits)
{
	if (src_bits == 0)
	{
		return 0;
	}

	// Repeat the source pattern downwards from the top of the destination
	uint64_t result = 0;
	int pos = static_cast<int>(dst_bits) - static_cast<int>(src_bits);
	uint64_t code = value & ((static_cast<uint64_t>(1) << src_bits) - 1);
	while (pos > -static_cast<int>(src_bits))
	{
		if (pos >= 0)
		{
			result |= code << pos;
		}
		else
		{
			result |= code >> -pos;
		}

		pos -= static_cast<int>(src_bits);
	}

	return static_cast<uint32_t>(result);
}
