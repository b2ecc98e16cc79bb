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
 * @brief Table-driven half-float conversion functions.
 *
 * The conversions use the lookup table method described in "Fast Half Float
 * Conversions" by Jeroen van der Zijp. Half to float conversion is exact;
 * float to half conversion truncates any mantissa bits that do not fit.
 */

#include "bcenc_mathlib.h"

/**
 * @brief The lookup tables for both conversion directions.
 */
struct sf16_tables
{
	/** @brief The float mantissa bits, indexed by offset + half mantissa. */
	uint32_t mantissa[2048];

	/** @brief The float sign and exponent bits, indexed by half sign and exponent. */
	uint32_t exponent[64];

	/** @brief The mantissa table offset, indexed by half sign and exponent. */
	uint16_t offset[64];

	/** @brief The half sign and exponent bits, indexed by float sign and exponent. */
	uint16_t base[512];

	/** @brief The mantissa shift, indexed by float sign and exponent. */
	uint8_t shift[512];
};

/**
 * @brief Renormalize a denormal half mantissa into float mantissa and exponent bits.
 *
 * @param i   The half mantissa, in the range 1-1023.
 *
 * @return The float bit pattern, excluding the sign.
 */
static uint32_t convert_mantissa(uint32_t i)
{
	uint32_t m = i << 13;
	uint32_t e = 0;

	// Shift until the implicit leading one is in place
	while (!(m & 0x00800000))
	{
		e -= 0x00800000;
		m <<= 1;
	}

	m &= ~0x00800000u;
	e += 0x38800000;
	return m | e;
}

static void build_sf16_tables(sf16_tables& t)
{
	t.mantissa[0] = 0;
	for (uint32_t i = 1; i < 1024; i++)
	{
		t.mantissa[i] = convert_mantissa(i);
	}

	for (uint32_t i = 1024; i < 2048; i++)
	{
		t.mantissa[i] = 0x38000000 + ((i - 1024) << 13);
	}

	t.exponent[0] = 0;
	for (uint32_t i = 1; i < 31; i++)
	{
		t.exponent[i] = i << 23;
	}

	t.exponent[31] = 0x47800000;
	t.exponent[32] = 0x80000000;
	for (uint32_t i = 33; i < 63; i++)
	{
		t.exponent[i] = 0x80000000 + ((i - 32) << 23);
	}

	t.exponent[63] = 0xC7800000;

	for (unsigned int i = 0; i < 64; i++)
	{
		t.offset[i] = 1024;
	}

	t.offset[0] = 0;
	t.offset[32] = 0;

	for (int i = 0; i < 256; i++)
	{
		int e = i - 127;

		// Very small numbers map to zero
		if (e < -24)
		{
			t.base[i | 0x000] = 0x0000;
			t.base[i | 0x100] = 0x8000;
			t.shift[i | 0x000] = 24;
			t.shift[i | 0x100] = 24;
		}
		// Small numbers map to denorms
		else if (e < -14)
		{
			t.base[i | 0x000] = static_cast<uint16_t>(0x0400 >> (-e - 14));
			t.base[i | 0x100] = static_cast<uint16_t>((0x0400 >> (-e - 14)) | 0x8000);
			t.shift[i | 0x000] = static_cast<uint8_t>(-e - 1);
			t.shift[i | 0x100] = static_cast<uint8_t>(-e - 1);
		}
		// Normal numbers just lose precision
		else if (e <= 15)
		{
			t.base[i | 0x000] = static_cast<uint16_t>((e + 15) << 10);
			t.base[i | 0x100] = static_cast<uint16_t>(((e + 15) << 10) | 0x8000);
			t.shift[i | 0x000] = 13;
			t.shift[i | 0x100] = 13;
		}
		// Large numbers map to infinity
		else if (e < 128)
		{
			t.base[i | 0x000] = 0x7C00;
			t.base[i | 0x100] = 0xFC00;
			t.shift[i | 0x000] = 24;
			t.shift[i | 0x100] = 24;
		}
		// Infinity and NaN stay infinity and NaN
		else
		{
			t.base[i | 0x000] = 0x7C00;
			t.base[i | 0x100] = 0xFC00;
			t.shift[i | 0x000] = 13;
			t.shift[i | 0x100] = 13;
		}
	}
}

/**
 * @brief Get the conversion tables, building them on first use.
 */
static const sf16_tables& get_sf16_tables()
{
	static const sf16_tables tables = []() {
		sf16_tables t;
		build_sf16_tables(t);
		return t;
	}();

	return tables;
}

/* Public function, see header file for detailed documentation */
void init_sf16_tables()
{
	(void)get_sf16_tables();
}

/* Public function, see header file for detailed documentation */
sf16 float_to_sf16(float val)
{
	const sf16_tables& t = get_sf16_tables();

	if32 p;
	p.f = val;
	uint32_t idx = (p.u >> 23) & 0x1FF;
	uint32_t res = t.base[idx] + ((p.u & 0x007FFFFF) >> t.shift[idx]);

	// A NaN with a payload only in the truncated bits must not become infinity
	if (((p.u & 0x7FFFFFFF) > 0x7F800000) && !(res & 0x3FF))
	{
		res |= 0x200;
	}

	return static_cast<sf16>(res);
}

/* Public function, see header file for detailed documentation */
float sf16_to_float(sf16 val)
{
	const sf16_tables& t = get_sf16_tables();

	uint32_t idx = val >> 10;
	if32 p;
	p.u = t.mantissa[t.offset[idx] + (val & 0x3FF)] + t.exponent[idx];
	return p.f;
}
