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
 * @brief Functions for packing and unpacking BC color blocks.
 *
 * A color block stores two 5:6:5 endpoints followed by 16 2-bit indices, four
 * per byte with the first texel of each row in the low bits. The endpoint
 * order selects the codebook: BC1 uses the 3 color codebook with transparent
 * black when the first endpoint is not greater than the second.
 */

#include "bcenc_internal.h"

/* Public function, see header file for detailed documentation */
int float_to_565(
	float3 color
) {
	int r = bcn::clampi(bcn::flt2int_rtn(31.0f * color.r), 0, 31);
	int g = bcn::clampi(bcn::flt2int_rtn(63.0f * color.g), 0, 63);
	int b = bcn::clampi(bcn::flt2int_rtn(31.0f * color.b), 0, 31);
	return (r << 11) | (g << 5) | b;
}

/**
 * @brief Unpack a 5:6:5 endpoint to RGBA8.
 *
 * @param      packed   The little-endian packed endpoint.
 * @param[out] color    The unpacked color.
 *
 * @return The packed endpoint value.
 */
static unsigned int unpack_565(
	const uint8_t* packed,
	uint8_t* color
) {
	unsigned int value = packed[0] | (packed[1] << 8);

	unsigned int red = (value >> 11) & 0x1F;
	unsigned int green = (value >> 5) & 0x3F;
	unsigned int blue = value & 0x1F;

	color[0] = static_cast<uint8_t>(bcn::unorm_widen(red, 5, 8));
	color[1] = static_cast<uint8_t>(bcn::unorm_widen(green, 6, 8));
	color[2] = static_cast<uint8_t>(bcn::unorm_widen(blue, 5, 8));
	color[3] = 255;

	return value;
}

/**
 * @brief Write packed endpoints and indices.
 */
static void write_color_block_raw(
	int a,
	int b,
	const uint8_t* indices,
	uint8_t* block
) {
	block[0] = static_cast<uint8_t>(a & 0xFF);
	block[1] = static_cast<uint8_t>(a >> 8);
	block[2] = static_cast<uint8_t>(b & 0xFF);
	block[3] = static_cast<uint8_t>(b >> 8);

	for (unsigned int i = 0; i < 4; i++)
	{
		const uint8_t* ind = indices + 4 * i;
		block[4 + i] = static_cast<uint8_t>(ind[0] | (ind[1] << 2) | (ind[2] << 4) | (ind[3] << 6));
	}
}

/* Public function, see header file for detailed documentation */
void write_color_block(
	const color_fit_result& result,
	uint8_t* block
) {
	int a = float_to_565(result.start);
	int b = float_to_565(result.end);

	uint8_t remapped[TEXELS_PER_BLOCK];

	if (result.three_color)
	{
		if (a <= b)
		{
			for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
			{
				remapped[i] = result.indices[i];
			}
		}
		else
		{
			// Swap the endpoints, and so the endpoint indices
			int tmp = a;
			a = b;
			b = tmp;

			for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
			{
				uint8_t index = result.indices[i];
				remapped[i] = index == 0 ? 1 : (index == 1 ? 0 : index);
			}
		}
	}
	else
	{
		if (a < b)
		{
			// Swap the endpoints; this reverses the codebook order
			int tmp = a;
			a = b;
			b = tmp;

			for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
			{
				remapped[i] = static_cast<uint8_t>((result.indices[i] ^ 0x1) & 0x3);
			}
		}
		else if (a == b)
		{
			// Equal endpoints would select the 3 color codebook, so use index 0
			for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
			{
				remapped[i] = 0;
			}
		}
		else
		{
			for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
			{
				remapped[i] = result.indices[i];
			}
		}
	}

	write_color_block_raw(a, b, remapped, block);
}

/* Public function, see header file for detailed documentation */
void decompress_color_block(
	const uint8_t* block,
	bool is_bc1,
	image_block& blk
) {
	uint8_t codes[16];
	unsigned int a = unpack_565(block, codes);
	unsigned int b = unpack_565(block + 2, codes + 4);

	bool three_color = is_bc1 && a <= b;

	for (unsigned int i = 0; i < 3; i++)
	{
		int c = codes[i];
		int d = codes[4 + i];

		if (three_color)
		{
			codes[8 + i] = static_cast<uint8_t>((c + d) / 2);
			codes[12 + i] = 0;
		}
		else
		{
			codes[8 + i] = static_cast<uint8_t>((2 * c + d) / 3);
			codes[12 + i] = static_cast<uint8_t>((c + 2 * d) / 3);
		}
	}

	codes[8 + 3] = 255;
	codes[12 + 3] = three_color ? 0 : 255;

	for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
	{
		unsigned int index = (block[4 + i / 4] >> (2 * (i % 4))) & 0x3;
		for (unsigned int j = 0; j < 4; j++)
		{
			blk.texels[4 * i + j] = codes[4 * index + j];
		}
	}
}
