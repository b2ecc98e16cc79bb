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
 * @brief Functions for packing and unpacking BC2 and BC3 alpha blocks.
 */

#include <climits>

#include "bcenc_internal.h"

/* Public function, see header file for detailed documentation */
void compress_alpha_bc2(
	const image_block& blk,
	uint8_t* block
) {
	// Quantize and pack the alpha values pairwise
	for (unsigned int i = 0; i < 8; i++)
	{
		float alpha1 = static_cast<float>(blk.texels[8 * i + 3]) * (15.0f / 255.0f);
		float alpha2 = static_cast<float>(blk.texels[8 * i + 7]) * (15.0f / 255.0f);
		int quant1 = bcn::clampi(bcn::flt2int_rtn(alpha1), 0, 15);
		int quant2 = bcn::clampi(bcn::flt2int_rtn(alpha2), 0, 15);

		if ((blk.mask & (1u << (2 * i))) == 0)
		{
			quant1 = 0;
		}

		if ((blk.mask & (1u << (2 * i + 1))) == 0)
		{
			quant2 = 0;
		}

		block[i] = static_cast<uint8_t>(quant1 | (quant2 << 4));
	}
}

/* Public function, see header file for detailed documentation */
void decompress_alpha_bc2(
	const uint8_t* block,
	image_block& blk
) {
	for (unsigned int i = 0; i < 8; i++)
	{
		uint8_t quant = block[i];
		uint8_t lo = quant & 0x0F;
		uint8_t hi = quant & 0xF0;

		blk.texels[8 * i + 3] = static_cast<uint8_t>(lo | (lo << 4));
		blk.texels[8 * i + 7] = static_cast<uint8_t>(hi | (hi >> 4));
	}
}

/**
 * @brief Widen an alpha range to cover at least @c steps codes.
 */
static void fix_range(
	int& min,
	int& max,
	int steps
) {
	if (max - min < steps)
	{
		max = bcn::clampi(min + steps, 0, 255);
	}

	if (max - min < steps)
	{
		min = bcn::clampi(max - steps, 0, 255);
	}
}

/**
 * @brief Assign each alpha value to the nearest codebook entry.
 *
 * @param      blk       The block.
 * @param      codes     The 8 entry codebook.
 * @param[out] indices   The codebook index of each texel.
 *
 * @return The total squared error.
 */
static int fit_codes(
	const image_block& blk,
	const uint8_t* codes,
	uint8_t* indices
) {
	int err = 0;
	for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
	{
		if ((blk.mask & (1u << i)) == 0)
		{
			indices[i] = 0;
			continue;
		}

		int value = blk.texels[4 * i + 3];
		int least = INT_MAX;
		int index = 0;
		for (int j = 0; j < 8; j++)
		{
			int dist = value - codes[j];
			dist *= dist;

			if (dist < least)
			{
				least = dist;
				index = j;
			}
		}

		indices[i] = static_cast<uint8_t>(index);
		err += least;
	}

	return err;
}

/**
 * @brief Write endpoints and 3-bit indices.
 *
 * Each group of 8 indices is packed into 3 bytes, least significant first.
 */
static void write_alpha_block(
	int alpha0,
	int alpha1,
	const uint8_t* indices,
	uint8_t* block
) {
	block[0] = static_cast<uint8_t>(alpha0);
	block[1] = static_cast<uint8_t>(alpha1);

	uint8_t* dst = block + 2;
	const uint8_t* src = indices;
	for (unsigned int i = 0; i < 2; i++)
	{
		unsigned int value = 0;
		for (unsigned int j = 0; j < 8; j++)
		{
			value |= static_cast<unsigned int>(*src++) << (3 * j);
		}

		for (unsigned int j = 0; j < 3; j++)
		{
			*dst++ = static_cast<uint8_t>((value >> (8 * j)) & 0xFF);
		}
	}
}

/**
 * @brief Write a block using the 5 alpha codebook, which needs alpha0 <= alpha1.
 */
static void write_alpha_block5(
	int alpha0,
	int alpha1,
	const uint8_t* indices,
	uint8_t* block
) {
	if (alpha0 > alpha1)
	{
		uint8_t swapped[TEXELS_PER_BLOCK];
		for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
		{
			uint8_t index = indices[i];
			if (index == 0)
			{
				swapped[i] = 1;
			}
			else if (index == 1)
			{
				swapped[i] = 0;
			}
			else if (index <= 5)
			{
				swapped[i] = static_cast<uint8_t>(7 - index);
			}
			else
			{
				swapped[i] = index;
			}
		}

		write_alpha_block(alpha1, alpha0, swapped, block);
	}
	else
	{
		write_alpha_block(alpha0, alpha1, indices, block);
	}
}

/**
 * @brief Write a block using the 7 alpha codebook, which needs alpha0 > alpha1.
 */
static void write_alpha_block7(
	int alpha0,
	int alpha1,
	const uint8_t* indices,
	uint8_t* block
) {
	if (alpha0 < alpha1)
	{
		uint8_t swapped[TEXELS_PER_BLOCK];
		for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
		{
			uint8_t index = indices[i];
			if (index == 0)
			{
				swapped[i] = 1;
			}
			else if (index == 1)
			{
				swapped[i] = 0;
			}
			else
			{
				swapped[i] = static_cast<uint8_t>(9 - index);
			}
		}

		write_alpha_block(alpha1, alpha0, swapped, block);
	}
	else
	{
		write_alpha_block(alpha0, alpha1, indices, block);
	}
}

/* Public function, see header file for detailed documentation */
void compress_alpha_bc3(
	const image_block& blk,
	uint8_t* block
) {
	// The 5 alpha codebook has explicit 0 and 255 entries, so it ignores them
	int min5 = 255;
	int max5 = 0;
	int min7 = 255;
	int max7 = 0;
	for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
	{
		if ((blk.mask & (1u << i)) == 0)
		{
			continue;
		}

		int value = blk.texels[4 * i + 3];
		if (value < min7)
		{
			min7 = value;
		}

		if (value > max7)
		{
			max7 = value;
		}

		if (value != 0 && value < min5)
		{
			min5 = value;
		}

		if (value != 255 && value > max5)
		{
			max5 = value;
		}
	}

	if (min5 > max5)
	{
		min5 = max5;
	}

	if (min7 > max7)
	{
		min7 = max7;
	}

	fix_range(min5, max5, 5);
	fix_range(min7, max7, 7);

	uint8_t codes5[8];
	codes5[0] = static_cast<uint8_t>(min5);
	codes5[1] = static_cast<uint8_t>(max5);
	for (int i = 1; i < 5; i++)
	{
		codes5[1 + i] = static_cast<uint8_t>(((5 - i) * min5 + i * max5) / 5);
	}

	codes5[6] = 0;
	codes5[7] = 255;

	uint8_t codes7[8];
	codes7[0] = static_cast<uint8_t>(min7);
	codes7[1] = static_cast<uint8_t>(max7);
	for (int i = 1; i < 7; i++)
	{
		codes7[1 + i] = static_cast<uint8_t>(((7 - i) * min7 + i * max7) / 7);
	}

	uint8_t indices5[TEXELS_PER_BLOCK];
	uint8_t indices7[TEXELS_PER_BLOCK];
	int err5 = fit_codes(blk, codes5, indices5);
	int err7 = fit_codes(blk, codes7, indices7);

	if (err5 <= err7)
	{
		write_alpha_block5(min5, max5, indices5, block);
	}
	else
	{
		write_alpha_block7(min7, max7, indices7, block);
	}
}

/* Public function, see header file for detailed documentation */
void decompress_alpha_bc3(
	const uint8_t* block,
	image_block& blk
) {
	int alpha0 = block[0];
	int alpha1 = block[1];

	uint8_t codes[8];
	codes[0] = static_cast<uint8_t>(alpha0);
	codes[1] = static_cast<uint8_t>(alpha1);
	if (alpha0 <= alpha1)
	{
		for (int i = 1; i < 5; i++)
		{
			codes[1 + i] = static_cast<uint8_t>(((5 - i) * alpha0 + i * alpha1) / 5);
		}

		codes[6] = 0;
		codes[7] = 255;
	}
	else
	{
		for (int i = 1; i < 7; i++)
		{
			codes[1 + i] = static_cast<uint8_t>(((7 - i) * alpha0 + i * alpha1) / 7);
		}
	}

	const uint8_t* src = block + 2;
	for (unsigned int i = 0; i < 2; i++)
	{
		unsigned int value = src[0] | (src[1] << 8) | (src[2] << 16);
		src += 3;

		for (unsigned int j = 0; j < 8; j++)
		{
			unsigned int index = (value >> (3 * j)) & 0x7;
			blk.texels[4 * (8 * i + j) + 3] = codes[index];
		}
	}
}
