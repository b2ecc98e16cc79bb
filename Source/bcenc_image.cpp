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
 * @brief Functions for reading and writing texels and blocks of image data.
 */

#include <cstring>

#include "bcenc_internal.h"

/**
 * @brief Get the bitmask for a channel width.
 */
static uint32_t channel_mask(unsigned int bits)
{
	return bits >= 32 ? 0xFFFFFFFFu : (1u << bits) - 1;
}

/**
 * @brief Load a little-endian storage word.
 */
static uint32_t load_word(const uint8_t* data, unsigned int word_bytes)
{
	uint32_t word = 0;
	for (unsigned int i = 0; i < word_bytes; i++)
	{
		word |= static_cast<uint32_t>(data[i]) << (8 * i);
	}

	return word;
}

/**
 * @brief Store a little-endian storage word.
 */
static void store_word(uint8_t* data, unsigned int word_bytes, uint32_t word)
{
	for (unsigned int i = 0; i < word_bytes; i++)
	{
		data[i] = static_cast<uint8_t>(word >> (8 * i));
	}
}

/**
 * @brief Decode a stored channel code to a float.
 */
static float decode_channel(const channel_descriptor& ch, uint32_t code)
{
	uint32_t mask = channel_mask(ch.bits);

	switch (ch.kind)
	{
	case CHANNEL_UNORM:
		return bcn::unorm_to_float(code, mask);
	case CHANNEL_SNORM:
		return bcn::snorm_to_float(code, mask);
	case CHANNEL_UINT:
		return bcn::uint_to_float(code, mask);
	case CHANNEL_SINT:
		return bcn::sint_to_float(code, mask);
	case CHANNEL_FLOAT:
		if (ch.bits == 16)
		{
			return sf16_to_float(static_cast<sf16>(code));
		}
		else
		{
			if32 p;
			p.u = code;
			return p.f;
		}
	}

	return 0.0f;
}

/**
 * @brief Encode a float to a stored channel code.
 */
static uint32_t encode_channel(const channel_descriptor& ch, float value)
{
	uint32_t mask = channel_mask(ch.bits);

	switch (ch.kind)
	{
	case CHANNEL_UNORM:
		return bcn::float_to_unorm(value, mask);
	case CHANNEL_SNORM:
		return bcn::float_to_snorm(value, mask);
	case CHANNEL_UINT:
		return bcn::float_to_uint(value, mask);
	case CHANNEL_SINT:
		return bcn::float_to_sint(value, mask);
	case CHANNEL_FLOAT:
		if (ch.bits == 16)
		{
			return float_to_sf16(value);
		}
		else
		{
			if32 p;
			p.f = value;
			return p.u;
		}
	}

	return 0;
}

/* Public function, see header file for detailed documentation */
void read_texel(
	const format_descriptor& fd,
	const uint8_t* data,
	texel& tx
) {
	for (unsigned int i = 0; i < 4; i++)
	{
		tx.value[i] = i == 3 ? 1.0f : 0.0f;
		tx.code[i] = 0;
		tx.code_bits[i] = 0;
	}

	for (unsigned int i = 0; i < fd.channel_count; i++)
	{
		const channel_descriptor& ch = fd.channels[i];
		if (ch.kind == CHANNEL_NONE)
		{
			continue;
		}

		uint32_t word = load_word(data + ch.word * fd.word_bytes, fd.word_bytes);
		uint32_t code = (word >> ch.shift) & channel_mask(ch.bits);

		tx.value[ch.component] = decode_channel(ch, code);
		if (ch.kind == CHANNEL_UNORM)
		{
			tx.code[ch.component] = code;
			tx.code_bits[ch.component] = ch.bits;
		}
	}
}

/* Public function, see header file for detailed documentation */
void write_texel(
	const format_descriptor& fd,
	const texel& tx,
	uint8_t* data
) {
	uint32_t words[4] { 0, 0, 0, 0 };

	for (unsigned int i = 0; i < fd.channel_count; i++)
	{
		const channel_descriptor& ch = fd.channels[i];
		if (ch.kind == CHANNEL_NONE)
		{
			continue;
		}

		unsigned int comp = ch.component;
		uint32_t code;

		// UNORM to wider UNORM is an exact integer operation
		if (ch.kind == CHANNEL_UNORM && tx.code_bits[comp] != 0 && tx.code_bits[comp] <= ch.bits)
		{
			code = bcn::unorm_widen(tx.code[comp], tx.code_bits[comp], ch.bits);
		}
		else
		{
			code = encode_channel(ch, tx.value[comp]);
		}

		words[ch.word] |= (code & channel_mask(ch.bits)) << ch.shift;
	}

	unsigned int word_count = fd.pixel_bytes / fd.word_bytes;
	for (unsigned int i = 0; i < word_count; i++)
	{
		store_word(data + i * fd.word_bytes, fd.word_bytes, words[i]);
	}
}

/* Public function, see header file for detailed documentation */
size_t get_row_pitch(
	const bcenc_image& img,
	const format_descriptor& fd
) {
	if (img.row_pitch)
	{
		return img.row_pitch;
	}

	return get_min_row_pitch(fd, img.dim_x);
}

/* Public function, see header file for detailed documentation */
void fetch_image_block(
	const bcenc_image& img,
	const format_descriptor& fd,
	unsigned int xpos,
	unsigned int ypos,
	image_block& blk
) {
	const uint8_t* base = static_cast<const uint8_t*>(img.data);
	size_t pitch = get_row_pitch(img, fd);

	std::memset(blk.texels, 0, sizeof(blk.texels));
	blk.mask = 0;

	for (unsigned int py = 0; py < BLOCK_DIM; py++)
	{
		unsigned int sy = ypos + py;
		if (sy >= img.dim_y)
		{
			break;
		}

		for (unsigned int px = 0; px < BLOCK_DIM; px++)
		{
			unsigned int sx = xpos + px;
			if (sx >= img.dim_x)
			{
				break;
			}

			const uint8_t* src = base + sy * pitch + static_cast<size_t>(sx) * fd.pixel_bytes;
			unsigned int idx = BLOCK_DIM * py + px;

			texel tx;
			read_texel(fd, src, tx);

			// 8-bit UNORM codes pass through unchanged
			for (unsigned int c = 0; c < 4; c++)
			{
				uint32_t code;
				if (tx.code_bits[c] == 8)
				{
					code = tx.code[c];
				}
				else
				{
					code = bcn::float_to_unorm(tx.value[c], 0xFF);
				}

				blk.texels[4 * idx + c] = static_cast<uint8_t>(code);
			}

			blk.mask |= 1u << idx;
		}
	}
}

/* Public function, see header file for detailed documentation */
void write_image_block(
	bcenc_image& img,
	const format_descriptor& fd,
	unsigned int xpos,
	unsigned int ypos,
	const image_block& blk
) {
	uint8_t* base = static_cast<uint8_t*>(img.data);
	size_t pitch = get_row_pitch(img, fd);

	for (unsigned int py = 0; py < BLOCK_DIM; py++)
	{
		unsigned int sy = ypos + py;
		if (sy >= img.dim_y)
		{
			break;
		}

		for (unsigned int px = 0; px < BLOCK_DIM; px++)
		{
			unsigned int sx = xpos + px;
			if (sx >= img.dim_x)
			{
				break;
			}

			unsigned int idx = BLOCK_DIM * py + px;

			texel tx;
			for (unsigned int c = 0; c < 4; c++)
			{
				uint8_t code = blk.texels[4 * idx + c];
				tx.value[c] = bcn::unorm_to_float(code, 0xFF);
				tx.code[c] = code;
				tx.code_bits[c] = 8;
			}

			uint8_t* dst = base + sy * pitch + static_cast<size_t>(sx) * fd.pixel_bytes;
			write_texel(fd, tx, dst);
		}
	}
}
