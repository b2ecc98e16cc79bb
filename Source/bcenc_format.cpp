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
 * @brief Functions for the data format catalog.
 */

#include "bcenc_internal.h"

/**
 * @brief Create a descriptor for a format with one storage word per channel.
 *
 * @param format     The format.
 * @param name       The format name.
 * @param kind       The channel_kind shared by all channels.
 * @param bits       The channel width, which is also the storage word width.
 * @param count      The number of channels, stored in RGBA order.
 */
static format_descriptor plain_format(
	bcenc_format format,
	const char* name,
	channel_kind kind,
	unsigned int bits,
	unsigned int count
) {
	format_descriptor fd {};
	fd.format = format;
	fd.name = name;
	fd.block = BLOCK_NONE;
	fd.block_bytes = 0;
	fd.word_bytes = bits / 8;
	fd.pixel_bytes = fd.word_bytes * count;
	fd.channel_count = count;

	for (unsigned int i = 0; i < count; i++)
	{
		fd.channels[i] = channel_descriptor {
			static_cast<uint8_t>(kind),
			static_cast<uint8_t>(i),
			static_cast<uint8_t>(i),
			0,
			static_cast<uint8_t>(bits)
		};
	}

	return fd;
}

/**
 * @brief Create a descriptor for a format packed into a single storage word.
 *
 * @param format       The format.
 * @param name         The format name.
 * @param word_bytes   The storage word size.
 * @param count        The number of channels.
 * @param channels     The channels.
 */
static format_descriptor packed_format(
	bcenc_format format,
	const char* name,
	unsigned int word_bytes,
	unsigned int count,
	const channel_descriptor* channels
) {
	format_descriptor fd {};
	fd.format = format;
	fd.name = name;
	fd.block = BLOCK_NONE;
	fd.block_bytes = 0;
	fd.word_bytes = word_bytes;
	fd.pixel_bytes = word_bytes;
	fd.channel_count = count;

	for (unsigned int i = 0; i < count; i++)
	{
		fd.channels[i] = channels[i];
	}

	return fd;
}

/**
 * @brief Create a descriptor for a block compressed format.
 */
static format_descriptor block_format(
	bcenc_format format,
	const char* name,
	block_kind kind
) {
	format_descriptor fd {};
	fd.format = format;
	fd.name = name;
	fd.block = kind;
	fd.block_bytes = get_block_bytes(kind);
	fd.pixel_bytes = 0;
	fd.word_bytes = 0;
	fd.channel_count = 0;
	return fd;
}

/**
 * @brief Create a channel of a packed storage word.
 */
static channel_descriptor packed(
	channel_kind kind,
	unsigned int component,
	unsigned int shift,
	unsigned int bits
) {
	return channel_descriptor {
		static_cast<uint8_t>(kind),
		static_cast<uint8_t>(component),
		0,
		static_cast<uint8_t>(shift),
		static_cast<uint8_t>(bits)
	};
}

/**
 * @brief Build the format catalog, indexed by format.
 */
static void build_format_catalog(format_descriptor* catalog)
{
	// Unknown formats are marked by a null name
	for (unsigned int i = 0; i < BCENC_FMT_COUNT; i++)
	{
		catalog[i] = format_descriptor {};
		catalog[i].format = static_cast<bcenc_format>(i);
	}

	struct plain_row
	{
		bcenc_format format;
		const char* name;
		channel_kind kind;
		unsigned int bits;
		unsigned int count;
	};

	static const plain_row plain_rows[] {
		{ BCENC_FMT_R32G32B32A32_FLOAT, "R32G32B32A32_FLOAT", CHANNEL_FLOAT, 32, 4 },
		{ BCENC_FMT_R32G32B32A32_UINT, "R32G32B32A32_UINT", CHANNEL_UINT, 32, 4 },
		{ BCENC_FMT_R32G32B32A32_SINT, "R32G32B32A32_SINT", CHANNEL_SINT, 32, 4 },
		{ BCENC_FMT_R32G32B32_FLOAT, "R32G32B32_FLOAT", CHANNEL_FLOAT, 32, 3 },
		{ BCENC_FMT_R32G32B32_UINT, "R32G32B32_UINT", CHANNEL_UINT, 32, 3 },
		{ BCENC_FMT_R32G32B32_SINT, "R32G32B32_SINT", CHANNEL_SINT, 32, 3 },
		{ BCENC_FMT_R16G16B16A16_FLOAT, "R16G16B16A16_FLOAT", CHANNEL_FLOAT, 16, 4 },
		{ BCENC_FMT_R16G16B16A16_UNORM, "R16G16B16A16_UNORM", CHANNEL_UNORM, 16, 4 },
		{ BCENC_FMT_R16G16B16A16_UINT, "R16G16B16A16_UINT", CHANNEL_UINT, 16, 4 },
		{ BCENC_FMT_R16G16B16A16_SNORM, "R16G16B16A16_SNORM", CHANNEL_SNORM, 16, 4 },
		{ BCENC_FMT_R16G16B16A16_SINT, "R16G16B16A16_SINT", CHANNEL_SINT, 16, 4 },
		{ BCENC_FMT_R32G32_FLOAT, "R32G32_FLOAT", CHANNEL_FLOAT, 32, 2 },
		{ BCENC_FMT_R32G32_UINT, "R32G32_UINT", CHANNEL_UINT, 32, 2 },
		{ BCENC_FMT_R32G32_SINT, "R32G32_SINT", CHANNEL_SINT, 32, 2 },
		{ BCENC_FMT_R8G8B8A8_UNORM, "R8G8B8A8_UNORM", CHANNEL_UNORM, 8, 4 },
		{ BCENC_FMT_R8G8B8A8_UNORM_SRGB, "R8G8B8A8_UNORM_SRGB", CHANNEL_UNORM, 8, 4 },
		{ BCENC_FMT_R8G8B8A8_UINT, "R8G8B8A8_UINT", CHANNEL_UINT, 8, 4 },
		{ BCENC_FMT_R8G8B8A8_SNORM, "R8G8B8A8_SNORM", CHANNEL_SNORM, 8, 4 },
		{ BCENC_FMT_R8G8B8A8_SINT, "R8G8B8A8_SINT", CHANNEL_SINT, 8, 4 },
		{ BCENC_FMT_R16G16_FLOAT, "R16G16_FLOAT", CHANNEL_FLOAT, 16, 2 },
		{ BCENC_FMT_R16G16_UNORM, "R16G16_UNORM", CHANNEL_UNORM, 16, 2 },
		{ BCENC_FMT_R16G16_UINT, "R16G16_UINT", CHANNEL_UINT, 16, 2 },
		{ BCENC_FMT_R16G16_SNORM, "R16G16_SNORM", CHANNEL_SNORM, 16, 2 },
		{ BCENC_FMT_R16G16_SINT, "R16G16_SINT", CHANNEL_SINT, 16, 2 },
		{ BCENC_FMT_R32_FLOAT, "R32_FLOAT", CHANNEL_FLOAT, 32, 1 },
		{ BCENC_FMT_R32_UINT, "R32_UINT", CHANNEL_UINT, 32, 1 },
		{ BCENC_FMT_R32_SINT, "R32_SINT", CHANNEL_SINT, 32, 1 },
		{ BCENC_FMT_R8G8_UNORM, "R8G8_UNORM", CHANNEL_UNORM, 8, 2 },
		{ BCENC_FMT_R8G8_UINT, "R8G8_UINT", CHANNEL_UINT, 8, 2 },
		{ BCENC_FMT_R8G8_SNORM, "R8G8_SNORM", CHANNEL_SNORM, 8, 2 },
		{ BCENC_FMT_R8G8_SINT, "R8G8_SINT", CHANNEL_SINT, 8, 2 },
		{ BCENC_FMT_R16_FLOAT, "R16_FLOAT", CHANNEL_FLOAT, 16, 1 },
		{ BCENC_FMT_R16_UNORM, "R16_UNORM", CHANNEL_UNORM, 16, 1 },
		{ BCENC_FMT_R16_UINT, "R16_UINT", CHANNEL_UINT, 16, 1 },
		{ BCENC_FMT_R16_SNORM, "R16_SNORM", CHANNEL_SNORM, 16, 1 },
		{ BCENC_FMT_R16_SINT, "R16_SINT", CHANNEL_SINT, 16, 1 },
		{ BCENC_FMT_R8_UNORM, "R8_UNORM", CHANNEL_UNORM, 8, 1 },
		{ BCENC_FMT_R8_UINT, "R8_UINT", CHANNEL_UINT, 8, 1 },
		{ BCENC_FMT_R8_SNORM, "R8_SNORM", CHANNEL_SNORM, 8, 1 },
		{ BCENC_FMT_R8_SINT, "R8_SINT", CHANNEL_SINT, 8, 1 }
	};

	for (const plain_row& row : plain_rows)
	{
		catalog[row.format] = plain_format(row.format, row.name, row.kind, row.bits, row.count);
	}

	// A8 stores only the alpha component
	catalog[BCENC_FMT_A8_UNORM] = plain_format(BCENC_FMT_A8_UNORM, "A8_UNORM", CHANNEL_UNORM, 8, 1);
	catalog[BCENC_FMT_A8_UNORM].channels[0].component = 3;

	const channel_descriptor r10g10b10a2_unorm[4] {
		packed(CHANNEL_UNORM, 0, 0, 10),
		packed(CHANNEL_UNORM, 1, 10, 10),
		packed(CHANNEL_UNORM, 2, 20, 10),
		packed(CHANNEL_UNORM, 3, 30, 2)
	};

	const channel_descriptor r10g10b10a2_uint[4] {
		packed(CHANNEL_UINT, 0, 0, 10),
		packed(CHANNEL_UINT, 1, 10, 10),
		packed(CHANNEL_UINT, 2, 20, 10),
		packed(CHANNEL_UINT, 3, 30, 2)
	};

	const channel_descriptor b5g6r5[3] {
		packed(CHANNEL_UNORM, 2, 0, 5),
		packed(CHANNEL_UNORM, 1, 5, 6),
		packed(CHANNEL_UNORM, 0, 11, 5)
	};

	const channel_descriptor b5g5r5a1[4] {
		packed(CHANNEL_UNORM, 2, 0, 5),
		packed(CHANNEL_UNORM, 1, 5, 5),
		packed(CHANNEL_UNORM, 0, 10, 5),
		packed(CHANNEL_UNORM, 3, 15, 1)
	};

	const channel_descriptor b4g4r4a4[4] {
		packed(CHANNEL_UNORM, 2, 0, 4),
		packed(CHANNEL_UNORM, 1, 4, 4),
		packed(CHANNEL_UNORM, 0, 8, 4),
		packed(CHANNEL_UNORM, 3, 12, 4)
	};

	const channel_descriptor b8g8r8a8[4] {
		packed(CHANNEL_UNORM, 2, 0, 8),
		packed(CHANNEL_UNORM, 1, 8, 8),
		packed(CHANNEL_UNORM, 0, 16, 8),
		packed(CHANNEL_UNORM, 3, 24, 8)
	};

	const channel_descriptor b8g8r8x8[4] {
		packed(CHANNEL_UNORM, 2, 0, 8),
		packed(CHANNEL_UNORM, 1, 8, 8),
		packed(CHANNEL_UNORM, 0, 16, 8),
		packed(CHANNEL_NONE, 3, 24, 8)
	};

	catalog[BCENC_FMT_R10G10B10A2_UNORM] = packed_format(BCENC_FMT_R10G10B10A2_UNORM, "R10G10B10A2_UNORM", 4, 4, r10g10b10a2_unorm);
	catalog[BCENC_FMT_R10G10B10A2_UINT] = packed_format(BCENC_FMT_R10G10B10A2_UINT, "R10G10B10A2_UINT", 4, 4, r10g10b10a2_uint);
	catalog[BCENC_FMT_B5G6R5_UNORM] = packed_format(BCENC_FMT_B5G6R5_UNORM, "B5G6R5_UNORM", 2, 3, b5g6r5);
	catalog[BCENC_FMT_B5G5R5A1_UNORM] = packed_format(BCENC_FMT_B5G5R5A1_UNORM, "B5G5R5A1_UNORM", 2, 4, b5g5r5a1);
	catalog[BCENC_FMT_B4G4R4A4_UNORM] = packed_format(BCENC_FMT_B4G4R4A4_UNORM, "B4G4R4A4_UNORM", 2, 4, b4g4r4a4);
	catalog[BCENC_FMT_B8G8R8A8_UNORM] = packed_format(BCENC_FMT_B8G8R8A8_UNORM, "B8G8R8A8_UNORM", 4, 4, b8g8r8a8);
	catalog[BCENC_FMT_B8G8R8A8_UNORM_SRGB] = packed_format(BCENC_FMT_B8G8R8A8_UNORM_SRGB, "B8G8R8A8_UNORM_SRGB", 4, 4, b8g8r8a8);
	catalog[BCENC_FMT_B8G8R8X8_UNORM] = packed_format(BCENC_FMT_B8G8R8X8_UNORM, "B8G8R8X8_UNORM", 4, 4, b8g8r8x8);
	catalog[BCENC_FMT_B8G8R8X8_UNORM_SRGB] = packed_format(BCENC_FMT_B8G8R8X8_UNORM_SRGB, "B8G8R8X8_UNORM_SRGB", 4, 4, b8g8r8x8);

	catalog[BCENC_FMT_BC1_UNORM] = block_format(BCENC_FMT_BC1_UNORM, "BC1_UNORM", BLOCK_BC1);
	catalog[BCENC_FMT_BC1_UNORM_SRGB] = block_format(BCENC_FMT_BC1_UNORM_SRGB, "BC1_UNORM_SRGB", BLOCK_BC1);
	catalog[BCENC_FMT_BC2_UNORM] = block_format(BCENC_FMT_BC2_UNORM, "BC2_UNORM", BLOCK_BC2);
	catalog[BCENC_FMT_BC2_UNORM_SRGB] = block_format(BCENC_FMT_BC2_UNORM_SRGB, "BC2_UNORM_SRGB", BLOCK_BC2);
	catalog[BCENC_FMT_BC3_UNORM] = block_format(BCENC_FMT_BC3_UNORM, "BC3_UNORM", BLOCK_BC3);
	catalog[BCENC_FMT_BC3_UNORM_SRGB] = block_format(BCENC_FMT_BC3_UNORM_SRGB, "BC3_UNORM_SRGB", BLOCK_BC3);
}

/* Public function, see header file for detailed documentation */
const format_descriptor* get_format_descriptor(
	bcenc_format format
) {
	struct format_catalog
	{
		format_descriptor entries[BCENC_FMT_COUNT];
	};

	static const format_catalog catalog = []() {
		format_catalog c;
		build_format_catalog(c.entries);
		return c;
	}();

	unsigned int index = static_cast<unsigned int>(format);
	if (index >= BCENC_FMT_COUNT || !catalog.entries[index].name)
	{
		return nullptr;
	}

	return &catalog.entries[index];
}

/* Public function, see header file for detailed documentation */
size_t get_min_row_pitch(
	const format_descriptor& fd,
	unsigned int dim_x
) {
	if (fd.block != BLOCK_NONE)
	{
		size_t blocks_x = (static_cast<size_t>(dim_x) + BLOCK_DIM - 1) / BLOCK_DIM;
		return blocks_x * fd.block_bytes;
	}

	return static_cast<size_t>(dim_x) * fd.pixel_bytes;
}

/* Public function, see header file for detailed documentation */
unsigned int get_row_count(
	const format_descriptor& fd,
	unsigned int dim_y
) {
	if (fd.block != BLOCK_NONE)
	{
		return (dim_y + BLOCK_DIM - 1) / BLOCK_DIM;
	}

	return dim_y;
}

/* Public function, see header file for detailed documentation */
bool bcenc_is_block_compressed(
	bcenc_format format
) {
	const format_descriptor* fd = get_format_descriptor(format);
	return fd && fd->block != BLOCK_NONE;
}

/* Public function, see header file for detailed documentation */
unsigned int bcenc_get_bytes_per_block(
	bcenc_format format
) {
	const format_descriptor* fd = get_format_descriptor(format);
	return fd ? fd->block_bytes : 0;
}

/* Public function, see header file for detailed documentation */
unsigned int bcenc_get_bytes_per_pixel(
	bcenc_format format
) {
	const format_descriptor* fd = get_format_descriptor(format);
	return fd ? fd->pixel_bytes : 0;
}

/* Public function, see header file for detailed documentation */
size_t bcenc_get_storage_size(
	bcenc_format format,
	unsigned int dim_x,
	unsigned int dim_y
) {
	const format_descriptor* fd = get_format_descriptor(format);
	if (!fd)
	{
		return 0;
	}

	return get_min_row_pitch(*fd, dim_x) * get_row_count(*fd, dim_y);
}

/* Public function, see header file for detailed documentation */
const char* bcenc_get_format_name(
	bcenc_format format
) {
	const format_descriptor* fd = get_format_descriptor(format);
	return fd ? fd->name : nullptr;
}
