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
 * @brief Functions for converting images between data formats.
 *
 * Conversions are split into independent tasks. When either format is block
 * compressed a task is a single 4x4 block, otherwise a task is a single image
 * row. Every task writes a disjoint region of the output, so tasks can run on
 * any thread in any order and still give identical output.
 */

#include <cstring>

#include "bcenc_internal.h"

/**
 * @brief Test if a format is one of the 8-bit RGBA UNORM formats.
 */
static bool is_rgba8_unorm(bcenc_format format)
{
	return format == BCENC_FMT_R8G8B8A8_UNORM ||
	       format == BCENC_FMT_R8G8B8A8_UNORM_SRGB;
}

/**
 * @brief Test if a format is one of the 8-bit BGRA UNORM formats.
 */
static bool is_bgra8_unorm(bcenc_format format)
{
	return format == BCENC_FMT_B8G8R8A8_UNORM ||
	       format == BCENC_FMT_B8G8R8A8_UNORM_SRGB;
}

/* Public function, see header file for detailed documentation */
bool bcenc_can_convert(
	bcenc_format src,
	bcenc_format dst
) {
	const format_descriptor* src_fd = get_format_descriptor(src);
	const format_descriptor* dst_fd = get_format_descriptor(dst);
	if (!src_fd || !dst_fd)
	{
		return false;
	}

	if (src == dst)
	{
		return true;
	}

	bool dst_compressed = dst_fd->block != BLOCK_NONE;
	bool dst_float = dst == BCENC_FMT_R32G32B32A32_FLOAT;

	switch (src)
	{
	case BCENC_FMT_R32G32B32A32_FLOAT:
		// Float is the hub format, and converts to everything
		return true;

	case BCENC_FMT_R32G32B32A32_UINT:
	case BCENC_FMT_R32G32B32A32_SINT:
	case BCENC_FMT_R32G32B32_FLOAT:
	case BCENC_FMT_R32G32B32_UINT:
	case BCENC_FMT_R32G32B32_SINT:
	case BCENC_FMT_R16G16B16A16_FLOAT:
	case BCENC_FMT_R16G16B16A16_UNORM:
	case BCENC_FMT_R16G16B16A16_UINT:
	case BCENC_FMT_R16G16B16A16_SNORM:
	case BCENC_FMT_R16G16B16A16_SINT:
	case BCENC_FMT_R32G32_FLOAT:
	case BCENC_FMT_R32G32_UINT:
	case BCENC_FMT_R32G32_SINT:
	case BCENC_FMT_R10G10B10A2_UNORM:
	case BCENC_FMT_R10G10B10A2_UINT:
	case BCENC_FMT_R8G8B8A8_UINT:
	case BCENC_FMT_R8G8B8A8_SNORM:
	case BCENC_FMT_R8G8B8A8_SINT:
	case BCENC_FMT_R16G16_FLOAT:
	case BCENC_FMT_R16G16_UNORM:
	case BCENC_FMT_R16G16_UINT:
	case BCENC_FMT_R16G16_SNORM:
	case BCENC_FMT_R16G16_SINT:
	case BCENC_FMT_R32_FLOAT:
	case BCENC_FMT_R32_UINT:
	case BCENC_FMT_R32_SINT:
	case BCENC_FMT_R8G8_UNORM:
	case BCENC_FMT_R8G8_UINT:
	case BCENC_FMT_R8G8_SNORM:
	case BCENC_FMT_R8G8_SINT:
	case BCENC_FMT_R16_FLOAT:
	case BCENC_FMT_R16_UNORM:
	case BCENC_FMT_R16_UINT:
	case BCENC_FMT_R16_SNORM:
	case BCENC_FMT_R16_SINT:
	case BCENC_FMT_R8_UINT:
	case BCENC_FMT_R8_SNORM:
	case BCENC_FMT_R8_SINT:
		return dst_float;

	case BCENC_FMT_R8G8B8A8_UNORM:
	case BCENC_FMT_R8G8B8A8_UNORM_SRGB:
		return dst_float || is_bgra8_unorm(dst) || dst_compressed;

	case BCENC_FMT_R8_UNORM:
	case BCENC_FMT_A8_UNORM:
		return dst_float || is_rgba8_unorm(dst) || is_bgra8_unorm(dst);

	case BCENC_FMT_BC1_UNORM:
	case BCENC_FMT_BC1_UNORM_SRGB:
	case BCENC_FMT_BC2_UNORM:
	case BCENC_FMT_BC2_UNORM_SRGB:
	case BCENC_FMT_BC3_UNORM:
	case BCENC_FMT_BC3_UNORM_SRGB:
		return dst_float || is_rgba8_unorm(dst);

	case BCENC_FMT_B5G6R5_UNORM:
	case BCENC_FMT_B5G5R5A1_UNORM:
	case BCENC_FMT_B4G4R4A4_UNORM:
	case BCENC_FMT_B8G8R8A8_UNORM:
	case BCENC_FMT_B8G8R8A8_UNORM_SRGB:
	case BCENC_FMT_B8G8R8X8_UNORM:
	case BCENC_FMT_B8G8R8X8_UNORM_SRGB:
		return dst_float || is_rgba8_unorm(dst);

	default:
		return false;
	}
}

/* Public function, see header file for detailed documentation */
unsigned int get_convert_task_count(
	const format_descriptor& src,
	const format_descriptor& dst,
	unsigned int dim_x,
	unsigned int dim_y
) {
	// Same format copies are done row by row, including block rows
	if (src.format == dst.format)
	{
		return get_row_count(src, dim_y);
	}

	if (src.block != BLOCK_NONE || dst.block != BLOCK_NONE)
	{
		unsigned int blocks_x = (dim_x + BLOCK_DIM - 1) / BLOCK_DIM;
		unsigned int blocks_y = (dim_y + BLOCK_DIM - 1) / BLOCK_DIM;
		return blocks_x * blocks_y;
	}

	return dim_y;
}

/**
 * @brief Copy one row of an image in the same format.
 */
static void copy_row(
	const bcenc_image& image_in,
	const format_descriptor& fd,
	bcenc_image& image_out,
	unsigned int row
) {
	size_t row_bytes = get_min_row_pitch(fd, image_in.dim_x);
	const uint8_t* src = static_cast<const uint8_t*>(image_in.data) + row * get_row_pitch(image_in, fd);
	uint8_t* dst = static_cast<uint8_t*>(image_out.data) + row * get_row_pitch(image_out, fd);
	std::memcpy(dst, src, row_bytes);
}

/**
 * @brief Convert one row of an image texel by texel.
 */
static void convert_row(
	const bcenc_image& image_in,
	const format_descriptor& src,
	bcenc_image& image_out,
	const format_descriptor& dst,
	unsigned int row
) {
	const uint8_t* src_row = static_cast<const uint8_t*>(image_in.data) + row * get_row_pitch(image_in, src);
	uint8_t* dst_row = static_cast<uint8_t*>(image_out.data) + row * get_row_pitch(image_out, dst);

	for (unsigned int x = 0; x < image_in.dim_x; x++)
	{
		texel tx;
		read_texel(src, src_row + static_cast<size_t>(x) * src.pixel_bytes, tx);
		write_texel(dst, tx, dst_row + static_cast<size_t>(x) * dst.pixel_bytes);
	}
}

/* Public function, see header file for detailed documentation */
void convert_task(
	const block_compress_config& bcc,
	const bcenc_image& image_in,
	const format_descriptor& src,
	bcenc_image& image_out,
	const format_descriptor& dst,
	unsigned int task,
	compress_block_buffers& tmpbuf
) {
	if (src.format == dst.format)
	{
		copy_row(image_in, src, image_out, task);
		return;
	}

	if (src.block == BLOCK_NONE && dst.block == BLOCK_NONE)
	{
		convert_row(image_in, src, image_out, dst, task);
		return;
	}

	unsigned int blocks_x = (image_in.dim_x + BLOCK_DIM - 1) / BLOCK_DIM;
	unsigned int block_x = task % blocks_x;
	unsigned int block_y = task / blocks_x;

	TRACE_NODE(node0, "task");
	trace_add_data("block_x", block_x);
	trace_add_data("block_y", block_y);

	image_block blk;

	if (dst.block != BLOCK_NONE)
	{
		block_compress_config block_bcc = bcc;
		block_bcc.kind = dst.block;

		fetch_image_block(image_in, src, block_x * BLOCK_DIM, block_y * BLOCK_DIM, blk);

		uint8_t* block = static_cast<uint8_t*>(image_out.data) +
		                 block_y * get_row_pitch(image_out, dst) +
		                 static_cast<size_t>(block_x) * dst.block_bytes;

		compress_block(block_bcc, blk, block, tmpbuf);
	}
	else
	{
		const uint8_t* block = static_cast<const uint8_t*>(image_in.data) +
		                       block_y * get_row_pitch(image_in, src) +
		                       static_cast<size_t>(block_x) * src.block_bytes;

		decompress_block(src.block, block, blk);
		write_image_block(image_out, dst, block_x * BLOCK_DIM, block_y * BLOCK_DIM, blk);
	}
}
