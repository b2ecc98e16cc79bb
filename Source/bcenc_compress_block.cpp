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
 * @brief Functions to compress and decompress a single BCn block.
 */

#include "bcenc_internal.h"

#if defined(BCENC_DIAGNOSTICS)
/**
 * @brief Get a printable name for a color fit strategy.
 */
static const char* get_fit_name(color_fit_mode mode)
{
	switch (mode)
	{
	case FIT_SINGLE_COLOR:
		return "single";
	case FIT_RANGE:
		return "range";
	case FIT_CLUSTER:
		return "cluster";
	}

	return "unknown";
}
#endif

/* Public function, see header file for detailed documentation */
color_fit_mode select_color_fit(
	const block_compress_config& bcc,
	const color_set& colors
) {
	if (colors.count == 1)
	{
		return FIT_SINGLE_COLOR;
	}

	if (bcc.use_range_fit || colors.count == 0)
	{
		return FIT_RANGE;
	}

	return FIT_CLUSTER;
}

/* Public function, see header file for detailed documentation */
void compress_block(
	const block_compress_config& bcc,
	const image_block& blk,
	uint8_t* block,
	compress_block_buffers& tmpbuf
) {
	TRACE_NODE(node0, "block");

	bool is_bc1 = bcc.kind == BLOCK_BC1;

	// BC2 and BC3 store the alpha block first
	uint8_t* color_block = is_bc1 ? block : block + 8;
	if (bcc.kind == BLOCK_BC2)
	{
		compress_alpha_bc2(blk, block);
	}
	else if (bcc.kind == BLOCK_BC3)
	{
		compress_alpha_bc3(blk, block);
	}

	color_set& colors = tmpbuf.colors;
	compute_color_set(blk, is_bc1, bcc.weight_by_alpha, colors);

	color_fit_result result;
	result.start = float3(0.0f);
	result.end = float3(0.0f);
	result.three_color = false;
	result.error = ERROR_CALC_DEFAULT;
	for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
	{
		result.indices[i] = 0;
	}

	color_fit_mode mode = select_color_fit(bcc, colors);
	switch (mode)
	{
	case FIT_SINGLE_COLOR:
		compute_single_color_fit(colors, is_bc1, result);
		break;
	case FIT_RANGE:
		compute_range_fit(colors, is_bc1, bcc.metric, result);
		break;
	case FIT_CLUSTER:
		compute_cluster_fit(colors, is_bc1, bcc.metric, bcc.iteration_count, tmpbuf.cluster, result);
		break;
	}

	trace_add_data("colors", colors.count);
	trace_add_data("fit", get_fit_name(mode));
	trace_add_data("three_color", result.three_color ? 1 : 0);
	trace_add_data("error", result.error);

	write_color_block(result, color_block);

	trace_add_data("endpoint0", static_cast<unsigned int>(color_block[0] | (color_block[1] << 8)));
	trace_add_data("endpoint1", static_cast<unsigned int>(color_block[2] | (color_block[3] << 8)));
}

/* Public function, see header file for detailed documentation */
void decompress_block(
	block_kind kind,
	const uint8_t* block,
	image_block& blk
) {
	blk.mask = 0xFFFF;

	if (kind == BLOCK_BC1)
	{
		decompress_color_block(block, true, blk);
		return;
	}

	decompress_color_block(block + 8, false, blk);
	if (kind == BLOCK_BC2)
	{
		decompress_alpha_bc2(block, blk);
	}
	else
	{
		decompress_alpha_bc3(block, blk);
	}
}
