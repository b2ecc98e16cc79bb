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
 * @brief Functions for building the deduplicated color set of a block.
 */

#include <cmath>

#include "bcenc_internal.h"

/* Public function, see header file for detailed documentation */
void compute_color_set(
	const image_block& blk,
	bool is_bc1,
	bool weight_by_alpha,
	color_set& colors
) {
	colors.count = 0;
	colors.transparent = false;

	for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
	{
		const uint8_t* rgba = blk.texels + 4 * i;

		// Texels outside the image do not contribute
		if ((blk.mask & (1u << i)) == 0)
		{
			colors.remap[i] = -1;
			continue;
		}

		// BC1 can only encode transparent texels as black, so exclude them
		if (is_bc1 && rgba[3] < 128)
		{
			colors.remap[i] = -1;
			colors.transparent = true;
			continue;
		}

		float weight = weight_by_alpha ? static_cast<float>(rgba[3] + 1) / 256.0f : 1.0f;

		// Merge with an earlier texel of the same color, if there is one
		for (unsigned int j = 0; ; j++)
		{
			if (j == i)
			{
				float3 point(static_cast<float>(rgba[0]) / 255.0f,
				             static_cast<float>(rgba[1]) / 255.0f,
				             static_cast<float>(rgba[2]) / 255.0f);

				colors.points[colors.count] = point;
				colors.weights[colors.count] = weight;
				colors.remap[i] = static_cast<int>(colors.count);
				colors.count++;
				break;
			}

			const uint8_t* other = blk.texels + 4 * j;
			bool match = ((blk.mask & (1u << j)) != 0) &&
			             rgba[0] == other[0] &&
			             rgba[1] == other[1] &&
			             rgba[2] == other[2] &&
			             (other[3] >= 128 || !is_bc1);

			if (match)
			{
				int index = colors.remap[j];
				colors.weights[index] += weight;
				colors.remap[i] = index;
				break;
			}
		}
	}

	// The fits minimize squared error, so use the square root of the weights
	for (unsigned int i = 0; i < colors.count; i++)
	{
		colors.weights[i] = std::sqrt(colors.weights[i]);
	}
}

/* Public function, see header file for detailed documentation */
void remap_color_indices(
	const color_set& colors,
	const uint8_t* source,
	uint8_t* target
) {
	for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
	{
		int index = colors.remap[i];
		target[i] = index == -1 ? 3 : source[index];
	}
}
