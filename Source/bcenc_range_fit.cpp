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
 * @brief Functions for the fast range color fit.
 *
 * The range fit projects the colors onto their principal axis and uses the
 * two extreme colors as the endpoints. Each color is then assigned to the
 * nearest codebook entry.
 */

#include "bcenc_internal.h"

/**
 * @brief Assign colors to the nearest codebook entry, keeping the result if it wins.
 *
 * @param      colors       The color set.
 * @param      metric       The error weight of each color channel.
 * @param      codes        The codebook.
 * @param      code_count   The codebook size, 3 or 4.
 * @param      start        The start endpoint.
 * @param      end          The end endpoint.
 * @param[out] result       The best fit, updated if this codebook wins.
 */
static void fit_codebook(
	const color_set& colors,
	float3 metric,
	const float3* codes,
	unsigned int code_count,
	float3 start,
	float3 end,
	color_fit_result& result
) {
	uint8_t closest[TEXELS_PER_BLOCK];
	float error = 0.0f;

	for (unsigned int i = 0; i < colors.count; i++)
	{
		float dist = ERROR_CALC_DEFAULT;
		unsigned int idx = 0;
		for (unsigned int j = 0; j < code_count; j++)
		{
			float3 diff = metric * (colors.points[i] - codes[j]);
			float d = dot(diff, diff);
			if (d < dist)
			{
				dist = d;
				idx = j;
			}
		}

		closest[i] = static_cast<uint8_t>(idx);
		error += dist;
	}

	if (error < result.error)
	{
		result.start = start;
		result.end = end;
		result.three_color = code_count == 3;
		result.error = error;
		remap_color_indices(colors, closest, result.indices);
	}
}

/* Public function, see header file for detailed documentation */
void compute_range_fit(
	const color_set& colors,
	bool is_bc1,
	float3 metric,
	color_fit_result& result
) {
	unsigned int count = colors.count;
	const float3* values = colors.points;

	sym3x3 covariance = compute_weighted_covariance(count, values, colors.weights);
	float3 principal = compute_principal_component(covariance);

	// Use the extremes of the projected range as endpoints
	float3 start(0.0f);
	float3 end(0.0f);
	if (count > 0)
	{
		start = end = values[0];
		float min = dot(values[0], principal);
		float max = min;
		for (unsigned int i = 1; i < count; i++)
		{
			float val = dot(values[i], principal);
			if (val < min)
			{
				start = values[i];
				min = val;
			}
			else if (val > max)
			{
				end = values[i];
				max = val;
			}
		}
	}

	// Snap the endpoints to the 5:6:5 grid
	start = truncate(COLOR_GRID * clamp1f(start) + float3(0.5f)) * COLOR_GRID_RCP;
	end = truncate(COLOR_GRID * clamp1f(end) + float3(0.5f)) * COLOR_GRID_RCP;

	result.error = ERROR_CALC_DEFAULT;

	if (is_bc1)
	{
		float3 codes[3] {
			start,
			end,
			0.5f * start + 0.5f * end
		};

		fit_codebook(colors, metric, codes, 3, start, end, result);
	}

	if (!is_bc1 || !colors.transparent)
	{
		float3 codes[4] {
			start,
			end,
			(2.0f / 3.0f) * start + (1.0f / 3.0f) * end,
			(1.0f / 3.0f) * start + (2.0f / 3.0f) * end
		};

		fit_codebook(colors, metric, codes, 4, start, end, result);
	}
}
