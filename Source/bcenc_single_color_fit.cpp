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
 * @brief Functions for encoding blocks that contain a single color.
 *
 * A single color is encoded exactly where the 5:6:5 endpoint grid allows it,
 * using either an endpoint or an interpolated codebook entry. The best
 * endpoints for every 8-bit channel value are precomputed into lookup tables,
 * one for each endpoint bit count and codebook size.
 */

#include <climits>

#include "bcenc_internal.h"

/**
 * @brief The best encoding found so far for a target value and codebook index.
 */
struct table_candidate
{
	int start;
	int end;
	int error;
};

/**
 * @brief Build one single color lookup table.
 *
 * For every target value, find the endpoint pair whose codebook index 0 or
 * index 2 reproduces it with the smallest error. Exact matches are found by
 * enumerating all endpoint pairs, and near misses are filled in by propagating
 * exact matches to their neighbours, one unit of error per step.
 *
 * @param      bits      The endpoint bit count.
 * @param      colors    The codebook size, 3 or 4.
 * @param[out] table     The table to populate.
 */
static void build_single_color_table(
	int bits,
	int colors,
	single_color_entry* table
) {
	table_candidate values[256][4];

	for (int target = 0; target < 256; target++)
	{
		for (int index = 0; index < 4; index++)
		{
			values[target][index] = table_candidate { 0, 0, 255 };
		}
	}

	int value_count = 1 << bits;
	for (int value1 = 0; value1 < value_count; value1++)
	{
		for (int value2 = 0; value2 < value_count; value2++)
		{
			int a = (value1 << (8 - bits)) | (value1 >> (2 * bits - 8));
			int b = (value2 << (8 - bits)) | (value2 >> (2 * bits - 8));

			int codes[4];
			codes[0] = a;
			codes[1] = b;
			if (colors == 3)
			{
				codes[2] = (a + b) / 2;
				codes[3] = 0;
			}
			else
			{
				codes[2] = (2 * a + b) / 3;
				codes[3] = (a + 2 * b) / 3;
			}

			for (int index = 0; index < colors; index++)
			{
				table_candidate& cand = values[codes[index]][index];
				if (cand.error != 0)
				{
					cand = table_candidate { value1, value2, 0 };
				}
			}
		}
	}

	bool changed = true;
	while (changed)
	{
		changed = false;
		for (int index = 0; index < colors; index++)
		{
			for (int target = 0; target < 256; target++)
			{
				table_candidate& cand = values[target][index];

				if (target != 255)
				{
					const table_candidate& next = values[target + 1][index];
					if (cand.error > next.error + 1)
					{
						cand = table_candidate { next.start, next.end, next.error + 1 };
						changed = true;
					}
				}

				if (target != 0)
				{
					const table_candidate& prev = values[target - 1][index];
					if (cand.error > prev.error + 1)
					{
						cand = table_candidate { prev.start, prev.end, prev.error + 1 };
						changed = true;
					}
				}
			}
		}
	}

	// Only the first endpoint and the first interpolant are ever selected
	for (int target = 0; target < 256; target++)
	{
		for (int i = 0; i < 2; i++)
		{
			const table_candidate& cand = values[target][2 * i];
			single_color_source& src = table[target].sources[i];
			src.start = static_cast<uint8_t>(cand.start);
			src.end = static_cast<uint8_t>(cand.end);
			src.error = static_cast<uint8_t>(cand.error);
		}
	}
}

/* Public function, see header file for detailed documentation */
const single_color_tables& get_single_color_tables()
{
	static const single_color_tables tables = []() {
		single_color_tables t;
		build_single_color_table(5, 3, t.lookup_5_3);
		build_single_color_table(6, 3, t.lookup_6_3);
		build_single_color_table(5, 4, t.lookup_5_4);
		build_single_color_table(6, 4, t.lookup_6_4);
		return t;
	}();

	return tables;
}

/**
 * @brief Find the best endpoints for a single color using one codebook size.
 *
 * @param      color     The 8-bit color.
 * @param      lookups   The lookup table for each channel.
 * @param[out] start     The start endpoint.
 * @param[out] end       The end endpoint.
 * @param[out] index     The codebook index to use.
 *
 * @return The squared error of the encoding.
 */
static int compute_single_color_endpoints(
	const int color[3],
	const single_color_entry* const lookups[3],
	float3& start,
	float3& end,
	uint8_t& index
) {
	int best_error = INT_MAX;

	for (int i = 0; i < 2; i++)
	{
		const single_color_source* sources[3];
		int error = 0;
		for (int channel = 0; channel < 3; channel++)
		{
			sources[channel] = &lookups[channel][color[channel]].sources[i];
			int diff = sources[channel]->error;
			error += diff * diff;
		}

		if (error < best_error)
		{
			start = float3(static_cast<float>(sources[0]->start) / 31.0f,
			               static_cast<float>(sources[1]->start) / 63.0f,
			               static_cast<float>(sources[2]->start) / 31.0f);

			end = float3(static_cast<float>(sources[0]->end) / 31.0f,
			             static_cast<float>(sources[1]->end) / 63.0f,
			             static_cast<float>(sources[2]->end) / 31.0f);

			index = static_cast<uint8_t>(2 * i);
			best_error = error;
		}
	}

	return best_error;
}

/* Public function, see header file for detailed documentation */
void compute_single_color_fit(
	const color_set& colors,
	bool is_bc1,
	color_fit_result& result
) {
	const single_color_tables& tables = get_single_color_tables();

	int color[3] {
		bcn::clampi(bcn::flt2int_rtn(255.0f * colors.points[0].r), 0, 255),
		bcn::clampi(bcn::flt2int_rtn(255.0f * colors.points[0].g), 0, 255),
		bcn::clampi(bcn::flt2int_rtn(255.0f * colors.points[0].b), 0, 255)
	};

	int best_error = INT_MAX;

	if (is_bc1)
	{
		const single_color_entry* const lookups3[3] {
			tables.lookup_5_3, tables.lookup_6_3, tables.lookup_5_3
		};

		float3 start, end;
		uint8_t index;
		int error = compute_single_color_endpoints(color, lookups3, start, end, index);
		if (error < best_error)
		{
			result.start = start;
			result.end = end;
			result.three_color = true;
			result.error = static_cast<float>(error);
			remap_color_indices(colors, &index, result.indices);
			best_error = error;
		}
	}

	if (!is_bc1 || !colors.transparent)
	{
		const single_color_entry* const lookups4[3] {
			tables.lookup_5_4, tables.lookup_6_4, tables.lookup_5_4
		};

		float3 start, end;
		uint8_t index;
		int error = compute_single_color_endpoints(color, lookups4, start, end, index);
		if (error < best_error)
		{
			result.start = start;
			result.end = end;
			result.three_color = false;
			result.error = static_cast<float>(error);
			remap_color_indices(colors, &index, result.indices);
		}
	}
}
