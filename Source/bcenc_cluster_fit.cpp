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
 * @brief Functions for the least squares cluster color fit.
 *
 * The colors are sorted along an axis, and every split of the sorted list into
 * contiguous clusters is tried. Each cluster maps to one codebook entry, so the
 * endpoints minimizing the squared error of a split have a closed form least
 * squares solution. Iterative refinement re-sorts the colors along the best
 * endpoint axis found so far, and stops once an ordering repeats or an
 * iteration fails to improve.
 */

#include "bcenc_internal.h"

/**
 * @brief Clamp each lane of a vector to [0, 1], keeping NaN lanes as NaN.
 *
 * Degenerate splits produce NaN endpoints, and so NaN errors, which can never
 * win a less-than comparison.
 */
static float3 clamp_unit(float3 p)
{
	float3 r = p;
	r.r = r.r < 0.0f ? 0.0f : (r.r > 1.0f ? 1.0f : r.r);
	r.g = r.g < 0.0f ? 0.0f : (r.g > 1.0f ? 1.0f : r.g);
	r.b = r.b < 0.0f ? 0.0f : (r.b > 1.0f ? 1.0f : r.b);
	return r;
}

/**
 * @brief Snap an endpoint to the 5:6:5 grid.
 */
static float3 snap_to_grid(float3 p)
{
	return truncate(COLOR_GRID * clamp_unit(p) + float3(0.5f)) * COLOR_GRID_RCP;
}

/**
 * @brief The best split found by a cluster search.
 */
struct cluster_split
{
	float3 start;
	float3 end;
	float error;
	unsigned int iteration;

	/** @brief The cluster boundaries; unused boundaries are zero. */
	unsigned int bounds[3];
};

/**
 * @brief Sort the colors along an axis.
 *
 * @param      colors      The color set.
 * @param      axis        The axis to sort along.
 * @param      iteration   The iteration index to store the ordering for.
 * @param[out] tmpbuf      The cluster scratch buffers.
 *
 * @return False if the ordering matches one from an earlier iteration.
 */
static bool construct_ordering(
	const color_set& colors,
	float3 axis,
	unsigned int iteration,
	cluster_fit_buffers& tmpbuf
) {
	unsigned int count = colors.count;
	uint8_t* order = tmpbuf.order + TEXELS_PER_BLOCK * iteration;

	float dps[TEXELS_PER_BLOCK];
	for (unsigned int i = 0; i < count; i++)
	{
		dps[i] = dot(colors.points[i], axis);
		order[i] = static_cast<uint8_t>(i);
	}

	// Stable insertion sort
	for (unsigned int i = 0; i < count; i++)
	{
		for (unsigned int j = i; j > 0 && dps[j] < dps[j - 1]; j--)
		{
			float tmp_dp = dps[j];
			dps[j] = dps[j - 1];
			dps[j - 1] = tmp_dp;

			uint8_t tmp_order = order[j];
			order[j] = order[j - 1];
			order[j - 1] = tmp_order;
		}
	}

	for (unsigned int it = 0; it < iteration; it++)
	{
		const uint8_t* prev = tmpbuf.order + TEXELS_PER_BLOCK * it;
		bool same = true;
		for (unsigned int i = 0; i < count; i++)
		{
			if (order[i] != prev[i])
			{
				same = false;
				break;
			}
		}

		if (same)
		{
			return false;
		}
	}

	tmpbuf.xsum_wsum = float4(0.0f);
	for (unsigned int i = 0; i < count; i++)
	{
		unsigned int j = order[i];
		float4 x = float4(colors.points[j], 1.0f) * colors.weights[j];
		tmpbuf.points_weights[i] = x;
		tmpbuf.xsum_wsum = tmpbuf.xsum_wsum + x;
	}

	return true;
}

/**
 * @brief Solve for the endpoints of one split, and compute its error.
 *
 * The error omits the constant sum of squared colors, so it is only
 * comparable with errors of the same color set.
 *
 * @param      alphax      The weighted sum of colors, by start endpoint share.
 * @param      betax       The weighted sum of colors, by end endpoint share.
 * @param      alphabeta   The weighted sum of the endpoint share products.
 * @param      metric      The error weight of each color channel.
 * @param[out] a           The start endpoint.
 * @param[out] b           The end endpoint.
 *
 * @return The error of the split.
 */
static float solve_split(
	float4 alphax,
	float4 betax,
	float alphabeta,
	float3 metric,
	float3& a,
	float3& b
) {
	float alpha2 = alphax.a;
	float beta2 = betax.a;

	float factor = 1.0f / (alpha2 * beta2 - alphabeta * alphabeta);
	a = snap_to_grid((alphax.rgb() * beta2 - betax.rgb() * alphabeta) * factor);
	b = snap_to_grid((betax.rgb() * alpha2 - alphax.rgb() * alphabeta) * factor);

	float3 e1 = a * a * alpha2 + b * b * beta2;
	float3 e2 = a * b * alphabeta - a * alphax.rgb();
	float3 e3 = e2 - b * betax.rgb();
	float3 e4 = 2.0f * e3 + e1;

	return dot(e4, metric);
}

/**
 * @brief Search all three cluster splits of the ordered colors.
 */
static void search_three_clusters(
	const color_set& colors,
	float3 metric,
	float3 principal,
	unsigned int iteration_count,
	cluster_fit_buffers& tmpbuf,
	cluster_split& best
) {
	const float4 half_half2(0.5f, 0.5f, 0.5f, 0.25f);
	unsigned int count = colors.count;
	const float4* pw = tmpbuf.points_weights;

	construct_ordering(colors, principal, 0, tmpbuf);

	for (unsigned int iteration = 0; ; )
	{
		// First cluster [0,i) is at the start
		float4 part0(0.0f);
		for (unsigned int i = 0; i < count; i++)
		{
			// Second cluster [i,j) is half along
			float4 part1 = (i == 0) ? pw[0] : float4(0.0f);
			for (unsigned int j = (i == 0) ? 1 : i; ; )
			{
				// Last cluster [j,count) is at the end
				float4 part2 = tmpbuf.xsum_wsum - part1 - part0;

				float4 alphax = part1 * half_half2 + part0;
				float4 betax = part1 * half_half2 + part2;
				float alphabeta = (part1 * half_half2).a;

				float3 a, b;
				float error = solve_split(alphax, betax, alphabeta, metric, a, b);
				if (error < best.error)
				{
					best.start = a;
					best.end = b;
					best.error = error;
					best.iteration = iteration;
					best.bounds[0] = i;
					best.bounds[1] = j;
				}

				if (j == count)
				{
					break;
				}

				part1 = part1 + pw[j];
				j++;
			}

			part0 = part0 + pw[i];
		}

		// Stop if this iteration did not improve
		if (best.iteration != iteration)
		{
			break;
		}

		iteration++;
		if (iteration == iteration_count)
		{
			break;
		}

		if (!construct_ordering(colors, best.end - best.start, iteration, tmpbuf))
		{
			break;
		}
	}
}

/**
 * @brief Search all four cluster splits of the ordered colors.
 */
static void search_four_clusters(
	const color_set& colors,
	float3 metric,
	float3 principal,
	unsigned int iteration_count,
	cluster_fit_buffers& tmpbuf,
	cluster_split& best
) {
	const float4 onethird_onethird2(1.0f / 3.0f, 1.0f / 3.0f, 1.0f / 3.0f, 1.0f / 9.0f);
	const float4 twothirds_twothirds2(2.0f / 3.0f, 2.0f / 3.0f, 2.0f / 3.0f, 4.0f / 9.0f);
	unsigned int count = colors.count;
	const float4* pw = tmpbuf.points_weights;

	construct_ordering(colors, principal, 0, tmpbuf);

	for (unsigned int iteration = 0; ; )
	{
		// First cluster [0,i) is at the start
		float4 part0(0.0f);
		for (unsigned int i = 0; i < count; i++)
		{
			// Second cluster [i,j) is one third along
			float4 part1(0.0f);
			for (unsigned int j = i; ; )
			{
				// Third cluster [j,k) is two thirds along
				float4 part2 = (j == 0) ? pw[0] : float4(0.0f);
				for (unsigned int k = (j == 0) ? 1 : j; ; )
				{
					// Last cluster [k,count) is at the end
					float4 part3 = tmpbuf.xsum_wsum - part2 - part1 - part0;

					float4 alphax = part2 * onethird_onethird2 + (part1 * twothirds_twothirds2 + part0);
					float4 betax = part1 * onethird_onethird2 + (part2 * twothirds_twothirds2 + part3);
					float alphabeta = (2.0f / 9.0f) * (part1 + part2).a;

					float3 a, b;
					float error = solve_split(alphax, betax, alphabeta, metric, a, b);
					if (error < best.error)
					{
						best.start = a;
						best.end = b;
						best.error = error;
						best.iteration = iteration;
						best.bounds[0] = i;
						best.bounds[1] = j;
						best.bounds[2] = k;
					}

					if (k == count)
					{
						break;
					}

					part2 = part2 + pw[k];
					k++;
				}

				if (j == count)
				{
					break;
				}

				part1 = part1 + pw[j];
				j++;
			}

			part0 = part0 + pw[i];
		}

		// Stop if this iteration did not improve
		if (best.iteration != iteration)
		{
			break;
		}

		iteration++;
		if (iteration == iteration_count)
		{
			break;
		}

		if (!construct_ordering(colors, best.end - best.start, iteration, tmpbuf))
		{
			break;
		}
	}
}

/* Public function, see header file for detailed documentation */
void compute_cluster_fit(
	const color_set& colors,
	bool is_bc1,
	float3 metric,
	unsigned int iteration_count,
	cluster_fit_buffers& tmpbuf,
	color_fit_result& result
) {
	unsigned int count = colors.count;
	sym3x3 covariance = compute_weighted_covariance(count, colors.points, colors.weights);
	float3 principal = compute_principal_component(covariance);

	result.error = ERROR_CALC_DEFAULT;

	if (is_bc1)
	{
		cluster_split best { float3(0.0f), float3(0.0f), result.error, 0, { 0, 0, 0 } };
		search_three_clusters(colors, metric, principal, iteration_count, tmpbuf, best);

		if (best.error < result.error)
		{
			const uint8_t* order = tmpbuf.order + TEXELS_PER_BLOCK * best.iteration;

			// Clusters map to codebook entries 0, 2, and 1
			uint8_t unordered[TEXELS_PER_BLOCK];
			for (unsigned int m = 0; m < count; m++)
			{
				uint8_t index = m < best.bounds[0] ? 0 : (m < best.bounds[1] ? 2 : 1);
				unordered[order[m]] = index;
			}

			result.start = best.start;
			result.end = best.end;
			result.three_color = true;
			result.error = best.error;
			remap_color_indices(colors, unordered, result.indices);
		}
	}

	if (!is_bc1 || !colors.transparent)
	{
		cluster_split best { float3(0.0f), float3(0.0f), result.error, 0, { 0, 0, 0 } };
		search_four_clusters(colors, metric, principal, iteration_count, tmpbuf, best);

		if (best.error < result.error)
		{
			const uint8_t* order = tmpbuf.order + TEXELS_PER_BLOCK * best.iteration;

			// Clusters map to codebook entries 0, 2, 3, and 1
			uint8_t unordered[TEXELS_PER_BLOCK];
			for (unsigned int m = 0; m < count; m++)
			{
				uint8_t index;
				if (m < best.bounds[0])
				{
					index = 0;
				}
				else if (m < best.bounds[1])
				{
					index = 2;
				}
				else if (m < best.bounds[2])
				{
					index = 3;
				}
				else
				{
					index = 1;
				}

				unordered[order[m]] = index;
			}

			result.start = best.start;
			result.end = best.end;
			result.three_color = false;
			result.error = best.error;
			remap_color_indices(colors, unordered, result.indices);
		}
	}
}
