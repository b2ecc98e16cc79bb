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
 * @brief Functions for finding the dominant direction of a set of colors.
 */

#include <cfloat>

#include "bcenc_internal.h"

/* Public function, see header file for detailed documentation */
sym3x3 compute_weighted_covariance(
	unsigned int count,
	const float3* points,
	const float* weights
) {
	// Compute the centroid
	float total = 0.0f;
	float3 centroid(0.0f);
	for (unsigned int i = 0; i < count; i++)
	{
		total += weights[i];
		centroid = centroid + weights[i] * points[i];
	}

	if (total > FLT_EPSILON)
	{
		centroid = centroid * (1.0f / total);
	}

	// Accumulate the covariance matrix
	sym3x3 covariance;
	for (unsigned int i = 0; i < 6; i++)
	{
		covariance.m[i] = 0.0f;
	}

	for (unsigned int i = 0; i < count; i++)
	{
		float3 a = points[i] - centroid;
		float3 b = weights[i] * a;

		covariance.m[0] += a.r * b.r;
		covariance.m[1] += a.r * b.g;
		covariance.m[2] += a.r * b.b;
		covariance.m[3] += a.g * b.g;
		covariance.m[4] += a.g * b.b;
		covariance.m[5] += a.b * b.b;
	}

	return covariance;
}

/* Public function, see header file for detailed documentation */
float3 compute_principal_component(
	const sym3x3& matrix
) {
	float3 row0(matrix.m[0], matrix.m[1], matrix.m[2]);
	float3 row1(matrix.m[1], matrix.m[3], matrix.m[4]);
	float3 row2(matrix.m[2], matrix.m[4], matrix.m[5]);
	float3 v(1.0f);

	for (unsigned int i = 0; i < 8; i++)
	{
		float3 w = row0 * v.r + row1 * v.g + row2 * v.b;
		float a = bcn::fmax(w.r, bcn::fmax(w.g, w.b));
		v = w * (1.0f / a);
	}

	return v;
}
