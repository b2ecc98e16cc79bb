// SPDX-License-Identifier: Apache-2.0
// ----------------------------------------------------------------------------
// Copyright 2021 Arm Limited
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
 * @brief Unit tests for the single color lookup tables and the color analysis
 * helpers.
 */

#include <cmath>
#include <cstdlib>

#include "gtest/gtest.h"

#include "../bcenc_internal.h"

namespace bcenc
{

/**
 * @brief Check one source of a table entry.
 */
static void expect_source(
	const single_color_source& src,
	int start,
	int end,
	int error
) {
	EXPECT_EQ(src.start, start);
	EXPECT_EQ(src.end, end);
	EXPECT_EQ(src.error, error);
}

/** @brief Test selected entries of the 5-bit 3 color table. */
TEST(single_color_tables, Lookup53)
{
	const single_color_tables& t = get_single_color_tables();

	expect_source(t.lookup_5_3[0].sources[0], 0, 0, 0);
	expect_source(t.lookup_5_3[0].sources[1], 0, 0, 0);

	expect_source(t.lookup_5_3[3].sources[0], 0, 0, 3);
	expect_source(t.lookup_5_3[3].sources[1], 0, 1, 1);

	expect_source(t.lookup_5_3[5].sources[0], 1, 0, 3);
	expect_source(t.lookup_5_3[5].sources[1], 0, 1, 1);

	expect_source(t.lookup_5_3[7].sources[0], 1, 0, 1);
	expect_source(t.lookup_5_3[7].sources[1], 0, 2, 1);
}

/** @brief Test selected entries of the 6-bit 3 color table. */
TEST(single_color_tables, Lookup63)
{
	const single_color_tables& t = get_single_color_tables();

	expect_source(t.lookup_6_3[3].sources[0], 1, 0, 1);
	expect_source(t.lookup_6_3[3].sources[1], 0, 2, 1);
}

/** @brief Test selected entries of the 5-bit 4 color table. */
TEST(single_color_tables, Lookup54)
{
	const single_color_tables& t = get_single_color_tables();

	expect_source(t.lookup_5_4[4].sources[0], 0, 0, 4);
	expect_source(t.lookup_5_4[4].sources[1], 0, 2, 1);
}

/** @brief Test selected entries of the 6-bit 4 color table. */
TEST(single_color_tables, Lookup64)
{
	const single_color_tables& t = get_single_color_tables();

	expect_source(t.lookup_6_4[3].sources[0], 1, 0, 1);
	expect_source(t.lookup_6_4[3].sources[1], 0, 3, 1);

	expect_source(t.lookup_6_4[252].sources[0], 62, 0, 1);
	expect_source(t.lookup_6_4[252].sources[1], 62, 63, 0);

	expect_source(t.lookup_6_4[253].sources[0], 62, 0, 2);
	expect_source(t.lookup_6_4[253].sources[1], 63, 62, 0);

	expect_source(t.lookup_6_4[254].sources[0], 63, 0, 1);
	expect_source(t.lookup_6_4[254].sources[1], 63, 63, 1);

	expect_source(t.lookup_6_4[255].sources[0], 63, 0, 0);
	expect_source(t.lookup_6_4[255].sources[1], 63, 63, 0);
}

/** @brief Test every table entry reproduces its target within its error. */
TEST(single_color_tables, ErrorsAreConsistent)
{
	const single_color_tables& t = get_single_color_tables();

	struct table_info
	{
		const single_color_entry* table;
		unsigned int bits;
		bool four_color;
	};

	const table_info infos[4] {
		{ t.lookup_5_3, 5, false },
		{ t.lookup_6_3, 6, false },
		{ t.lookup_5_4, 5, true },
		{ t.lookup_6_4, 6, true }
	};

	for (const table_info& info : infos)
	{
		for (int target = 0; target < 256; target++)
		{
			const single_color_entry& entry = info.table[target];

			int a0 = static_cast<int>(bcn::unorm_widen(entry.sources[0].start, info.bits, 8));
			EXPECT_LE(std::abs(a0 - target), entry.sources[0].error);

			int a1 = static_cast<int>(bcn::unorm_widen(entry.sources[1].start, info.bits, 8));
			int b1 = static_cast<int>(bcn::unorm_widen(entry.sources[1].end, info.bits, 8));
			int interp = info.four_color ? (2 * a1 + b1) / 3 : (a1 + b1) / 2;
			EXPECT_LE(std::abs(interp - target), entry.sources[1].error);
		}
	}
}

/** @brief Test the tables are built once and shared. */
TEST(single_color_tables, Shared)
{
	const single_color_tables& t1 = get_single_color_tables();
	const single_color_tables& t2 = get_single_color_tables();
	EXPECT_EQ(&t1, &t2);
}

/**
 * @brief Build an opaque block filled with one color.
 */
static void fill_block(
	image_block& blk,
	uint8_t r,
	uint8_t g,
	uint8_t b,
	uint8_t a
) {
	for (unsigned int i = 0; i < TEXELS_PER_BLOCK; i++)
	{
		blk.texels[4 * i + 0] = r;
		blk.texels[4 * i + 1] = g;
		blk.texels[4 * i + 2] = b;
		blk.texels[4 * i + 3] = a;
	}

	blk.mask = 0xFFFF;
}

/** @brief Test color set deduplication and weights. */
TEST(color_set, Deduplicate)
{
	image_block blk;
	fill_block(blk, 10, 20, 30, 255);
	for (unsigned int i = 8; i < TEXELS_PER_BLOCK; i++)
	{
		blk.texels[4 * i] = 200;
	}

	color_set colors;
	compute_color_set(blk, true, false, colors);

	EXPECT_EQ(colors.count, 2u);
	EXPECT_FALSE(colors.transparent);
	EXPECT_FLOAT_EQ(colors.weights[0], std::sqrt(8.0f));
	EXPECT_FLOAT_EQ(colors.weights[1], std::sqrt(8.0f));
	EXPECT_FLOAT_EQ(colors.points[1].r, 200.0f / 255.0f);
	EXPECT_EQ(colors.remap[0], 0);
	EXPECT_EQ(colors.remap[15], 1);
}

/** @brief Test BC1 excludes transparent texels, and other kinds keep them. */
TEST(color_set, Transparency)
{
	image_block blk;
	fill_block(blk, 10, 20, 30, 255);
	blk.texels[4 * 5 + 3] = 127;

	color_set colors;
	compute_color_set(blk, true, false, colors);
	EXPECT_EQ(colors.count, 1u);
	EXPECT_TRUE(colors.transparent);
	EXPECT_EQ(colors.remap[5], -1);

	compute_color_set(blk, false, false, colors);
	EXPECT_EQ(colors.count, 1u);
	EXPECT_FALSE(colors.transparent);
	EXPECT_EQ(colors.remap[5], 0);
}

/** @brief Test texels outside the mask are excluded. */
TEST(color_set, Mask)
{
	image_block blk;
	fill_block(blk, 10, 20, 30, 255);
	blk.mask = 0x0001;

	color_set colors;
	compute_color_set(blk, false, false, colors);
	EXPECT_EQ(colors.count, 1u);
	EXPECT_FLOAT_EQ(colors.weights[0], 1.0f);
	EXPECT_FALSE(colors.transparent);

	uint8_t source[1] { 2 };
	uint8_t target[TEXELS_PER_BLOCK];
	remap_color_indices(colors, source, target);
	EXPECT_EQ(target[0], 2);
	EXPECT_EQ(target[1], 3);
	EXPECT_EQ(target[15], 3);
}

/** @brief Test alpha weighting. */
TEST(color_set, AlphaWeight)
{
	image_block blk;
	fill_block(blk, 10, 20, 30, 255);
	blk.mask = 0x0001;

	color_set colors;
	compute_color_set(blk, false, true, colors);
	EXPECT_FLOAT_EQ(colors.weights[0], 1.0f);

	blk.texels[3] = 63;
	compute_color_set(blk, false, true, colors);
	EXPECT_FLOAT_EQ(colors.weights[0], 0.5f);
}

/** @brief Test the principal axis of two points is the line between them. */
TEST(averages_and_directions, PrincipalComponent)
{
	float3 points[2] {
		float3(0.0f, 0.0f, 0.0f),
		float3(1.0f, 0.5f, 0.25f)
	};

	float weights[2] { 1.0f, 1.0f };

	sym3x3 cov = compute_weighted_covariance(2, points, weights);
	EXPECT_FLOAT_EQ(cov.m[0], 0.5f);
	EXPECT_FLOAT_EQ(cov.m[1], 0.25f);
	EXPECT_FLOAT_EQ(cov.m[5], 0.03125f);

	float3 axis = compute_principal_component(cov);
	EXPECT_NEAR(axis.r, 1.0f, 1e-5f);
	EXPECT_NEAR(axis.g, 0.5f, 1e-5f);
	EXPECT_NEAR(axis.b, 0.25f, 1e-5f);
}

/** @brief Test a single gray is encoded exactly by the single color fit. */
TEST(single_color_fit, ExactGray)
{
	image_block blk;
	fill_block(blk, 128, 128, 128, 255);

	color_set colors;
	compute_color_set(blk, false, false, colors);

	color_fit_result result;
	result.error = ERROR_CALC_DEFAULT;
	compute_single_color_fit(colors, false, result);

	EXPECT_FALSE(result.three_color);
	EXPECT_EQ(result.error, 0.0f);
}

/** @brief Test a transparent BC1 block only uses the 3 color codebook. */
TEST(single_color_fit, TransparentUsesThreeColor)
{
	image_block blk;
	fill_block(blk, 40, 80, 120, 255);
	blk.texels[3] = 0;

	color_set colors;
	compute_color_set(blk, true, false, colors);

	color_fit_result result;
	result.error = ERROR_CALC_DEFAULT;
	compute_single_color_fit(colors, true, result);

	EXPECT_TRUE(result.three_color);
	EXPECT_EQ(result.indices[0], 3);
	EXPECT_NE(result.indices[1], 3);
}

}
