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
 * @brief Unit tests for whole image analysis and processing.
 */

#include <cmath>
#include <limits>
#include <vector>

#include "gtest/gtest.h"

#include "../bcenc_internal.h"

namespace bcenc
{

/**
 * @brief Make a tightly packed RGBA8 image with a given alpha for each texel.
 */
static bcenc_image make_rgba8(
	std::vector<uint8_t>& buffer,
	const std::vector<uint8_t>& alpha
) {
	buffer.assign(alpha.size() * 4, 100);
	for (size_t i = 0; i < alpha.size(); i++)
	{
		buffer[4 * i + 3] = alpha[i];
	}

	bcenc_image image;
	image.dim_x = static_cast<unsigned int>(alpha.size());
	image.dim_y = 1;
	image.row_pitch = 0;
	image.format = BCENC_FMT_R8G8B8A8_UNORM;
	image.data = buffer.data();
	image.data_len = buffer.size();
	return image;
}

/**
 * @brief Make a float RGBA image view over a buffer.
 */
static bcenc_image make_float(
	std::vector<float>& data,
	unsigned int dim_x,
	unsigned int dim_y,
	size_t row_pitch = 0
) {
	bcenc_image image;
	image.dim_x = dim_x;
	image.dim_y = dim_y;
	image.row_pitch = row_pitch;
	image.format = BCENC_FMT_R32G32B32A32_FLOAT;
	image.data = data.data();
	image.data_len = data.size() * sizeof(float);
	return image;
}

/** @brief Test an opaque image has no alpha. */
TEST(image_analysis, Opaque)
{
	std::vector<uint8_t> buffer;
	bcenc_image image = make_rgba8(buffer, { 255, 255, 255, 255 });

	bool has_alpha = true;
	bool has_fractional_alpha = true;
	EXPECT_EQ(bcenc_analyze_alpha(image, has_alpha, has_fractional_alpha), BCENC_SUCCESS);
	EXPECT_FALSE(has_alpha);
	EXPECT_FALSE(has_fractional_alpha);
}

/** @brief Test binary alpha is not reported as fractional. */
TEST(image_analysis, BinaryAlpha)
{
	std::vector<uint8_t> buffer;
	bcenc_image image = make_rgba8(buffer, { 255, 0, 255, 0 });

	bool has_alpha = false;
	bool has_fractional_alpha = true;
	EXPECT_EQ(bcenc_analyze_alpha(image, has_alpha, has_fractional_alpha), BCENC_SUCCESS);
	EXPECT_TRUE(has_alpha);
	EXPECT_FALSE(has_fractional_alpha);
}

/** @brief Test partial alpha is reported as fractional. */
TEST(image_analysis, FractionalAlpha)
{
	std::vector<uint8_t> buffer;
	bcenc_image image = make_rgba8(buffer, { 255, 0, 128, 255 });

	bool has_alpha = false;
	bool has_fractional_alpha = false;
	EXPECT_EQ(bcenc_analyze_alpha(image, has_alpha, has_fractional_alpha), BCENC_SUCCESS);
	EXPECT_TRUE(has_alpha);
	EXPECT_TRUE(has_fractional_alpha);
}

/** @brief Test float images use the fourth float as alpha. */
TEST(image_analysis, FloatAlpha)
{
	std::vector<float> data { 0.5f, 0.5f, 0.5f, 1.0f,
	                          0.5f, 0.5f, 0.5f, 0.0f };

	bcenc_image image;
	image.dim_x = 2;
	image.dim_y = 1;
	image.row_pitch = 0;
	image.format = BCENC_FMT_R32G32B32A32_FLOAT;
	image.data = data.data();
	image.data_len = data.size() * sizeof(float);

	bool has_alpha = false;
	bool has_fractional_alpha = true;
	EXPECT_EQ(bcenc_analyze_alpha(image, has_alpha, has_fractional_alpha), BCENC_SUCCESS);
	EXPECT_TRUE(has_alpha);
	EXPECT_FALSE(has_fractional_alpha);

	data[7] = 0.25f;
	EXPECT_EQ(bcenc_analyze_alpha(image, has_alpha, has_fractional_alpha), BCENC_SUCCESS);
	EXPECT_TRUE(has_fractional_alpha);
}

/** @brief Test BGRA images use the fourth byte as alpha. */
TEST(image_analysis, BGRAAlpha)
{
	std::vector<uint8_t> buffer;
	bcenc_image image = make_rgba8(buffer, { 255, 40 });
	image.format = BCENC_FMT_B8G8R8A8_UNORM;

	bool has_alpha = false;
	bool has_fractional_alpha = false;
	EXPECT_EQ(bcenc_analyze_alpha(image, has_alpha, has_fractional_alpha), BCENC_SUCCESS);
	EXPECT_TRUE(has_alpha);
	EXPECT_TRUE(has_fractional_alpha);
}

/** @brief Test unsupported formats and bad buffers are rejected. */
TEST(image_analysis, Errors)
{
	std::vector<uint8_t> buffer;
	bcenc_image image = make_rgba8(buffer, { 255, 255 });

	bool has_alpha;
	bool has_fractional_alpha;

	bcenc_image bad = image;
	bad.format = BCENC_FMT_BC1_UNORM;
	EXPECT_EQ(bcenc_analyze_alpha(bad, has_alpha, has_fractional_alpha), BCENC_ERR_BAD_FORMAT);

	bad.format = BCENC_FMT_UNKNOWN;
	EXPECT_EQ(bcenc_analyze_alpha(bad, has_alpha, has_fractional_alpha), BCENC_ERR_BAD_FORMAT);

	bad = image;
	bad.data_len = 7;
	EXPECT_EQ(bcenc_analyze_alpha(bad, has_alpha, has_fractional_alpha), BCENC_ERR_BAD_PARAM);

	bad = image;
	bad.data = nullptr;
	EXPECT_EQ(bcenc_analyze_alpha(bad, has_alpha, has_fractional_alpha), BCENC_ERR_BAD_PARAM);
}

/** @brief Test premultiplication scales color by alpha. */
TEST(image_analysis, Premultiply)
{
	std::vector<float> data { 1.0f, 0.5f, 0.25f, 0.5f,
	                          0.8f, 0.6f, 0.4f, 1.0f };

	bcenc_image image;
	image.dim_x = 2;
	image.dim_y = 1;
	image.row_pitch = 0;
	image.format = BCENC_FMT_R32G32B32A32_FLOAT;
	image.data = data.data();
	image.data_len = data.size() * sizeof(float);

	EXPECT_EQ(bcenc_premultiply_alpha(image), BCENC_SUCCESS);
	EXPECT_EQ(data[0], 0.5f);
	EXPECT_EQ(data[1], 0.25f);
	EXPECT_EQ(data[2], 0.125f);
	EXPECT_EQ(data[3], 0.5f);
	EXPECT_EQ(data[4], 0.8f);
	EXPECT_EQ(data[5], 0.6f);
	EXPECT_EQ(data[6], 0.4f);
	EXPECT_EQ(data[7], 1.0f);

	std::vector<uint8_t> buffer;
	bcenc_image rgba8 = make_rgba8(buffer, { 128 });
	EXPECT_EQ(bcenc_premultiply_alpha(rgba8), BCENC_ERR_BAD_FORMAT);
}

/** @brief Test float alpha close to the limits counts as the limit. */
TEST(image_analysis, FloatAlphaTolerance)
{
	std::vector<float> data { 0.5f, 0.5f, 0.5f, 0.999999f,
	                          0.5f, 0.5f, 0.5f, 1.0f };
	bcenc_image image = make_float(data, 2, 1);

	bool has_alpha = true;
	bool has_fractional_alpha = true;
	EXPECT_EQ(bcenc_analyze_alpha(image, has_alpha, has_fractional_alpha), BCENC_SUCCESS);
	EXPECT_FALSE(has_alpha);
	EXPECT_FALSE(has_fractional_alpha);

	data[7] = 0.000001f;
	EXPECT_EQ(bcenc_analyze_alpha(image, has_alpha, has_fractional_alpha), BCENC_SUCCESS);
	EXPECT_TRUE(has_alpha);
	EXPECT_FALSE(has_fractional_alpha);

	data[7] = 0.001f;
	EXPECT_EQ(bcenc_analyze_alpha(image, has_alpha, has_fractional_alpha), BCENC_SUCCESS);
	EXPECT_TRUE(has_fractional_alpha);
}

/** @brief Test gamma conversion in both directions leaves alpha alone. */
TEST(image_processing, Gamma)
{
	std::vector<float> data { 0.25f, 0.5f, 1.0f, 0.3f,
	                          0.0f, 0.81f, 0.09f, 0.7f };
	bcenc_image image = make_float(data, 2, 1);

	EXPECT_EQ(bcenc_gamma_to_linear(image, 2.0f), BCENC_SUCCESS);
	EXPECT_FLOAT_EQ(data[0], 0.0625f);
	EXPECT_FLOAT_EQ(data[1], 0.25f);
	EXPECT_FLOAT_EQ(data[2], 1.0f);
	EXPECT_EQ(data[3], 0.3f);
	EXPECT_FLOAT_EQ(data[4], 0.0f);
	EXPECT_FLOAT_EQ(data[5], 0.6561f);
	EXPECT_FLOAT_EQ(data[6], 0.0081f);
	EXPECT_EQ(data[7], 0.7f);

	EXPECT_EQ(bcenc_linear_to_gamma(image, 2.0f), BCENC_SUCCESS);
	EXPECT_FLOAT_EQ(data[0], 0.25f);
	EXPECT_FLOAT_EQ(data[1], 0.5f);
	EXPECT_FLOAT_EQ(data[2], 1.0f);
	EXPECT_EQ(data[3], 0.3f);
	EXPECT_FLOAT_EQ(data[5], 0.81f);
	EXPECT_FLOAT_EQ(data[6], 0.09f);
	EXPECT_EQ(data[7], 0.7f);
}

/** @brief Test a unit gamma does nothing, and invalid gammas are rejected. */
TEST(image_processing, GammaErrors)
{
	std::vector<float> data { -0.5f, 0.5f, 2.0f, 1.0f };
	const std::vector<float> expected = data;
	bcenc_image image = make_float(data, 1, 1);

	EXPECT_EQ(bcenc_gamma_to_linear(image, 1.0f), BCENC_SUCCESS);
	EXPECT_EQ(bcenc_linear_to_gamma(image, 1.000001f), BCENC_SUCCESS);
	EXPECT_EQ(data, expected);

	EXPECT_EQ(bcenc_gamma_to_linear(image, 0.0f), BCENC_ERR_BAD_PARAM);
	EXPECT_EQ(bcenc_gamma_to_linear(image, -2.2f), BCENC_ERR_BAD_PARAM);
	EXPECT_EQ(bcenc_linear_to_gamma(image, std::numeric_limits<float>::quiet_NaN()), BCENC_ERR_BAD_PARAM);
	EXPECT_EQ(bcenc_linear_to_gamma(image, std::numeric_limits<float>::infinity()), BCENC_ERR_BAD_PARAM);
	EXPECT_EQ(data, expected);

	std::vector<uint8_t> buffer;
	bcenc_image rgba8 = make_rgba8(buffer, { 128 });
	EXPECT_EQ(bcenc_gamma_to_linear(rgba8, 2.2f), BCENC_ERR_BAD_FORMAT);
	EXPECT_EQ(bcenc_linear_to_gamma(rgba8, 2.2f), BCENC_ERR_BAD_FORMAT);

	image.data = nullptr;
	EXPECT_EQ(bcenc_gamma_to_linear(image, 2.2f), BCENC_ERR_BAD_PARAM);
}

/** @brief Test texels matching the color key become transparent. */
TEST(image_processing, ColorKey)
{
	std::vector<float> data { 1.0f, 0.0f, 1.0f, 1.0f,
	                          1.0f, 0.000001f, 1.0f, 1.0f,
	                          1.0f, 0.01f, 1.0f, 1.0f,
	                          1.0f, 0.0f, 1.0f, 0.5f };
	bcenc_image image = make_float(data, 4, 1);

	const float key[4] { 1.0f, 0.0f, 1.0f, 1.0f };
	EXPECT_EQ(bcenc_apply_color_key(image, key), BCENC_SUCCESS);

	// Color is kept, only alpha changes
	EXPECT_EQ(data[0], 1.0f);
	EXPECT_EQ(data[2], 1.0f);
	EXPECT_EQ(data[3], 0.0f);
	EXPECT_EQ(data[5], 0.000001f);
	EXPECT_EQ(data[7], 0.0f);
	EXPECT_EQ(data[11], 1.0f);
	EXPECT_EQ(data[15], 0.5f);

	EXPECT_EQ(bcenc_apply_color_key(image, nullptr), BCENC_ERR_BAD_PARAM);

	std::vector<uint8_t> buffer;
	bcenc_image rgba8 = make_rgba8(buffer, { 255 });
	EXPECT_EQ(bcenc_apply_color_key(rgba8, key), BCENC_ERR_BAD_FORMAT);
}

/**
 * @brief Make a float image where each texel stores its own coordinates.
 */
static std::vector<float> make_coordinate_image(
	unsigned int dim_x,
	unsigned int dim_y,
	unsigned int pitch_floats
) {
	std::vector<float> data(pitch_floats * dim_y, -1.0f);
	for (unsigned int y = 0; y < dim_y; y++)
	{
		for (unsigned int x = 0; x < dim_x; x++)
		{
			float* texel = data.data() + y * pitch_floats + 4 * x;
			texel[0] = static_cast<float>(x);
			texel[1] = static_cast<float>(y);
			texel[2] = 0.0f;
			texel[3] = 1.0f;
		}
	}

	return data;
}

/** @brief Test horizontal mirroring, including an odd width. */
TEST(image_processing, FlipX)
{
	std::vector<float> data = make_coordinate_image(3, 2, 12);
	bcenc_image image = make_float(data, 3, 2);

	EXPECT_EQ(bcenc_flip_x(image), BCENC_SUCCESS);
	for (unsigned int y = 0; y < 2; y++)
	{
		for (unsigned int x = 0; x < 3; x++)
		{
			const float* texel = data.data() + y * 12 + 4 * x;
			EXPECT_EQ(texel[0], static_cast<float>(2 - x));
			EXPECT_EQ(texel[1], static_cast<float>(y));
		}
	}
}

/** @brief Test vertical mirroring honours the row pitch. */
TEST(image_processing, FlipY)
{
	// Three texels per row, padded to four
	std::vector<float> data = make_coordinate_image(3, 3, 16);
	bcenc_image image = make_float(data, 3, 3, 16 * sizeof(float));

	EXPECT_EQ(bcenc_flip_y(image), BCENC_SUCCESS);
	for (unsigned int y = 0; y < 3; y++)
	{
		for (unsigned int x = 0; x < 3; x++)
		{
			const float* texel = data.data() + y * 16 + 4 * x;
			EXPECT_EQ(texel[0], static_cast<float>(x));
			EXPECT_EQ(texel[1], static_cast<float>(2 - y));
		}

		// Row padding is not touched
		for (unsigned int i = 12; i < 16; i++)
		{
			EXPECT_EQ(data[y * 16 + i], -1.0f);
		}
	}

	std::vector<uint8_t> buffer;
	bcenc_image rgba8 = make_rgba8(buffer, { 255, 255 });
	EXPECT_EQ(bcenc_flip_x(rgba8), BCENC_ERR_BAD_FORMAT);
	EXPECT_EQ(bcenc_flip_y(rgba8), BCENC_ERR_BAD_FORMAT);
}

}
