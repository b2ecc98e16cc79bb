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
 * @brief Functions for whole image analysis and processing.
 *
 * Apart from the alpha analysis, which also reads 8-bit images, these
 * operations process R32G32B32A32_FLOAT images in place before they are
 * converted to a storage format.
 */

#include <cmath>
#include <cstring>

#include "bcenc_internal.h"

/**
 * @brief The tolerance used when comparing float texel values.
 */
static const float IMAGE_EPSILON { 1e-5f };

/**
 * @brief Check that an image buffer is large enough for its dimensions.
 */
static bool is_image_buffer_valid(
	const bcenc_image& image,
	const format_descriptor& fd
) {
	if (!image.data || image.dim_x == 0 || image.dim_y == 0)
	{
		return false;
	}

	size_t min_pitch = get_min_row_pitch(fd, image.dim_x);
	size_t pitch = get_row_pitch(image, fd);
	if (pitch < min_pitch)
	{
		return false;
	}

	size_t size_needed = (static_cast<size_t>(image.dim_y) - 1) * pitch + min_pitch;
	return image.data_len >= size_needed;
}

/* Public function, see header file for detailed documentation */
bcenc_error bcenc_analyze_alpha(
	const bcenc_image& image,
	bool& has_alpha,
	bool& has_fractional_alpha
) {
	has_alpha = false;
	has_fractional_alpha = false;

	const format_descriptor* fd = get_format_descriptor(image.format);
	if (!fd)
	{
		return BCENC_ERR_BAD_FORMAT;
	}

	bool is_float = false;
	unsigned int alpha_offset = 0;
	switch (image.format)
	{
	case BCENC_FMT_R32G32B32A32_FLOAT:
		is_float = true;
		alpha_offset = 12;
		break;
	case BCENC_FMT_R8G8B8A8_UNORM:
	case BCENC_FMT_R8G8B8A8_UNORM_SRGB:
	case BCENC_FMT_R8G8B8A8_UINT:
	case BCENC_FMT_R8G8B8A8_SNORM:
	case BCENC_FMT_R8G8B8A8_SINT:
	case BCENC_FMT_B8G8R8A8_UNORM:
	case BCENC_FMT_B8G8R8A8_UNORM_SRGB:
		alpha_offset = 3;
		break;
	default:
		return BCENC_ERR_BAD_FORMAT;
	}

	if (!is_image_buffer_valid(image, *fd))
	{
		return BCENC_ERR_BAD_PARAM;
	}

	const uint8_t* base = static_cast<const uint8_t*>(image.data);
	size_t pitch = get_row_pitch(image, *fd);

	for (unsigned int y = 0; y < image.dim_y; y++)
	{
		const uint8_t* row = base + y * pitch;
		for (unsigned int x = 0; x < image.dim_x; x++)
		{
			const uint8_t* pixel = row + static_cast<size_t>(x) * fd->pixel_bytes;

			bool below_max;
			bool above_min;
			if (is_float)
			{
				float alpha;
				std::memcpy(&alpha, pixel + alpha_offset, sizeof(float));
				below_max = alpha < 1.0f - IMAGE_EPSILON;
				above_min = alpha > IMAGE_EPSILON;
			}
			else
			{
				uint8_t alpha = pixel[alpha_offset];
				below_max = alpha < 255;
				above_min = alpha > 0;
			}

			if (below_max)
			{
				has_alpha = true;
				if (above_min)
				{
					// Nothing further can change the result
					has_fractional_alpha = true;
					return BCENC_SUCCESS;
				}
			}
		}
	}

	return BCENC_SUCCESS;
}

/**
 * @brief Check that an image is a valid float RGBA image.
 *
 * @param image   The image to check.
 *
 * @return BCENC_SUCCESS if valid, or the error to report.
 */
static bcenc_error validate_float_image(
	const bcenc_image& image
) {
	if (image.format != BCENC_FMT_R32G32B32A32_FLOAT)
	{
		return BCENC_ERR_BAD_FORMAT;
	}

	const format_descriptor* fd = get_format_descriptor(image.format);
	if (!is_image_buffer_valid(image, *fd))
	{
		return BCENC_ERR_BAD_PARAM;
	}

	return BCENC_SUCCESS;
}

/**
 * @brief Get a pointer to a texel of a valid float RGBA image.
 */
static uint8_t* get_float_texel(
	bcenc_image& image,
	unsigned int x,
	unsigned int y
) {
	const format_descriptor* fd = get_format_descriptor(image.format);
	size_t pitch = get_row_pitch(image, *fd);
	return static_cast<uint8_t*>(image.data) + y * pitch + static_cast<size_t>(x) * fd->pixel_bytes;
}

/**
 * @brief Raise the color channels of a float RGBA image to a power.
 */
static void apply_power(
	bcenc_image& image,
	float exponent
) {
	for (unsigned int y = 0; y < image.dim_y; y++)
	{
		for (unsigned int x = 0; x < image.dim_x; x++)
		{
			float rgba[4];
			uint8_t* pixel = get_float_texel(image, x, y);
			std::memcpy(rgba, pixel, sizeof(rgba));

			rgba[0] = std::pow(rgba[0], exponent);
			rgba[1] = std::pow(rgba[1], exponent);
			rgba[2] = std::pow(rgba[2], exponent);
			std::memcpy(pixel, rgba, sizeof(rgba));
		}
	}
}

/**
 * @brief Validate a gamma value and check if it changes the image.
 *
 * @param      gamma    The gamma value.
 * @param[out] is_nop   Set if the gamma is close enough to 1 to do nothing.
 *
 * @return BCENC_SUCCESS if valid, or BCENC_ERR_BAD_PARAM otherwise.
 */
static bcenc_error validate_gamma(
	float gamma,
	bool& is_nop
) {
	is_nop = std::fabs(gamma - 1.0f) <= IMAGE_EPSILON;
	if (is_nop)
	{
		return BCENC_SUCCESS;
	}

	// Also rejects NaN
	if (!(gamma > 0.0f) || std::isinf(gamma))
	{
		return BCENC_ERR_BAD_PARAM;
	}

	return BCENC_SUCCESS;
}

/* Public function, see header file for detailed documentation */
bcenc_error bcenc_premultiply_alpha(
	bcenc_image& image
) {
	bcenc_error status = validate_float_image(image);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	for (unsigned int y = 0; y < image.dim_y; y++)
	{
		for (unsigned int x = 0; x < image.dim_x; x++)
		{
			float rgba[4];
			uint8_t* pixel = get_float_texel(image, x, y);
			std::memcpy(rgba, pixel, sizeof(rgba));

			if (rgba[3] < 1.0f)
			{
				rgba[0] *= rgba[3];
				rgba[1] *= rgba[3];
				rgba[2] *= rgba[3];
				std::memcpy(pixel, rgba, sizeof(rgba));
			}
		}
	}

	return BCENC_SUCCESS;
}

/* Public function, see header file for detailed documentation */
bcenc_error bcenc_gamma_to_linear(
	bcenc_image& image,
	float gamma
) {
	bcenc_error status = validate_float_image(image);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	bool is_nop;
	status = validate_gamma(gamma, is_nop);
	if (status != BCENC_SUCCESS || is_nop)
	{
		return status;
	}

	apply_power(image, gamma);
	return BCENC_SUCCESS;
}

/* Public function, see header file for detailed documentation */
bcenc_error bcenc_linear_to_gamma(
	bcenc_image& image,
	float gamma
) {
	bcenc_error status = validate_float_image(image);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	bool is_nop;
	status = validate_gamma(gamma, is_nop);
	if (status != BCENC_SUCCESS || is_nop)
	{
		return status;
	}

	apply_power(image, 1.0f / gamma);
	return BCENC_SUCCESS;
}

/* Public function, see header file for detailed documentation */
bcenc_error bcenc_apply_color_key(
	bcenc_image& image,
	const float color_key[4]
) {
	bcenc_error status = validate_float_image(image);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	if (!color_key)
	{
		return BCENC_ERR_BAD_PARAM;
	}

	for (unsigned int y = 0; y < image.dim_y; y++)
	{
		for (unsigned int x = 0; x < image.dim_x; x++)
		{
			float rgba[4];
			uint8_t* pixel = get_float_texel(image, x, y);
			std::memcpy(rgba, pixel, sizeof(rgba));

			bool matches = true;
			for (unsigned int i = 0; i < 4; i++)
			{
				matches = matches && std::fabs(rgba[i] - color_key[i]) <= IMAGE_EPSILON;
			}

			// Keyed texels keep their color and become fully transparent
			if (matches)
			{
				rgba[3] = 0.0f;
				std::memcpy(pixel, rgba, sizeof(rgba));
			}
		}
	}

	return BCENC_SUCCESS;
}

/**
 * @brief Swap two float RGBA texels.
 */
static void swap_float_texels(
	uint8_t* p,
	uint8_t* q
) {
	uint8_t tmp[16];
	std::memcpy(tmp, p, sizeof(tmp));
	std::memcpy(p, q, sizeof(tmp));
	std::memcpy(q, tmp, sizeof(tmp));
}

/* Public function, see header file for detailed documentation */
bcenc_error bcenc_flip_x(
	bcenc_image& image
) {
	bcenc_error status = validate_float_image(image);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	unsigned int half_x = image.dim_x / 2;
	for (unsigned int y = 0; y < image.dim_y; y++)
	{
		for (unsigned int x0 = 0; x0 < half_x; x0++)
		{
			unsigned int x1 = image.dim_x - x0 - 1;
			swap_float_texels(get_float_texel(image, x0, y), get_float_texel(image, x1, y));
		}
	}

	return BCENC_SUCCESS;
}

/* Public function, see header file for detailed documentation */
bcenc_error bcenc_flip_y(
	bcenc_image& image
) {
	bcenc_error status = validate_float_image(image);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	unsigned int half_y = image.dim_y / 2;
	for (unsigned int y0 = 0; y0 < half_y; y0++)
	{
		unsigned int y1 = image.dim_y - y0 - 1;
		for (unsigned int x = 0; x < image.dim_x; x++)
		{
			swap_float_texels(get_float_texel(image, x, y0), get_float_texel(image, x, y1));
		}
	}

	return BCENC_SUCCESS;
}
