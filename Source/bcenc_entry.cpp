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
 * @brief Functions for the library entrypoint.
 */

#include <cstring>
#include <new>

#include "bcenc.h"
#include "bcenc_internal.h"

// The codec is written with the assumption that a float threaded through the
// "if32" union will in fact be stored and reloaded as a 32-bit IEEE-754
// single-precision float, stored with round-to-nearest rounding. This is
// always the case in an IEEE-754 compliant system, however not every system is
// actually IEEE-754 compliant in the first place. As such, we run a quick test
// to check that this is actually the case (e.g. gcc on 32-bit x86 will
// typically fail unless -msse2 -mfpmath=sse2 is specified).
static bcenc_error validate_cpu_float()
{
	if32 p;
	volatile float xprec_testval = 2.51f;
	p.f = xprec_testval + 12582912.0f;
	float q = p.f - 12582912.0f;

	if (q != 3.0f)
	{
		return BCENC_ERR_BAD_CPU_FLOAT;
	}

	return BCENC_SUCCESS;
}

static bcenc_error validate_preset(
	bcenc_preset preset
) {
	switch (preset)
	{
	case BCENC_PRE_FAST:
	case BCENC_PRE_MEDIUM:
	case BCENC_PRE_THOROUGH:
		return BCENC_SUCCESS;
	default:
		return BCENC_ERR_BAD_PRESET;
	}
}

static bcenc_error validate_flags(
	unsigned int flags
) {
	// Flags field must not contain any unknown flag bits
	unsigned int exMask = ~BCENC_ALL_FLAGS;
	if (bcn::popcount(flags & exMask) != 0)
	{
		return BCENC_ERR_BAD_FLAGS;
	}

	return BCENC_SUCCESS;
}

static bcenc_error validate_config(
	bcenc_config &config,
	unsigned int thread_count
) {
	bcenc_error status;

	status = validate_preset(config.preset);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	status = validate_flags(config.flags);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

#if defined(BCENC_DIAGNOSTICS)
	// Diagnostic builds are single threaded only
	if (thread_count != 1)
	{
		return BCENC_ERR_BAD_PARAM;
	}
#else
	(void)thread_count;
#endif

	config.tune_refinement_limit = bcn::clamp(config.tune_refinement_limit, 1u,
	                                          static_cast<unsigned int>(MAX_CLUSTER_ITERATIONS));

	// Negative or NaN weights are invalid, and at least one must be non-zero
	if (!(config.cw_r_weight >= 0.0f) ||
	    !(config.cw_g_weight >= 0.0f) ||
	    !(config.cw_b_weight >= 0.0f))
	{
		return BCENC_ERR_BAD_PARAM;
	}

	float max_weight = bcn::fmax(config.cw_r_weight, bcn::fmax(config.cw_g_weight, config.cw_b_weight));
	if (max_weight <= 0.0f)
	{
		return BCENC_ERR_BAD_PARAM;
	}

	// Tiny weights make the endpoint axis unstable, so floor them
	float min_weight = max_weight / 1000.0f;
	config.cw_r_weight = bcn::fmax(config.cw_r_weight, min_weight);
	config.cw_g_weight = bcn::fmax(config.cw_g_weight, min_weight);
	config.cw_b_weight = bcn::fmax(config.cw_b_weight, min_weight);

	return BCENC_SUCCESS;
}

/**
 * @brief Validate an image, and get its format descriptor.
 *
 * @param      image   The image to validate.
 * @param[out] fd      The format descriptor of the image.
 *
 * @return BCENC_SUCCESS if the image is usable.
 */
static bcenc_error validate_image(
	const bcenc_image& image,
	const format_descriptor*& fd
) {
	fd = get_format_descriptor(image.format);
	if (!fd)
	{
		return BCENC_ERR_BAD_FORMAT;
	}

	return BCENC_SUCCESS;
}

/**
 * @brief Validate the buffer of an image against its dimensions.
 */
static bcenc_error validate_image_buffer(
	const bcenc_image& image,
	const format_descriptor& fd
) {
	if (!image.data || image.dim_x == 0 || image.dim_y == 0)
	{
		return BCENC_ERR_BAD_PARAM;
	}

	size_t min_pitch = get_min_row_pitch(fd, image.dim_x);
	size_t pitch = get_row_pitch(image, fd);
	if (pitch < min_pitch)
	{
		return BCENC_ERR_BAD_PARAM;
	}

	// The final row only needs to hold its own data, not the row padding
	size_t rows = get_row_count(fd, image.dim_y);
	size_t size_needed = (rows - 1) * pitch + min_pitch;
	if (image.data_len < size_needed)
	{
		return BCENC_ERR_BAD_PARAM;
	}

	return BCENC_SUCCESS;
}

/* Public function, see header file for detailed documentation */
bcenc_error bcenc_config_init(
	bcenc_preset preset,
	unsigned int flags,
	bcenc_config& config
) {
	bcenc_error status;

	// Zero init all config fields; although most of will be over written
	std::memset(&config, 0, sizeof(config));

	config.preset = preset;

	// Process the search preset
	switch (preset)
	{
	case BCENC_PRE_FAST:
		config.tune_refinement_limit = 1;
		break;
	case BCENC_PRE_MEDIUM:
		config.tune_refinement_limit = 1;
		break;
	case BCENC_PRE_THOROUGH:
		config.tune_refinement_limit = MAX_CLUSTER_ITERATIONS;
		break;
	default:
		return BCENC_ERR_BAD_PRESET;
	}

	// Flags field must not contain any unknown flag bits
	status = validate_flags(flags);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	if (flags & BCENC_FLG_USE_PERCEPTUAL)
	{
		config.cw_r_weight = 0.2126f;
		config.cw_g_weight = 0.7152f;
		config.cw_b_weight = 0.0722f;
	}
	else
	{
		config.cw_r_weight = 1.0f;
		config.cw_g_weight = 1.0f;
		config.cw_b_weight = 1.0f;
	}

	config.flags = flags;

	return BCENC_SUCCESS;
}

/* Public function, see header file for detailed documentation */
bcenc_error bcenc_context_alloc(
	const bcenc_config& config,
	unsigned int thread_count,
	bcenc_context** context
) {
	bcenc_error status;
	bcenc_context* ctx = nullptr;

	if (!context)
	{
		return BCENC_ERR_BAD_PARAM;
	}

	status = validate_cpu_float();
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	if (thread_count == 0)
	{
		return BCENC_ERR_BAD_PARAM;
	}

	ctx = new bcenc_context;
	ctx->thread_count = thread_count;
	ctx->config = config;
	ctx->working_buffers = nullptr;
#if defined(BCENC_DIAGNOSTICS)
	ctx->trace_log = nullptr;
#endif

	// Copy the config first and validate the copy (we may modify it)
	status = validate_config(ctx->config, thread_count);
	if (status != BCENC_SUCCESS)
	{
		delete ctx;
		return status;
	}

	ctx->bcc.kind = BLOCK_NONE;
	ctx->bcc.use_range_fit = ctx->config.preset == BCENC_PRE_FAST;
	ctx->bcc.weight_by_alpha = (ctx->config.flags & BCENC_FLG_USE_ALPHA_WEIGHT) != 0;
	ctx->bcc.metric = float3(ctx->config.cw_r_weight, ctx->config.cw_g_weight, ctx->config.cw_b_weight);
	ctx->bcc.iteration_count = ctx->config.tune_refinement_limit;

	size_t worksize = sizeof(compress_block_buffers) * thread_count;
	ctx->working_buffers = aligned_malloc<compress_block_buffers>(worksize, 32);
	if (!ctx->working_buffers)
	{
		delete ctx;
		*context = nullptr;
		return BCENC_ERR_OUT_OF_MEM;
	}

#if defined(BCENC_DIAGNOSTICS)
	if (ctx->config.trace_file_path)
	{
		ctx->trace_log = new TraceLog(ctx->config.trace_file_path);
		if (!ctx->trace_log->m_file)
		{
			delete ctx->trace_log;
			aligned_free<compress_block_buffers>(ctx->working_buffers);
			delete ctx;
			*context = nullptr;
			return BCENC_ERR_BAD_PARAM;
		}
	}
#endif

	// Build the shared lookup tables now, rather than on first use by a worker
	init_sf16_tables();
	get_single_color_tables();

	*context = ctx;
	return BCENC_SUCCESS;
}

/* Public function, see header file for detailed documentation */
void bcenc_context_free(
	bcenc_context* ctx
) {
	if (ctx)
	{
		aligned_free<compress_block_buffers>(ctx->working_buffers);
#if defined(BCENC_DIAGNOSTICS)
		delete ctx->trace_log;
#endif
		delete ctx;
	}
}

/**
 * @brief Run the conversion tasks for a single thread.
 */
static void convert_image(
	bcenc_context& ctx,
	unsigned int thread_index,
	const bcenc_image& image_in,
	const format_descriptor& src,
	bcenc_image& image_out,
	const format_descriptor& dst
) {
	// Use preallocated scratch buffer
	compress_block_buffers& temp_buffers = ctx.working_buffers[thread_index];

	// Only the first thread actually runs the initializer
	ctx.manage_convert.init(get_convert_task_count(src, dst, image_in.dim_x, image_in.dim_y));

	// All threads run this processing loop until there is no work remaining
	while (true)
	{
		unsigned int count;
		unsigned int base = ctx.manage_convert.get_task_assignment(TASK_GRANULE, count);
		if (!count)
		{
			break;
		}

		for (unsigned int i = base; i < base + count; i++)
		{
			convert_task(ctx.bcc, image_in, src, image_out, dst, i, temp_buffers);
		}

		ctx.manage_convert.complete_task_assignment(count);
	}
}

/* Public function, see header file for detailed documentation */
bcenc_error bcenc_convert_image(
	bcenc_context* ctx,
	const bcenc_image& image_in,
	bcenc_image& image_out,
	unsigned int thread_index
) {
	bcenc_error status;

	if (!ctx)
	{
		return BCENC_ERR_BAD_CONTEXT;
	}

	if (thread_index >= ctx->thread_count)
	{
		return BCENC_ERR_BAD_PARAM;
	}

	const format_descriptor* src = nullptr;
	const format_descriptor* dst = nullptr;

	status = validate_image(image_in, src);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	status = validate_image(image_out, dst);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	if (!bcenc_can_convert(image_in.format, image_out.format))
	{
		return BCENC_ERR_UNSUPPORTED_CONVERSION;
	}

	if (image_in.dim_x != image_out.dim_x || image_in.dim_y != image_out.dim_y)
	{
		return BCENC_ERR_BAD_PARAM;
	}

	status = validate_image_buffer(image_in, *src);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	status = validate_image_buffer(image_out, *dst);
	if (status != BCENC_SUCCESS)
	{
		return status;
	}

	TRACE_NODE(node0, "convert");
	trace_add_data("src", src->name);
	trace_add_data("dst", dst->name);
	trace_add_data("dim_x", image_in.dim_x);
	trace_add_data("dim_y", image_in.dim_y);

	convert_image(*ctx, thread_index, image_in, *src, image_out, *dst);

	// Wait for all threads to finish before returning to the caller
	ctx->manage_convert.wait();

	return BCENC_SUCCESS;
}

/* Public function, see header file for detailed documentation */
bcenc_error bcenc_convert_reset(
	bcenc_context* ctx
) {
	if (!ctx)
	{
		return BCENC_ERR_BAD_CONTEXT;
	}

	ctx->manage_convert.reset();
	return BCENC_SUCCESS;
}

/* Public function, see header file for detailed documentation */
const char* bcenc_get_error_string(
	bcenc_error status
) {
	switch (status)
	{
	case BCENC_SUCCESS:
		return "BCENC_SUCCESS";
	case BCENC_ERR_OUT_OF_MEM:
		return "BCENC_ERR_OUT_OF_MEM";
	case BCENC_ERR_BAD_CPU_FLOAT:
		return "BCENC_ERR_BAD_CPU_FLOAT";
	case BCENC_ERR_BAD_PARAM:
		return "BCENC_ERR_BAD_PARAM";
	case BCENC_ERR_BAD_FORMAT:
		return "BCENC_ERR_BAD_FORMAT";
	case BCENC_ERR_BAD_PRESET:
		return "BCENC_ERR_BAD_PRESET";
	case BCENC_ERR_BAD_FLAGS:
		return "BCENC_ERR_BAD_FLAGS";
	case BCENC_ERR_BAD_CONTEXT:
		return "BCENC_ERR_BAD_CONTEXT";
	case BCENC_ERR_UNSUPPORTED_CONVERSION:
		return "BCENC_ERR_UNSUPPORTED_CONVERSION";
	default:
		return nullptr;
	}
}
