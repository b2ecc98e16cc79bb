// SPDX-License-Identifier: Apache-2.0
// ----------------------------------------------------------------------------
// Copyright 2020-2021 Arm Limited
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
 * @brief The core bcenc texture codec library interface.
 *
 * This interface is the entry point to the core bcenc codec. The codec
 * converts images between GPU texture data formats, including compression to
 * and decompression from the BC1, BC2, and BC3 block compressed formats. The
 * core codec only handles conversion, transferring all inputs and outputs via
 * memory buffers. To catch obvious input/output buffer sizing issues, which
 * can cause security and stability problems, all transfer buffers are
 * explicitly sized.
 *
 * The codec does not decide which conversion to run. Callers can query the
 * set of supported format pairs using bcenc_can_convert(); a conversion
 * request for any other pair fails without touching the output buffer.
 *
 * The API state management is based around an explicit context object, which
 * is the context for all allocated memory resources needed to convert a single
 * image. A context can be used to sequentially convert multiple images using
 * the same configuration, allowing setup overheads to be amortized over
 * multiple images.
 *
 * Threading
 * =========
 *
 * Multi-threading can be used two ways.
 *
 *     * An application wishing to process multiple images in parallel can
 *       allocate multiple contexts and assign each context to a thread.
 *     * An application wishing to process a single image in using multiple
 *       threads can configure the context for multi-threaded use, and invoke
 *       bcenc_convert_image() once per thread. The caller is responsible for
 *       creating the worker threads.
 *
 * In pseudocode, the usage for manual user threading looks like this:
 *
 *     // Configure the codec run
 *     bcenc_config my_config;
 *     bcenc_config_init(..., my_config);
 *
 *     // Allocate working state given config and thread_count
 *     bcenc_context* my_context;
 *     bcenc_context_alloc(my_config, thread_count, &my_context);
 *
 *     // Convert each image using these config settings
 *     foreach image:
 *         // For each thread in the thread pool
 *         for i in range(0, thread_count):
 *             bcenc_convert_image(my_context, my_input, my_output, i);
 *
 *         bcenc_convert_reset(my_context);
 *
 *     // Clean up
 *     bcenc_context_free(my_context);
 *
 * Images
 * ======
 *
 * Images are passed in as a bcenc_image structure, which wraps a raw byte
 * buffer. Data is stored row-major; each row starts row_pitch bytes after the
 * previous one. For block compressed formats a row is a row of 4x4 blocks.
 * Images can be any dimension; there is no requirement for them to be a
 * multiple of the block size.
 *
 * Multi-byte pixel components and packed pixel words are stored little-endian,
 * matching the Direct3D data format conventions.
 */

#ifndef BCENC_INCLUDED
#define BCENC_INCLUDED

#include <cstddef>
#include <cstdint>

/* ============================================================================
    Data declarations
============================================================================ */

/**
 * @brief An opaque structure; see bcenc_internal.h for definition.
 */
struct bcenc_context;

/**
 * @brief A codec API error code.
 */
enum bcenc_error {
	/** @brief The call was successful. */
	BCENC_SUCCESS = 0,
	/** @brief The call failed due to low memory. */
	BCENC_ERR_OUT_OF_MEM,
	/** @brief The call failed due to the build using fast math. */
	BCENC_ERR_BAD_CPU_FLOAT,
	/** @brief The call failed due to an out-of-spec parameter or buffer. */
	BCENC_ERR_BAD_PARAM,
	/** @brief The call failed due to an unknown data format. */
	BCENC_ERR_BAD_FORMAT,
	/** @brief The call failed due to an out-of-spec quality preset. */
	BCENC_ERR_BAD_PRESET,
	/** @brief The call failed due to an out-of-spec flag set. */
	BCENC_ERR_BAD_FLAGS,
	/** @brief The call failed due to a missing or unusable context. */
	BCENC_ERR_BAD_CONTEXT,
	/** @brief The call failed due to an unsupported format pair. */
	BCENC_ERR_UNSUPPORTED_CONVERSION
};

/**
 * @brief A codec quality preset.
 */
enum bcenc_preset {
	/** @brief The fast search preset; fits endpoints to the color range. */
	BCENC_PRE_FAST = 0,
	/** @brief The medium quality preset; a single cluster fit pass. */
	BCENC_PRE_MEDIUM,
	/** @brief The thorough quality preset; an iterative cluster fit. */
	BCENC_PRE_THOROUGH
};

/**
 * @brief A texture data format.
 *
 * Format names give the channel order from the least significant bits of the
 * first pixel byte upwards, using the Direct3D naming conventions.
 */
enum bcenc_format {
	BCENC_FMT_UNKNOWN = 0,

	BCENC_FMT_R32G32B32A32_FLOAT,
	BCENC_FMT_R32G32B32A32_UINT,
	BCENC_FMT_R32G32B32A32_SINT,
	BCENC_FMT_R32G32B32_FLOAT,
	BCENC_FMT_R32G32B32_UINT,
	BCENC_FMT_R32G32B32_SINT,
	BCENC_FMT_R16G16B16A16_FLOAT,
	BCENC_FMT_R16G16B16A16_UNORM,
	BCENC_FMT_R16G16B16A16_UINT,
	BCENC_FMT_R16G16B16A16_SNORM,
	BCENC_FMT_R16G16B16A16_SINT,
	BCENC_FMT_R32G32_FLOAT,
	BCENC_FMT_R32G32_UINT,
	BCENC_FMT_R32G32_SINT,
	BCENC_FMT_R10G10B10A2_UNORM,
	BCENC_FMT_R10G10B10A2_UINT,
	BCENC_FMT_R8G8B8A8_UNORM,
	BCENC_FMT_R8G8B8A8_UNORM_SRGB,
	BCENC_FMT_R8G8B8A8_UINT,
	BCENC_FMT_R8G8B8A8_SNORM,
	BCENC_FMT_R8G8B8A8_SINT,
	BCENC_FMT_R16G16_FLOAT,
	BCENC_FMT_R16G16_UNORM,
	BCENC_FMT_R16G16_UINT,
	BCENC_FMT_R16G16_SNORM,
	BCENC_FMT_R16G16_SINT,
	BCENC_FMT_R32_FLOAT,
	BCENC_FMT_R32_UINT,
	BCENC_FMT_R32_SINT,
	BCENC_FMT_R8G8_UNORM,
	BCENC_FMT_R8G8_UINT,
	BCENC_FMT_R8G8_SNORM,
	BCENC_FMT_R8G8_SINT,
	BCENC_FMT_R16_FLOAT,
	BCENC_FMT_R16_UNORM,
	BCENC_FMT_R16_UINT,
	BCENC_FMT_R16_SNORM,
	BCENC_FMT_R16_SINT,
	BCENC_FMT_R8_UNORM,
	BCENC_FMT_R8_UINT,
	BCENC_FMT_R8_SNORM,
	BCENC_FMT_R8_SINT,
	BCENC_FMT_A8_UNORM,
	BCENC_FMT_B5G6R5_UNORM,
	BCENC_FMT_B5G5R5A1_UNORM,
	BCENC_FMT_B4G4R4A4_UNORM,
	BCENC_FMT_B8G8R8A8_UNORM,
	BCENC_FMT_B8G8R8A8_UNORM_SRGB,
	BCENC_FMT_B8G8R8X8_UNORM,
	BCENC_FMT_B8G8R8X8_UNORM_SRGB,
	BCENC_FMT_BC1_UNORM,
	BCENC_FMT_BC1_UNORM_SRGB,
	BCENC_FMT_BC2_UNORM,
	BCENC_FMT_BC2_UNORM_SRGB,
	BCENC_FMT_BC3_UNORM,
	BCENC_FMT_BC3_UNORM_SRGB,

	/** @brief The number of format values; not a valid format. */
	BCENC_FMT_COUNT
};

/**
 * @brief Enable alpha weighting.
 *
 * The input alpha value is used for transparency, so errors in the RGB
 * channels are weighted by the transparency level. This allows the codec to
 * spend endpoint precision on the opaque texels of a block, where color errors
 * are most visible.
 */
static const unsigned int BCENC_FLG_USE_ALPHA_WEIGHT    = 1 << 0;

/**
 * @brief Enable perceptual error metrics.
 *
 * This mode weights the color channel errors by their contribution to the
 * perceived luminance, rather than treating all channels equally.
 */
static const unsigned int BCENC_FLG_USE_PERCEPTUAL      = 1 << 1;

/**
 * @brief The bit mask of all valid flags.
 */
static const unsigned int BCENC_ALL_FLAGS =
                              BCENC_FLG_USE_ALPHA_WEIGHT |
                              BCENC_FLG_USE_PERCEPTUAL;

/**
 * @brief The config structure.
 *
 * This structure will initially be populated by a call to bcenc_config_init,
 * but power users may modify it before calling bcenc_context_alloc.
 */
struct bcenc_config {
	/** @brief The quality preset used to populate the config. */
	bcenc_preset preset;

	/** @brief The set of set flags. */
	unsigned int flags;

	/** @brief The red channel weight scale for error weighting. */
	float cw_r_weight;

	/** @brief The green channel weight scale for error weighting. */
	float cw_g_weight;

	/** @brief The blue channel weight scale for error weighting. */
	float cw_b_weight;

	/**
	 * @brief The maximum number of cluster fit iterations.
	 *
	 * Valid values are between 1 and 8. Each iteration reorders the colors
	 * using the best endpoints of the previous one; the search stops early if
	 * an ordering repeats or an iteration fails to improve the error. This
	 * setting is ignored by the fast preset.
	 */
	unsigned int tune_refinement_limit;

#if defined(BCENC_DIAGNOSTICS)
	/**
	 * @brief The path to write the diagnostic trace to.
	 *
	 * No trace is written if this is nullptr.
	 */
	const char* trace_file_path;
#endif
};

/**
 * @brief An image stored in a raw byte buffer.
 */
struct bcenc_image {
	/** @brief The X dimension of the image, in texels. */
	unsigned int dim_x;
	/** @brief The Y dimension of the image, in texels. */
	unsigned int dim_y;
	/**
	 * @brief The distance between rows, in bytes.
	 *
	 * For compressed formats this is the distance between rows of blocks. A
	 * value of zero means the rows are tightly packed.
	 */
	size_t row_pitch;
	/** @brief The data format. */
	bcenc_format format;
	/** @brief The data. */
	void* data;
	/** @brief The length of the data, in bytes. */
	size_t data_len;
};

/**
 * Populate a codec config based on default settings.
 *
 * Power users can edit the returned config struct to apply manual fine tuning
 * before allocating the context.
 *
 * @param      preset    Search quality preset.
 * @param      flags     A valid set of BCENC_FLG_* flag bits.
 * @param[out] config    Output config struct to populate.
 *
 * @return BCENC_SUCCESS on success, or an error if the inputs are invalid
 * either individually, or in combination.
 */
bcenc_error bcenc_config_init(
	bcenc_preset preset,
	unsigned int flags,
	bcenc_config& config);

/**
 * @brief Allocate a new codec context based on a config.
 *
 * This function allocates all of the memory resources needed by the codec,
 * including one scratch buffer per thread. This can be slow, so it is
 * recommended that contexts are reused to serially convert multiple images
 * to amortize setup cost.
 *
 * @param[in]  config         Codec config.
 * @param      thread_count   Thread count to configure for.
 * @param[out] context        Location to store an opaque context pointer.
 *
 * @return BCENC_SUCCESS on success, or an error if context creation failed.
 */
bcenc_error bcenc_context_alloc(
	const bcenc_config& config,
	unsigned int thread_count,
	bcenc_context** context);

/**
 * @brief Convert an image to another data format.
 *
 * A single context can only convert a single image at a time.
 *
 * For a context configured for multi-threading, any set of the N threads can
 * call this function. Work will be dynamically scheduled across the threads
 * available. Each thread must have a unique thread_index.
 *
 * All argument validation happens before any output is written; if this
 * function returns an error the output buffer is untouched. The input and
 * output images must have the same dimensions.
 *
 * @param         context        Codec context.
 * @param[in]     image_in       Input image.
 * @param[in,out] image_out      Output image; the data buffer is written.
 * @param         thread_index   Thread index [0..N-1] of calling thread.
 *
 * @return BCENC_SUCCESS on success, or an error if the conversion failed.
 */
bcenc_error bcenc_convert_image(
	bcenc_context* context,
	const bcenc_image& image_in,
	bcenc_image& image_out,
	unsigned int thread_index);

/**
 * @brief Reset the codec state for a new conversion.
 *
 * The caller is responsible for synchronizing threads in the worker thread
 * pool. This function must only be called when all threads have exited the
 * bcenc_convert_image() function for image N, but before any thread enters
 * it for image N + 1.
 *
 * @param context   Codec context.
 *
 * @return BCENC_SUCCESS on success, or an error if reset failed.
 */
bcenc_error bcenc_convert_reset(
	bcenc_context* context);

/**
 * Free the codec context.
 *
 * @param context   The codec context.
 */
void bcenc_context_free(
	bcenc_context* context);

/**
 * @brief Test if a conversion between two formats is supported.
 *
 * @param src   The source format.
 * @param dst   The destination format.
 *
 * @return True if bcenc_convert_image() can convert from @c src to @c dst.
 */
bool bcenc_can_convert(
	bcenc_format src,
	bcenc_format dst);

/**
 * @brief Test if a format is block compressed.
 *
 * @param format   The data format.
 *
 * @return True for BCn formats, false otherwise.
 */
bool bcenc_is_block_compressed(
	bcenc_format format);

/**
 * @brief Get the size of a compressed block.
 *
 * @param format   The data format.
 *
 * @return The block size in bytes, or zero for uncompressed or unknown formats.
 */
unsigned int bcenc_get_bytes_per_block(
	bcenc_format format);

/**
 * @brief Get the size of an uncompressed pixel.
 *
 * @param format   The data format.
 *
 * @return The pixel size in bytes, or zero for compressed or unknown formats.
 */
unsigned int bcenc_get_bytes_per_pixel(
	bcenc_format format);

/**
 * @brief Get the tightly packed storage size of an image.
 *
 * @param format   The data format.
 * @param dim_x    The X dimension of the image, in texels.
 * @param dim_y    The Y dimension of the image, in texels.
 *
 * @return The storage size in bytes, or zero for unknown formats.
 */
size_t bcenc_get_storage_size(
	bcenc_format format,
	unsigned int dim_x,
	unsigned int dim_y);

/**
 * @brief Get a printable name for a data format.
 *
 * @param format   The data format.
 *
 * @return A human readable nul-terminated string, or nullptr if unknown.
 */
const char* bcenc_get_format_name(
	bcenc_format format);

/**
 * @brief Determine if an image uses its alpha channel.
 *
 * Supported formats are R32G32B32A32_FLOAT and the 8-bit RGBA and BGRA
 * formats. Float alpha within a small tolerance of 0 or 1 counts as fully
 * transparent or fully opaque.
 *
 * @param[in]  image                  The image to analyze.
 * @param[out] has_alpha              Set if any texel is not fully opaque.
 * @param[out] has_fractional_alpha   Set if any texel is neither fully opaque
 *                                    nor fully transparent.
 *
 * @return BCENC_SUCCESS on success, or an error if the image is invalid.
 */
bcenc_error bcenc_analyze_alpha(
	const bcenc_image& image,
	bool& has_alpha,
	bool& has_fractional_alpha);

/**
 * @brief Premultiply the color channels of an image by alpha.
 *
 * Only R32G32B32A32_FLOAT images are supported.
 *
 * @param[in,out] image   The image to process in place.
 *
 * @return BCENC_SUCCESS on success, or an error if the image is invalid.
 */
bcenc_error bcenc_premultiply_alpha(
	bcenc_image& image);

/**
 * @brief Convert the color channels of an image from gamma space to linear.
 *
 * Each color channel is raised to the power of @c gamma; alpha is unchanged.
 * A gamma within a small tolerance of 1 leaves the image untouched. Only
 * R32G32B32A32_FLOAT images are supported.
 *
 * @param[in,out] image   The image to process in place.
 * @param         gamma   The gamma value; must be greater than zero.
 *
 * @return BCENC_SUCCESS on success, or an error if the image or gamma is
 *         invalid.
 */
bcenc_error bcenc_gamma_to_linear(
	bcenc_image& image,
	float gamma);

/**
 * @brief Convert the color channels of an image from linear to gamma space.
 *
 * The inverse of @c bcenc_gamma_to_linear(), raising each color channel to
 * the power of @c 1/gamma.
 *
 * @param[in,out] image   The image to process in place.
 * @param         gamma   The gamma value; must be greater than zero.
 *
 * @return BCENC_SUCCESS on success, or an error if the image or gamma is
 *         invalid.
 */
bcenc_error bcenc_linear_to_gamma(
	bcenc_image& image,
	float gamma);

/**
 * @brief Make every texel matching a color key fully transparent.
 *
 * Texels whose four components all match the key within a small tolerance
 * have their alpha set to zero. Only R32G32B32A32_FLOAT images are supported.
 *
 * @param[in,out] image       The image to process in place.
 * @param         color_key   The RGBA color key.
 *
 * @return BCENC_SUCCESS on success, or an error if the image is invalid.
 */
bcenc_error bcenc_apply_color_key(
	bcenc_image& image,
	const float color_key[4]);

/**
 * @brief Mirror an R32G32B32A32_FLOAT image horizontally, in place.
 */
bcenc_error bcenc_flip_x(
	bcenc_image& image);

/**
 * @brief Mirror an R32G32B32A32_FLOAT image vertically, in place.
 */
bcenc_error bcenc_flip_y(
	bcenc_image& image);

/**
 * @brief Get a printable string for specific status code.
 *
 * @param status   The status value.
 *
 * @return A human readable nul-terminated string.
 */
const char* bcenc_get_error_string(
	bcenc_error status);

#endif
