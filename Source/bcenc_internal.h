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
 * @brief Functions and data declarations.
 */

#ifndef BCENC_INTERNAL_INCLUDED
#define BCENC_INTERNAL_INCLUDED

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <condition_variable>
#include <mutex>

#include "bcenc.h"
#include "bcenc_mathlib.h"
#include "bcenc_diagnostic_trace.h"

/* ============================================================================
  Constants
============================================================================ */
#define BLOCK_DIM 4
#define TEXELS_PER_BLOCK 16
#define MAX_CLUSTER_ITERATIONS 8

// The 5:6:5 endpoint grid
static const float3 COLOR_GRID { 31.0f, 63.0f, 31.0f };
static const float3 COLOR_GRID_RCP { 1.0f / 31.0f, 1.0f / 63.0f, 1.0f / 31.0f };

// A high default error value
static const float ERROR_CALC_DEFAULT { 3.402823466e+38f };

// The number of tasks handed to a thread per assignment
static const unsigned int TASK_GRANULE { 4 };

/* ============================================================================
  Parallel execution control
============================================================================ */

/**
 * @brief A simple counter-based manager for parallel task execution.
 *
 * The task processing execution consists of:
 *
 *     * A single-threaded init stage.
 *     * A multi-threaded processing stage.
 *     * A condition variable so threads can wait for processing completion.
 *
 * The init stage will be executed by the first thread to arrive in the
 * critical section, there is no main thread in the thread pool.
 *
 * The processing stage uses dynamic dispatch to assign task tickets to threads
 * on an on-demand basis. Threads may each therefore executed different numbers
 * of tasks, depending on their processing complexity. The task queue and the
 * task tickets are just counters; the caller must map these integers to an
 * actual processing partition in a specific problem domain, such as a block
 * index or an image row.
 *
 * The exit wait condition is needed to ensure processing has finished before
 * a worker thread can return to the caller. Specifically a worker may exit the
 * processing stage because there are no new tasks to assign to it while other
 * worker threads are still processing. Calling wait() will ensure that all
 * other worker have finished before the thread can proceed.
 *
 * The basic usage model:
 *
 *     // --------- From single-threaded code ---------
 *
 *     // Reset the tracker state
 *     manager->reset()
 *
 *     // --------- From multi-threaded code ---------
 *
 *     // Run the stage init; only first thread actually runs it
 *     manager->init(<total_task_count>)
 *
 *     do
 *     {
 *         // Request a task assignment
 *         uint task_count;
 *         uint base_index = manager->get_task_assignment(<granule>, task_count);
 *
 *         // Process any tasks we were given (task_count <= granule size)
 *         if (task_count)
 *         {
 *             // Run the user task processing code here
 *             ...
 *
 *             // Flag these tasks as complete
 *             manager->complete_task_assignment(task_count);
 *         }
 *     } while (task_count);
 *
 *     // Wait for all threads to complete tasks before progressing
 *     manager->wait()
 */
class ParallelManager
{
private:
	/** @brief Lock used for critical section and condition synchronization. */
	std::mutex m_lock;

	/** @brief True if the stage init() step has been executed. */
	bool m_init_done;

	/** @brief Contition variable for tracking stage processing completion. */
	std::condition_variable m_complete;

	/** @brief Number of tasks started, but not necessarily finished. */
	std::atomic<unsigned int> m_start_count;

	/** @brief Number of tasks finished. */
	unsigned int m_done_count;

	/** @brief Number of tasks that need to be processed. */
	unsigned int m_task_count;

public:
	/** @brief Create a new ParallelManager. */
	ParallelManager()
	{
		reset();
	}

	/**
	 * @brief Reset the tracker for a new processing batch.
	 *
	 * This must be called from single-threaded code before starting the
	 * multi-threaded procesing operations.
	 */
	void reset()
	{
		m_init_done = false;
		m_start_count = 0;
		m_done_count = 0;
		m_task_count = 0;
	}

	/**
	 * @brief Trigger the pipeline stage init step.
	 *
	 * This can be called from multi-threaded code. The first thread to
	 * hit this will process the initialization. Other threads will block
	 * and wait for it to complete.
	 *
	 * @param task_count   Total number of tasks needing processing.
	 */
	void init(unsigned int task_count)
	{
		std::lock_guard<std::mutex> lck(m_lock);
		if (!m_init_done)
		{
			m_task_count = task_count;
			m_init_done = true;
		}
	}

	/**
	 * @brief Request a task assignment.
	 *
	 * Assign up to @c granule tasks to the caller for processing.
	 *
	 * @param      granule   Maximum number of tasks that can be assigned.
	 * @param[out] count     Actual number of tasks assigned, or zero if
	 *                       no tasks were assigned.
	 *
	 * @return Task index of the first assigned task; assigned tasks
	 *         increment from this.
	 */
	unsigned int get_task_assignment(unsigned int granule, unsigned int& count)
	{
		unsigned int base = m_start_count.fetch_add(granule, std::memory_order_relaxed);
		if (base >= m_task_count)
		{
			count = 0;
			return 0;
		}

		count = m_task_count - base;
		if (count > granule)
		{
			count = granule;
		}

		return base;
	}

	/**
	 * @brief Complete a task assignment.
	 *
	 * Mark @c count tasks as complete. This will notify all threads blocked
	 * on @c wait() if this completes the processing of the stage.
	 *
	 * @param count   The number of completed tasks.
	 */
	void complete_task_assignment(unsigned int count)
	{
		// Note: m_done_count cannot use an atomic without the mutex; this has
		// a race between the update here and the wait() for other threads
		std::unique_lock<std::mutex> lck(m_lock);
		this->m_done_count += count;
		if (m_done_count == m_task_count)
		{
			lck.unlock();
			m_complete.notify_all();
		}
	}

	/**
	 * @brief Wait for stage processing to complete.
	 */
	void wait()
	{
		std::unique_lock<std::mutex> lck(m_lock);
		m_complete.wait(lck, [this]{ return m_done_count == m_task_count; });
	}
};

/* ============================================================================
  Data format catalog
============================================================================ */

/**
 * @brief The numeric interpretation of a stored channel.
 */
enum channel_kind
{
	/** @brief Padding bits, ignored on read and written as zero. */
	CHANNEL_NONE = 0,
	CHANNEL_UNORM,
	CHANNEL_SNORM,
	CHANNEL_UINT,
	CHANNEL_SINT,
	CHANNEL_FLOAT
};

/**
 * @brief The storage layout of one channel of a pixel.
 */
struct channel_descriptor
{
	/** @brief The channel_kind of the stored value. */
	uint8_t kind;

	/** @brief The RGBA component index (0-3) the channel maps to. */
	uint8_t component;

	/** @brief The index of the storage word holding the channel. */
	uint8_t word;

	/** @brief The bit offset of the channel in its storage word. */
	uint8_t shift;

	/** @brief The bit width of the channel. */
	uint8_t bits;
};

/**
 * @brief The kind of BCn block encoding.
 */
enum block_kind
{
	BLOCK_NONE = 0,
	BLOCK_BC1,
	BLOCK_BC2,
	BLOCK_BC3
};

/**
 * @brief An immutable descriptor of a data format.
 *
 * Uncompressed pixels are stored as a sequence of little-endian storage words,
 * each holding one or more channels. Compressed formats have no channels.
 */
struct format_descriptor
{
	/** @brief The format. */
	bcenc_format format;

	/** @brief The printable format name. */
	const char* name;

	/** @brief The block encoding, or BLOCK_NONE if uncompressed. */
	block_kind block;

	/** @brief The size of a compressed block, or zero if uncompressed. */
	unsigned int block_bytes;

	/** @brief The size of a pixel, or zero if compressed. */
	unsigned int pixel_bytes;

	/** @brief The size of a storage word, in bytes. */
	unsigned int word_bytes;

	/** @brief The number of stored channels. */
	unsigned int channel_count;

	/** @brief The stored channels. */
	channel_descriptor channels[4];
};

/**
 * @brief Get the descriptor for a format.
 *
 * @param format   The format to look up.
 *
 * @return The descriptor, or nullptr if the format is not valid.
 */
const format_descriptor* get_format_descriptor(
	bcenc_format format);

/**
 * @brief Get the minimum distance between rows of an image.
 *
 * For compressed formats this is the size of a row of blocks.
 */
size_t get_min_row_pitch(
	const format_descriptor& fd,
	unsigned int dim_x);

/**
 * @brief Get the number of rows of an image.
 *
 * For compressed formats this is the number of rows of blocks.
 */
unsigned int get_row_count(
	const format_descriptor& fd,
	unsigned int dim_y);

/* ============================================================================
  Image access
============================================================================ */

/**
 * @brief A single decoded texel.
 *
 * Every texel carries an RGBA float value. Channels which were stored as UNORM
 * also carry their integer code, which allows exact integer widening when the
 * destination channel is UNORM with at least as many bits.
 */
struct texel
{
	/** @brief The RGBA channel values. */
	float value[4];

	/** @brief The stored UNORM code of each channel. */
	uint32_t code[4];

	/** @brief The bit width of each UNORM code, or zero if there is none. */
	unsigned int code_bits[4];
};

/**
 * @brief A 4x4 block of RGBA8 texels with a validity mask.
 */
struct image_block
{
	/** @brief The texel data, in row-major RGBA order. */
	uint8_t texels[TEXELS_PER_BLOCK * 4];

	/** @brief Bit i is set if texel i is inside the image. */
	unsigned int mask;
};

/**
 * @brief Decode a pixel into a texel.
 *
 * Channels absent from the format default to zero for color, and one for
 * alpha.
 *
 * @param      fd    The descriptor of the pixel format; must be uncompressed.
 * @param      data  The pixel data.
 * @param[out] tx    The decoded texel.
 */
void read_texel(
	const format_descriptor& fd,
	const uint8_t* data,
	texel& tx);

/**
 * @brief Encode a texel into a pixel.
 *
 * @param     fd     The descriptor of the pixel format; must be uncompressed.
 * @param     tx     The texel to encode.
 * @param[out] data  The pixel data.
 */
void write_texel(
	const format_descriptor& fd,
	const texel& tx,
	uint8_t* data);

/**
 * @brief Fetch a 4x4 block of texels from an uncompressed image.
 *
 * Texels outside of the image are excluded from the block mask and are set to
 * zero; their contents never depend on the image buffer.
 *
 * @param      img   The image.
 * @param      fd    The descriptor of the image format.
 * @param      xpos  The block X coordinate, in texels.
 * @param      ypos  The block Y coordinate, in texels.
 * @param[out] blk   The fetched block.
 */
void fetch_image_block(
	const bcenc_image& img,
	const format_descriptor& fd,
	unsigned int xpos,
	unsigned int ypos,
	image_block& blk);

/**
 * @brief Write the in-bounds texels of a 4x4 block to an uncompressed image.
 *
 * @param img    The image.
 * @param fd     The descriptor of the image format.
 * @param xpos   The block X coordinate, in texels.
 * @param ypos   The block Y coordinate, in texels.
 * @param blk    The block to write.
 */
void write_image_block(
	bcenc_image& img,
	const format_descriptor& fd,
	unsigned int xpos,
	unsigned int ypos,
	const image_block& blk);

/**
 * @brief Get the effective row pitch of an image.
 */
size_t get_row_pitch(
	const bcenc_image& img,
	const format_descriptor& fd);

/* ============================================================================
  Block compression: color sets and fitting
============================================================================ */

/**
 * @brief The deduplicated colors of a block.
 */
struct color_set
{
	/** @brief The number of unique colors. */
	unsigned int count;

	/** @brief The unique colors, normalized to [0, 1]. */
	float3 points[TEXELS_PER_BLOCK];

	/** @brief The square root of the accumulated weight of each color. */
	float weights[TEXELS_PER_BLOCK];

	/** @brief The color index of each texel, or -1 if the texel is excluded. */
	int remap[TEXELS_PER_BLOCK];

	/** @brief True if any texel was excluded as transparent. */
	bool transparent;
};

/**
 * @brief Build the color set of a block.
 *
 * Texels outside the block mask are excluded. For BC1, texels with alpha below
 * 128 are also excluded, and mark the set as transparent.
 *
 * @param      blk               The block.
 * @param      is_bc1            True if compressing for BC1.
 * @param      weight_by_alpha   True if the color weight scales with alpha.
 * @param[out] colors            The color set.
 */
void compute_color_set(
	const image_block& blk,
	bool is_bc1,
	bool weight_by_alpha,
	color_set& colors);

/**
 * @brief Map per-color indices to per-texel indices.
 *
 * Excluded texels are assigned index 3.
 *
 * @param      colors   The color set.
 * @param      source   The index of each unique color.
 * @param[out] target   The index of each texel.
 */
void remap_color_indices(
	const color_set& colors,
	const uint8_t* source,
	uint8_t* target);

/**
 * @brief A symmetric 3x3 matrix, storing the upper triangle row by row.
 */
struct sym3x3
{
	float m[6];
};

/**
 * @brief Compute the weighted covariance matrix of a set of points.
 *
 * @param count     The number of points.
 * @param points    The points.
 * @param weights   The weight of each point.
 *
 * @return The covariance matrix.
 */
sym3x3 compute_weighted_covariance(
	unsigned int count,
	const float3* points,
	const float* weights);

/**
 * @brief Compute the principal component of a covariance matrix.
 *
 * This uses a fixed number of power iterations, so the result is only an
 * approximation of the dominant eigenvector, and is not normalized.
 *
 * @param matrix   The covariance matrix.
 *
 * @return The principal axis.
 */
float3 compute_principal_component(
	const sym3x3& matrix);

/**
 * @brief The color fitting strategies.
 */
enum color_fit_mode
{
	FIT_SINGLE_COLOR = 0,
	FIT_RANGE,
	FIT_CLUSTER
};

/**
 * @brief The result of a color fit; a BC color block before packing.
 */
struct color_fit_result
{
	/** @brief The start endpoint, on the 5:6:5 grid. */
	float3 start;

	/** @brief The end endpoint, on the 5:6:5 grid. */
	float3 end;

	/** @brief The codebook index of each texel. */
	uint8_t indices[TEXELS_PER_BLOCK];

	/** @brief True if the block uses the 3 color codebook. */
	bool three_color;

	/** @brief The fit error; only comparable between results of the same fit. */
	float error;
};

/**
 * @brief The best encoding and error for one target value of a single color table.
 */
struct single_color_source
{
	uint8_t start;
	uint8_t end;
	uint8_t error;
};

/**
 * @brief A single color table entry, for codebook index 0 and index 2.
 */
struct single_color_entry
{
	single_color_source sources[2];
};

/**
 * @brief The single color lookup tables.
 *
 * Tables are named for the endpoint bit count and the codebook size.
 */
struct single_color_tables
{
	single_color_entry lookup_5_3[256];
	single_color_entry lookup_6_3[256];
	single_color_entry lookup_5_4[256];
	single_color_entry lookup_6_4[256];
};

/**
 * @brief Get the single color lookup tables, building them on first use.
 */
const single_color_tables& get_single_color_tables();

/**
 * @brief Fit a block containing a single unique color.
 *
 * @param      colors   The color set; must have a count of one.
 * @param      is_bc1   True if compressing for BC1.
 * @param[out] result   The best fit.
 */
void compute_single_color_fit(
	const color_set& colors,
	bool is_bc1,
	color_fit_result& result);

/**
 * @brief Fit a block using the extremes of the principal axis.
 *
 * @param      colors   The color set.
 * @param      is_bc1   True if compressing for BC1.
 * @param      metric   The error weight of each color channel.
 * @param[out] result   The best fit.
 */
void compute_range_fit(
	const color_set& colors,
	bool is_bc1,
	float3 metric,
	color_fit_result& result);

/**
 * @brief The scratch memory used by the cluster fit.
 */
struct cluster_fit_buffers
{
	/** @brief The color ordering of each iteration. */
	uint8_t order[TEXELS_PER_BLOCK * MAX_CLUSTER_ITERATIONS];

	/** @brief The weighted colors in the current order, with the weight in alpha. */
	float4 points_weights[TEXELS_PER_BLOCK];

	/** @brief The sum of all points_weights entries. */
	float4 xsum_wsum;
};

/**
 * @brief Fit a block using a least squares search of all ordered clusterings.
 *
 * @param      colors            The color set.
 * @param      is_bc1            True if compressing for BC1.
 * @param      metric            The error weight of each color channel.
 * @param      iteration_count   The maximum number of orderings to try.
 * @param      tmpbuf            Preallocated scratch buffers.
 * @param[out] result            The best fit.
 */
void compute_cluster_fit(
	const color_set& colors,
	bool is_bc1,
	float3 metric,
	unsigned int iteration_count,
	cluster_fit_buffers& tmpbuf,
	color_fit_result& result);

/* ============================================================================
  Block compression: physical encoding
============================================================================ */

/**
 * @brief Pack a color in [0, 1] into 5:6:5 format.
 */
int float_to_565(
	float3 color);

/**
 * @brief Write a fitted color into an 8 byte BC color block.
 *
 * @param      result   The color fit.
 * @param[out] block    The color block.
 */
void write_color_block(
	const color_fit_result& result,
	uint8_t* block);

/**
 * @brief Decode an 8 byte BC color block.
 *
 * @param      block    The color block.
 * @param      is_bc1   True if the 3 color codebook is allowed.
 * @param[out] blk      The decoded texels; RGBA is written for every texel.
 */
void decompress_color_block(
	const uint8_t* block,
	bool is_bc1,
	image_block& blk);

/**
 * @brief Encode the explicit alpha of a BC2 block.
 */
void compress_alpha_bc2(
	const image_block& blk,
	uint8_t* block);

/**
 * @brief Decode the explicit alpha of a BC2 block.
 */
void decompress_alpha_bc2(
	const uint8_t* block,
	image_block& blk);

/**
 * @brief Encode the interpolated alpha of a BC3 block.
 */
void compress_alpha_bc3(
	const image_block& blk,
	uint8_t* block);

/**
 * @brief Decode the interpolated alpha of a BC3 block.
 */
void decompress_alpha_bc3(
	const uint8_t* block,
	image_block& blk);

/* ============================================================================
  Block compression: entry points
============================================================================ */

/**
 * @brief The block compression settings derived from the config.
 */
struct block_compress_config
{
	/** @brief The block encoding. */
	block_kind kind;

	/** @brief True if the range fit is used instead of the cluster fit. */
	bool use_range_fit;

	/** @brief True if color weights scale with alpha. */
	bool weight_by_alpha;

	/** @brief The error weight of each color channel. */
	float3 metric;

	/** @brief The maximum number of cluster fit iterations. */
	unsigned int iteration_count;
};

/**
 * @brief The per-thread scratch memory used by block compression.
 */
struct compress_block_buffers
{
	color_set colors;
	cluster_fit_buffers cluster;
};

/**
 * @brief Get the size of a compressed block.
 */
static inline unsigned int get_block_bytes(block_kind kind)
{
	return kind == BLOCK_BC1 ? 8 : 16;
}

/**
 * @brief Select the color fit strategy for a color set.
 */
color_fit_mode select_color_fit(
	const block_compress_config& bcc,
	const color_set& colors);

/**
 * @brief Compress a block.
 *
 * @param      bcc      The block compression settings.
 * @param      blk      The block texels and mask.
 * @param[out] block    The compressed block.
 * @param      tmpbuf   Preallocated scratch buffers.
 */
void compress_block(
	const block_compress_config& bcc,
	const image_block& blk,
	uint8_t* block,
	compress_block_buffers& tmpbuf);

/**
 * @brief Decompress a block.
 *
 * @param      kind     The block encoding.
 * @param      block    The compressed block.
 * @param[out] blk      The decoded texels; the mask is set to all texels.
 */
void decompress_block(
	block_kind kind,
	const uint8_t* block,
	image_block& blk);

/* ============================================================================
  Format conversion
============================================================================ */

/**
 * @brief Get the number of parallel tasks used to convert an image.
 */
unsigned int get_convert_task_count(
	const format_descriptor& src,
	const format_descriptor& dst,
	unsigned int dim_x,
	unsigned int dim_y);

/**
 * @brief Execute one conversion task.
 *
 * Tasks are blocks when either format is compressed, and rows otherwise.
 *
 * @param bcc          The block compression settings.
 * @param image_in     The input image.
 * @param src          The descriptor of the input format.
 * @param image_out    The output image.
 * @param dst          The descriptor of the output format.
 * @param task         The task index.
 * @param tmpbuf       Preallocated scratch buffers for the calling thread.
 */
void convert_task(
	const block_compress_config& bcc,
	const bcenc_image& image_in,
	const format_descriptor& src,
	bcenc_image& image_out,
	const format_descriptor& dst,
	unsigned int task,
	compress_block_buffers& tmpbuf);

/* ============================================================================
  Codec context
============================================================================ */

struct bcenc_context
{
	bcenc_config config;
	unsigned int thread_count;

	/** @brief The block compression settings, excluding the block kind. */
	block_compress_config bcc;

	compress_block_buffers* working_buffers;

	ParallelManager manage_convert;

#if defined(BCENC_DIAGNOSTICS)
	TraceLog* trace_log;
#endif
};

/* ============================================================================
  Platform-specific functions
============================================================================ */
/**
 * @brief Allocate an aligned memory buffer.
 *
 * Allocated memory must be freed by aligned_free;
 *
 * @param size    The desired buffer size.
 * @param align   The desired buffer alignment; must be 2^N.
 *
 * @return The memory buffer pointer or nullptr on allocation failure.
 */
template<typename T>
T* aligned_malloc(size_t size, size_t align)
{
	void* ptr;
	int error = 0;

#if defined(_WIN32)
	ptr = _aligned_malloc(size, align);
#else
	error = posix_memalign(&ptr, align, size);
#endif

	if (error || (!ptr))
	{
		return nullptr;
	}

	return static_cast<T*>(ptr);
}

/**
 * @brief Free an aligned memory buffer.
 *
 * @param ptr   The buffer to free.
 */
template<typename T>
void aligned_free(T* ptr)
{
#if defined(_WIN32)
	_aligned_free((void*)ptr);
#else
	free((void*)ptr);
#endif
}

#endif
