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

/*
 * This module implements a variety of mathematical data types and library
 * functions used by the codec, including the numeric quantizer and the
 * half-float conversion routines which are also used by external vertex data
 * packing code.
 */

#ifndef BCENC_MATHLIB_H_INCLUDED
#define BCENC_MATHLIB_H_INCLUDED

#include <cstdint>
#include <cmath>

/* ============================================================================
  Scalar math library
============================================================================ */

// These are namespaced to avoid colliding with C standard library functions.
namespace bcn
{

/**
 * @brief SP float max.
 *
 * @param p The first value to compare.
 * @param q The second value to compare.
 *
 * @return The largest value.
 */
static inline float fmax(float p, float q)
{
	return q < p ? p : q;
}

/**
 * @brief Clamp a value value between mn and mx
 *
 * For floats, NaNs are turned into mn.
 *
 * @param val The value clamp.
 * @param mn  The min value (inclusive).
 * @param mx  The max value (inclusive).
 *
 * @return The clamped value.
 */
template<typename T>
inline T clamp(T val, T mn, T mx)
{
	// Do not reorder; correct NaN handling relies on the fact that comparison
	// with NaN returns false and will fall-though to the "min" value.
	if (val > mx) return mx;
	if (val > mn) return val;
	return mn;
}

/**
 * @brief Clamp a float value between 0.0f and 1.0f.
 *
 * NaNs are turned into 0.0f.
 *
 * @param val The value clamp.
 *
 * @return The clamped value.
 */
static inline float clamp1f(float val)
{
	if (val > 1.0f) return 1.0f;
	if (val > 0.0f) return val;
	return 0.0f;
}

/**
 * @brief Clamp an integer between two specified limits.
 *
 * @param val The value clamp.
 *
 * @return The clamped value.
 */
static inline int clampi(int val, int low, int high)
{
	if (val < low) return low;
	if (val > high) return high;
	return val;
}

/**
 * @brief SP float round-to-nearest and convert to integer.
 *
 * @param val The value to round.
 *
 * @return The rounded value.
 */
static inline int flt2int_rtn(float val)
{
	return (int)(val + 0.5f);
}

/**
 * @brief Population bit count.
 *
 * @param p The value to count.
 *
 * @return The number of 1 bits.
 */
static inline int popcount(uint64_t p)
{
	uint64_t mask1 = 0x5555555555555555ULL;
	uint64_t mask2 = 0x3333333333333333ULL;
	uint64_t mask3 = 0x0F0F0F0F0F0F0F0FULL;
	p -= (p >> 1) & mask1;
	p = (p & mask2) + ((p >> 2) & mask2);
	p += p >> 4;
	p &= mask3;
	p *= 0x0101010101010101ULL;
	p >>= 56;
	return (int)p;
}

/* ============================================================================
  Numeric quantizer

  Conversions between floats and integer codes of arbitrary bit width, using
  the Direct3D data conversion rules. The bitmask selects the code width, and
  is always of the form (1 << bits) - 1. All functions are total; NaN inputs
  are converted to a zero code.
============================================================================ */

/**
 * @brief Convert a float to a two's complement signed integer code.
 *
 * The value is clamped to the representable range and rounded to nearest,
 * with ties to even.
 *
 * @param value     The value to convert.
 * @param bitmask   The bitmask of the code.
 *
 * @return The code, masked to the code width.
 */
uint32_t float_to_sint(float value, uint32_t bitmask);

/**
 * @brief Convert a two's complement signed integer code to a float.
 *
 * @param value     The code to convert; bits outside the mask are ignored.
 * @param bitmask   The bitmask of the code.
 *
 * @return The sign-extended integer value.
 */
float sint_to_float(uint32_t value, uint32_t bitmask);

/**
 * @brief Convert a float to an unsigned integer code.
 *
 * The value is clamped to [0, bitmask] and rounded to nearest, with ties to
 * even.
 *
 * @param value     The value to convert.
 * @param bitmask   The bitmask of the code.
 *
 * @return The code.
 */
uint32_t float_to_uint(float value, uint32_t bitmask);

/**
 * @brief Convert an unsigned integer code to a float.
 *
 * @param value     The code to convert; bits outside the mask are ignored.
 * @param bitmask   The bitmask of the code.
 *
 * @return The integer value.
 */
float uint_to_float(uint32_t value, uint32_t bitmask);

/**
 * @brief Convert a float in [-1, 1] to a signed normalized code.
 *
 * Values are rounded to nearest, with ties away from zero. The code range is
 * symmetric, so the most negative two's complement code is never produced.
 *
 * @param value     The value to convert.
 * @param bitmask   The bitmask of the code.
 *
 * @return The code, masked to the code width.
 */
uint32_t float_to_snorm(float value, uint32_t bitmask);

/**
 * @brief Convert a signed normalized code to a float in [-1, 1].
 *
 * Both the most negative code and its neighbour decode to exactly -1.0.
 *
 * @param value     The code to convert; bits outside the mask are ignored.
 * @param bitmask   The bitmask of the code.
 *
 * @return The normalized value.
 */
float snorm_to_float(uint32_t value, uint32_t bitmask);

/**
 * @brief Convert a float in [0, 1] to an unsigned normalized code.
 *
 * Values are rounded to nearest, with ties away from zero.
 *
 * @param value     The value to convert.
 * @param bitmask   The bitmask of the code.
 *
 * @return The code.
 */
uint32_t float_to_unorm(float value, uint32_t bitmask);

/**
 * @brief Convert an unsigned normalized code to a float in [0, 1].
 *
 * @param value     The code to convert; bits outside the mask are ignored.
 * @param bitmask   The bitmask of the code.
 *
 * @return The normalized value.
 */
float unorm_to_float(uint32_t value, uint32_t bitmask);

/**
 * @brief Widen an unsigned normalized code by bit replication.
 *
 * This is the exact integer expansion used by GPU hardware, e.g. a 5-bit
 * value c widens to 8 bits as (c << 3) | (c >> 2).
 *
 * @param value      The code to widen.
 * @param src_bits   The source code width, in bits.
 * @param dst_bits   The destination code width; must be >= @c src_bits.
 *
 * @return The widened code.
 */
uint32_t unorm_widen(uint32_t value, unsigned int src_bits, unsigned int dst_bits);

}

/* ============================================================================
  Utility vector template classes with basic operations
============================================================================ */

template <typename T> class vtype3
{
public:
	// Data storage
	T r, g, b;

	// Default constructor
	vtype3() {}

	// Initialize from 1 scalar
	vtype3(T p) : r(p), g(p), b(p) {}

	// Initialize from N scalars
	vtype3(T p, T q, T s) : r(p), g(q), b(s) {}

	// Initialize from another vector
	vtype3(const vtype3 & p) : r(p.r), g(p.g), b(p.b) {}

	// Assignment operator
	vtype3& operator=(const vtype3 &s) {
		this->r = s.r;
		this->g = s.g;
		this->b = s.b;
		return *this;
	}
};

// Vector by vector addition
template <typename T>
vtype3<T> operator+(vtype3<T> p, vtype3<T> q) {
	return vtype3<T> { p.r + q.r, p.g + q.g, p.b + q.b };
}

// Vector by vector subtraction
template <typename T>
vtype3<T> operator-(vtype3<T> p, vtype3<T> q) {
	return vtype3<T> { p.r - q.r, p.g - q.g, p.b - q.b };
}

// Vector by vector multiplication operator
template <typename T>
vtype3<T> operator*(vtype3<T> p, vtype3<T> q) {
	return vtype3<T> { p.r * q.r, p.g * q.g, p.b * q.b };
}

// Vector by scalar multiplication operator
template <typename T>
vtype3<T> operator*(vtype3<T> p, T q) {
	return vtype3<T> { p.r * q, p.g * q, p.b * q };
}

// Scalar by vector multiplication operator
template <typename T>
vtype3<T> operator*(T p, vtype3<T> q){
	return vtype3<T> { p * q.r, p * q.g, p * q.b };
}

template <typename T> class alignas(16) vtype4
{
public:
	// Data storage
	T r, g, b, a;

	// Default constructor
	vtype4() {}

	// Initialize from 1 scalar
	vtype4(T p) : r(p), g(p), b(p), a(p) {}

	// Initialize from N scalars
	vtype4(T p, T q, T s, T t) : r(p), g(q), b(s), a(t) {}

	// Initialize from a 3-vector and a scalar
	vtype4(vtype3<T> p, T t) : r(p.r), g(p.g), b(p.b), a(t) {}

	// Initialize from another vector
	vtype4(const vtype4 & p) : r(p.r), g(p.g), b(p.b), a(p.a) {}

	// Assignment operator
	vtype4& operator=(const vtype4 &s) {
		this->r = s.r;
		this->g = s.g;
		this->b = s.b;
		this->a = s.a;
		return *this;
	}

	// Return the RGB part
	vtype3<T> rgb() const {
		return vtype3<T> { r, g, b };
	}
};

// Vector by vector addition
template <typename T>
vtype4<T> operator+(vtype4<T> p, vtype4<T> q) {
	return vtype4<T> { p.r + q.r, p.g + q.g, p.b + q.b, p.a + q.a };
}

// Vector by vector subtraction
template <typename T>
vtype4<T> operator-(vtype4<T> p, vtype4<T> q) {
	return vtype4<T> { p.r - q.r, p.g - q.g, p.b - q.b, p.a - q.a };
}

// Vector by vector multiplication operator
template <typename T>
vtype4<T> operator*(vtype4<T> p, vtype4<T> q) {
	return vtype4<T> { p.r * q.r, p.g * q.g, p.b * q.b, p.a * q.a };
}

// Vector by scalar multiplication operator
template <typename T>
vtype4<T> operator*(vtype4<T> p, T q) {
	return vtype4<T> { p.r * q, p.g * q, p.b * q, p.a * q };
}

// Scalar by vector multiplication operator
template <typename T>
vtype4<T> operator*(T p, vtype4<T> q){
	return vtype4<T> { p * q.r, p * q.g, p * q.b, p * q.a };
}

typedef vtype3<float>        float3;
typedef vtype4<float>        float4;

static inline float dot(float3 p, float3 q)  { return p.r * q.r + p.g * q.g + p.b * q.b; }

/**
 * @brief Clamp each lane of a vector between 0.0f and 1.0f.
 */
static inline float3 clamp1f(float3 p)
{
	return float3(bcn::clamp1f(p.r), bcn::clamp1f(p.g), bcn::clamp1f(p.b));
}

/**
 * @brief Round each lane of a vector toward zero.
 */
static inline float3 truncate(float3 p)
{
	return float3(std::trunc(p.r), std::trunc(p.g), std::trunc(p.b));
}

/* ============================================================================
  Softfloat library with fp32 and fp16 conversion functionality.
============================================================================ */
typedef union if32_
{
	uint32_t u;
	int32_t s;
	float f;
} if32;

/*	sized soft-float types. These are mapped to the sized integer
    types of C99, instead of C's floating-point types; this is because
    the library needs to maintain exact, bit-level control on all
    operations on these data types. */
typedef uint16_t sf16;

/**
 * @brief Build the lookup tables used by the half-float conversions.
 *
 * This is called automatically by context creation, but can safely be called
 * multiple times and from multiple threads.
 */
void init_sf16_tables();

/**
 * @brief Convert a float to a half float.
 *
 * Mantissa bits which do not fit are truncated, rounding toward zero. Values
 * too small for the denormal range return signed zero, values too large for
 * the half exponent range return signed infinity, and NaNs stay NaNs.
 *
 * @param val   The value to convert.
 *
 * @return The half float bit pattern.
 */
sf16 float_to_sf16(float val);

/**
 * @brief Convert a half float to a float.
 *
 * @param val   The half float bit pattern.
 *
 * @return The converted value; this conversion is exact.
 */
float sf16_to_float(sf16 val);

#endif
