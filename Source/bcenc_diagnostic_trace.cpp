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
 * @brief Functions for the diagnostic trace log.
 */

#if defined(BCENC_DIAGNOSTICS)

#include <cassert>
#include <cstdarg>
#include <cstdio>

#include "bcenc_diagnostic_trace.h"

/** @brief The global trace logger. */
static TraceLog* g_TraceLog = nullptr;

/**
 * @brief Format a printf style argument list into a string.
 */
static std::string format_string(const char* format, va_list args)
{
	constexpr size_t bufsz = 256;
	char buffer[bufsz];

	vsnprintf(buffer, bufsz, format, args);

	// Guarantee there is a nul termintor
	buffer[bufsz - 1] = 0;

	return std::string(buffer);
}

/**
 * @brief Write one line of the trace, indented by the current node depth.
 */
static void write_line(int depth, const std::string& text)
{
	for (int i = 0; i < depth; i++)
	{
		g_TraceLog->m_file << "  ";
	}

	g_TraceLog->m_file << text << '\n';
}

TraceLog::TraceLog(const char* file_name): m_file(file_name)
{
	assert(!g_TraceLog);
	g_TraceLog = this;
}

TraceLog::~TraceLog()
{
	assert(g_TraceLog == this);
	m_file.flush();
	g_TraceLog = nullptr;
}

TraceNode* TraceLog::get_current_leaf()
{
	if (m_stack.empty())
	{
		return nullptr;
	}

	return m_stack.back();
}

int TraceLog::get_depth()
{
	return static_cast<int>(m_stack.size());
}

TraceNode::TraceNode(const char* format, ...)
{
	if (!g_TraceLog)
	{
		return;
	}

	va_list args;
	va_start(args, format);
	std::string name = format_string(format, args);
	va_end(args);

	write_line(g_TraceLog->get_depth(), name);
	g_TraceLog->m_stack.push_back(this);
}

void TraceNode::add_attrib(std::string type, std::string key, std::string value)
{
	if (!g_TraceLog)
	{
		return;
	}

	m_attrib_count++;
	write_line(g_TraceLog->get_depth(), key + " (" + type + ") => " + value);
}

TraceNode::~TraceNode()
{
	if (!g_TraceLog || g_TraceLog->get_current_leaf() != this)
	{
		return;
	}

	g_TraceLog->m_stack.pop_back();
}

void trace_add_data(const char* key, const char* format, ...)
{
	if (!g_TraceLog || !g_TraceLog->get_current_leaf())
	{
		return;
	}

	va_list args;
	va_start(args, format);
	std::string value = format_string(format, args);
	va_end(args);

	g_TraceLog->get_current_leaf()->add_attrib("str", key, value);
}

void trace_add_data(const char* key, float value)
{
	if (!g_TraceLog || !g_TraceLog->get_current_leaf())
	{
		return;
	}

	char buffer[64];
	snprintf(buffer, sizeof(buffer), "%.9g", static_cast<double>(value));
	g_TraceLog->get_current_leaf()->add_attrib("float", key, buffer);
}

void trace_add_data(const char* key, int value)
{
	if (!g_TraceLog || !g_TraceLog->get_current_leaf())
	{
		return;
	}

	g_TraceLog->get_current_leaf()->add_attrib("int", key, std::to_string(value));
}

void trace_add_data(const char* key, unsigned int value)
{
	if (!g_TraceLog || !g_TraceLog->get_current_leaf())
	{
		return;
	}

	g_TraceLog->get_current_leaf()->add_attrib("int", key, std::to_string(value));
}

#endif
