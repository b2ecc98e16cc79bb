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
 * @brief This module provides a set of diagnostic tracing utilities.
 *
 * Tracing is only compiled into builds with BCENC_DIAGNOSTICS defined. A trace
 * is a tree of named nodes, each holding a list of key/value data items, which
 * is written to a text file with one node or item per line. Nodes are scoped
 * objects; the node tree follows the call tree of the codec.
 *
 * Only a single trace log can exist at a time, and tracing is not thread safe,
 * so a context with tracing enabled must use a single thread.
 */

#ifndef BCENC_DIAGNOSTIC_TRACE_INCLUDED
#define BCENC_DIAGNOSTIC_TRACE_INCLUDED

#if defined(BCENC_DIAGNOSTICS)

#include <fstream>
#include <string>
#include <vector>

/**
 * @brief A single node in the trace tree.
 *
 * Nodes attach themselves to the current leaf of the global trace log when
 * constructed, and detach when destroyed.
 */
class TraceNode
{
public:
	/**
	 * @brief Create a new node, and make it the current leaf.
	 *
	 * @param format   The printf style format string for the node name.
	 */
	TraceNode(const char* format, ...);

	/**
	 * @brief Add a data item to this node.
	 *
	 * @param type    The item type name.
	 * @param key     The item key.
	 * @param value   The item value.
	 */
	void add_attrib(std::string type, std::string key, std::string value);

	/**
	 * @brief Destroy the node, and make its parent the current leaf.
	 */
	~TraceNode();

	/** @brief The number of data items added to this node. */
	unsigned int m_attrib_count { 0 };
};

/**
 * @brief The global trace log, which owns the output file.
 */
class TraceLog
{
public:
	/**
	 * @brief Create the trace log.
	 *
	 * @param file_name   The file to write the trace to.
	 */
	TraceLog(const char* file_name);

	/**
	 * @brief Close the trace log.
	 */
	~TraceLog();

	/**
	 * @brief Get the current leaf node, or nullptr if there is none.
	 */
	TraceNode* get_current_leaf();

	/**
	 * @brief Get the depth of the current leaf node.
	 */
	int get_depth();

	/** @brief The output file. */
	std::ofstream m_file;

	/** @brief The stack of open nodes. */
	std::vector<TraceNode*> m_stack;
};

#define TRACE_NODE(name, ...) TraceNode name(__VA_ARGS__);

void trace_add_data(const char* key, const char* format, ...);

void trace_add_data(const char* key, float value);

void trace_add_data(const char* key, int value);

void trace_add_data(const char* key, unsigned int value);

#else

#define TRACE_NODE(name, ...)

#define trace_add_data(...)

#endif

#endif
