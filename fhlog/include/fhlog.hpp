/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef FHLOG_HPP__
#define FHLOG_HPP__

#include <pthread.h>

#include <string_view>

#include "fhlog_fmt.hpp"

/**
 * Numeric log levels as written in the YAML config
 */
enum fhlog_level
{
    FHLOG_NONE  = 0,
    FHLOG_ERROR = 1,
    FHLOG_WARN  = 2,
    FHLOG_INFO  = 3,
    FHLOG_DEBUG = 4,
};

#define FHLOG_DEFAULT_LOG_DIR "/tmp"                 //!< Log directory when no config is given
#define FHLOG_LOG_PATH_ENV "FH_CAPTURE_LOG_PATH"     //!< Overrides the log directory

/**
 * Start fmtlog with a log file and a background poll thread
 *
 * Reads the "fhlog" section of yaml_file when it is not NULL:
 * log_level, log_file_path, max_file_size_bytes, max_rotating_file_num, tags.
 *
 * @param yaml_file YAML config path or NULL for defaults
 * @param name Log file name, appended to the log directory
 * @return Background thread id, or (pthread_t)-1 if already initialized or thread creation failed
 */
pthread_t fhlog_init(const char* yaml_file, const char* name);

/**
 * Stop the background thread, flush and close the log file
 */
void fhlog_close(pthread_t bg_thread_id);

/**
 * Preallocate the fmtlog queue of the calling thread and name it
 */
void fhlog_thread_init(const char* name);

/**
 * Map a numeric fhlog_level to an fmtlog level
 *
 * Out-of-range values map to WRN.
 */
fmtlog::LogLevel fhlog_to_fmtlog_level(int level);

/**
 * Set the same level on every tag
 */
void fhlog_set_all_levels(int level);

/**
 * Set the level of a single tag by name
 * @return false if the tag is unknown
 */
bool fhlog_set_tag_level(std::string_view tag, int level);

/**
 * Current level of a tag, fmtlog::OFF if the tag is unknown
 */
fmtlog::LogLevel fhlog_get_tag_level(std::string_view tag);

#endif // FHLOG_HPP__
