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

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <string>

#include <yaml-cpp/yaml.h>

#include "fhlog.hpp"

#define TAG "FHLOG"

#define MAX_PATH_LEN 1024

static char    logfile_base[MAX_PATH_LEN] = FHLOG_DEFAULT_LOG_DIR;
static int64_t logfile_count              = -1;
static size_t  max_log_file_size_bytes    = 2000000000;
static int32_t max_rotating_file_num      = 4;

// Avoid duplicate initiating
static std::atomic<int> fmt_log_initiated{0};

fmtlog::LogLevel fhlog_to_fmtlog_level(int level)
{
    switch(level)
    {
    case FHLOG_NONE:
        return fmtlog::OFF;
    case FHLOG_ERROR:
        return fmtlog::ERR;
    case FHLOG_WARN:
        return fmtlog::WRN;
    case FHLOG_INFO:
        return fmtlog::INF;
    case FHLOG_DEBUG:
        return fmtlog::DBG;
    default:
        printf("invalid log level %d, setting to WRN level\n", level);
        return fmtlog::WRN;
    }
}

void fhlog_set_all_levels(int level)
{
    const fmtlog::LogLevel fmt_level = fhlog_to_fmtlog_level(level);
    for(int n = 0; n < FHLOG_NUM_TAGS; n++)
    {
        g_fhlog_component_levels[n] = fmt_level;
    }
}

bool fhlog_set_tag_level(std::string_view tag, int level)
{
    if(!fhlog_component_is_valid(tag))
    {
        return false;
    }
    g_fhlog_component_levels[fhlog_get_component_id(tag)] = fhlog_to_fmtlog_level(level);
    return true;
}

fmtlog::LogLevel fhlog_get_tag_level(std::string_view tag)
{
    if(!fhlog_component_is_valid(tag))
    {
        return fmtlog::OFF;
    }
    return static_cast<fmtlog::LogLevel>(g_fhlog_component_levels[fhlog_get_component_id(tag)]);
}

static void update_log_filename()
{
    char logfile[MAX_PATH_LEN + 32] = {0};
    logfile_count = (logfile_count + 1) % max_rotating_file_num;
    if(logfile_count == 0)
    {
        snprintf(logfile, sizeof(logfile), "%s", logfile_base);
    }
    else
    {
        snprintf(logfile, sizeof(logfile), "%s.%ld", logfile_base, static_cast<long>(logfile_count));
        fmtlog::closeLogFile();
    }
    fmtlog::setLogFile(logfile, true);
}

static void logcb_fhlog(int64_t ns, fmtlog::LogLevel level, fmt::string_view location, size_t basePos, fmt::string_view threadName,
                        fmt::string_view msg, size_t bodyPos, size_t logFilePos)
{
    if(level >= fmtlog::WRN)
    {
        fmt::print("{}\n", msg);
        fflush(stdout);
    }

    if(logFilePos > max_log_file_size_bytes)
    {
        update_log_filename();
    }
}

static std::atomic_bool threadRunning{false};
static unsigned int     usec_poll_period = 100000;

static void* bg_fmtlog_collector(void*)
{
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, NULL);
    if(pthread_setname_np(pthread_self(), "bg_fhlog") != 0)
    {
        FHLOGW_FMT(TAG, "{}: set thread name failed", __func__);
    }
    while(threadRunning.load() == true)
    {
        fmtlog::poll(false);
        usleep(usec_poll_period);
    }
    fmtlog::poll(true);
    return NULL;
}

static pthread_t start_polling_thread()
{
    pthread_t thread_id;
    threadRunning.store(true);
    int ret = pthread_create(&thread_id, NULL, bg_fmtlog_collector, NULL);
    if(ret != 0)
    {
        threadRunning.store(false);
        FHLOGE_FMT(TAG, FH_CAPTURE_THREAD_EVENT, "fmtlog background thread creation failed: {}", ret);
        return static_cast<pthread_t>(-1);
    }
    return thread_id;
}

static void load_yaml_config(const char* yaml_file)
{
    FHLOGI_FMT(TAG, "Using {} for fhlog configuration", yaml_file);
    const YAML::Node root_node  = YAML::LoadFile(yaml_file);
    const YAML::Node fhlog_node = root_node["fhlog"];
    if(!fhlog_node)
    {
        FHLOGW_FMT(TAG, "No fhlog section in {}, using defaults", yaml_file);
        return;
    }

    if(fhlog_node["log_level"])
    {
        fhlog_set_all_levels(fhlog_node["log_level"].as<int>());
    }
    if(fhlog_node["max_file_size_bytes"])
    {
        max_log_file_size_bytes = fhlog_node["max_file_size_bytes"].as<size_t>();
    }
    if(fhlog_node["max_rotating_file_num"])
    {
        max_rotating_file_num = std::max(1, fhlog_node["max_rotating_file_num"].as<int32_t>());
    }
    if(fhlog_node["log_file_path"])
    {
        std::string log_file_path = fhlog_node["log_file_path"].as<std::string>();
        snprintf(logfile_base, MAX_PATH_LEN, "%s", log_file_path.c_str());
    }

    if(YAML::Node all_tags = fhlog_node["tags"]; all_tags.IsSequence())
    {
        for(YAML::const_iterator tag_node = all_tags.begin(); tag_node != all_tags.end(); ++tag_node)
        {
            if(!tag_node->IsMap() || tag_node->size() == 0)
            {
                FHLOGW_FMT(TAG, "fhlog tags entry is not a tag: level map, skipping");
                continue;
            }
            YAML::Node::const_iterator sub_it   = tag_node->begin();
            std::string                tag_name = sub_it->first.as<std::string>();
            int                        level    = sub_it->second.as<int>();
            if(!fhlog_set_tag_level(tag_name, level))
            {
                FHLOGW_FMT(TAG, "fhlog tag {} is not in fhlog_fmt.hpp, skipping", tag_name);
            }
        }
    }
}

pthread_t fhlog_init(const char* yaml_file, const char* name)
{
    if(fmt_log_initiated.fetch_add(1) != 0)
    {
        printf("FMT log already had been initiated\n");
        return static_cast<pthread_t>(-1);
    }

    fhlog_set_all_levels(FHLOG_WARN);

    if(yaml_file == NULL)
    {
        FHLOGI_FMT(TAG, "No fhlog config yaml found, using default fhlog configuration");
    }
    else
    {
        load_yaml_config(yaml_file);
    }

    // Overwrite log path if exported in environment
    if(const char* env = std::getenv(FHLOG_LOG_PATH_ENV); env != nullptr)
    {
        FHLOGI_FMT(TAG, "{} set to {}", FHLOG_LOG_PATH_ENV, env);
        snprintf(logfile_base, MAX_PATH_LEN, "%s", env);
    }

    strncat(logfile_base, "/", MAX_PATH_LEN - strlen(logfile_base) - 1);
    strncat(logfile_base, name, MAX_PATH_LEN - strlen(logfile_base) - 1);
    FHLOGI_FMT(TAG, "Output log file path {}", logfile_base);

    update_log_filename();
    fmtlog::setHeaderPattern("{HMSf} {l} {t} {s} ");
    fmtlog::setLogCB(logcb_fhlog, fmtlog::DBG);
    fmtlog::setLogLevel(fmtlog::DBG);
    return start_polling_thread();
}

void fhlog_close(pthread_t bg_thread_id)
{
    if(threadRunning.load() == false) return;
    threadRunning.store(false);
    pthread_join(bg_thread_id, NULL);
    fmtlog::closeLogFile();
    snprintf(logfile_base, MAX_PATH_LEN, "%s", FHLOG_DEFAULT_LOG_DIR);
    logfile_count = -1;
    fmt_log_initiated.store(0);
}

void fhlog_thread_init(const char* name)
{
    fmtlog::preallocate();
    fmtlog::setThreadName(name);
}

extern "C" const char* fhlog_event_name(fh_event_code_t code)
{
    switch(code)
    {
    case FH_CAPTURE_SUCCESS: return "FH_CAPTURE_SUCCESS";
    case FH_CAPTURE_INVALID_PARAM: return "FH_CAPTURE_INVALID_PARAM";
    case FH_CAPTURE_INTERNAL_EVENT: return "FH_CAPTURE_INTERNAL_EVENT";
    case FH_CAPTURE_FORMAT_EVENT: return "FH_CAPTURE_FORMAT_EVENT";
    case FH_CAPTURE_DECODE_EVENT: return "FH_CAPTURE_DECODE_EVENT";
    case FH_CAPTURE_IO_EVENT: return "FH_CAPTURE_IO_EVENT";
    case FH_CAPTURE_CONFIG_EVENT: return "FH_CAPTURE_CONFIG_EVENT";
    case FH_CAPTURE_YAML_EVENT: return "FH_CAPTURE_YAML_EVENT";
    case FH_CAPTURE_THREAD_EVENT: return "FH_CAPTURE_THREAD_EVENT";
    case FH_CAPTURE_FHLOG_EVENT: return "FH_CAPTURE_FHLOG_EVENT";
    }
    return "UNKNOWN_EVENT";
}
