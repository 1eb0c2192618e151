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

#pragma once
#ifndef FHLOG_FMT_HPP
#define FHLOG_FMT_HPP

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include "fmtlog.h"
#pragma GCC diagnostic pop

#include <string_view>
#include <type_traits>

#include "fh_event_code.h"

#define FHLOGD_FMT(component_id, format_fmt, ...) FHLOG_FMT(fmtlog::DBG, component_id, format_fmt, ##__VA_ARGS__)
#define FHLOGI_FMT(component_id, format_fmt, ...) FHLOG_FMT(fmtlog::INF, component_id, format_fmt, ##__VA_ARGS__)
#define FHLOGW_FMT(component_id, format_fmt, ...) FHLOG_FMT(fmtlog::WRN, component_id, format_fmt, ##__VA_ARGS__)

#define FHLOGI_FMT_EVT(component_id, event_level, format_fmt, ...) FHLOG_FMT_EVT(fmtlog::INF, component_id, event_level, format_fmt, ##__VA_ARGS__)
#define FHLOGE_FMT(component_id, event_level, format_fmt, ...) FHLOG_FMT_EVT(fmtlog::ERR, component_id, event_level, format_fmt, ##__VA_ARGS__)

/**
 * Tagged log line, filtered by the per-tag level table
 *
 * Formatting happens on the background poll thread.
 */
#define FHLOG_FMT(log_level, component_id, format_fmt, ...) do { \
    static_assert(fhlog_component_is_valid(component_id), "Component ID (TAG) doesn't exist"); \
    if(log_level >= g_fhlog_component_levels[fhlog_get_component_id(component_id)]) { \
        FMTLOG(log_level, "[{}] " format_fmt, fhlog_get_component_name(component_id), ##__VA_ARGS__); \
    } \
} while(0)

/**
 * Tagged log line with an event code, never filtered by tag level
 */
#define FHLOG_FMT_EVT(log_level, component_id, event_level, format_fmt, ...) do { \
    static_assert(fhlog_component_is_valid(component_id), "Component ID (TAG) doesn't exist"); \
    static_assert(std::is_same<decltype(event_level), fh_event_code_t>::value, "Event is not of type fh_event_code_t"); \
    FMTLOG(log_level, "[{}] [{}] " format_fmt, #event_level, fhlog_get_component_name(component_id), ##__VA_ARGS__); \
} while(0)

struct fhlog_component_ids
{
    int         id;
    const char* name;
};

inline constexpr fhlog_component_ids g_fhlog_component_ids[] {
    //Reserve number 0 for no tag print
    {0, ""},

    // fhlog
    {10, "FHLOG"},
    {11, "FHLOG.TEST"},
    {12, "FHLOG.YAML"},

    // fh-capture library
    {100, "FHC"},
    {101, "FHC.READER"},
    {102, "FHC.DECODE"},
    {103, "FHC.BFP"},
    {104, "FHC.METRICS"},
    {105, "FHC.PIPELINE"},
    {106, "FHC.SUMMARY"},
    {107, "FHC.CONFIG"},
    {108, "FHC.WRITER"},

    // applications
    {200, "FHC.CLI"},
};

inline constexpr int FHLOG_NUM_TAGS = sizeof(g_fhlog_component_ids) / sizeof(fhlog_component_ids);

inline int g_fhlog_component_levels[FHLOG_NUM_TAGS];

constexpr bool fhlog_component_is_valid(std::string_view name)
{
    for(auto& c : g_fhlog_component_ids)
    {
        if(name == c.name)
        {
            return true;
        }
    }
    return false;
}

constexpr const char* fhlog_get_component_name(std::string_view name)
{
    for(auto& c : g_fhlog_component_ids)
    {
        if(name == c.name)
        {
            return c.name;
        }
    }
    return "";
}

constexpr int fhlog_get_component_id(std::string_view name)
{
    for(int i = 0; i < FHLOG_NUM_TAGS; ++i)
    {
        if(name == g_fhlog_component_ids[i].name)
        {
            return i;
        }
    }
    return 0;
}

#endif // FHLOG_FMT_HPP
