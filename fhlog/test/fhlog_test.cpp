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

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

#include <gtest/gtest.h>

#include "fhlog.hpp"

#define TAG_TEST "FHLOG.TEST"

TEST(FhlogTest, ComponentTable)
{
    static_assert(fhlog_component_is_valid("FHC.READER"));
    static_assert(fhlog_component_is_valid(TAG_TEST));
    EXPECT_FALSE(fhlog_component_is_valid("FHC.UNKNOWN"));
    EXPECT_STREQ("FHC.BFP", fhlog_get_component_name("FHC.BFP"));
    EXPECT_STREQ("", fhlog_get_component_name("NOT.A.TAG"));
    EXPECT_EQ(0, fhlog_get_component_id("NOT.A.TAG"));
    EXPECT_EQ(1, fhlog_get_component_id("FHLOG"));
}

TEST(FhlogTest, LevelMapping)
{
    EXPECT_EQ(fmtlog::OFF, fhlog_to_fmtlog_level(FHLOG_NONE));
    EXPECT_EQ(fmtlog::ERR, fhlog_to_fmtlog_level(FHLOG_ERROR));
    EXPECT_EQ(fmtlog::WRN, fhlog_to_fmtlog_level(FHLOG_WARN));
    EXPECT_EQ(fmtlog::INF, fhlog_to_fmtlog_level(FHLOG_INFO));
    EXPECT_EQ(fmtlog::DBG, fhlog_to_fmtlog_level(FHLOG_DEBUG));
    EXPECT_EQ(fmtlog::WRN, fhlog_to_fmtlog_level(42));
}

TEST(FhlogTest, TagLevelOverride)
{
    fhlog_set_all_levels(FHLOG_WARN);
    EXPECT_TRUE(fhlog_set_tag_level("FHC.PIPELINE", FHLOG_DEBUG));
    EXPECT_FALSE(fhlog_set_tag_level("FHC.NOPE", FHLOG_DEBUG));
    EXPECT_EQ(fmtlog::DBG, fhlog_get_tag_level("FHC.PIPELINE"));
    EXPECT_EQ(fmtlog::WRN, fhlog_get_tag_level("FHC.READER"));
    EXPECT_EQ(fmtlog::OFF, fhlog_get_tag_level("FHC.NOPE"));

    FHLOGD_FMT("FHC.PIPELINE", "debug line visible for tag {}", "FHC.PIPELINE");
    FHLOGD_FMT("FHC.READER", "debug line filtered for tag {}", "FHC.READER");
    FHLOGE_FMT(TAG_TEST, FH_CAPTURE_INTERNAL_EVENT, "error lines are never filtered: {}", 1);
}

TEST(FhlogTest, EventNames)
{
    EXPECT_STREQ("FH_CAPTURE_FORMAT_EVENT", fhlog_event_name(FH_CAPTURE_FORMAT_EVENT));
    EXPECT_STREQ("FH_CAPTURE_IO_EVENT", fhlog_event_name(FH_CAPTURE_IO_EVENT));
}

TEST(FhlogTest, InitFromYaml)
{
    const std::string yaml_path = "/tmp/fhlog_test_" + std::to_string(getpid()) + ".yaml";
    {
        std::ofstream out(yaml_path);
        out << "fhlog:\n"
            << "  log_level: 3\n"
            << "  log_file_path: /tmp\n"
            << "  max_file_size_bytes: 1000000\n"
            << "  max_rotating_file_num: 2\n"
            << "  tags:\n"
            << "    - FHC.BFP: 4\n"
            << "    - {}\n"
            << "    - NOT.A.TAG: 4\n";
    }
    unsetenv(FHLOG_LOG_PATH_ENV);

    pthread_t bg_thread_id = fhlog_init(yaml_path.c_str(), "fhlog_test.log");
    ASSERT_NE(static_cast<pthread_t>(-1), bg_thread_id);
    EXPECT_EQ(fmtlog::INF, fhlog_get_tag_level("FHC.READER"));
    EXPECT_EQ(fmtlog::DBG, fhlog_get_tag_level("FHC.BFP"));

    // Second init is rejected while the first one is active
    EXPECT_EQ(static_cast<pthread_t>(-1), fhlog_init(nullptr, "fhlog_test_again.log"));

    FHLOGI_FMT(TAG_TEST, "fhlog test line {}", 1);
    fhlog_close(bg_thread_id);
    std::remove(yaml_path.c_str());

    std::ifstream log_file("/tmp/fhlog_test.log");
    EXPECT_TRUE(log_file.good());
}

TEST(FhlogTest, EventLineAndThreadName)
{
    unsetenv(FHLOG_LOG_PATH_ENV);
    pthread_t bg_thread_id = fhlog_init(nullptr, "fhlog_test_event.log");
    ASSERT_NE(static_cast<pthread_t>(-1), bg_thread_id);
    fhlog_thread_init("fhlog_test");

    fhlog_set_all_levels(FHLOG_NONE);
    FHLOGI_FMT_EVT(TAG_TEST, FH_CAPTURE_SUCCESS, "event lines ignore tag levels: {}", 2);
    fhlog_close(bg_thread_id);

    std::ifstream log_file("/tmp/fhlog_test_event.log");
    ASSERT_TRUE(log_file.good());
    std::string contents((std::istreambuf_iterator<char>(log_file)), std::istreambuf_iterator<char>());
    EXPECT_NE(std::string::npos, contents.find("[FH_CAPTURE_SUCCESS] [FHLOG.TEST] event lines ignore tag levels: 2"));
}

TEST(FhlogTest, ReinitAfterClose)
{
    unsetenv(FHLOG_LOG_PATH_ENV);
    std::remove("/tmp/fhlog_test_first.log");
    std::remove("/tmp/fhlog_test_second.log");

    pthread_t bg_thread_id = fhlog_init(nullptr, "fhlog_test_first.log");
    ASSERT_NE(static_cast<pthread_t>(-1), bg_thread_id);
    fhlog_close(bg_thread_id);

    // The log path restarts from the default directory, not the previous file
    bg_thread_id = fhlog_init(nullptr, "fhlog_test_second.log");
    ASSERT_NE(static_cast<pthread_t>(-1), bg_thread_id);
    FHLOGW_FMT(TAG_TEST, "second session line {}", 1);
    fhlog_close(bg_thread_id);

    EXPECT_TRUE(std::ifstream("/tmp/fhlog_test_first.log").good());
    EXPECT_TRUE(std::ifstream("/tmp/fhlog_test_second.log").good());
}
