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

#ifndef FH_CAPTURE_CONFIG_HPP__
#define FH_CAPTURE_CONFIG_HPP__

#include "fh-capture/sample_decompressor.hpp"

#include <cstddef>
#include <string>

namespace YAML
{
class Node;
}

namespace fh_capture
{
constexpr char kFhCaptureYaml[]             = "fh_capture";
constexpr char kChunkSizeYaml[]             = "chunk_size";
constexpr char kDecompressionModeYaml[]     = "decompression_mode";
constexpr char kBfpIqWidthYaml[]            = "bfp_iq_width";
constexpr char kMaxWarningsYaml[]           = "max_warnings";
constexpr char kComputeExtendedMetricsYaml[] = "compute_extended_metrics";

constexpr size_t kDefaultChunkSize = 50;

/**
 * Pipeline settings
 */
struct CaptureConfig
{
    size_t             chunk_size{kDefaultChunkSize};   //!< Packets per chunk, > 0
    DecompressorConfig decompressor{};                   //!< Sample decompression mode and width
    size_t             max_warnings{0};                  //!< Stored warnings cap, 0 for unlimited
    bool               compute_extended_metrics{true};   //!< Also compute SignalMetrics per packet
};

/**
 * Check value ranges
 * @throws CaptureException (EINVAL) on the first invalid value
 */
void validate_config(const CaptureConfig& config);

/**
 * Reads the fh_capture section of a YAML config file
 *
 * Missing keys keep their defaults.
 */
class ConfigParser {
public:
    /**
     * @throws CaptureException (ENOENT) if the file does not exist, (EINVAL) for malformed YAML or bad values
     */
    explicit ConfigParser(const std::string& config_file);

    /**
     * Parse an in-memory YAML document
     * @throws CaptureException (EINVAL) for malformed YAML or bad values
     */
    static CaptureConfig parse_string(const std::string& yaml_text);

    [[nodiscard]] const CaptureConfig& get_capture_config() const { return config_; }
    [[nodiscard]] const std::string&   get_config_file() const { return config_file_; }

protected:
    static CaptureConfig parse_root(const YAML::Node& root);

    std::string   config_file_;
    CaptureConfig config_;
};

} // namespace fh_capture

#endif //ifndef FH_CAPTURE_CONFIG_HPP__
