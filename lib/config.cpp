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

#include "fh-capture/config.hpp"
#include "utils.hpp"

#include <fstream>

#include <yaml-cpp/yaml.h>

#undef TAG
#define TAG "FHC.CONFIG"

namespace fh_capture
{
static bool file_exists(const std::string& name)
{
    std::ifstream f(name.c_str());
    return f.good();
}

void validate_config(const CaptureConfig& config)
{
    if(config.chunk_size == 0)
    {
        THROW_FHC(EINVAL, "chunk_size must be greater than 0");
    }
    if(config.decompressor.bfp_iq_width < 1 || config.decompressor.bfp_iq_width > FH_CAPTURE_BFP_NO_COMPRESSION)
    {
        THROW_FHC(EINVAL, StringBuilder() << "bfp_iq_width must be in 1.." << FH_CAPTURE_BFP_NO_COMPRESSION << ", got "
                                          << config.decompressor.bfp_iq_width);
    }
}

CaptureConfig ConfigParser::parse_root(const YAML::Node& root)
{
    CaptureConfig config{};
    const YAML::Node node = root[kFhCaptureYaml];
    if(!node)
    {
        FHLOGW_FMT(TAG, "No {} section, using defaults", kFhCaptureYaml);
        return config;
    }

    try
    {
        if(node[kChunkSizeYaml])
        {
            auto chunk_size = node[kChunkSizeYaml].as<int64_t>();
            if(chunk_size <= 0)
            {
                THROW_FHC(EINVAL, StringBuilder() << kChunkSizeYaml << " must be greater than 0, got " << chunk_size);
            }
            config.chunk_size = static_cast<size_t>(chunk_size);
        }
        if(node[kDecompressionModeYaml])
        {
            config.decompressor.mode = parse_decompression_mode(node[kDecompressionModeYaml].as<std::string>());
        }
        if(node[kBfpIqWidthYaml])
        {
            config.decompressor.bfp_iq_width = node[kBfpIqWidthYaml].as<int>();
        }
        if(node[kMaxWarningsYaml])
        {
            config.max_warnings = node[kMaxWarningsYaml].as<size_t>();
        }
        if(node[kComputeExtendedMetricsYaml])
        {
            config.compute_extended_metrics = node[kComputeExtendedMetricsYaml].as<bool>();
        }
    }
    catch(const YAML::Exception& e)
    {
        FHLOGE_FMT(TAG, FH_CAPTURE_YAML_EVENT, "Bad value in {} section: {}", kFhCaptureYaml, e.what());
        THROW_FHC(EINVAL, StringBuilder() << "Bad value in " << kFhCaptureYaml << " section: " << e.what());
    }

    validate_config(config);
    return config;
}

CaptureConfig ConfigParser::parse_string(const std::string& yaml_text)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml_text);
    }
    catch(const YAML::Exception& e)
    {
        THROW_FHC(EINVAL, StringBuilder() << "Malformed YAML: " << e.what());
    }
    return parse_root(root);
}

ConfigParser::ConfigParser(const std::string& config_file) :
    config_file_{config_file}
{
    if(!file_exists(config_file))
    {
        FHLOGE_FMT(TAG, FH_CAPTURE_CONFIG_EVENT, "Config file {} not found", config_file);
        THROW_FHC(ENOENT, StringBuilder() << "Config file: '" << config_file << "' not found!");
    }

    FHLOGI_FMT(TAG, "Parsing config file {}", config_file);
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(config_file);
    }
    catch(const YAML::Exception& e)
    {
        THROW_FHC(EINVAL, StringBuilder() << "Malformed YAML in " << config_file << ": " << e.what());
    }
    config_ = parse_root(root);

    FHLOGI_FMT(TAG, "chunk_size={} decompression_mode={} bfp_iq_width={} max_warnings={} extended_metrics={}", config_.chunk_size,
               decompression_mode_name(config_.decompressor.mode), config_.decompressor.bfp_iq_width, config_.max_warnings,
               config_.compute_extended_metrics);
}

} // namespace fh_capture
