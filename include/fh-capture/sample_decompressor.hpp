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

#ifndef FH_CAPTURE_SAMPLE_DECOMPRESSOR_HPP__
#define FH_CAPTURE_SAMPLE_DECOMPRESSOR_HPP__

#include "fh-capture/types.hpp"
#include "fh-capture/wire.hpp"

#include <string>

namespace fh_capture
{
/**
 * Compressed-payload decoding scheme
 */
enum class DecompressionMode
{
    LEGACY,   //!< Exponent nibble plus offset-binary 8-bit pairs, fallback for captures made by the legacy tooling
    ORAN_BFP, //!< O-RAN block floating point, one exponent per PRB
};

const char* decompression_mode_name(DecompressionMode mode);

/**
 * Parse "legacy" or "oran_bfp"
 * @throws CaptureException (EINVAL) for other names
 */
DecompressionMode parse_decompression_mode(const std::string& name);

struct DecompressorConfig
{
    DecompressionMode mode{DecompressionMode::LEGACY};
    int               bfp_iq_width{FH_CAPTURE_BFP_DEFAULT_WIDTH};  //!< Mantissa width in bits, 16 means uncompressed
};

/**
 * True if the leading nibble marks a LEGACY compressed payload
 */
bool is_compressed_payload(const uint8_t* data, size_t size);

/**
 * Interleaved 16-bit big-endian I/Q pairs, trailing partial pair dropped
 */
SampleBlock decode_raw_samples(const uint8_t* data, size_t size);

/**
 * LEGACY compressed block
 *
 * Byte 0 low nibble is the shared exponent, byte 1 is reserved,
 * then one offset-binary byte per I and Q: sample = (byte - 128) * 2^exponent.
 * Payloads shorter than 4 bytes give an empty block.
 */
SampleBlock decompress_legacy(const uint8_t* data, size_t size);

/**
 * O-RAN block floating point PRBs
 *
 * Each PRB is one udCompParam byte (exponent in the low nibble) followed by
 * 12 REs of I/Q two's-complement mantissas, iq_width bits each, MSB first.
 * iq_width 16 means 48-byte uncompressed PRBs without udCompParam.
 *
 * @param num_prb PRBs to decode, 0 for as many complete PRBs as the payload holds
 * @throws CaptureException (EINVAL) if iq_width is outside 1..16
 */
SampleBlock decompress_bfp(const uint8_t* data, size_t size, int iq_width, uint16_t num_prb);

/**
 * Reconstruct I/Q samples from the payload following the radio header
 */
class SampleDecompressor {
public:
    /**
     * @throws CaptureException (EINVAL) if bfp_iq_width is outside 1..16
     */
    explicit SampleDecompressor(const DecompressorConfig& config = DecompressorConfig{});

    /**
     * @param radio Radio header of the packet, provides numPrbu for ORAN_BFP
     */
    SampleBlock decompress(const uint8_t* data, size_t size, const RadioHeader* radio = nullptr) const;

    [[nodiscard]] const DecompressorConfig& config() const { return config_; }

protected:
    DecompressorConfig config_;
};

} // namespace fh_capture

#endif //ifndef FH_CAPTURE_SAMPLE_DECOMPRESSOR_HPP__
