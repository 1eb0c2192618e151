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

#include "fh-capture/sample_decompressor.hpp"
#include "utils.hpp"

#undef TAG
#define TAG "FHC.BFP"

namespace fh_capture
{
const char* decompression_mode_name(DecompressionMode mode)
{
    switch(mode)
    {
    case DecompressionMode::LEGACY: return "legacy";
    case DecompressionMode::ORAN_BFP: return "oran_bfp";
    }
    return "unknown";
}

DecompressionMode parse_decompression_mode(const std::string& name)
{
    if(name == "legacy")
    {
        return DecompressionMode::LEGACY;
    }
    if(name == "oran_bfp")
    {
        return DecompressionMode::ORAN_BFP;
    }
    THROW_FHC(EINVAL, StringBuilder() << "Unknown decompression mode '" << name << "', expected legacy or oran_bfp");
}

static void check_iq_width(int iq_width)
{
    if(unlikely(iq_width < 1 || iq_width > FH_CAPTURE_BFP_NO_COMPRESSION))
    {
        THROW_FHC(EINVAL, StringBuilder() << "Invalid BFP IQ width: " << iq_width);
    }
}

bool is_compressed_payload(const uint8_t* data, size_t size)
{
    return size >= 2 && ((data[0] >> 4) & 0x0f) == 1;
}

SampleBlock decode_raw_samples(const uint8_t* data, size_t size)
{
    SampleBlock block;
    block.i.reserve(size / 4);
    block.q.reserve(size / 4);
    for(size_t n = 0; n + 3 < size; n += 4)
    {
        block.i.push_back(static_cast<int16_t>(from_network(load_wire<uint16_t>(data + n))));
        block.q.push_back(static_cast<int16_t>(from_network(load_wire<uint16_t>(data + n + 2))));
    }
    return block;
}

SampleBlock decompress_legacy(const uint8_t* data, size_t size)
{
    SampleBlock block;
    if(size < 4)
    {
        return block;
    }

    const int32_t scale = 1 << (data[0] & 0x0f);
    // data[1] is reserved
    for(size_t n = 2; n + 1 < size; n += 2)
    {
        block.i.push_back((static_cast<int32_t>(data[n]) - 128) * scale);
        block.q.push_back((static_cast<int32_t>(data[n + 1]) - 128) * scale);
    }
    return block;
}

/**
 * MSB-first reader of fixed-width mantissas
 */
class MantissaReader {
public:
    MantissaReader(const uint8_t* data, int width) :
        data_{data},
        width_{width},
        mask_{(1u << width) - 1} {}

    uint32_t next()
    {
        while(bits_ < width_)
        {
            acc_ = (acc_ << 8) | *data_++;
            bits_ += 8;
        }
        bits_ -= width_;
        return static_cast<uint32_t>(acc_ >> bits_) & mask_;
    }

protected:
    const uint8_t* data_;
    int            width_;
    uint32_t       mask_;
    uint64_t       acc_{0};
    int            bits_{0};
};

SampleBlock decompress_bfp(const uint8_t* data, size_t size, int iq_width, uint16_t num_prb)
{
    check_iq_width(iq_width);

    const bool   uncompressed = iq_width == FH_CAPTURE_BFP_NO_COMPRESSION;
    const size_t prb_stride   = FH_CAPTURE_BFP_PRB_SIZE(iq_width);
    const size_t prb_fit      = size / prb_stride;
    const size_t prb_count    = (num_prb == 0) ? prb_fit : std::min<size_t>(num_prb, prb_fit);

    SampleBlock block;
    block.i.reserve(prb_count * FH_CAPTURE_PRB_NUM_RE);
    block.q.reserve(prb_count * FH_CAPTURE_PRB_NUM_RE);

    for(size_t prb = 0; prb < prb_count; ++prb)
    {
        const uint8_t* prb_data = data + prb * prb_stride;
        int32_t        shift    = 0;
        if(!uncompressed)
        {
            shift = prb_data[0] & 0x0f;
            ++prb_data;
        }

        MantissaReader reader{prb_data, iq_width};
        for(int re = 0; re < FH_CAPTURE_PRB_NUM_RE; ++re)
        {
            // shift left first then right to propagate the sign bits
            int32_t vi = static_cast<int32_t>(reader.next() << (32 - iq_width));
            int32_t vq = static_cast<int32_t>(reader.next() << (32 - iq_width));
            block.i.push_back(vi >> (32 - iq_width - shift));
            block.q.push_back(vq >> (32 - iq_width - shift));
        }
    }

    if(num_prb != 0 && prb_count < num_prb)
    {
        FHLOGD_FMT(TAG, "Payload of {} bytes holds {} of {} PRBs at {} bits", size, prb_count, num_prb, iq_width);
    }
    return block;
}

SampleDecompressor::SampleDecompressor(const DecompressorConfig& config) :
    config_{config}
{
    check_iq_width(config_.bfp_iq_width);
    FHLOGD_FMT(TAG, "Sample decompressor mode={} iq_width={}", decompression_mode_name(config_.mode), config_.bfp_iq_width);
}

SampleBlock SampleDecompressor::decompress(const uint8_t* data, size_t size, const RadioHeader* radio) const
{
    if(config_.mode == DecompressionMode::ORAN_BFP)
    {
        return decompress_bfp(data, size, config_.bfp_iq_width, radio != nullptr ? radio->num_prb : 0);
    }

    if(is_compressed_payload(data, size))
    {
        return decompress_legacy(data, size);
    }
    return decode_raw_samples(data, size);
}

} // namespace fh_capture
