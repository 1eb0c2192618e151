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

#include "fh_capture_tests.hpp"

TEST(SampleDecompressorTest, RawPairs)
{
    const uint8_t data[] = {0x00, 0x01, 0xff, 0xff, 0x01, 0x00, 0xff, 0x00, 0x7f, 0xff, 0x80, 0x00, 0xaa};
    SampleBlock   block  = decode_raw_samples(data, sizeof(data));

    // 3 complete pairs, the trailing byte is dropped
    ASSERT_EQ(3u, block.size());
    EXPECT_EQ(1, block.i[0]);
    EXPECT_EQ(-1, block.q[0]);
    EXPECT_EQ(256, block.i[1]);
    EXPECT_EQ(-256, block.q[1]);
    EXPECT_EQ(32767, block.i[2]);
    EXPECT_EQ(-32768, block.q[2]);

    EXPECT_TRUE(decode_raw_samples(data, 3).empty());
}

TEST(SampleDecompressorTest, RawPairCount)
{
    for(size_t n : {0, 1, 12, 100})
    {
        SampleBlock in;
        for(size_t k = 0; k < n; ++k)
        {
            in.i.push_back(static_cast<int32_t>(k) - 50);
            in.q.push_back(static_cast<int32_t>(k) * 3);
        }
        std::vector<uint8_t> bytes = encode_raw_samples(in);
        SampleBlock          out   = decode_raw_samples(bytes.data(), bytes.size());
        EXPECT_EQ(n, out.size());
        EXPECT_EQ(in.i, out.i);
        EXPECT_EQ(in.q, out.q);
    }
}

TEST(SampleDecompressorTest, CompressedNibble)
{
    const uint8_t compressed[] = {0x13, 0x00};
    const uint8_t raw[]        = {0x03, 0x00};
    EXPECT_TRUE(is_compressed_payload(compressed, sizeof(compressed)));
    EXPECT_FALSE(is_compressed_payload(compressed, 1));
    EXPECT_FALSE(is_compressed_payload(raw, sizeof(raw)));
}

TEST(SampleDecompressorTest, Legacy)
{
    const uint8_t data[] = {0x12, 0x00, 0x81, 0x7f, 0x80, 0x00, 0xff};
    SampleBlock   block  = decompress_legacy(data, sizeof(data));
    ASSERT_EQ(2u, block.size());
    EXPECT_EQ(4, block.i[0]);
    EXPECT_EQ(-4, block.q[0]);
    EXPECT_EQ(0, block.i[1]);
    EXPECT_EQ(-512, block.q[1]);

    EXPECT_TRUE(decompress_legacy(data, 3).empty());

    SampleDecompressor decompressor;
    EXPECT_EQ(DecompressionMode::LEGACY, decompressor.config().mode);
    SampleBlock via_mode = decompressor.decompress(data, sizeof(data));
    EXPECT_EQ(block.i, via_mode.i);
    EXPECT_EQ(block.q, via_mode.q);
}

class BfpTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        for(int re = 0; re < 2 * FH_CAPTURE_PRB_NUM_RE; ++re)
        {
            mantissa_i.push_back(re * 18 - 200);
            mantissa_q.push_back(127 - re * 15);
        }
    }

    std::vector<int32_t> mantissa_i;
    std::vector<int32_t> mantissa_q;
};

TEST_F(BfpTest, PrbSize)
{
    EXPECT_EQ(28, FH_CAPTURE_BFP_PRB_SIZE(9));
    EXPECT_EQ(43, FH_CAPTURE_BFP_PRB_SIZE(14));
    EXPECT_EQ(48, FH_CAPTURE_BFP_PRB_SIZE(16));
    EXPECT_EQ(56u, pack_bfp(mantissa_i, mantissa_q, 9, 0).size());
}

TEST_F(BfpTest, Exponent)
{
    std::vector<uint8_t> payload = pack_bfp(mantissa_i, mantissa_q, 9, 3);
    SampleBlock          block   = decompress_bfp(payload.data(), payload.size(), 9, 2);
    ASSERT_EQ(24u, block.size());
    for(size_t re = 0; re < block.size(); ++re)
    {
        EXPECT_EQ(mantissa_i[re] * 8, block.i[re]) << "re " << re;
        EXPECT_EQ(mantissa_q[re] * 8, block.q[re]) << "re " << re;
    }
}

TEST_F(BfpTest, PrbCount)
{
    std::vector<uint8_t> payload = pack_bfp(mantissa_i, mantissa_q, 9, 0);
    EXPECT_EQ(12u, decompress_bfp(payload.data(), payload.size(), 9, 1).size());
    EXPECT_EQ(24u, decompress_bfp(payload.data(), payload.size(), 9, 0).size());
    // numPrbu larger than the payload: complete PRBs only
    EXPECT_EQ(24u, decompress_bfp(payload.data(), payload.size(), 9, 5).size());
    EXPECT_EQ(12u, decompress_bfp(payload.data(), payload.size() - 1, 9, 0).size());
    EXPECT_TRUE(decompress_bfp(payload.data(), 10, 9, 0).empty());
}

TEST_F(BfpTest, Uncompressed)
{
    std::vector<uint8_t> payload = pack_bfp(mantissa_i, mantissa_q, 16, 0);
    ASSERT_EQ(96u, payload.size());
    SampleBlock bfp = decompress_bfp(payload.data(), payload.size(), 16, 0);
    SampleBlock raw = decode_raw_samples(payload.data(), payload.size());
    EXPECT_EQ(raw.i, bfp.i);
    EXPECT_EQ(raw.q, bfp.q);
    EXPECT_EQ(mantissa_i, bfp.i);
}

TEST_F(BfpTest, ModeIgnoresNibble)
{
    // First byte 0x15 looks like a LEGACY payload
    std::vector<uint8_t> payload = pack_bfp(mantissa_i, mantissa_q, 9, 5);
    payload[0]                   = 0x15;
    payload[28]                  = 0x15;

    DecompressorConfig config;
    config.mode         = DecompressionMode::ORAN_BFP;
    config.bfp_iq_width = 9;
    SampleDecompressor decompressor(config);

    RadioHeader radio{};
    radio.num_prb     = 2;
    SampleBlock block = decompressor.decompress(payload.data(), payload.size(), &radio);
    ASSERT_EQ(24u, block.size());
    EXPECT_EQ(mantissa_i[0] * 32, block.i[0]);
    EXPECT_EQ(mantissa_q[23] * 32, block.q[23]);
}

TEST(SampleDecompressorTest, InvalidWidth)
{
    const uint8_t data[64] = {};
    EXPECT_THROW(decompress_bfp(data, sizeof(data), 0, 0), CaptureException);
    EXPECT_THROW(decompress_bfp(data, sizeof(data), 17, 0), CaptureException);

    DecompressorConfig config;
    config.bfp_iq_width = 20;
    EXPECT_THROW(SampleDecompressor{config}, CaptureException);
}

TEST(SampleDecompressorTest, ModeNames)
{
    EXPECT_EQ(DecompressionMode::LEGACY, parse_decompression_mode("legacy"));
    EXPECT_EQ(DecompressionMode::ORAN_BFP, parse_decompression_mode("oran_bfp"));
    EXPECT_STREQ("oran_bfp", decompression_mode_name(DecompressionMode::ORAN_BFP));
    try
    {
        parse_decompression_mode("mu-law");
        FAIL() << "Expected CaptureException";
    }
    catch(const CaptureException& e)
    {
        EXPECT_EQ(EINVAL, e.err_code());
    }
}
