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

namespace
{
CaptureBuffer summary_capture()
{
    CaptureWriter writer;
    writer.add_record(iq_packet(1, 0, constant_block(3, 4, 12)));
    writer.add_record(iq_packet(2, 0, constant_block(6, 8, 12)));
    writer.add_record(iq_packet(1, 1, constant_block(0, 0, 12)));
    return writer.buffer();
}

size_t count_warnings(const RunResult& result, WarningKind kind)
{
    return std::count_if(result.warnings.begin(), result.warnings.end(), [kind](const Warning& w) { return w.kind == kind; });
}
} // namespace

TEST(PipelineTest, CleanCapture)
{
    std::vector<std::pair<Phase, double>> reports;
    RunResult result = analyze_capture(make_capture(7), CaptureConfig{}, [&reports](Phase phase, double progress) {
        reports.emplace_back(phase, progress);
        return true;
    });

    EXPECT_EQ(RunStatus::SUCCESS, result.status);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_FALSE(result.error.has_value());
    EXPECT_FALSE(result.cancelled);
    ASSERT_TRUE(result.capture_header.has_value());
    EXPECT_EQ(FH_CAPTURE_LINKTYPE_ETHERNET, result.capture_header->link_type);

    ASSERT_EQ(7u, result.records.size());
    for(size_t n = 0; n < result.records.size(); ++n)
    {
        const PacketRecord& record = result.records[n];
        EXPECT_EQ(n, record.index);
        EXPECT_DOUBLE_EQ(86400.0 + 0.001 * n, record.timestamp);
        ASSERT_TRUE(record.radio.has_value());
        ASSERT_TRUE(record.samples.has_value());
        EXPECT_EQ(12u, record.samples->size());
        ASSERT_TRUE(record.metrics.has_value());
        EXPECT_DOUBLE_EQ(rms(*record.samples), record.metrics->rms);
    }
    EXPECT_EQ(7u, result.summary.total_packets);
    EXPECT_EQ(4u, result.summary.unique_rtc_ids.size());

    ASSERT_FALSE(reports.empty());
    for(size_t n = 1; n < reports.size(); ++n)
    {
        EXPECT_GE(reports[n].second, reports[n - 1].second);
        EXPECT_GE(static_cast<int>(reports[n].first), static_cast<int>(reports[n - 1].first));
    }
    EXPECT_EQ(Phase::DONE, reports.back().first);
    EXPECT_DOUBLE_EQ(100.0, reports.back().second);
}

TEST(PipelineTest, BigEndianCapture)
{
    RunResult little = analyze_capture(make_capture(5, ByteOrder::LITTLE_ENDIAN_STREAM));
    RunResult big    = analyze_capture(make_capture(5, ByteOrder::BIG_ENDIAN_STREAM));
    EXPECT_EQ(RunStatus::SUCCESS, big.status);
    ASSERT_EQ(little.records.size(), big.records.size());
    EXPECT_EQ(little.summary.rms_values, big.summary.rms_values);
    EXPECT_EQ(little.summary.rtc_distribution, big.summary.rtc_distribution);
}

TEST(PipelineTest, BadMagicIsFatal)
{
    auto      buffer = std::make_shared<const std::vector<uint8_t>>(std::vector<uint8_t>(128, 0));
    bool      done_reported = false;
    RunResult result = analyze_capture(buffer, CaptureConfig{}, [&done_reported](Phase phase, double) {
        done_reported = phase == Phase::DONE;
        return true;
    });

    EXPECT_EQ(RunStatus::FATAL, result.status);
    EXPECT_TRUE(done_reported);
    EXPECT_TRUE(result.records.empty());
    EXPECT_FALSE(result.capture_header.has_value());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(FormatError::BAD_MAGIC, result.error->format_error);
    EXPECT_EQ(0u, result.summary.total_packets);
}

TEST(PipelineTest, TruncatedHeaderIsFatal)
{
    CaptureWriter        writer(ByteOrder::BIG_ENDIAN_STREAM);
    std::vector<uint8_t> bytes(writer.bytes().begin(), writer.bytes().begin() + 12);

    RunResult result = analyze_capture(std::make_shared<const std::vector<uint8_t>>(bytes));
    EXPECT_EQ(RunStatus::FATAL, result.status);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(FormatError::TRUNCATED_HEADER, result.error->format_error);
}

TEST(PipelineTest, TruncatedRecordKeepsEarlierRecords)
{
    UPlanePacketParams params;
    params.payload = encode_raw_samples(constant_block(100, 50, 8));
    params.payload.resize(34, 0);

    CaptureWriter writer;
    writer.add_record(build_uplane_packet(params));
    writer.add_record_header(86400, 1000, 10000, 10000);
    std::vector<uint8_t> tail(50, 0x11);
    writer.add_raw_bytes(tail.data(), tail.size());

    RunResult result = analyze_capture(writer.buffer());
    EXPECT_EQ(RunStatus::SUCCESS_WITH_WARNINGS, result.status);
    ASSERT_EQ(1u, result.records.size());
    EXPECT_EQ(64u, result.records[0].length);
    EXPECT_EQ(8u, result.records[0].samples->size());
    ASSERT_EQ(1u, result.warnings.size());
    EXPECT_EQ(WarningKind::TRUNCATION, result.warnings[0].kind);
    EXPECT_FALSE(result.warnings[0].record_index.has_value());
}

TEST(PipelineTest, EmptySamples)
{
    CaptureWriter writer;
    writer.add_record(iq_packet(3, 0, SampleBlock{}));

    UPlanePacketParams short_payload;
    short_payload.payload = {0x00, 0x01, 0x02};
    writer.add_record(build_uplane_packet(short_payload));

    RunResult result = analyze_capture(writer.buffer());
    EXPECT_EQ(RunStatus::SUCCESS_WITH_WARNINGS, result.status);
    ASSERT_EQ(2u, result.records.size());
    EXPECT_EQ(2u, count_warnings(result, WarningKind::EMPTY_SAMPLE));

    EXPECT_TRUE(result.records[0].has_diagnostic(DIAG_EMPTY_SAMPLES));
    EXPECT_FALSE(result.records[0].samples.has_value());
    EXPECT_EQ(0.0, packet_rms(result.records[0]));

    EXPECT_TRUE(result.records[1].has_diagnostic(DIAG_EMPTY_SAMPLES));
    ASSERT_TRUE(result.records[1].samples.has_value());
    EXPECT_TRUE(result.records[1].samples->empty());
    EXPECT_EQ(0.0, result.records[1].metrics->rms);
    EXPECT_TRUE(result.summary.rms_values.empty());
}

TEST(PipelineTest, WarningCap)
{
    CaptureWriter writer;
    for(int n = 0; n < 5; ++n)
    {
        UPlanePacketParams params;
        params.ethertype = 0x0800;
        params.payload   = encode_raw_samples(constant_block(10, 10, 12));
        writer.add_record(build_uplane_packet(params));
    }

    CaptureConfig config;
    config.max_warnings = 2;
    RunResult result    = analyze_capture(writer.buffer(), config);
    EXPECT_EQ(RunStatus::SUCCESS_WITH_WARNINGS, result.status);
    EXPECT_EQ(5u, result.records.size());
    ASSERT_EQ(2u, result.warnings.size());
    EXPECT_EQ(3u, result.dropped_warnings);
    EXPECT_EQ(WarningKind::LAYER_DECODE, result.warnings[0].kind);
    EXPECT_EQ(0u, result.warnings[0].record_index.value());
    EXPECT_EQ(1u, result.warnings[1].record_index.value());
}

TEST(PipelineTest, CancelKeepsCommittedRecords)
{
    CaptureConfig config;
    config.chunk_size = 2;

    RunResult result = analyze_capture(make_capture(10), config, [](Phase phase, double progress) {
        return !(phase == Phase::COMPUTING_METRICS && progress > 80.0);
    });

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(RunStatus::SUCCESS_WITH_WARNINGS, result.status);
    EXPECT_EQ(1u, count_warnings(result, WarningKind::CANCELLED));
    ASSERT_EQ(2u, result.records.size());
    EXPECT_EQ(0u, result.records[0].index);
    EXPECT_EQ(1u, result.records[1].index);
    EXPECT_EQ(2u, result.summary.total_packets);
}

TEST(PipelineTest, CancelBeforeStart)
{
    CaptureAnalyzer analyzer(make_capture(3));
    analyzer.cancel();
    EXPECT_EQ(Phase::DONE, analyzer.step());
    EXPECT_TRUE(analyzer.result().cancelled);
    EXPECT_TRUE(analyzer.result().records.empty());
}

TEST(PipelineTest, StepByStep)
{
    CaptureConfig config;
    config.chunk_size = 1;
    CaptureAnalyzer analyzer(make_capture(3), config);

    EXPECT_EQ(Phase::READING_CONTAINER, analyzer.step());
    EXPECT_DOUBLE_EQ(20.0, analyzer.progress());
    EXPECT_TRUE(analyzer.result().capture_header.has_value());

    std::vector<Phase> phases;
    int                steps = 0;
    while(analyzer.phase() != Phase::DONE && steps < 100)
    {
        phases.push_back(analyzer.step());
        ++steps;
    }
    ASSERT_EQ(Phase::DONE, analyzer.phase());
    EXPECT_NE(phases.end(), std::find(phases.begin(), phases.end(), Phase::ENRICHING_LAYERS));
    EXPECT_NE(phases.end(), std::find(phases.begin(), phases.end(), Phase::COMPUTING_METRICS));
    EXPECT_EQ(Phase::DONE, analyzer.step());

    RunResult result = analyzer.take_result();
    EXPECT_EQ(3u, result.records.size());
    EXPECT_EQ(RunStatus::SUCCESS, result.status);
}

TEST(PipelineTest, ChunkSizeDoesNotChangeResult)
{
    CaptureBuffer buffer = make_capture(23);
    RunResult     reference = analyze_capture(buffer);
    for(size_t chunk : {1, 4, 7, 1000})
    {
        CaptureConfig config;
        config.chunk_size = chunk;
        RunResult result  = analyze_capture(buffer, config);
        ASSERT_EQ(reference.records.size(), result.records.size()) << "chunk " << chunk;
        EXPECT_EQ(reference.summary.rms_values, result.summary.rms_values) << "chunk " << chunk;
        EXPECT_DOUBLE_EQ(reference.summary.average_rms, result.summary.average_rms) << "chunk " << chunk;
        EXPECT_EQ(reference.summary.frame_stats, result.summary.frame_stats) << "chunk " << chunk;
    }
}

TEST(PipelineTest, OranBfpMode)
{
    std::vector<int32_t> i(FH_CAPTURE_PRB_NUM_RE, 100);
    std::vector<int32_t> q(FH_CAPTURE_PRB_NUM_RE, -100);
    UPlanePacketParams   params;
    params.num_prb = 1;
    params.payload = pack_bfp(i, q, 9, 2);

    CaptureWriter writer;
    writer.add_record(build_uplane_packet(params));

    CaptureConfig config;
    config.decompressor.mode = DecompressionMode::ORAN_BFP;
    RunResult result         = analyze_capture(writer.buffer(), config);
    ASSERT_EQ(1u, result.records.size());
    ASSERT_TRUE(result.records[0].samples.has_value());
    ASSERT_EQ(12u, result.records[0].samples->size());
    EXPECT_EQ(400, result.records[0].samples->i[0]);
    EXPECT_EQ(-400, result.records[0].samples->q[11]);
}

TEST(PipelineTest, ExtendedMetricsOff)
{
    CaptureConfig config;
    config.compute_extended_metrics = false;
    RunResult result                = analyze_capture(summary_capture(), config);
    ASSERT_EQ(3u, result.records.size());
    EXPECT_FALSE(result.records[0].metrics.has_value());
    EXPECT_DOUBLE_EQ(5.0, packet_rms(result.records[0]));
    EXPECT_DOUBLE_EQ(7.5, result.summary.average_rms);
}

TEST(PipelineTest, InvalidArguments)
{
    CaptureConfig config;
    config.chunk_size = 0;
    EXPECT_THROW(CaptureAnalyzer(make_capture(1), config), CaptureException);
    EXPECT_THROW(CaptureAnalyzer(nullptr), CaptureException);
}

TEST(PipelineTest, Names)
{
    EXPECT_STREQ("ComputingMetrics", phase_name(Phase::COMPUTING_METRICS));
    EXPECT_STREQ("TruncationWarning", warning_kind_name(WarningKind::TRUNCATION));
    EXPECT_STREQ("SuccessWithWarnings", run_status_name(RunStatus::SUCCESS_WITH_WARNINGS));
}

TEST(SummaryTest, Aggregates)
{
    RunResult result = analyze_capture(summary_capture());
    const AnalysisSummary& summary = result.summary;

    EXPECT_EQ(3u, summary.total_packets);
    EXPECT_EQ((std::set<uint16_t>{1, 2}), summary.unique_rtc_ids);
    EXPECT_EQ((std::map<uint16_t, uint64_t>{{1, 2}, {2, 1}}), summary.rtc_distribution);
    EXPECT_EQ((std::map<uint8_t, uint64_t>{{0, 2}, {1, 1}}), summary.frame_stats);
    ASSERT_EQ(2u, summary.rms_values.size());
    EXPECT_DOUBLE_EQ(5.0, summary.rms_values[0]);
    EXPECT_DOUBLE_EQ(10.0, summary.rms_values[1]);
    EXPECT_DOUBLE_EQ(7.5, summary.average_rms);

    AnalysisSummary rebuilt = build_summary(result.records);
    EXPECT_EQ(summary.rms_values, rebuilt.rms_values);
    EXPECT_EQ(summary.rtc_distribution, rebuilt.rtc_distribution);

    AnalysisSummary empty = build_summary({});
    EXPECT_EQ(0u, empty.total_packets);
    EXPECT_EQ(0.0, empty.average_rms);
}

TEST(SummaryTest, Filter)
{
    RunResult                  result  = analyze_capture(summary_capture());
    std::vector<PacketRecord>& records = result.records;

    PacketFilter by_rtc;
    by_rtc.rtc_id = 1;
    auto matched  = filter_packets(records, by_rtc);
    ASSERT_EQ(2u, matched.size());
    EXPECT_EQ(0u, matched[0]->index);
    EXPECT_EQ(2u, matched[1]->index);

    PacketFilter by_frame;
    by_frame.frame_id = 1;
    matched           = filter_packets(records, by_frame);
    ASSERT_EQ(1u, matched.size());
    EXPECT_EQ(2u, matched[0]->index);

    PacketFilter by_type;
    by_type.message_type = 0;
    EXPECT_EQ(3u, filter_packets(records, by_type).size());

    PacketFilter loud;
    loud.min_rms = 6.0;
    matched      = filter_packets(records, loud);
    ASSERT_EQ(1u, matched.size());
    EXPECT_EQ(1u, matched[0]->index);

    PacketFilter quiet;
    quiet.max_rms = 6.0;
    EXPECT_EQ(2u, filter_packets(records, quiet).size());

    PacketRecord tiny = make_record(std::vector<uint8_t>(8, 0), 3);
    decode_packet_layers(tiny);
    EXPECT_FALSE(by_rtc.matches(tiny));
    EXPECT_FALSE(by_frame.matches(tiny));
    EXPECT_TRUE(PacketFilter{}.matches(tiny));
    EXPECT_FALSE(quiet.matches(tiny));

    // Control messages carry no samples and never match an RMS bound
    UPlanePacketParams control_params;
    control_params.message_type = 2;
    control_params.rtc_id       = 1;
    PacketRecord control        = make_record(build_uplane_packet(control_params), 4);
    decode_packet_layers(control);
    ASSERT_TRUE(control.transport.has_value());
    EXPECT_FALSE(control.samples.has_value());
    EXPECT_TRUE(by_rtc.matches(control));
    EXPECT_FALSE(quiet.matches(control));
    EXPECT_FALSE(loud.matches(control));

    PacketFilter zero_floor;
    zero_floor.min_rms = 0.0;
    EXPECT_FALSE(zero_floor.matches(control));
    EXPECT_EQ(3u, filter_packets(records, zero_floor).size());
}

TEST(PipelineTest, Deterministic)
{
    CaptureBuffer buffer = make_capture(9, ByteOrder::BIG_ENDIAN_STREAM);
    RunResult     first  = analyze_capture(buffer);
    RunResult     second = analyze_capture(buffer);
    ASSERT_EQ(first.records.size(), second.records.size());
    for(size_t n = 0; n < first.records.size(); ++n)
    {
        EXPECT_EQ(first.records[n].offset, second.records[n].offset);
        EXPECT_EQ(first.records[n].length, second.records[n].length);
        EXPECT_EQ(first.records[n].samples->i, second.records[n].samples->i);
        EXPECT_EQ(first.records[n].samples->q, second.records[n].samples->q);
    }
}
