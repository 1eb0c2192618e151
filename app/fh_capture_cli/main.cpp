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

#include "fh-capture/analysis.hpp"
#include "fh-capture/capture_writer.hpp"
#include "fh-capture/config.hpp"
#include "fh-capture/container_reader.hpp"
#include "fh-capture/pipeline.hpp"
#include "fhlog.hpp"

#include "CLI/CLI.hpp"
#include <fmt/format.h>

#include <cmath>
#include <cstdlib>
#include <exception>
#include <string>

#undef TAG
#define TAG "FHC.CLI"

using namespace fh_capture;

namespace
{
struct AnalyzeOptions
{
    std::string capture_file;
    std::string config_file;
    size_t      chunk_size{0};
    std::string mode;
    int         bfp_width{0};
    size_t      list{0};
    uint16_t    rtc_id{0};
    uint16_t    frame_id{0};
    uint16_t    message_type{0};
};

struct GenerateOptions
{
    std::string capture_file;
    uint32_t    packets{16};
    bool        big_endian{false};
};

std::string diagnostics_str(const PacketRecord& record)
{
    static const struct
    {
        PacketDiagnostic diag;
        const char*      name;
    } kNames[] = {
        {DIAG_SHORT_FRAME, "short_frame"},
        {DIAG_SHORT_TRANSPORT, "short_transport"},
        {DIAG_UNEXPECTED_ETHERTYPE, "ethertype"},
        {DIAG_SHORT_RADIO_HEADER, "short_radio"},
        {DIAG_EMPTY_SAMPLES, "empty_samples"},
    };

    std::string out;
    for(const auto& entry : kNames)
    {
        if(record.has_diagnostic(entry.diag))
        {
            out += out.empty() ? entry.name : fmt::format(",{}", entry.name);
        }
    }
    return out.empty() ? "-" : out;
}

void print_record(const PacketRecord& record)
{
    fmt::print("#{:<6} t={:.6f} len={:<5}", record.index, record.timestamp, record.length);
    if(record.transport)
    {
        fmt::print(" rtc={:<4} seq={:<5} msg={}", record.transport->rtc_id, record.transport->seq_id, record.transport->message_type);
    }
    if(record.radio)
    {
        fmt::print(" frame={:<3} sf={:<2} slot={:<2} sym={:<2} prb={}+{}", record.radio->frame_id, record.radio->subframe_id,
                   record.radio->slot_id, record.radio->symbol_id, record.radio->start_prb, record.radio->num_prb);
    }
    if(record.samples)
    {
        fmt::print(" samples={} rms={:.3f}", record.samples->size(), packet_rms(record));
    }
    if(record.metrics)
    {
        fmt::print(" p2p={:.1f} dr={:.2f} snr={:.2f}dB", record.metrics->peak_to_peak, record.metrics->dynamic_range, record.metrics->snr_db);
    }
    fmt::print(" diag={}\n", diagnostics_str(record));
}

void print_summary(const RunResult& result)
{
    const AnalysisSummary& summary = result.summary;
    fmt::print("Status:          {}\n", run_status_name(result.status));
    if(result.capture_header)
    {
        fmt::print("Capture:         v{}.{} snaplen={} linktype={} {}\n", result.capture_header->version_major,
                   result.capture_header->version_minor, result.capture_header->snaplen, result.capture_header->link_type,
                   result.capture_header->byte_order == ByteOrder::LITTLE_ENDIAN_STREAM ? "little-endian" : "big-endian");
    }
    fmt::print("Packets:         {}\n", summary.total_packets);
    fmt::print("Unique RTC ids:  {}\n", summary.unique_rtc_ids.size());
    fmt::print("Average RMS:     {:.3f} over {} packets\n", summary.average_rms, summary.rms_values.size());
    for(const auto& [rtc_id, count] : summary.rtc_distribution)
    {
        fmt::print("  rtc {:<6} {} packets\n", rtc_id, count);
    }
    for(const auto& [frame_id, count] : summary.frame_stats)
    {
        fmt::print("  frame {:<4} {} packets\n", frame_id, count);
    }
    for(const auto& warning : result.warnings)
    {
        fmt::print("Warning: {}: {}\n", warning_kind_name(warning.kind), warning.message);
    }
    if(result.dropped_warnings != 0)
    {
        fmt::print("Warning: {} more warnings not stored\n", result.dropped_warnings);
    }
    if(result.error)
    {
        fmt::print("Error: {}: {}\n", format_error_name(result.error->format_error), result.error->message);
    }
}

int run_analyze(const AnalyzeOptions& opts, const CLI::App& cmd)
{
    CaptureConfig config = opts.config_file.empty() ? CaptureConfig{} : ConfigParser(opts.config_file).get_capture_config();
    if(cmd.count("--chunk-size") != 0)
    {
        config.chunk_size = opts.chunk_size;
    }
    if(cmd.count("--mode") != 0)
    {
        config.decompressor.mode = parse_decompression_mode(opts.mode);
    }
    if(cmd.count("--bfp-width") != 0)
    {
        config.decompressor.bfp_iq_width = opts.bfp_width;
    }

    CaptureBuffer buffer = load_capture_file(opts.capture_file);
    RunResult     result = analyze_capture(buffer, config, [](Phase phase, double progress) {
        FHLOGD_FMT(TAG, "{} {:.1f}%", phase_name(phase), progress);
        return true;
    });
    print_summary(result);

    PacketFilter filter;
    if(cmd.count("--rtc-id") != 0)
    {
        filter.rtc_id = opts.rtc_id;
    }
    if(cmd.count("--frame-id") != 0)
    {
        filter.frame_id = static_cast<uint8_t>(opts.frame_id);
    }
    if(cmd.count("--msg-type") != 0)
    {
        filter.message_type = static_cast<uint8_t>(opts.message_type);
    }

    std::vector<const PacketRecord*> matched = filter_packets(result.records, filter);
    if(cmd.count("--rtc-id") + cmd.count("--frame-id") + cmd.count("--msg-type") != 0)
    {
        fmt::print("Matched:         {} packets\n", matched.size());
    }
    for(size_t n = 0; n < matched.size() && n < opts.list; ++n)
    {
        print_record(*matched[n]);
    }

    return result.status == RunStatus::FATAL ? EXIT_FAILURE : EXIT_SUCCESS;
}

int run_generate(const GenerateOptions& opts)
{
    constexpr uint8_t kNumPrb     = 2;
    constexpr size_t  kNumSamples = kNumPrb * FH_CAPTURE_PRB_NUM_RE;
    constexpr double  kPi         = 3.14159265358979323846;

    CaptureWriter writer(opts.big_endian ? ByteOrder::BIG_ENDIAN_STREAM : ByteOrder::LITTLE_ENDIAN_STREAM);
    for(uint32_t n = 0; n < opts.packets; ++n)
    {
        SampleBlock block;
        double      amplitude = 1000.0 * (1 + n % 4);
        for(size_t k = 0; k < kNumSamples; ++k)
        {
            double phase = 2.0 * kPi * static_cast<double>(k) / kNumSamples;
            block.i.push_back(static_cast<int32_t>(std::lround(amplitude * std::cos(phase))));
            block.q.push_back(static_cast<int32_t>(std::lround(amplitude * std::sin(phase))));
        }

        UPlanePacketParams params;
        params.rtc_id      = static_cast<uint16_t>(n % 4);
        params.seq_id      = static_cast<uint16_t>(n);
        params.frame_id    = static_cast<uint8_t>(n / 56);
        params.subframe_id = static_cast<uint8_t>((n / 14) % 10);
        params.symbol_id   = static_cast<uint8_t>(n % 14);
        params.section_id  = 1;
        params.num_prb     = kNumPrb;
        params.payload     = encode_raw_samples(block);
        writer.add_record(build_uplane_packet(params));
    }
    writer.write_file(opts.capture_file);
    fmt::print("Wrote {} packets to {}\n", writer.record_count(), opts.capture_file);
    return EXIT_SUCCESS;
}

int main_throw(int argc, char** argv)
{
    CLI::App app{"fh_capture_cli: fronthaul capture decoder"};
    app.require_subcommand(1);

    AnalyzeOptions analyze_opts;
    CLI::App*      analyze = app.add_subcommand("analyze", "Decode a capture and print a summary");
    analyze->add_option("file", analyze_opts.capture_file, "Capture file")->required()->check(CLI::ExistingFile);
    analyze->add_option("-c,--config", analyze_opts.config_file, "YAML config with fh_capture and fhlog sections")->check(CLI::ExistingFile);
    analyze->add_option("--chunk-size", analyze_opts.chunk_size, "Packets per processing chunk");
    analyze->add_option("--mode", analyze_opts.mode, "Decompression mode: legacy or oran_bfp");
    analyze->add_option("--bfp-width", analyze_opts.bfp_width, "BFP mantissa width, 16 for uncompressed");
    analyze->add_option("--list", analyze_opts.list, "Print the first N matching packets")->capture_default_str();
    analyze->add_option("--rtc-id", analyze_opts.rtc_id, "Only packets with this RTC id");
    analyze->add_option("--frame-id", analyze_opts.frame_id, "Only packets with this frame id");
    analyze->add_option("--msg-type", analyze_opts.message_type, "Only packets with this transport message type");

    GenerateOptions generate_opts;
    CLI::App*       generate = app.add_subcommand("generate", "Write a synthetic U-plane capture");
    generate->add_option("file", generate_opts.capture_file, "Output capture file")->required();
    generate->add_option("-n,--packets", generate_opts.packets, "Number of packets")->capture_default_str();
    generate->add_flag("--big-endian", generate_opts.big_endian, "Write a big-endian container")->capture_default_str();

    try
    {
        app.parse(argc, argv);
    }
    catch(const CLI::ParseError& e)
    {
        return app.exit(e);
    }

    const char* yaml_file    = analyze->parsed() && !analyze_opts.config_file.empty() ? analyze_opts.config_file.c_str() : nullptr;
    pthread_t   bg_thread_id = fhlog_init(yaml_file, "fh_capture.log");
    fhlog_thread_init("fh_capture_cli");

    int ret = EXIT_FAILURE;
    try
    {
        ret = analyze->parsed() ? run_analyze(analyze_opts, *analyze) : run_generate(generate_opts);
    }
    catch(const CaptureException& e)
    {
        FHLOGE_FMT(TAG, FH_CAPTURE_INTERNAL_EVENT, "{} ({}:{} errno {})", e.what(), e.file(), e.lineno(), e.err_code());
        fmt::print(stderr, "Error: {}\n", e.what());
    }

    fhlog_close(bg_thread_id);
    return ret;
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        return main_throw(argc, argv);
    }
    catch(std::exception& e)
    {
        fmt::print(stderr, "main() Exception caught: {}\n", e.what());
    }
    return EXIT_FAILURE;
}
