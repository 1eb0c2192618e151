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

#include "fh-capture/pipeline.hpp"
#include "fh-capture/layer_decoders.hpp"
#include "fh-capture/signal_metrics.hpp"
#include "fh-capture/wire.hpp"
#include "utils.hpp"

#include <fmt/format.h>

#include <algorithm>

#undef TAG
#define TAG "FHC.PIPELINE"

namespace fh_capture
{
const char* phase_name(Phase phase)
{
    switch(phase)
    {
    case Phase::READING_CONTAINER: return "ReadingContainer";
    case Phase::ENRICHING_LAYERS: return "EnrichingLayers";
    case Phase::COMPUTING_METRICS: return "ComputingMetrics";
    case Phase::DONE: return "Done";
    }
    return "Unknown";
}

const char* warning_kind_name(WarningKind kind)
{
    switch(kind)
    {
    case WarningKind::TRUNCATION: return "TruncationWarning";
    case WarningKind::LAYER_DECODE: return "LayerDecodeWarning";
    case WarningKind::EMPTY_SAMPLE: return "EmptySampleWarning";
    case WarningKind::CANCELLED: return "CancelledWarning";
    }
    return "UnknownWarning";
}

const char* run_status_name(RunStatus status)
{
    switch(status)
    {
    case RunStatus::SUCCESS: return "Success";
    case RunStatus::SUCCESS_WITH_WARNINGS: return "SuccessWithWarnings";
    case RunStatus::FATAL: return "Fatal";
    }
    return "Unknown";
}

// Progress at the end of each stage
static constexpr double kProgressBufferReady = 10.0;
static constexpr double kProgressHeaderDone  = 20.0;
static constexpr double kProgressReadDone    = 50.0;
static constexpr double kProgressEnrichDone  = 80.0;
static constexpr double kProgressMetricsDone = 90.0;
static constexpr double kProgressSummaryDone = 95.0;
static constexpr double kProgressComplete    = 100.0;

static double stage_progress(double begin, double end, size_t done, size_t total)
{
    if(total == 0)
    {
        return end;
    }
    return begin + (end - begin) * std::min(1.0, static_cast<double>(done) / static_cast<double>(total));
}

CaptureAnalyzer::CaptureAnalyzer(CaptureBuffer buffer, const CaptureConfig& config) :
    buffer_{std::move(buffer)},
    config_{config},
    decompressor_{config.decompressor}
{
    if(unlikely(buffer_ == nullptr))
    {
        THROW_FHC(EINVAL, "Capture buffer is null");
    }
    validate_config(config_);
}

void CaptureAnalyzer::set_progress(double value)
{
    progress_ = std::max(progress_, value);
}

void CaptureAnalyzer::add_warning(WarningKind kind, std::optional<uint64_t> record_index, std::string message)
{
    FHLOGW_FMT(TAG, "{}: {}", warning_kind_name(kind), message);
    if(config_.max_warnings != 0 && result_.warnings.size() >= config_.max_warnings)
    {
        ++result_.dropped_warnings;
        return;
    }
    result_.warnings.push_back(Warning{kind, record_index, std::move(message)});
}

Phase CaptureAnalyzer::step()
{
    if(phase_ == Phase::DONE)
    {
        return phase_;
    }

    if(cancel_requested_.load())
    {
        finish_cancelled();
        return phase_;
    }

    try
    {
        switch(phase_)
        {
        case Phase::READING_CONTAINER:
            read_chunk();
            break;
        case Phase::ENRICHING_LAYERS:
            enrich_chunk();
            break;
        case Phase::COMPUTING_METRICS:
            metrics_chunk();
            break;
        case Phase::DONE:
            break;
        }
    }
    catch(const CaptureException& e)
    {
        fail(e);
    }
    return phase_;
}

void CaptureAnalyzer::read_chunk()
{
    if(reader_ == nullptr)
    {
        FHLOGI_FMT(TAG, "Decoding capture of {} bytes, chunk size {}", buffer_->size(), config_.chunk_size);
        reader_ = std::make_unique<ContainerReader>(buffer_);
        set_progress(kProgressBufferReady);
        result_.capture_header = reader_->parse_global_header();
        set_progress(kProgressHeaderDone);
        sequence_.emplace(reader_->parse_records());
        return;
    }

    for(size_t n = 0; n < config_.chunk_size; ++n)
    {
        std::optional<RawRecord> raw = sequence_->next();
        if(!raw)
        {
            break;
        }

        PacketRecord record;
        record.index         = raw->index;
        record.timestamp     = raw->header.timestamp();
        record.length        = raw->header.captured_length;
        record.record_header = raw->header;
        record.buffer        = buffer_;
        record.offset        = raw->offset;
        pending_.push_back(std::move(record));
    }
    set_progress(stage_progress(kProgressHeaderDone, kProgressReadDone, sequence_->position(), buffer_->size()));

    if(sequence_->done())
    {
        if(sequence_->truncated())
        {
            add_warning(WarningKind::TRUNCATION, std::nullopt, sequence_->truncation_message());
        }
        FHLOGI_FMT(TAG, "Read {} records", pending_.size());
        phase_ = Phase::ENRICHING_LAYERS;
        set_progress(kProgressReadDone);
    }
}

void CaptureAnalyzer::enrich_chunk()
{
    const size_t end = std::min(enrich_pos_ + config_.chunk_size, pending_.size());
    for(; enrich_pos_ < end; ++enrich_pos_)
    {
        PacketRecord& record = pending_[enrich_pos_];
        try
        {
            decode_packet_layers(record);
        }
        catch(const CaptureException& e)
        {
            add_warning(WarningKind::LAYER_DECODE, record.index, fmt::format("Record {}: {}", record.index, e.what()));
            continue;
        }

        if(record.has_diagnostic(DIAG_SHORT_FRAME))
        {
            add_warning(WarningKind::LAYER_DECODE, record.index,
                        fmt::format("Record {}: {} bytes, shorter than an Ethernet header", record.index, record.length));
        }
        if(record.has_diagnostic(DIAG_SHORT_TRANSPORT))
        {
            add_warning(WarningKind::LAYER_DECODE, record.index,
                        fmt::format("Record {}: {} bytes, transport header missing", record.index, record.length));
        }
        if(record.has_diagnostic(DIAG_UNEXPECTED_ETHERTYPE))
        {
            add_warning(WarningKind::LAYER_DECODE, record.index,
                        fmt::format("Record {}: ethertype {:#06x} is not eCPRI", record.index, record.ethernet->ethertype));
        }
        if(record.has_diagnostic(DIAG_SHORT_RADIO_HEADER))
        {
            add_warning(WarningKind::LAYER_DECODE, record.index,
                        fmt::format("Record {}: IQ data message of {} bytes, radio header missing", record.index, record.length));
        }
    }
    set_progress(stage_progress(kProgressReadDone, kProgressEnrichDone, enrich_pos_, pending_.size()));

    if(enrich_pos_ >= pending_.size())
    {
        phase_ = Phase::COMPUTING_METRICS;
        set_progress(kProgressEnrichDone);
    }
}

void CaptureAnalyzer::metrics_chunk()
{
    const size_t end = std::min(metrics_pos_ + config_.chunk_size, pending_.size());
    for(; metrics_pos_ < end; ++metrics_pos_)
    {
        PacketRecord& record = pending_[metrics_pos_];
        if(record.radio)
        {
            if(record.raw_size() <= FH_CAPTURE_IQ_DATA_OFFSET)
            {
                record.diagnostics |= DIAG_EMPTY_SAMPLES;
                add_warning(WarningKind::EMPTY_SAMPLE, record.index, fmt::format("Record {}: no IQ payload after the radio header", record.index));
            }
            else
            {
                SampleBlock block = decompressor_.decompress(record.raw_data() + FH_CAPTURE_IQ_DATA_OFFSET,
                                                             record.raw_size() - FH_CAPTURE_IQ_DATA_OFFSET, &*record.radio);
                if(block.empty())
                {
                    record.diagnostics |= DIAG_EMPTY_SAMPLES;
                    add_warning(WarningKind::EMPTY_SAMPLE, record.index,
                                fmt::format("Record {}: {} payload bytes decoded to no samples", record.index,
                                            record.raw_size() - FH_CAPTURE_IQ_DATA_OFFSET));
                }
                if(config_.compute_extended_metrics)
                {
                    record.metrics = signal_quality(block);
                }
                record.samples = std::move(block);
            }
        }
        summary_builder_.add(record);
        result_.records.push_back(std::move(record));
    }
    set_progress(stage_progress(kProgressEnrichDone, kProgressMetricsDone, metrics_pos_, pending_.size()));
    FHLOGD_FMT(TAG, "Committed {} of {} records", result_.records.size(), pending_.size());

    if(metrics_pos_ >= pending_.size())
    {
        set_progress(kProgressMetricsDone);
        finish();
    }
}

void CaptureAnalyzer::finish()
{
    result_.summary = summary_builder_.finish();
    set_progress(kProgressSummaryDone);

    result_.status = (result_.warnings.empty() && result_.dropped_warnings == 0) ? RunStatus::SUCCESS : RunStatus::SUCCESS_WITH_WARNINGS;
    pending_.clear();
    phase_ = Phase::DONE;
    set_progress(kProgressComplete);
    FHLOGI_FMT_EVT(TAG, FH_CAPTURE_SUCCESS, "{}: {} records, {} warnings", run_status_name(result_.status), result_.records.size(),
                   result_.warnings.size() + result_.dropped_warnings);
}

void CaptureAnalyzer::finish_cancelled()
{
    add_warning(WarningKind::CANCELLED, std::nullopt,
                fmt::format("Cancelled during {} with {} records committed", phase_name(phase_), result_.records.size()));
    result_.cancelled = true;
    result_.summary   = summary_builder_.finish();
    result_.status    = RunStatus::SUCCESS_WITH_WARNINGS;
    pending_.clear();
    phase_ = Phase::DONE;
}

void CaptureAnalyzer::fail(const CaptureException& e)
{
    if(e.format_error() != FormatError::NONE)
    {
        FHLOGE_FMT(TAG, FH_CAPTURE_FORMAT_EVENT, "{} ({}:{}): {}", format_error_name(e.format_error()), e.file(), e.lineno(), e.what());
    }
    else
    {
        FHLOGE_FMT(TAG, FH_CAPTURE_DECODE_EVENT, "{}:{}: {}", e.file(), e.lineno(), e.what());
    }
    result_.status = RunStatus::FATAL;
    result_.error  = FatalError{e.format_error(), e.err_code(), e.what()};
    result_.records.clear();
    result_.summary = AnalysisSummary{};
    pending_.clear();
    phase_ = Phase::DONE;
}

RunResult CaptureAnalyzer::run(const ProgressCallback& progress_cb)
{
    while(phase_ != Phase::DONE)
    {
        step();
        if(progress_cb && !progress_cb(phase_, progress_))
        {
            cancel();
        }
    }
    return take_result();
}

RunResult analyze_capture(CaptureBuffer buffer, const CaptureConfig& config, const ProgressCallback& progress_cb)
{
    CaptureAnalyzer analyzer{std::move(buffer), config};
    return analyzer.run(progress_cb);
}

} // namespace fh_capture
