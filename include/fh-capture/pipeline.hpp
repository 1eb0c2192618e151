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

#ifndef FH_CAPTURE_PIPELINE_HPP__
#define FH_CAPTURE_PIPELINE_HPP__

#include "fh-capture/analysis.hpp"
#include "fh-capture/config.hpp"
#include "fh-capture/container_reader.hpp"
#include "fh-capture/exception.hpp"
#include "fh-capture/sample_decompressor.hpp"
#include "fh-capture/types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fh_capture
{
enum class Phase
{
    READING_CONTAINER,
    ENRICHING_LAYERS,
    COMPUTING_METRICS,
    DONE,
};

const char* phase_name(Phase phase);

enum class WarningKind
{
    TRUNCATION,    //!< Container ended inside a record, earlier records kept
    LAYER_DECODE,  //!< A header layer is missing or inconsistent, record kept
    EMPTY_SAMPLE,  //!< Radio header without usable samples, metrics are 0
    CANCELLED,     //!< Run stopped at a chunk boundary on request
};

const char* warning_kind_name(WarningKind kind);

/**
 * Non-fatal condition attached to a run
 */
struct Warning
{
    WarningKind             kind;
    std::optional<uint64_t> record_index;  //!< Offending record, if any
    std::string             message;
};

enum class RunStatus
{
    SUCCESS,
    SUCCESS_WITH_WARNINGS,
    FATAL,
};

const char* run_status_name(RunStatus status);

/**
 * Terminal error of a FATAL run
 */
struct FatalError
{
    FormatError format_error;
    int         err_code;
    std::string message;
};

/**
 * Outcome of a pipeline run
 */
struct RunResult
{
    RunStatus                    status{RunStatus::SUCCESS};
    std::optional<CaptureHeader> capture_header;
    std::vector<PacketRecord>    records;           //!< Committed records, container order
    AnalysisSummary              summary;
    std::vector<Warning>         warnings;
    uint64_t                     dropped_warnings{0};  //!< Warnings beyond max_warnings, counted only
    std::optional<FatalError>    error;
    bool                         cancelled{false};
};

/**
 * Called after every chunk with the current phase and progress in [0, 100]
 * @return false to request cancellation
 */
using ProgressCallback = std::function<bool(Phase phase, double progress)>;

/**
 * Chunked capture decoding state machine
 *
 * READING_CONTAINER -> ENRICHING_LAYERS -> COMPUTING_METRICS -> DONE.
 * Each step() processes at most chunk_size records and returns, so the
 * host decides when to resume. Records are committed to the output
 * sequence in COMPUTING_METRICS; cancellation keeps committed records only.
 */
class CaptureAnalyzer {
public:
    /**
     * @throws CaptureException (EINVAL) for an invalid config or a null buffer
     */
    explicit CaptureAnalyzer(CaptureBuffer buffer, const CaptureConfig& config = CaptureConfig{});

    /**
     * Process one chunk
     * @return Phase after the chunk
     */
    Phase step();

    /**
     * Step until DONE, reporting progress after every chunk
     */
    RunResult run(const ProgressCallback& progress_cb = nullptr);

    /**
     * Request cancellation, honoured at the next chunk boundary
     *
     * Safe to call from another thread.
     */
    void cancel() { cancel_requested_.store(true); }

    [[nodiscard]] Phase            phase() const { return phase_; }
    [[nodiscard]] double           progress() const { return progress_; }
    [[nodiscard]] const RunResult& result() const { return result_; }

    /**
     * Move the result out, only meaningful once phase() is DONE
     */
    RunResult take_result() { return std::move(result_); }

protected:
    void read_chunk();
    void enrich_chunk();
    void metrics_chunk();
    void finish();
    void finish_cancelled();
    void fail(const CaptureException& e);
    void add_warning(WarningKind kind, std::optional<uint64_t> record_index, std::string message);
    void set_progress(double value);

    CaptureBuffer                   buffer_;
    CaptureConfig                   config_;
    SampleDecompressor              decompressor_;
    std::unique_ptr<ContainerReader> reader_;
    std::optional<RecordSequence>   sequence_;
    std::vector<PacketRecord>       pending_;
    size_t                          enrich_pos_{0};
    size_t                          metrics_pos_{0};
    SummaryBuilder                  summary_builder_;
    Phase                           phase_{Phase::READING_CONTAINER};
    double                          progress_{0.0};
    std::atomic<bool>               cancel_requested_{false};
    RunResult                       result_;
};

/**
 * Decode a whole capture in one call
 */
RunResult analyze_capture(CaptureBuffer buffer, const CaptureConfig& config = CaptureConfig{},
                          const ProgressCallback& progress_cb = nullptr);

} // namespace fh_capture

#endif //ifndef FH_CAPTURE_PIPELINE_HPP__
