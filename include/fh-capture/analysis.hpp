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

#ifndef FH_CAPTURE_ANALYSIS_HPP__
#define FH_CAPTURE_ANALYSIS_HPP__

#include "fh-capture/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <vector>

namespace fh_capture
{
/**
 * Aggregate statistics over a decoded capture
 */
struct AnalysisSummary
{
    uint64_t                     total_packets{0};
    std::set<uint16_t>           unique_rtc_ids;    //!< RTC ids seen in transport headers
    std::map<uint8_t, uint64_t>  frame_stats;       //!< Frame id -> packets with a radio header
    std::map<uint16_t, uint64_t> rtc_distribution;  //!< RTC id -> packets
    std::vector<double>          rms_values;        //!< Non-zero per-packet RMS, record order
    double                       average_rms{0.0};
};

/**
 * Sample RMS of a record, 0 without samples
 */
double packet_rms(const PacketRecord& record);

/**
 * Incremental summary, records are added in container order
 */
class SummaryBuilder {
public:
    void            add(const PacketRecord& record);
    AnalysisSummary finish() const;

protected:
    AnalysisSummary summary_;
    double          rms_sum_{0.0};
};

AnalysisSummary build_summary(const std::vector<PacketRecord>& records);

/**
 * Record predicate, unset fields match everything
 *
 * A record without a transport header never matches an rtc_id or
 * message_type criterion, one without a radio header never matches frame_id.
 */
struct PacketFilter
{
    std::optional<uint16_t> rtc_id;
    std::optional<uint8_t>  frame_id;
    std::optional<uint8_t>  message_type;
    std::optional<double>   min_rms;
    std::optional<double>   max_rms;

    bool matches(const PacketRecord& record) const;
};

/**
 * Records matching the filter, container order preserved
 */
std::vector<const PacketRecord*> filter_packets(const std::vector<PacketRecord>& records, const PacketFilter& filter);

} // namespace fh_capture

#endif //ifndef FH_CAPTURE_ANALYSIS_HPP__
