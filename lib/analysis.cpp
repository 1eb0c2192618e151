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
#include "fh-capture/signal_metrics.hpp"
#include "utils.hpp"

#undef TAG
#define TAG "FHC.SUMMARY"

namespace fh_capture
{
double packet_rms(const PacketRecord& record)
{
    if(record.metrics)
    {
        return record.metrics->rms;
    }
    if(record.samples)
    {
        return rms(*record.samples);
    }
    return 0.0;
}

void SummaryBuilder::add(const PacketRecord& record)
{
    ++summary_.total_packets;

    if(record.transport)
    {
        const uint16_t rtc_id = record.transport->rtc_id;
        summary_.unique_rtc_ids.insert(rtc_id);
        ++summary_.rtc_distribution[rtc_id];
    }

    if(record.radio)
    {
        ++summary_.frame_stats[record.radio->frame_id];
    }

    if(record.samples)
    {
        double value = packet_rms(record);
        if(value > 0.0)
        {
            summary_.rms_values.push_back(value);
            rms_sum_ += value;
        }
    }
}

AnalysisSummary SummaryBuilder::finish() const
{
    AnalysisSummary summary = summary_;
    summary.average_rms     = summary.rms_values.empty() ? 0.0 : rms_sum_ / static_cast<double>(summary.rms_values.size());
    FHLOGI_FMT(TAG, "{} packets, {} RTC ids, {} frames, {} RMS values, average RMS {:.3f}", summary.total_packets,
               summary.unique_rtc_ids.size(), summary.frame_stats.size(), summary.rms_values.size(), summary.average_rms);
    return summary;
}

AnalysisSummary build_summary(const std::vector<PacketRecord>& records)
{
    SummaryBuilder builder;
    for(const auto& record : records)
    {
        builder.add(record);
    }
    return builder.finish();
}

bool PacketFilter::matches(const PacketRecord& record) const
{
    if(rtc_id && (!record.transport || record.transport->rtc_id != *rtc_id))
    {
        return false;
    }
    if(frame_id && (!record.radio || record.radio->frame_id != *frame_id))
    {
        return false;
    }
    if(message_type && (!record.transport || record.transport->message_type != *message_type))
    {
        return false;
    }
    if(min_rms || max_rms)
    {
        if(!record.samples)
        {
            return false;
        }
        double value = packet_rms(record);
        if(min_rms && value < *min_rms)
        {
            return false;
        }
        if(max_rms && value > *max_rms)
        {
            return false;
        }
    }
    return true;
}

std::vector<const PacketRecord*> filter_packets(const std::vector<PacketRecord>& records, const PacketFilter& filter)
{
    std::vector<const PacketRecord*> matched;
    for(const auto& record : records)
    {
        if(filter.matches(record))
        {
            matched.push_back(&record);
        }
    }
    return matched;
}

} // namespace fh_capture
