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

#include "fh-capture/signal_metrics.hpp"
#include "utils.hpp"

#include <cmath>
#include <limits>

#undef TAG
#define TAG "FHC.METRICS"

namespace fh_capture
{
static double sample_power(int32_t i, int32_t q)
{
    const double di = static_cast<double>(i);
    const double dq = static_cast<double>(q);
    return di * di + dq * dq;
}

void RmsAccumulator::add_sample(int32_t i, int32_t q)
{
    const double y = sample_power(i, q) - compensation_;
    const double t = sum_ + y;
    compensation_  = (t - sum_) - y;
    sum_           = t;
    ++count_;
}

void RmsAccumulator::add(const SampleBlock& block)
{
    const size_t n = block.size();
    for(size_t k = 0; k < n; ++k)
    {
        add_sample(block.i[k], block.q[k]);
    }
}

void RmsAccumulator::reset()
{
    sum_          = 0.0;
    compensation_ = 0.0;
    count_        = 0;
}

double RmsAccumulator::value() const
{
    if(count_ == 0 || sum_ <= 0.0)
    {
        return 0.0;
    }
    return std::sqrt(sum_ / static_cast<double>(count_));
}

double rms(const SampleBlock& block)
{
    RmsAccumulator acc;
    acc.add(block);
    return acc.value();
}

static double component_rms(const std::vector<int32_t>& samples)
{
    if(samples.empty())
    {
        return 0.0;
    }
    double sum = 0.0;
    for(int32_t s : samples)
    {
        sum += static_cast<double>(s) * s;
    }
    return std::sqrt(sum / static_cast<double>(samples.size()));
}

double rms_i(const SampleBlock& block)
{
    return component_rms(block.i);
}

double rms_q(const SampleBlock& block)
{
    return component_rms(block.q);
}

std::vector<double> power_spectrum(const SampleBlock& block)
{
    const size_t        n = block.size();
    std::vector<double> psd;
    psd.reserve(n);
    for(size_t k = 0; k < n; ++k)
    {
        psd.push_back(sample_power(block.i[k], block.q[k]));
    }
    return psd;
}

SignalMetrics signal_quality(const SampleBlock& block)
{
    SignalMetrics metrics{};
    const size_t  n = block.size();
    if(n == 0)
    {
        return metrics;
    }

    RmsAccumulator acc;
    double         max_magnitude = 0.0;
    double         min_magnitude = std::numeric_limits<double>::max();
    for(size_t k = 0; k < n; ++k)
    {
        const double magnitude = std::sqrt(sample_power(block.i[k], block.q[k]));
        max_magnitude          = std::max(max_magnitude, magnitude);
        min_magnitude          = std::min(min_magnitude, magnitude);
        acc.add_sample(block.i[k], block.q[k]);
    }

    metrics.rms           = acc.value();
    metrics.peak_to_peak  = max_magnitude - min_magnitude;
    metrics.dynamic_range = max_magnitude / std::max(min_magnitude, 1.0);

    const double average_power = acc.power_sum() / static_cast<double>(n);
    const double noise_power   = metrics.rms * metrics.rms * 0.01;
    if(average_power > 0.0 && noise_power > 0.0)
    {
        metrics.snr_db = 10.0 * std::log10(average_power / noise_power);
    }
    FHLOGD_FMT(TAG, "signal quality over {} samples: rms={:.3f} p2p={:.3f} dr={:.3f} snr={:.2f}dB", n, metrics.rms,
               metrics.peak_to_peak, metrics.dynamic_range, metrics.snr_db);
    return metrics;
}

} // namespace fh_capture
