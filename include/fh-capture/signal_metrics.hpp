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

#ifndef FH_CAPTURE_SIGNAL_METRICS_HPP__
#define FH_CAPTURE_SIGNAL_METRICS_HPP__

#include "fh-capture/types.hpp"

#include <vector>

namespace fh_capture
{
/**
 * Incremental RMS of complex samples
 *
 * Power terms are summed with Kahan compensation so that very long
 * captures fed in chunks give the same value as a single pass.
 */
class RmsAccumulator {
public:
    void add(const SampleBlock& block);
    void add_sample(int32_t i, int32_t q);
    void reset();

    [[nodiscard]] uint64_t count() const { return count_; }
    [[nodiscard]] double   power_sum() const { return sum_; }

    /**
     * sqrt(sum(I^2 + Q^2) / count), 0 when no samples were added
     */
    [[nodiscard]] double value() const;

protected:
    double   sum_{0.0};
    double   compensation_{0.0};
    uint64_t count_{0};
};

/**
 * RMS magnitude over min(|I|, |Q|) samples, 0 for an empty block
 */
double rms(const SampleBlock& block);

/**
 * RMS of the I component alone
 */
double rms_i(const SampleBlock& block);

/**
 * RMS of the Q component alone
 */
double rms_q(const SampleBlock& block);

/**
 * Per-sample power I^2 + Q^2
 */
std::vector<double> power_spectrum(const SampleBlock& block);

/**
 * RMS, peak-to-peak magnitude, dynamic range and an SNR estimate
 *
 * Dynamic range floors the minimum magnitude at 1. All fields are 0
 * for an empty block, never NaN.
 */
SignalMetrics signal_quality(const SampleBlock& block);

} // namespace fh_capture

#endif //ifndef FH_CAPTURE_SIGNAL_METRICS_HPP__
