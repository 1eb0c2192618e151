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

#ifndef FH_CAPTURE_TYPES_HPP__
#define FH_CAPTURE_TYPES_HPP__

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fh_capture
{
using CaptureBuffer = std::shared_ptr<const std::vector<uint8_t>>;  //!< Whole container contents, shared by all records

/**
 * Byte order of the multi-byte container fields
 */
enum class ByteOrder
{
    BIG_ENDIAN_STREAM,
    LITTLE_ENDIAN_STREAM,
};

/**
 * Container global header
 */
struct CaptureHeader
{
    uint32_t  magic;          //!< Magic number in stream order
    uint16_t  version_major;  //!< Major version number
    uint16_t  version_minor;  //!< Minor version number
    int32_t   timezone;       //!< GMT to local correction
    uint32_t  sigfigs;        //!< Accuracy of timestamps
    uint32_t  snaplen;        //!< Maximum length of captured packets
    uint32_t  link_type;      //!< Data link type
    ByteOrder byte_order;     //!< Byte order selected by the magic
};

/**
 * Per-record container header
 */
struct RecordHeader
{
    uint32_t ts_sec;           //!< Capture timestamp seconds
    uint32_t ts_usec;          //!< Capture timestamp microseconds
    uint32_t captured_length;  //!< Bytes present in the container
    uint32_t original_length;  //!< Bytes on the wire

    double timestamp() const { return ts_sec + ts_usec / 1e6; }  //!< Seconds with microsecond fraction
};

/**
 * Layer-2 addressing
 */
struct EthernetFrameHeader
{
    std::string destination;  //!< aa:bb:cc:dd:ee:ff
    std::string source;       //!< aa:bb:cc:dd:ee:ff
    uint16_t    ethertype;
};

/**
 * eCPRI-style transport header
 */
struct TransportHeader
{
    uint8_t  version;
    uint8_t  reserved;
    uint8_t  concatenation;
    uint8_t  message_type;
    uint16_t payload_size;
    uint16_t rtc_id;
    uint16_t seq_id;
};

/**
 * O-RAN U-plane radio application header with its first section
 */
struct RadioHeader
{
    uint8_t  data_direction;
    uint8_t  payload_version;
    uint8_t  filter_index;
    uint8_t  frame_id;
    uint8_t  subframe_id;
    uint8_t  slot_id;
    uint8_t  symbol_id;
    uint16_t section_id;
    uint8_t  rb;
    uint8_t  sym_inc;
    uint16_t start_prb;
    uint8_t  num_prb;
};

/**
 * Header plus the number of bytes the decoder consumed
 */
template <typename T>
struct Decoded
{
    T      header;
    size_t consumed;
};

/**
 * Decompressed I/Q samples, i and q always have the same length
 */
struct SampleBlock
{
    std::vector<int32_t> i;
    std::vector<int32_t> q;

    size_t size() const { return std::min(i.size(), q.size()); }
    bool   empty() const { return size() == 0; }
};

/**
 * Signal quality statistics derived from a SampleBlock
 */
struct SignalMetrics
{
    double rms{0.0};
    double peak_to_peak{0.0};
    double dynamic_range{0.0};
    double snr_db{0.0};
};

/**
 * Per-record diagnostic flags
 */
enum PacketDiagnostic : uint32_t
{
    DIAG_NONE                  = 0,
    DIAG_SHORT_FRAME           = 1u << 0,  //!< Fewer bytes than an Ethernet header
    DIAG_SHORT_TRANSPORT       = 1u << 1,  //!< Fewer bytes than Ethernet plus transport headers
    DIAG_UNEXPECTED_ETHERTYPE  = 1u << 2,  //!< Ethertype is not eCPRI, layers still decoded
    DIAG_SHORT_RADIO_HEADER    = 1u << 3,  //!< IQ message type without a complete radio header
    DIAG_EMPTY_SAMPLES         = 1u << 4,  //!< Radio header present but no usable samples
};

/**
 * Decoded packet
 *
 * Layers that could not be decoded stay empty and set a diagnostic flag.
 * The raw bytes are an index range into the shared container buffer.
 */
struct PacketRecord
{
    uint64_t                           index{0};
    double                             timestamp{0.0};
    uint32_t                           length{0};
    RecordHeader                       record_header{};
    std::optional<EthernetFrameHeader> ethernet;
    std::optional<TransportHeader>     transport;
    std::optional<RadioHeader>         radio;
    std::optional<SampleBlock>         samples;
    std::optional<SignalMetrics>       metrics;  //!< Derived from samples when extended metrics are enabled
    uint32_t                           diagnostics{DIAG_NONE};
    CaptureBuffer                      buffer;
    size_t                             offset{0};

    const uint8_t* raw_data() const { return buffer->data() + offset; }
    size_t         raw_size() const { return length; }
    bool           has_diagnostic(PacketDiagnostic diag) const { return (diagnostics & diag) != 0; }
};

} // namespace fh_capture

#endif //ifndef FH_CAPTURE_TYPES_HPP__
