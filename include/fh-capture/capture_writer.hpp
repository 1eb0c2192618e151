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

#ifndef FH_CAPTURE_CAPTURE_WRITER_HPP__
#define FH_CAPTURE_CAPTURE_WRITER_HPP__

#include "fh-capture/types.hpp"
#include "fh-capture/wire.hpp"

#include <array>
#include <string>
#include <vector>

namespace fh_capture
{
/**
 * Fields of a synthetic U-plane packet
 *
 * Ethernet, transport and minimal radio headers followed by the payload bytes.
 */
struct UPlanePacketParams
{
    std::array<uint8_t, FH_CAPTURE_ETHER_ADDR_LEN> dst_mac{{0x00, 0x11, 0x22, 0x33, 0x44, 0x55}};
    std::array<uint8_t, FH_CAPTURE_ETHER_ADDR_LEN> src_mac{{0x66, 0x77, 0x88, 0x99, 0xaa, 0xbb}};
    uint16_t ethertype{FH_CAPTURE_ETHER_TYPE_ECPRI};

    uint8_t  ecpri_version{FH_CAPTURE_ECPRI_VERSION};
    uint8_t  message_type{FH_CAPTURE_ECPRI_MSG_TYPE_IQ};
    uint16_t rtc_id{0};
    uint16_t seq_id{0};

    uint8_t  data_direction{0};
    uint8_t  payload_version{1};
    uint8_t  filter_index{0};
    uint8_t  frame_id{0};
    uint8_t  subframe_id{0};
    uint8_t  slot_id{0};
    uint8_t  symbol_id{0};
    uint16_t section_id{0};
    uint8_t  rb{0};
    uint8_t  sym_inc{0};
    uint16_t start_prb{0};
    uint8_t  num_prb{0};

    std::vector<uint8_t> payload;  //!< Bytes after the radio header
};

/**
 * Serialize a U-plane packet, multi-byte header fields in network order
 *
 * The transport payload size covers the radio header and the payload.
 */
std::vector<uint8_t> build_uplane_packet(const UPlanePacketParams& params);

/**
 * Interleaved 16-bit big-endian I/Q pairs
 */
std::vector<uint8_t> encode_raw_samples(const SampleBlock& block);

/**
 * In-memory capture container writer
 *
 * The global header is written on construction. Records get sequential
 * timestamps 1 ms apart starting one day after the epoch unless given.
 */
class CaptureWriter {
public:
    explicit CaptureWriter(ByteOrder order = ByteOrder::LITTLE_ENDIAN_STREAM, uint32_t snaplen = FH_CAPTURE_PCAP_SNAPLEN,
                           uint32_t link_type = FH_CAPTURE_LINKTYPE_ETHERNET);

    void add_record(const std::vector<uint8_t>& packet);
    void add_record(const std::vector<uint8_t>& packet, uint32_t ts_sec, uint32_t ts_usec);

    /**
     * Append a record header only, for building malformed containers
     */
    void add_record_header(uint32_t ts_sec, uint32_t ts_usec, uint32_t incl_len, uint32_t orig_len);

    /**
     * Append bytes verbatim
     */
    void add_raw_bytes(const uint8_t* data, size_t size);

    [[nodiscard]] const std::vector<uint8_t>& bytes() const { return data_; }
    [[nodiscard]] uint64_t                    record_count() const { return record_count_; }
    [[nodiscard]] ByteOrder                   byte_order() const { return order_; }

    /**
     * Snapshot of the container contents for the reader
     */
    CaptureBuffer buffer() const;

    /**
     * @throws CaptureException (EIO) if the file cannot be written
     */
    void write_file(const std::string& path) const;

protected:
    template <typename T>
    void put(T value);

    ByteOrder            order_;
    std::vector<uint8_t> data_;
    uint64_t             record_count_{0};
    uint32_t             sequential_sec_{86400};  //!< One day after the epoch
    uint32_t             sequential_usec_{0};
};

} // namespace fh_capture

#endif //ifndef FH_CAPTURE_CAPTURE_WRITER_HPP__
