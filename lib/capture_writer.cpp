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

#include "fh-capture/capture_writer.hpp"
#include "utils.hpp"

#include <cstdio>
#include <memory>

#undef TAG
#define TAG "FHC.WRITER"

namespace fh_capture
{
template <typename T>
static void append_wire(std::vector<uint8_t>& out, const T& hdr)
{
    const auto* bytes = reinterpret_cast<const uint8_t*>(&hdr);
    out.insert(out.end(), bytes, bytes + sizeof(T));
}

std::vector<uint8_t> build_uplane_packet(const UPlanePacketParams& params)
{
    fhc_ether_hdr eth{};
    std::memcpy(eth.dst_addr.addr_bytes, params.dst_mac.data(), FH_CAPTURE_ETHER_ADDR_LEN);
    std::memcpy(eth.src_addr.addr_bytes, params.src_mac.data(), FH_CAPTURE_ETHER_ADDR_LEN);
    eth.ether_type = from_network(params.ethertype);

    fhc_transport_hdr ecpri{};
    ecpri.version       = params.ecpri_version;
    ecpri.messageType   = params.message_type;
    ecpri.payloadSize   = from_network(static_cast<uint16_t>(FH_CAPTURE_RADIO_HDR_SIZE + params.payload.size()));
    ecpri.rtcId         = from_network(params.rtc_id);
    ecpri.seqId         = from_network(params.seq_id);

    fhc_radio_hdr radio{};
    radio.dataDirection  = params.data_direction;
    radio.payloadVersion = params.payload_version;
    radio.filterIndex    = params.filter_index;
    radio.frameId        = params.frame_id;
    radio.subframeId     = params.subframe_id;
    radio.slotId         = params.slot_id;
    radio.symbolId       = params.symbol_id;
    radio.sectionId      = params.section_id;
    radio.rb             = params.rb;
    radio.symInc         = params.sym_inc;
    radio.startPrbu      = params.start_prb;
    radio.numPrbu        = params.num_prb;

    std::vector<uint8_t> packet;
    packet.reserve(FH_CAPTURE_IQ_DATA_OFFSET + params.payload.size());
    append_wire(packet, eth);
    append_wire(packet, ecpri);
    append_wire(packet, radio);
    packet.insert(packet.end(), params.payload.begin(), params.payload.end());
    return packet;
}

std::vector<uint8_t> encode_raw_samples(const SampleBlock& block)
{
    std::vector<uint8_t> out;
    out.reserve(block.size() * 4);
    for(size_t n = 0; n < block.size(); ++n)
    {
        auto i = static_cast<uint16_t>(static_cast<int16_t>(block.i[n]));
        auto q = static_cast<uint16_t>(static_cast<int16_t>(block.q[n]));
        out.push_back(static_cast<uint8_t>(i >> 8));
        out.push_back(static_cast<uint8_t>(i & 0xff));
        out.push_back(static_cast<uint8_t>(q >> 8));
        out.push_back(static_cast<uint8_t>(q & 0xff));
    }
    return out;
}

CaptureWriter::CaptureWriter(ByteOrder order, uint32_t snaplen, uint32_t link_type) :
    order_{order}
{
    put<uint32_t>(FH_CAPTURE_PCAP_MAGIC);
    put<uint16_t>(FH_CAPTURE_PCAP_VERSION_MAJOR);
    put<uint16_t>(FH_CAPTURE_PCAP_VERSION_MINOR);
    put<int32_t>(0);
    put<uint32_t>(0);
    put<uint32_t>(snaplen);
    put<uint32_t>(link_type);
}

template <typename T>
void CaptureWriter::put(T value)
{
    T wire = fix_endianness(value, order_);
    append_wire(data_, wire);
}

void CaptureWriter::add_record(const std::vector<uint8_t>& packet)
{
    add_record(packet, sequential_sec_, sequential_usec_);
    sequential_usec_ += 1000;
    if(sequential_usec_ >= 1000000)
    {
        sequential_usec_ = 0;
        ++sequential_sec_;
    }
}

void CaptureWriter::add_record(const std::vector<uint8_t>& packet, uint32_t ts_sec, uint32_t ts_usec)
{
    const auto len = static_cast<uint32_t>(packet.size());
    add_record_header(ts_sec, ts_usec, len, len);
    add_raw_bytes(packet.data(), packet.size());
    ++record_count_;
}

void CaptureWriter::add_record_header(uint32_t ts_sec, uint32_t ts_usec, uint32_t incl_len, uint32_t orig_len)
{
    put<uint32_t>(ts_sec);
    put<uint32_t>(ts_usec);
    put<uint32_t>(incl_len);
    put<uint32_t>(orig_len);
}

void CaptureWriter::add_raw_bytes(const uint8_t* data, size_t size)
{
    data_.insert(data_.end(), data, data + size);
}

CaptureBuffer CaptureWriter::buffer() const
{
    return std::make_shared<const std::vector<uint8_t>>(data_);
}

void CaptureWriter::write_file(const std::string& path) const
{
    std::unique_ptr<FILE, decltype(&fclose)> file(fopen(path.c_str(), "wb"), &fclose);
    if(file == nullptr)
    {
        FHLOGE_FMT(TAG, FH_CAPTURE_IO_EVENT, "Failed to open {} for writing: {}", path, std::strerror(errno));
        THROW_FHC(EIO, StringBuilder() << "Failed to open capture file for writing: " << path);
    }

    if(!data_.empty() && fwrite(data_.data(), 1, data_.size(), file.get()) != data_.size())
    {
        FHLOGE_FMT(TAG, FH_CAPTURE_IO_EVENT, "Short write to {}", path);
        THROW_FHC(EIO, StringBuilder() << "Failed to write capture file: " << path);
    }
    FHLOGI_FMT(TAG, "Wrote {} records, {} bytes to {}", record_count_, data_.size(), path);
}

} // namespace fh_capture
