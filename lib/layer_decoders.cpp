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

#include "fh-capture/layer_decoders.hpp"
#include "fh-capture/wire.hpp"
#include "utils.hpp"

#include <cstdio>

#undef TAG
#define TAG "FHC.DECODE"

namespace fh_capture
{
static void check_remaining(size_t size, size_t offset, size_t needed, const char* layer)
{
    if(unlikely(offset > size || size - offset < needed))
    {
        THROW_FHC(EINVAL, StringBuilder() << layer << " header needs " << needed << " bytes at offset " << offset
                                          << ", packet has " << size);
    }
}

std::string format_mac(const uint8_t* addr)
{
    char buf[3 * FH_CAPTURE_ETHER_ADDR_LEN];
    snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", addr[0], addr[1], addr[2], addr[3], addr[4], addr[5]);
    return std::string(buf);
}

Decoded<EthernetFrameHeader> decode_ethernet(const uint8_t* data, size_t size, size_t offset)
{
    check_remaining(size, offset, FH_CAPTURE_ETHER_HDR_SIZE, "Ethernet");

    auto                hdr = load_wire<fhc_ether_hdr>(data + offset);
    EthernetFrameHeader eth{};
    eth.destination = format_mac(hdr.dst_addr.addr_bytes);
    eth.source      = format_mac(hdr.src_addr.addr_bytes);
    eth.ethertype   = from_network(hdr.ether_type);
    return {eth, FH_CAPTURE_ETHER_HDR_SIZE};
}

Decoded<TransportHeader> decode_transport(const uint8_t* data, size_t size, size_t offset)
{
    check_remaining(size, offset, FH_CAPTURE_TRANSPORT_HDR_SIZE, "Transport");

    auto            hdr = load_wire<fhc_transport_hdr>(data + offset);
    TransportHeader transport{};
    transport.version       = hdr.version.get();
    transport.reserved      = hdr.reserved.get();
    transport.concatenation = hdr.concatenation.get();
    transport.message_type  = hdr.messageType.get();
    transport.payload_size  = from_network(hdr.payloadSize);
    transport.rtc_id        = from_network(hdr.rtcId);
    transport.seq_id        = from_network(hdr.seqId);
    return {transport, FH_CAPTURE_TRANSPORT_HDR_SIZE};
}

Decoded<RadioHeader> decode_radio(const uint8_t* data, size_t size, size_t offset)
{
    check_remaining(size, offset, FH_CAPTURE_RADIO_HDR_SIZE, "Radio");

    auto        hdr = load_wire<fhc_radio_hdr>(data + offset);
    RadioHeader radio{};
    radio.data_direction  = hdr.dataDirection.get();
    radio.payload_version = hdr.payloadVersion.get();
    radio.filter_index    = hdr.filterIndex.get();
    radio.frame_id        = hdr.frameId;
    radio.subframe_id     = hdr.subframeId.get();
    radio.slot_id         = hdr.slotId.get();
    radio.symbol_id       = hdr.symbolId.get();
    radio.section_id      = static_cast<uint16_t>(hdr.sectionId.get());
    radio.rb              = static_cast<uint8_t>(hdr.rb.get());
    radio.sym_inc         = static_cast<uint8_t>(hdr.symInc.get());
    radio.start_prb       = static_cast<uint16_t>(hdr.startPrbu.get());
    radio.num_prb         = static_cast<uint8_t>(hdr.numPrbu.get());
    return {radio, FH_CAPTURE_RADIO_HDR_SIZE};
}

void decode_packet_layers(PacketRecord& record)
{
    const uint8_t* data   = record.raw_data();
    const size_t   size   = record.raw_size();
    size_t         offset = 0;

    if(size < FH_CAPTURE_ETHER_HDR_SIZE)
    {
        record.diagnostics |= DIAG_SHORT_FRAME;
        FHLOGD_FMT(TAG, "Record {}: {} bytes, no Ethernet header", record.index, size);
        return;
    }
    auto eth = decode_ethernet(data, size, offset);
    offset += eth.consumed;
    if(eth.header.ethertype != FH_CAPTURE_ETHER_TYPE_ECPRI)
    {
        record.diagnostics |= DIAG_UNEXPECTED_ETHERTYPE;
    }
    record.ethernet = std::move(eth.header);

    if(size - offset < FH_CAPTURE_TRANSPORT_HDR_SIZE)
    {
        record.diagnostics |= DIAG_SHORT_TRANSPORT;
        FHLOGD_FMT(TAG, "Record {}: {} bytes, no transport header", record.index, size);
        return;
    }
    auto transport = decode_transport(data, size, offset);
    offset += transport.consumed;
    record.transport = transport.header;

    if(!carries_iq_data(transport.header))
    {
        return;
    }

    if(size - offset < FH_CAPTURE_RADIO_HDR_SIZE)
    {
        record.diagnostics |= DIAG_SHORT_RADIO_HEADER;
        FHLOGD_FMT(TAG, "Record {}: IQ message with {} bytes, no radio header", record.index, size);
        return;
    }
    record.radio = decode_radio(data, size, offset).header;
}

} // namespace fh_capture
