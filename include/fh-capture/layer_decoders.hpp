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

#ifndef FH_CAPTURE_LAYER_DECODERS_HPP__
#define FH_CAPTURE_LAYER_DECODERS_HPP__

#include "fh-capture/types.hpp"

#include <string>

namespace fh_capture
{
/**
 * Format 6 address bytes as lowercase colon-separated hex octets
 */
std::string format_mac(const uint8_t* addr);

/**
 * Decode the 14-byte Ethernet header at data[offset]
 *
 * The ethertype is always big-endian.
 * @throws CaptureException (EINVAL) if fewer than 14 bytes remain
 */
Decoded<EthernetFrameHeader> decode_ethernet(const uint8_t* data, size_t size, size_t offset);

/**
 * Decode the 8-byte transport header at data[offset]
 *
 * Multi-byte fields are network order regardless of the container byte order.
 * @throws CaptureException (EINVAL) if fewer than 8 bytes remain
 */
Decoded<TransportHeader> decode_transport(const uint8_t* data, size_t size, size_t offset);

/**
 * Decode the 8-byte minimal radio application header at data[offset]
 *
 * Section extensions are not decoded, their bytes stay in the payload.
 * @throws CaptureException (EINVAL) if fewer than 8 bytes remain
 */
Decoded<RadioHeader> decode_radio(const uint8_t* data, size_t size, size_t offset);

/**
 * True when the transport message type selects sample data
 */
inline bool carries_iq_data(const TransportHeader& transport)
{
    return transport.message_type == 0;
}

/**
 * Decode every header layer of a record in place
 *
 * Fills ethernet, transport and radio as far as the record bytes allow and
 * sets the matching diagnostic flags. Never throws for short records.
 */
void decode_packet_layers(PacketRecord& record);

} // namespace fh_capture

#endif //ifndef FH_CAPTURE_LAYER_DECODERS_HPP__
