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

#ifndef FH_CAPTURE_WIRE_HPP__
#define FH_CAPTURE_WIRE_HPP__

#include <inttypes.h>

//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
//// Bits manipulation
//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * Bitfield over a big-endian wire word
 *
 * Packed structures with C bitfields have implementation-defined layout,
 * so every sub-byte field is a view on the network-order storage word.
 * Only supports 8, 16, 32 bit sized bitfields
 *
 * \tparam T Underlying integer type (uint8_t, uint16_t, or uint32_t)
 * \tparam Offset Bit offset within the field, counted from the LSB of the big-endian value
 * \tparam Bits Number of bits for this field
 */
template <typename T, int Offset, int Bits>
class __attribute__((__packed__)) Bitfield {
    static_assert(Offset + Bits <= (int)sizeof(T) * 8, "Member exceeds bitfield boundaries");
    static_assert(Bits < (int)sizeof(T) * 8, "Can't fill entire bitfield with one member");
    static_assert(sizeof(T) == sizeof(uint8_t) ||
                      sizeof(T) == sizeof(uint16_t) ||
                      sizeof(T) == sizeof(uint32_t),
                  "Size not supported by bitfield");
    static const T Maximum = (T(1) << Bits) - 1;
    static const T Mask    = Maximum << Offset;

    T field;

    static T swap(T value)
    {
        if(sizeof(T) == sizeof(uint16_t))
        {
            return static_cast<T>(__builtin_bswap16(static_cast<uint16_t>(value)));
        }
        else if(sizeof(T) == sizeof(uint32_t))
        {
            return static_cast<T>(__builtin_bswap32(static_cast<uint32_t>(value)));
        }
        return value;
    }

    static T to_host(T value)
    {
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
        return swap(value);
#else
        return value;
#endif
    }

public:
    void operator=(T value)
    {
        value &= Maximum;
        T host = to_host(field);
        host   = (host & ~Mask) | (value << Offset);
        field  = to_host(host);
    }

    operator T() const
    {
        return get();
    }

    T get() const
    {
        return (T)(to_host(field) >> Offset) & Maximum;
    }
};

//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
//// Capture container (libpcap classic format)
//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
#define FH_CAPTURE_PCAP_MAGIC 0xa1b2c3d4u          //!< Magic as read from a big-endian stream
#define FH_CAPTURE_PCAP_MAGIC_SWAPPED 0xd4c3b2a1u  //!< Magic as read from a little-endian stream
#define FH_CAPTURE_PCAP_VERSION_MAJOR 2            //!< Container major version
#define FH_CAPTURE_PCAP_VERSION_MINOR 4            //!< Container minor version
#define FH_CAPTURE_PCAP_SNAPLEN 65535              //!< Default snapshot length
#define FH_CAPTURE_LINKTYPE_ETHERNET 1             //!< Ethernet link type

/**
 * Capture container global header
 *
 * Multi-byte fields are in the stream byte order selected by the magic.
 */
struct fhc_capture_file_hdr
{
    uint32_t magic_number;  //!< Magic number identifying byte order
    uint16_t version_major; //!< Major version number
    uint16_t version_minor; //!< Minor version number
    int32_t  thiszone;      //!< GMT to local correction
    uint32_t sigfigs;       //!< Accuracy of timestamps
    uint32_t snaplen;       //!< Maximum length of captured packets
    uint32_t network;       //!< Data link type
} __attribute__((__packed__));

/**
 * Capture container record header
 */
struct fhc_record_hdr
{
    uint32_t ts_sec;   //!< Timestamp seconds
    uint32_t ts_usec;  //!< Timestamp microseconds
    uint32_t incl_len; //!< Number of octets of packet saved in file
    uint32_t orig_len; //!< Actual length of packet
} __attribute__((__packed__));

#define FH_CAPTURE_GLOBAL_HDR_SIZE sizeof(struct fhc_capture_file_hdr)  //!< 24 bytes
#define FH_CAPTURE_RECORD_HDR_SIZE sizeof(struct fhc_record_hdr)        //!< 16 bytes

//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
//// Ethernet generic
//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
#define FH_CAPTURE_ETHER_ADDR_LEN 6        //!< Ethernet address length (6 bytes)
#define FH_CAPTURE_ETHER_TYPE_ECPRI 0xAEFE //!< eCPRI Ethertype

/**
 * Ethernet MAC address
 */
struct fhc_ether_addr
{
    uint8_t addr_bytes[FH_CAPTURE_ETHER_ADDR_LEN]; //!< Address bytes in transmission order
} __attribute__((__packed__));

/**
 * Ethernet header
 */
struct fhc_ether_hdr
{
    struct fhc_ether_addr dst_addr;   //!< Destination MAC address
    struct fhc_ether_addr src_addr;   //!< Source MAC address
    uint16_t              ether_type; //!< Ethertype, network order
} __attribute__((__packed__));

#define FH_CAPTURE_ETHER_HDR_SIZE sizeof(struct fhc_ether_hdr)  //!< 14 bytes

//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
//// eCPRI transport header
//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
#define FH_CAPTURE_ECPRI_VERSION 1      //!< Default eCPRI protocol version
#define FH_CAPTURE_ECPRI_MSG_TYPE_IQ 0x0  //!< IQ data message type
#define FH_CAPTURE_ECPRI_MSG_TYPE_RTC 0x2 //!< Real-time control message type

/**
 * eCPRI transport header as carried by the captures
 *
 * The message type shares the first byte with the version and flags.
 */
struct fhc_transport_hdr
{
    /*
    BIG ENDIAN FORMAT (8 bits):
    ---------------------------------------------------------
    | version | reserved | concatenation | message type     |
    ---------------------------------------------------------
    |    4    |     1    |       1       |       2          |
    ---------------------------------------------------------
*/
    union __attribute__((__packed__))
    {
        Bitfield<uint8_t, 0, 2> messageType;
        Bitfield<uint8_t, 2, 1> concatenation;
        Bitfield<uint8_t, 3, 1> reserved;
        Bitfield<uint8_t, 4, 4> version;
    };

    uint16_t payloadSize; //!< Network order
    uint16_t rtcId;       //!< Network order
    uint16_t seqId;       //!< Network order
    uint8_t  padding;     //!< Not decoded
} __attribute__((__packed__));

#define FH_CAPTURE_TRANSPORT_HDR_SIZE sizeof(struct fhc_transport_hdr)  //!< 8 bytes
#define FH_CAPTURE_TRANSPORT_HDR_OFFSET FH_CAPTURE_ETHER_HDR_SIZE       //!< Transport header offset in packet

//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
//// O-RAN U-plane radio application header, minimal variant
//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
struct fhc_radio_hdr
{
    /*
    BIG ENDIAN FORMAT (8 bits):
    ---------------------------------------------------
    | Data Direction | Payload Version | Filter Index |
    ---------------------------------------------------
    |     1          |          3      |      4       |
    ---------------------------------------------------
*/
    union __attribute__((__packed__))
    {
        Bitfield<uint8_t, 0, 4> filterIndex;
        Bitfield<uint8_t, 4, 3> payloadVersion;
        Bitfield<uint8_t, 7, 1> dataDirection;
    };

    uint8_t frameId;

    union __attribute__((__packed__))
    {
        Bitfield<uint8_t, 0, 4> slotId;
        Bitfield<uint8_t, 4, 4> subframeId;
    };

    union __attribute__((__packed__))
    {
        Bitfield<uint8_t, 2, 6> symbolId; //!< Low 2 bits reserved
    };

/*
    BIG ENDIAN FORMAT (32 bits):
    -------------------------------------------------------------
    | sectionId | rb | symInc | startPrbu | numPrbu              |
    -------------------------------------------------------------
    |    12     | 1  |   1    |    10     |    8                 |
    -------------------------------------------------------------
*/
    union __attribute__((__packed__))
    {
        Bitfield<uint32_t, 0, 8>   numPrbu;
        Bitfield<uint32_t, 8, 10>  startPrbu;
        Bitfield<uint32_t, 18, 1>  symInc;
        Bitfield<uint32_t, 19, 1>  rb;
        Bitfield<uint32_t, 20, 12> sectionId;
    };
} __attribute__((__packed__));

#define FH_CAPTURE_RADIO_HDR_SIZE sizeof(struct fhc_radio_hdr)                                         //!< 8 bytes
#define FH_CAPTURE_RADIO_HDR_OFFSET (FH_CAPTURE_TRANSPORT_HDR_OFFSET + FH_CAPTURE_TRANSPORT_HDR_SIZE)  //!< 22 bytes
#define FH_CAPTURE_IQ_DATA_OFFSET (FH_CAPTURE_RADIO_HDR_OFFSET + FH_CAPTURE_RADIO_HDR_SIZE)            //!< 30 bytes

static_assert(FH_CAPTURE_GLOBAL_HDR_SIZE == 24, "Capture header must be 24 bytes");
static_assert(FH_CAPTURE_RECORD_HDR_SIZE == 16, "Record header must be 16 bytes");
static_assert(FH_CAPTURE_ETHER_HDR_SIZE == 14, "Ethernet header must be 14 bytes");
static_assert(FH_CAPTURE_TRANSPORT_HDR_SIZE == 8, "Transport header must be 8 bytes");
static_assert(FH_CAPTURE_RADIO_HDR_SIZE == 8, "Radio header must be 8 bytes");

//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
//// Block floating point
//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
#define FH_CAPTURE_PRB_NUM_RE 12            //!< Resource elements per PRB
#define FH_CAPTURE_BFP_NO_COMPRESSION 16    //!< IQ width meaning uncompressed
#define FH_CAPTURE_BFP_DEFAULT_WIDTH 9      //!< Default BFP mantissa width
#define FH_CAPTURE_BFP_PRB_SIZE(iq_width) \
    ((iq_width) == FH_CAPTURE_BFP_NO_COMPRESSION ? 48 : 3 * (iq_width) + 1)  //!< PRB size in bytes, udCompParam included

#endif //ifndef FH_CAPTURE_WIRE_HPP__
