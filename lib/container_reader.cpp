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

#include "fh-capture/container_reader.hpp"
#include "fh-capture/wire.hpp"
#include "utils.hpp"

#include <fmt/format.h>

#include <fstream>
#include <iterator>

#undef TAG
#define TAG "FHC.READER"

namespace fh_capture
{
ByteOrder detect_byte_order(const uint8_t* data, size_t size)
{
    if(unlikely(size < sizeof(uint32_t)))
    {
        THROW_FHC_FORMAT(FormatError::BAD_MAGIC, StringBuilder() << "Invalid capture magic number: only " << size << " bytes");
    }

    // Magic is compared as a big-endian value
    uint32_t magic = from_network(load_wire<uint32_t>(data));
    if(magic == FH_CAPTURE_PCAP_MAGIC)
    {
        return ByteOrder::BIG_ENDIAN_STREAM;
    }
    if(magic == FH_CAPTURE_PCAP_MAGIC_SWAPPED)
    {
        return ByteOrder::LITTLE_ENDIAN_STREAM;
    }
    THROW_FHC_FORMAT(FormatError::BAD_MAGIC, fmt::format("Invalid capture magic number: {:#010x}", magic));
}

RecordReadResult read_record(const std::vector<uint8_t>& buffer, ByteOrder order, size_t offset, uint64_t index)
{
    RecordReadResult result{RecordStatus::END, RawRecord{index, RecordHeader{}, 0}, offset, {}};
    if(offset >= buffer.size())
    {
        return result;
    }

    size_t remaining = buffer.size() - offset;
    if(remaining < FH_CAPTURE_RECORD_HDR_SIZE)
    {
        result.status  = RecordStatus::TRUNCATED;
        result.message = StringBuilder() << "Incomplete record header " << index << ": " << remaining
                                         << " trailing bytes, " << index << " records read";
        return result;
    }

    auto          hdr = load_wire<fhc_record_hdr>(buffer.data() + offset);
    RecordHeader& rh  = result.record.header;
    rh.ts_sec          = fix_endianness(hdr.ts_sec, order);
    rh.ts_usec         = fix_endianness(hdr.ts_usec, order);
    rh.captured_length = fix_endianness(hdr.incl_len, order);
    rh.original_length = fix_endianness(hdr.orig_len, order);

    size_t payload_offset = offset + FH_CAPTURE_RECORD_HDR_SIZE;
    size_t available      = buffer.size() - payload_offset;
    if(rh.captured_length > available)
    {
        result.status  = RecordStatus::TRUNCATED;
        result.message = StringBuilder() << "Incomplete record " << index << ": expected " << rh.captured_length
                                         << " bytes, only " << available << " available, " << index << " records read";
        return result;
    }

    result.status        = RecordStatus::OK;
    result.record.offset = payload_offset;
    result.next_offset   = payload_offset + rh.captured_length;
    return result;
}

RecordSequence::RecordSequence(CaptureBuffer buffer, ByteOrder order, size_t start_offset) :
    buffer_{std::move(buffer)},
    order_{order},
    offset_{start_offset}
{
}

std::optional<RawRecord> RecordSequence::next()
{
    if(done_)
    {
        return std::nullopt;
    }

    RecordReadResult result = read_record(*buffer_, order_, offset_, records_read_);
    switch(result.status)
    {
    case RecordStatus::OK:
        offset_ = result.next_offset;
        ++records_read_;
        return result.record;
    case RecordStatus::TRUNCATED:
        truncated_          = true;
        truncation_message_ = std::move(result.message);
        FHLOGD_FMT(TAG, "{}", truncation_message_);
        break;
    case RecordStatus::END:
        break;
    }
    done_ = true;
    return std::nullopt;
}

ContainerReader::ContainerReader(CaptureBuffer buffer) :
    buffer_{std::move(buffer)}
{
    if(unlikely(buffer_ == nullptr))
    {
        THROW_FHC(EINVAL, "Capture buffer is null");
    }
    order_ = detect_byte_order(buffer_->data(), buffer_->size());
}

CaptureHeader ContainerReader::parse_global_header()
{
    if(unlikely(buffer_->size() < FH_CAPTURE_GLOBAL_HDR_SIZE))
    {
        THROW_FHC_FORMAT(FormatError::TRUNCATED_HEADER, StringBuilder() << "Capture header needs " << FH_CAPTURE_GLOBAL_HDR_SIZE
                                                                        << " bytes, container has " << buffer_->size());
    }

    auto          hdr = load_wire<fhc_capture_file_hdr>(buffer_->data());
    CaptureHeader header{};
    header.magic         = fix_endianness(hdr.magic_number, order_);
    header.version_major = fix_endianness(hdr.version_major, order_);
    header.version_minor = fix_endianness(hdr.version_minor, order_);
    header.timezone      = fix_endianness(hdr.thiszone, order_);
    header.sigfigs       = fix_endianness(hdr.sigfigs, order_);
    header.snaplen       = fix_endianness(hdr.snaplen, order_);
    header.link_type     = fix_endianness(hdr.network, order_);
    header.byte_order    = order_;

    cursor_ = FH_CAPTURE_GLOBAL_HDR_SIZE;
    FHLOGI_FMT(TAG, "Capture v{}.{} snaplen={} linktype={} {}", header.version_major, header.version_minor, header.snaplen,
               header.link_type, order_ == ByteOrder::LITTLE_ENDIAN_STREAM ? "little-endian" : "big-endian");
    return header;
}

RecordSequence ContainerReader::parse_records() const
{
    size_t start = cursor_ < FH_CAPTURE_GLOBAL_HDR_SIZE ? FH_CAPTURE_GLOBAL_HDR_SIZE : cursor_;
    return RecordSequence{buffer_, order_, start};
}

CaptureBuffer load_capture_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if(!file.is_open())
    {
        FHLOGE_FMT(TAG, FH_CAPTURE_IO_EVENT, "Failed to open capture file {}", path);
        THROW_FHC(EIO, StringBuilder() << "Failed to open capture file: " << path);
    }

    auto data = std::make_shared<std::vector<uint8_t>>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if(file.bad())
    {
        THROW_FHC(EIO, StringBuilder() << "Failed to read capture file: " << path);
    }
    FHLOGI_FMT(TAG, "Loaded {} bytes from {}", data->size(), path);
    return data;
}

const char* format_error_name(FormatError error)
{
    switch(error)
    {
    case FormatError::NONE: return "NONE";
    case FormatError::BAD_MAGIC: return "BAD_MAGIC";
    case FormatError::TRUNCATED_HEADER: return "TRUNCATED_HEADER";
    }
    return "UNKNOWN";
}

} // namespace fh_capture
