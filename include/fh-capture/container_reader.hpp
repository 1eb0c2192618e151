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

#ifndef FH_CAPTURE_CONTAINER_READER_HPP__
#define FH_CAPTURE_CONTAINER_READER_HPP__

#include "fh-capture/types.hpp"

#include <optional>
#include <string>

namespace fh_capture
{
/**
 * Record located in the container, payload not decoded yet
 */
struct RawRecord
{
    uint64_t     index;   //!< Dense 0-based position in the container
    RecordHeader header;  //!< Record header, host order
    size_t       offset;  //!< Payload offset in the container buffer
};

enum class RecordStatus
{
    OK,        //!< Record read, cursor advanced
    END,       //!< No bytes left
    TRUNCATED, //!< Remaining bytes cannot hold the declared record
};

/**
 * Outcome of reading a single record at a given cursor
 */
struct RecordReadResult
{
    RecordStatus status;
    RawRecord    record;
    size_t       next_offset;  //!< Cursor after the record, unchanged unless status is OK
    std::string  message;      //!< Reason when TRUNCATED
};

/**
 * Determine the stream byte order from the first 4 bytes
 *
 * @throws CaptureException with FormatError::BAD_MAGIC if the magic matches neither order
 */
ByteOrder detect_byte_order(const uint8_t* data, size_t size);

/**
 * Read the record whose header starts at offset
 *
 * Pure function of its inputs, the caller owns the cursor.
 */
RecordReadResult read_record(const std::vector<uint8_t>& buffer, ByteOrder order, size_t offset, uint64_t index);

/**
 * Lazy, finite, non-restartable sequence of records
 */
class RecordSequence {
public:
    RecordSequence(CaptureBuffer buffer, ByteOrder order, size_t start_offset);

    /**
     * Read the next record
     * @return The record, or std::nullopt once the container is exhausted or truncated
     */
    std::optional<RawRecord> next();

    [[nodiscard]] bool               done() const { return done_; }
    [[nodiscard]] bool               truncated() const { return truncated_; }
    [[nodiscard]] const std::string& truncation_message() const { return truncation_message_; }
    [[nodiscard]] uint64_t           records_read() const { return records_read_; }
    [[nodiscard]] size_t             position() const { return offset_; }

protected:
    CaptureBuffer buffer_;
    ByteOrder     order_;
    size_t        offset_;
    uint64_t      records_read_{0};
    bool          done_{false};
    bool          truncated_{false};
    std::string   truncation_message_;
};

/**
 * Capture container reader
 *
 * The byte order is fixed at construction from the magic number,
 * every later multi-byte container field uses it.
 */
class ContainerReader {
public:
    /**
     * @throws CaptureException with FormatError::BAD_MAGIC
     */
    explicit ContainerReader(CaptureBuffer buffer);

    /**
     * Parse the 24-byte global header and move the cursor past it
     * @throws CaptureException with FormatError::TRUNCATED_HEADER if the buffer is shorter than the header
     */
    CaptureHeader parse_global_header();

    /**
     * Records starting at the current cursor
     */
    RecordSequence parse_records() const;

    [[nodiscard]] ByteOrder            byte_order() const { return order_; }
    [[nodiscard]] size_t               cursor() const { return cursor_; }
    [[nodiscard]] const CaptureBuffer& buffer() const { return buffer_; }

protected:
    CaptureBuffer buffer_;
    ByteOrder     order_;
    size_t        cursor_{0};
};

/**
 * Read a whole capture file into memory
 * @throws CaptureException (EIO) if the file cannot be read
 */
CaptureBuffer load_capture_file(const std::string& path);

} // namespace fh_capture

#endif //ifndef FH_CAPTURE_CONTAINER_READER_HPP__
