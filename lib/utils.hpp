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

#ifndef FH_CAPTURE_UTILS_HPP__
#define FH_CAPTURE_UTILS_HPP__

#include "fh-capture/exception.hpp"
#include "fh-capture/types.hpp"
#include "fhlog.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>

#ifndef likely
#define likely(x) __builtin_expect((x), 1)      //!< Branch prediction hint: likely true
#endif
#ifndef unlikely
#define unlikely(x) __builtin_expect((x), 0)    //!< Branch prediction hint: unlikely true
#endif

namespace fh_capture
{
/**
 * String builder for efficient string concatenation
 *
 * Used for building error messages and logging output.
 * Wraps std::stringstream with operator<< overloading.
 */
class StringBuilder {
public:
    template <class T>
    StringBuilder& operator<<(T const& x)
    {
        ss_ << x;
        return *this;
    }
    operator std::string()
    {
        return ss_.str();
    }

protected:
    std::stringstream ss_;
};

#define FILE_BNAME (__builtin_strrchr(__FILE__, '/') ? __builtin_strrchr(__FILE__, '/') + 1 : __FILE__)  //!< Extract filename from path

// Exception throw macros
#pragma GCC diagnostic push
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic ignored "-Wterminate"
#endif
/**
 * Internal function for throwing fh-capture exceptions
 */
[[noreturn]] inline void throw_fhc_func(int err_code, const std::string& what, const char* filename, const char* funcname, int line,
                                        FormatError format_error = FormatError::NONE)
{
    throw CaptureException(err_code, what, filename, funcname, line, format_error);
}
#define THROW_FHC(err_code, what) throw_fhc_func(err_code, what, FILE_BNAME, __FUNCTION__, __LINE__)  //!< Throw exception with context
#define THROW_FHC_FORMAT(format_error, what) throw_fhc_func(EINVAL, what, FILE_BNAME, __FUNCTION__, __LINE__, format_error)  //!< Throw fatal format error
#pragma GCC diagnostic pop

constexpr ByteOrder host_byte_order()
{
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
    return ByteOrder::LITTLE_ENDIAN_STREAM;
#else
    return ByteOrder::BIG_ENDIAN_STREAM;
#endif
}

/**
 * Convert a value read from a stream of the given byte order to host order
 */
template <typename T>
T fix_endianness(T value, ByteOrder stream_order)
{
    if(stream_order == host_byte_order())
    {
        return value;
    }
    if constexpr(sizeof(T) == sizeof(uint16_t))
    {
        return static_cast<T>(__builtin_bswap16(static_cast<uint16_t>(value)));
    }
    else if constexpr(sizeof(T) == sizeof(uint32_t))
    {
        return static_cast<T>(__builtin_bswap32(static_cast<uint32_t>(value)));
    }
    else
    {
        return value;
    }
}

/**
 * Network order to host order
 */
template <typename T>
T from_network(T value)
{
    return fix_endianness(value, ByteOrder::BIG_ENDIAN_STREAM);
}

/**
 * Copy a packed wire struct out of a byte buffer
 */
template <typename T>
T load_wire(const uint8_t* data)
{
    T hdr;
    std::memcpy(&hdr, data, sizeof(T));
    return hdr;
}

} // namespace fh_capture

#endif //ifndef FH_CAPTURE_UTILS_HPP__
