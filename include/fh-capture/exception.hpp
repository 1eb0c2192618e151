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

#ifndef FH_CAPTURE_EXCEPTION_HPP__
#define FH_CAPTURE_EXCEPTION_HPP__

#include <stdexcept>
#include <string>

namespace fh_capture
{
/**
 * Fatal container format errors
 */
enum class FormatError
{
    NONE,             //!< Not a format error
    BAD_MAGIC,        //!< Magic number matches neither byte order
    TRUNCATED_HEADER, //!< Valid magic but fewer than 24 bytes of capture header
};

/**
 * fh-capture exception class
 *
 * Extends std::runtime_error with additional context:
 * - Error code (Linux errno-style)
 * - Container format error, if any
 * - Source file, function, and line number
 */
class CaptureException : public std::runtime_error {
public:
    /**
     * Constructor
     * @param err_code Linux error code (e.g., EINVAL, EIO)
     * @param what Error description
     * @param file Source file where exception occurred
     * @param func Function name where exception occurred
     * @param lineno Line number where exception occurred
     * @param format_error Container format error, FormatError::NONE otherwise
     */
    CaptureException(int err_code, const std::string& what, const char* file, const char* func, int lineno,
                     FormatError format_error = FormatError::NONE) :
        std::runtime_error{what},
        err_code_{err_code},
        format_error_{format_error},
        file_{file},
        func_{func},
        lineno_{lineno} {}
    int         err_code() const { return err_code_; }          //!< Get error code
    FormatError format_error() const { return format_error_; }  //!< Get container format error
    const char* file() const { return file_; }                  //!< Get source file
    const char* func() const { return func_; }                  //!< Get function name
    int         lineno() const { return lineno_; }              //!< Get line number

protected:
    int         err_code_;      //!< Linux error code
    FormatError format_error_;  //!< Container format error
    const char* file_;          //!< Source file name
    const char* func_;          //!< Function name
    int         lineno_;        //!< Line number
};

const char* format_error_name(FormatError error);

} // namespace fh_capture

#endif //ifndef FH_CAPTURE_EXCEPTION_HPP__
