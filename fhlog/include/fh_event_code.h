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

#ifndef _FH_EVENT_CODE_H_
#define _FH_EVENT_CODE_H_

#ifdef __cplusplus /* For both C and C++ */
extern "C" {
#endif

typedef enum
{
    FH_CAPTURE_SUCCESS         = 0,
    FH_CAPTURE_INVALID_PARAM   = 1,
    FH_CAPTURE_INTERNAL_EVENT  = 2,
    FH_CAPTURE_FORMAT_EVENT    = 3,
    FH_CAPTURE_DECODE_EVENT    = 4,
    FH_CAPTURE_IO_EVENT        = 5,
    FH_CAPTURE_CONFIG_EVENT    = 6,
    FH_CAPTURE_YAML_EVENT      = 7,
    FH_CAPTURE_THREAD_EVENT    = 8,
    FH_CAPTURE_FHLOG_EVENT     = 9,
} fh_event_code_t;

const char* fhlog_event_name(fh_event_code_t code);

#if defined(__cplusplus) /* For both C and C++ */
} /* extern "C" */
#endif

#endif /* _FH_EVENT_CODE_H_ */
