// Copyright 2025 The XMBL Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <string>
#include <vector>
#include <stdint.h>
#include <stddef.h>

namespace xmbl {

// returns local timestamp in millisecond since the Epoch
uint64_t local_timestamp_msec();

// formatStr as for strftime (e.g. "%Y-%m-%d.%T"), if decimals==true, then .### milliseconds added
// returns bytes consumed
size_t format_timestamp(char* buffer, size_t bufferCap, const char* formatStr, uint64_t timestamp, bool formatMsec=true);

// formats timestamp into std::string
inline std::string format_timestamp(const char* formatStr, uint64_t timestamp, bool formatMsec=true) {
    char buf[128];
    size_t n = format_timestamp(buf, 128, formatStr, timestamp, formatMsec);
    return std::string(buf, n);
}

// Converts bytes to base16 string, writes to dst buffer.
// dst must contain at least size*2 bytes + 1
char* to_hex(char* dst, const void* bytes, size_t size);

// Converts bytes to base16 string.
std::string to_hex(const void* bytes, size_t size);

} //namespace
