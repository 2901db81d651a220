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

#include "helpers.h"
#include <chrono>
#include <stdio.h>
#include <time.h>

namespace xmbl {

uint64_t local_timestamp_msec() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

size_t format_timestamp(char* buffer, size_t bufferCap, const char* formatStr, uint64_t timestamp, bool formatMsec) {
    time_t seconds = (time_t)(timestamp/1000);
    struct tm tm;
#ifdef WIN32
    localtime_s(&tm, &seconds);
    size_t nBytes = strftime(buffer, bufferCap, formatStr, &tm);
#else
    size_t nBytes = strftime(buffer, bufferCap, formatStr, localtime_r(&seconds, &tm));
#endif
    if (formatMsec && bufferCap - nBytes > 4) {
        snprintf(buffer + nBytes, 5, ".%03d", int(timestamp % 1000));
        nBytes += 4;
    }
    return nBytes;
}

char* to_hex(char* dst, const void* bytes, size_t size) {
    static const char digits[] = "0123456789abcdef";
    char* d = dst;

    const uint8_t* ptr = (const uint8_t*)bytes;
    const uint8_t* end = ptr + size;
    while (ptr < end) {
        uint8_t c = *ptr++;
        *d++ = digits[c >> 4];
        *d++ = digits[c & 0xF];
    }
    *d = '\0';
    return dst;
}

std::string to_hex(const void* bytes, size_t size) {
    std::string res(2 * size + 1, '\0');
    to_hex(&res.front(), bytes, size);
    res.resize(2 * size);
    return res;
}

} //namespace
