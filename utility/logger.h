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
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <stdint.h>
#include <stdio.h>

#ifndef LOG_DEBUG_ENABLED
    #ifndef NDEBUG
        #define LOG_DEBUG_ENABLED 1
    #else
        #define LOG_DEBUG_ENABLED 0
    #endif
#endif

#define LOG_LEVEL_CRITICAL 6
#define LOG_LEVEL_ERROR    5
#define LOG_LEVEL_WARNING  4
#define LOG_LEVEL_INFO     3
#define LOG_LEVEL_DEBUG    2
#define LOG_LEVEL_VERBOSE  1

#define LOG_SINK_DISABLED  0

// Swallows everything, compiled out
struct LogMessageStub {
    template <typename T> LogMessageStub& operator<<(const T&) { return *this; }
};

#define LOG_MESSAGE(LEVEL) if (xmbl::Logger::will_log(LEVEL)) xmbl::LogMessage(LEVEL)

#define LOG_CRITICAL() LOG_MESSAGE(LOG_LEVEL_CRITICAL)
#define LOG_ERROR() LOG_MESSAGE(LOG_LEVEL_ERROR)
#define LOG_WARNING() LOG_MESSAGE(LOG_LEVEL_WARNING)
#define LOG_INFO() LOG_MESSAGE(LOG_LEVEL_INFO)

#if LOG_DEBUG_ENABLED
    #define LOG_DEBUG() LOG_MESSAGE(LOG_LEVEL_DEBUG)
#else
    #define LOG_DEBUG() LogMessageStub()
#endif

namespace xmbl {

/// Process-wide log with an optional console sink (stdout) and an optional file sink.
/// At most one instance exists at a time, messages are dropped while there's none.
class Logger {
public:
    /// The returned pointer owns the logger, it stops logging when released.
    /// Levels are minimal accepted levels, LOG_SINK_DISABLED turns a sink off.
    /// The file is <dir>/<prefix><yy_mm_dd_HH_MM_SS>.log, dir is created if missing
    static std::shared_ptr<Logger> create(
        int flushLevel = LOG_LEVEL_WARNING,
        int consoleLevel = LOG_LEVEL_DEBUG,
        int fileLevel = LOG_SINK_DISABLED,
        const std::string& fileNamePrefix = std::string(),
        const std::string& dir = std::string()
    );

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static bool will_log(int level) {
        return s_pInstance && (level >= s_pInstance->m_MinLevel);
    }

    /// Empty if the file sink is off
    const std::string& get_file_path() const { return m_sFilePath; }

private:
    friend class LogMessage;

    struct Sink {
        FILE* m_pFile = nullptr;
        int m_MinLevel = LOG_SINK_DISABLED;

        bool Accepts(int level) const { return m_pFile && (level >= m_MinLevel); }
    };

    Logger(int flushLevel, int consoleLevel, int fileLevel);

    void OpenFile(const std::string& fileNamePrefix, const std::string& dir);
    void Write(int level, const char* szHeader, size_t nHeader, const std::string& sMsg);

    std::mutex m_Mutex;
    Sink m_Console;
    Sink m_File;
    int m_FlushLevel;
    int m_MinLevel;
    std::string m_sFilePath;

    static Logger* s_pInstance;
};

struct LogBuffer;

/// One line of log. Collects the streamed values and hands the line to the logger when destroyed
class LogMessage {
public:
    explicit LogMessage(int level);
    ~LogMessage();

    LogMessage(const LogMessage&) = delete;
    LogMessage& operator=(const LogMessage&) = delete;

    template <typename T> LogMessage& operator<<(const T& x) {
        *m_pStream << x;
        return *this;
    }

private:
    int m_Level;
    uint64_t m_Timestamp;
    LogBuffer* m_pBuf;
    std::unique_ptr<LogBuffer> m_pOwnBuf; // only if the thread buffer is taken by an outer message
    std::ostream* m_pStream;
};

} //namespace
