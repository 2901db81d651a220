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

#include "logger.h"
#include "helpers.h"
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <initializer_list>
#include <stdexcept>

namespace xmbl {

Logger* Logger::s_pInstance = nullptr;

namespace {

// buffers that grew past this are released after use
constexpr size_t s_MaxKeptBuffer = 16 * 1024;

const char* get_level_tag(int level) {
    switch (level) {
    case LOG_LEVEL_CRITICAL: return "C";
    case LOG_LEVEL_ERROR: return "E";
    case LOG_LEVEL_WARNING: return "W";
    case LOG_LEVEL_INFO: return "I";
    case LOG_LEVEL_DEBUG: return "D";
    case LOG_LEVEL_VERBOSE: return "V";
    }
    return "~";
}

} //namespace

struct LogBuffer {
    std::string m_sText;
    boost::iostreams::filtering_ostream m_Stream;
    bool m_Busy = false;

    LogBuffer() {
        m_Stream.push(boost::iostreams::back_inserter(m_sText));
    }

    void Reset() {
        if (m_sText.capacity() > s_MaxKeptBuffer)
            std::string().swap(m_sText);
        else
            m_sText.clear();
    }

    static LogBuffer& get_ThreadBuffer() {
        static thread_local LogBuffer s_Buf;
        return s_Buf;
    }
};

Logger::Logger(int flushLevel, int consoleLevel, int fileLevel)
    : m_FlushLevel(flushLevel)
    , m_MinLevel(LOG_SINK_DISABLED)
{
    if (consoleLevel > LOG_SINK_DISABLED) {
        m_Console.m_pFile = stdout;
        m_Console.m_MinLevel = consoleLevel;
    }

    m_File.m_MinLevel = fileLevel;

    // lowest level any enabled sink accepts
    m_MinLevel = (consoleLevel > LOG_SINK_DISABLED) ? consoleLevel : fileLevel;
    if ((fileLevel > LOG_SINK_DISABLED) && (fileLevel < m_MinLevel))
        m_MinLevel = fileLevel;
}

Logger::~Logger() {
    if (this == s_pInstance)
        s_pInstance = nullptr;

    if (m_File.m_pFile)
        fclose(m_File.m_pFile);
    if (m_Console.m_pFile)
        fflush(m_Console.m_pFile);
}

std::shared_ptr<Logger> Logger::create(int flushLevel, int consoleLevel, int fileLevel, const std::string& fileNamePrefix, const std::string& dir) {
    if (s_pInstance)
        throw std::runtime_error("logger already initialized");

    if ((consoleLevel <= LOG_SINK_DISABLED) && (fileLevel <= LOG_SINK_DISABLED))
        throw std::runtime_error("no logger sink configured");

    std::shared_ptr<Logger> pRes(new Logger(flushLevel, consoleLevel, fileLevel));
    if (fileLevel > LOG_SINK_DISABLED)
        pRes->OpenFile(fileNamePrefix, dir);

    s_pInstance = pRes.get();
    return pRes;
}

void Logger::OpenFile(const std::string& fileNamePrefix, const std::string& dir) {
    std::string sName = fileNamePrefix + format_timestamp("%y_%m_%d_%H_%M_%S", local_timestamp_msec(), false) + ".log";

    if (dir.empty()) {
        m_sFilePath = sName;
    } else {
        boost::filesystem::path path(dir);
        if (!boost::filesystem::exists(path))
            boost::filesystem::create_directories(path);

        m_sFilePath = (path / sName).string();
    }

    m_File.m_pFile = fopen(m_sFilePath.c_str(), "ab");
    if (!m_File.m_pFile)
        throw std::runtime_error("cannot open log file " + m_sFilePath);
}

void Logger::Write(int level, const char* szHeader, size_t nHeader, const std::string& sMsg) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    for (Sink* pSink : { &m_Console, &m_File }) {
        if (!pSink->Accepts(level))
            continue;

        fwrite(szHeader, 1, nHeader, pSink->m_pFile);
        fwrite(sMsg.data(), 1, sMsg.size(), pSink->m_pFile);
        if (level >= m_FlushLevel)
            fflush(pSink->m_pFile);
    }
}

LogMessage::LogMessage(int level)
    : m_Level(level)
    , m_Timestamp(local_timestamp_msec())
{
    m_pBuf = &LogBuffer::get_ThreadBuffer();
    if (m_pBuf->m_Busy) {
        // a value being streamed logs on its own
        m_pOwnBuf.reset(new LogBuffer);
        m_pBuf = m_pOwnBuf.get();
    }

    m_pBuf->m_Busy = true;
    m_pStream = &m_pBuf->m_Stream;
}

LogMessage::~LogMessage() {
    m_pBuf->m_Stream << '\n';
    m_pBuf->m_Stream.flush();

    // <tag> <yyyy-mm-dd.hh:mm:ss.mmm> <text>
    char szHeader[64];
    size_t n = snprintf(szHeader, sizeof(szHeader), "%s ", get_level_tag(m_Level));
    n += format_timestamp(szHeader + n, sizeof(szHeader) - n, "%Y-%m-%d.%T", m_Timestamp, true);
    if (n + 1 < sizeof(szHeader))
        szHeader[n++] = ' ';

    Logger* pLogger = Logger::s_pInstance;
    if (pLogger)
        pLogger->Write(m_Level, szHeader, n, m_pBuf->m_sText);

    m_pBuf->Reset();
    m_pBuf->m_Busy = false;
}

} //namespace
