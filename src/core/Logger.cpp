/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <cstring>
#include <format>
#include <mutex>
#include <string>

#ifndef BUMPER_APP_NAME
#define BUMPER_APP_NAME "BumperEngine"
#endif

namespace BumperEngine {
namespace {

constexpr const char* LOG_FILE_NAME = "bumper.log";
constexpr const char* PREVIOUS_LOG_FILE_NAME = "bumper.prev.log";
constexpr size_t FLUSH_EVERY = 16;

std::string timestamp() {
    SDL_Time now = 0;
    SDL_DateTime dt{};
    if (!SDL_GetCurrentTime(&now) || !SDL_TimeToDateTime(now, &dt, true)) {
        return "????-??-?? ??:??:??";
    }
    return std::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}", dt.year, dt.month, dt.day,
                       dt.hour, dt.minute, dt.second, dt.nanosecond / 1000000);
}

/*
 * Session log under the SDL pref path. The previous session's file is kept
 * as bumper.prev.log. When no file can be opened, messages go to SDL_Log.
 */
class SessionLog {
public:
    static SessionLog& Instance() {
        static SessionLog instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        bool critical = std::strcmp(level, "CRITICAL") == 0;
        if (m_stream == nullptr) {
            SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION,
                           critical ? SDL_LOG_PRIORITY_CRITICAL : SDL_LOG_PRIORITY_ERROR,
                           "[%s] %s", system, message);
            return;
        }

        std::string line = std::format("{} [{}] [{}] {}\n", timestamp(), level, system, message);
        bool ok = put(line);
        if (ok && (critical || ++m_pending >= FLUSH_EVERY)) {
            ok = SDL_FlushIO(m_stream);
            m_pending = 0;
        }
        if (!ok) {
            // Disk full or file gone; keep logging through SDL
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Log file write failed: %s", SDL_GetError());
            SDL_CloseIO(m_stream);
            m_stream = nullptr;
            write(level, system, message);
        }
    }

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

private:
    SessionLog() {
        char* prefPath = SDL_GetPrefPath("BumperEngine", BUMPER_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }
        std::string dir(prefPath);
        SDL_free(prefPath);

        std::string current = dir + LOG_FILE_NAME;
        std::string previous = dir + PREVIOUS_LOG_FILE_NAME;
        if (SDL_GetPathInfo(previous.c_str(), nullptr) && !SDL_RemovePath(previous.c_str())) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot remove %s: %s", previous.c_str(), SDL_GetError());
        }
        if (SDL_GetPathInfo(current.c_str(), nullptr) && !SDL_RenamePath(current.c_str(), previous.c_str())) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot keep %s: %s", current.c_str(), SDL_GetError());
        }

        m_stream = SDL_IOFromFile(current.c_str(), "w");
        if (m_stream == nullptr) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot open %s: %s", current.c_str(), SDL_GetError());
            return;
        }
        if (!put(std::format("=== {} log, started {} ===\n", BUMPER_APP_NAME, timestamp())) ||
            !SDL_FlushIO(m_stream)) {
            SDL_CloseIO(m_stream);
            m_stream = nullptr;
        }
    }

    bool put(const std::string& text) {
        return SDL_WriteIO(m_stream, text.data(), text.size()) == text.size();
    }

    ~SessionLog() {
        if (m_stream != nullptr) {
            SDL_CloseIO(m_stream);
        }
    }

    SDL_IOStream* m_stream{nullptr};
    size_t m_pending{0};
};

} // namespace

void Logger::Log(const char* level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    SessionLog::Instance().write(level, system, message);
}

} // namespace BumperEngine

#endif // DEBUG
