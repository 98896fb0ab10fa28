/*
 * 설명: 로그 레벨과 출력 경로를 제어하고 세션 단위 이벤트를 한 줄로 기록하는 로거를 제공한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md (Logging)
 * 테스트: tests/unit/session_test.cpp (세션 이벤트 경로)
 */
#pragma once

#include <fstream>
#include <string>

#include "utils/config.hpp"

class Logger {
   public:
    Logger();

    void SetLevel(config::LogLevel level);
    void SetOutput(const std::string &path);
    void Log(config::LogLevel level, const std::string &message);
    // "session=<id> event=<name> <detail>" 형식.
    void LogEvent(config::LogLevel level, unsigned long session_id, const std::string &event,
                  const std::string &detail);
    bool IsEnabled(config::LogLevel level) const;

   private:
    config::LogLevel level_;
    std::string path_;
    std::ofstream file_;

    void WriteLine(const std::string &line);
};
