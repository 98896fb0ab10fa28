/*
 * 설명: INI 설정 파일을 로드해 SMTP 서버/세션 설정 구조체를 생성한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md (Configuration)
 * 테스트: tests/unit/config_parser_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace config {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

struct Settings {
    std::string hostname;
    std::string bind_address;
    LogLevel log_level;
    std::string log_file;
    std::size_t max_line_length;
    std::size_t max_body_bytes;
    std::size_t outbound_lines;
    std::size_t hook_timeout_ms;

    Settings();
};

bool LoadFromFile(const std::string &path, Settings &out, std::string &error);
std::string LogLevelToString(LogLevel level);

}  // namespace config
