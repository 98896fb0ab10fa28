/*
 * 설명: INI 파일을 파싱해 SMTP 서버 설정을 생성하고 검증한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md (Configuration)
 * 테스트: tests/unit/config_parser_test.cpp
 */
#include "utils/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace {
bool StartsWith(const std::string &text, char c) { return !text.empty() && text[0] == c; }

std::string Trim(const std::string &text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

std::string ToLower(const std::string &text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool ParseLogLevel(const std::string &raw, config::LogLevel &out) {
    const std::string lowered = ToLower(raw);
    if (lowered == "debug") {
        out = config::LogLevel::kDebug;
        return true;
    }
    if (lowered == "info") {
        out = config::LogLevel::kInfo;
        return true;
    }
    if (lowered == "warn") {
        out = config::LogLevel::kWarn;
        return true;
    }
    if (lowered == "error") {
        out = config::LogLevel::kError;
        return true;
    }
    return false;
}

bool ParseNumber(const std::string &raw, std::size_t &out) {
    if (raw.empty() || raw.size() > 12) {
        return false;
    }
    std::size_t result = 0;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        if (!std::isdigit(c)) {
            return false;
        }
        result = result * 10 + static_cast<std::size_t>(c - '0');
    }
    out = result;
    return true;
}

bool IsDottedQuad(const std::string &raw) {
    std::size_t parts = 0;
    std::size_t digits = 0;
    std::size_t value = 0;
    for (std::size_t i = 0; i <= raw.size(); ++i) {
        if (i == raw.size() || raw[i] == '.') {
            if (digits == 0 || value > 255) {
                return false;
            }
            ++parts;
            digits = 0;
            value = 0;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(raw[i])) || digits == 3) {
            return false;
        }
        value = value * 10 + static_cast<std::size_t>(raw[i] - '0');
        ++digits;
    }
    return parts == 4;
}

std::string LineError(const std::string &what, std::size_t line_no) {
    std::ostringstream oss;
    oss << what << " (" << line_no << ")";
    return oss.str();
}
}  // namespace

namespace config {

Settings::Settings()
    : hostname("localhost"),
      bind_address("0.0.0.0"),
      log_level(LogLevel::kInfo),
      max_line_length(1000),
      max_body_bytes(0),
      outbound_lines(64),
      hook_timeout_ms(0) {}

bool LoadFromFile(const std::string &path, Settings &out, std::string &error) {
    out = Settings();

    if (path.empty()) {
        return true;
    }

    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        return true;
    }

    std::string section;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::string trimmed = Trim(line);
        if (trimmed.empty() || StartsWith(trimmed, '#') || StartsWith(trimmed, ';')) {
            continue;
        }

        if (StartsWith(trimmed, '[')) {
            if (trimmed.size() < 3 || trimmed.back() != ']') {
                error = LineError("잘못된 섹션 선언", line_no);
                return false;
            }
            section = ToLower(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }

        std::size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos) {
            error = LineError("키=값 형식 오류", line_no);
            return false;
        }

        std::string key = ToLower(Trim(trimmed.substr(0, eq_pos)));
        std::string value = Trim(trimmed.substr(eq_pos + 1));
        if (section.empty()) {
            error = LineError("섹션 없음", line_no);
            return false;
        }

        if (section == "server" && key == "hostname") {
            if (value.empty()) {
                error = LineError("server.hostname 누락", line_no);
                return false;
            }
            out.hostname = value;
        } else if (section == "server" && key == "bind") {
            if (!IsDottedQuad(value)) {
                error = LineError("server.bind 오류", line_no);
                return false;
            }
            out.bind_address = value;
        } else if (section == "logging" && key == "level") {
            LogLevel parsed;
            if (!ParseLogLevel(value, parsed)) {
                error = LineError("logging.level 오류", line_no);
                return false;
            }
            out.log_level = parsed;
        } else if (section == "logging" && key == "file") {
            out.log_file = value;
        } else if (section == "limits" && key == "max_line_length") {
            std::size_t number = 0;
            // 명령 줄 한도는 RFC 5321 최소 512 미만으로 내릴 수 없다.
            if (!ParseNumber(value, number) || number < 512) {
                error = LineError("limits.max_line_length 오류", line_no);
                return false;
            }
            out.max_line_length = number;
        } else if (section == "limits" && key == "max_body_bytes") {
            std::size_t number = 0;
            if (!ParseNumber(value, number)) {
                error = LineError("limits.max_body_bytes 오류", line_no);
                return false;
            }
            out.max_body_bytes = number;
        } else if (section == "limits" && key == "outbound_lines") {
            std::size_t number = 0;
            if (!ParseNumber(value, number) || number == 0) {
                error = LineError("limits.outbound_lines 오류", line_no);
                return false;
            }
            out.outbound_lines = number;
        } else if (section == "limits" && key == "hook_timeout_ms") {
            std::size_t number = 0;
            if (!ParseNumber(value, number)) {
                error = LineError("limits.hook_timeout_ms 오류", line_no);
                return false;
            }
            out.hook_timeout_ms = number;
        } else {
            error = LineError("알 수 없는 섹션/키", line_no);
            return false;
        }
    }

    return true;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "debug";
        case LogLevel::kInfo:
            return "info";
        case LogLevel::kWarn:
            return "warn";
        case LogLevel::kError:
            return "error";
    }
    return "info";
}

}  // namespace config
