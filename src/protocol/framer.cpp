/*
 * 설명: CRLF 기준으로 입력 버퍼 앞부분의 한 줄을 분리하고 길이 초과 여부를 판정한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Line Framer)
 * 테스트: tests/unit/framer_test.cpp
 */
#include "protocol/framer.hpp"

#include <cstddef>

namespace protocol {

LineResult ExtractLine(std::string &buffer, std::size_t max_length) {
    LineResult result;
    result.complete = false;
    result.line_too_long = false;
    result.line_cut = false;

    std::size_t pos = buffer.find("\r\n");
    if (pos == std::string::npos) {
        // CRLF 도달 이전에 길이 초과한 경우 즉시 종료 플래그를 세운다.
        if (buffer.size() > max_length) {
            // 끝의 CR 은 다음 조각의 LF 와 짝이 될 수 있어 남긴다.
            bool trailing_cr = buffer[buffer.size() - 1] == '\r';
            buffer.assign(trailing_cr ? "\r" : "");
            result.line_too_long = true;
            result.line_cut = true;
        }
        return result;
    }

    if (pos + 2 > max_length) {
        buffer.erase(0, pos + 2);
        result.line_too_long = true;
        return result;
    }

    result.line = buffer.substr(0, pos);
    buffer.erase(0, pos + 2);
    result.complete = true;
    return result;
}

bool SkipToLineEnd(std::string &buffer) {
    std::size_t pos = buffer.find("\r\n");
    if (pos == std::string::npos) {
        bool trailing_cr = !buffer.empty() && buffer[buffer.size() - 1] == '\r';
        buffer.assign(trailing_cr ? "\r" : "");
        return false;
    }
    buffer.erase(0, pos + 2);
    return true;
}

}  // namespace protocol
