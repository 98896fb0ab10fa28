/*
 * 설명: 명령 모드 입력 버퍼에서 CRLF 로 끝나는 줄을 하나씩 분리하고 길이 제한을 검사한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Line Framer)
 * 테스트: tests/unit/framer_test.cpp
 */
#pragma once

#include <string>

namespace protocol {

struct LineResult {
    bool complete;
    std::string line;
    bool line_too_long;
    // 길이 초과 줄이 CRLF 전에 잘렸다. 다음 CRLF 까지의 바이트는 같은 줄의 꼬리다.
    bool line_cut;
};

// DATA 이후 바이트가 본문으로 넘어가야 하므로 한 번에 한 줄만 꺼낸다.
LineResult ExtractLine(std::string &buffer, std::size_t max_length);

// 잘린 줄의 꼬리를 버린다. CRLF 까지 버렸으면 true, 아직 CRLF 가 오지 않았으면 false.
bool SkipToLineEnd(std::string &buffer);

}  // namespace protocol
