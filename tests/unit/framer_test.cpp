/*
 * 설명: CRLF 프레이밍 유틸리티가 조각난 입력과 파이프라이닝된 명령을 처리하는지 확인한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Line Framer)
 * 테스트: 이 파일 자체
 */
#include <cassert>
#include <string>

#include "protocol/framer.hpp"

void TestPartialThenComplete() {
    std::string buffer;
    buffer.append("HELO");
    protocol::LineResult res1 = protocol::ExtractLine(buffer, 1000);
    assert(!res1.complete);
    assert(!res1.line_too_long);
    assert(buffer == "HELO");

    buffer.append(" client\r\n");
    protocol::LineResult res2 = protocol::ExtractLine(buffer, 1000);
    assert(res2.complete);
    assert(res2.line == "HELO client");
    assert(buffer.empty());
}

void TestOneLinePerCall() {
    std::string buffer = "DATA\r\nSubject: hi\r\n";
    protocol::LineResult res = protocol::ExtractLine(buffer, 1000);
    assert(res.complete);
    assert(res.line == "DATA");
    assert(buffer == "Subject: hi\r\n");
}

void TestBareLfIsNotALineEnd() {
    std::string buffer = "NOOP\n";
    protocol::LineResult res = protocol::ExtractLine(buffer, 1000);
    assert(!res.complete);
    assert(buffer == "NOOP\n");
}

void TestTooLong() {
    std::string unterminated(1001, 'x');
    protocol::LineResult res1 = protocol::ExtractLine(unterminated, 1000);
    assert(res1.line_too_long);
    assert(res1.line_cut);
    assert(!res1.complete);
    assert(unterminated.empty());

    std::string terminated = std::string(999, 'y') + "\r\nNOOP\r\n";
    protocol::LineResult res2 = protocol::ExtractLine(terminated, 1000);
    assert(res2.line_too_long);
    assert(!res2.line_cut);
    assert(terminated == "NOOP\r\n");
}

void TestSkipCutLineTail() {
    std::string buffer = std::string(1000, 'z') + "\r";
    protocol::LineResult res = protocol::ExtractLine(buffer, 1000);
    assert(res.line_cut);
    assert(buffer == "\r");

    assert(!protocol::SkipToLineEnd(buffer));
    assert(buffer == "\r");
    buffer.append("\nNOOP\r\n");
    assert(protocol::SkipToLineEnd(buffer));
    assert(buffer == "NOOP\r\n");

    std::string tail = "zzzz";
    assert(!protocol::SkipToLineEnd(tail));
    assert(tail.empty());
}

int main() {
    TestPartialThenComplete();
    TestOneLinePerCall();
    TestBareLfIsNotALineEnd();
    TestTooLong();
    TestSkipCutLineTail();
    return 0;
}
