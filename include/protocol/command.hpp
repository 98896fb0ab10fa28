/*
 * 설명: SMTP 명령 줄을 고정된 우선순위 표로 식별하고 인자 추출과 주소 형식 검사를 제공한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Command Recognizer)
 * 테스트: tests/unit/command_test.cpp
 */
#pragma once

#include <string>

namespace protocol {

enum class CommandId {
    kEhlo,
    kHelo,
    kQuit,
    kMailFrom,
    kRcptTo,
    kData,
    kNoop,
    kRset,
    kVrfy,
    kExpn,
    kHelp,
    kStartTls,
    kAuth,
    kUnrecognized
};

// 대소문자 무시 접두 일치. 어떤 항목과도 맞지 않으면 kUnrecognized 를 돌려준다.
CommandId RecognizeCommand(const std::string &line);

// 표에 등록된 키워드 텍스트. kUnrecognized 는 빈 문자열.
std::string CommandKeyword(CommandId id);

std::string ExtractArgument(const std::string &keyword, const std::string &line);
std::string StripAngleBrackets(const std::string &text);
bool IsAcceptableAddress(const std::string &address);

}  // namespace protocol
