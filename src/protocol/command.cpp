/*
 * 설명: 명령 키워드 표 순회, 인자 추출, 단순화된 user@host.domain 주소 검사를 구현한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Command Recognizer)
 * 테스트: tests/unit/command_test.cpp
 */
#include "protocol/command.hpp"

#include <cctype>
#include <cstddef>
#include <string>

namespace protocol {

namespace {
struct CommandPattern {
    CommandId id;
    const char *keyword;
};

// 순서가 곧 우선순위다.
const CommandPattern kCommandTable[] = {
    {CommandId::kEhlo, "EHLO"},         {CommandId::kHelo, "HELO"},
    {CommandId::kQuit, "QUIT"},         {CommandId::kMailFrom, "MAIL FROM:"},
    {CommandId::kRcptTo, "RCPT TO:"},   {CommandId::kData, "DATA"},
    {CommandId::kNoop, "NOOP"},         {CommandId::kRset, "RSET"},
    {CommandId::kVrfy, "VRFY"},         {CommandId::kExpn, "EXPN"},
    {CommandId::kHelp, "HELP"},         {CommandId::kStartTls, "STARTTLS"},
    {CommandId::kAuth, "AUTH"},
};

const std::size_t kCommandCount = sizeof(kCommandTable) / sizeof(kCommandTable[0]);

bool StartsWithIgnoreCase(const std::string &text, const std::string &prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        unsigned char a = static_cast<unsigned char>(text[i]);
        unsigned char b = static_cast<unsigned char>(prefix[i]);
        if (std::toupper(a) != std::toupper(b)) {
            return false;
        }
    }
    return true;
}

bool IsTrimmable(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
}  // namespace

CommandId RecognizeCommand(const std::string &line) {
    for (std::size_t i = 0; i < kCommandCount; ++i) {
        if (StartsWithIgnoreCase(line, kCommandTable[i].keyword)) {
            return kCommandTable[i].id;
        }
    }
    return CommandId::kUnrecognized;
}

std::string CommandKeyword(CommandId id) {
    for (std::size_t i = 0; i < kCommandCount; ++i) {
        if (kCommandTable[i].id == id) {
            return kCommandTable[i].keyword;
        }
    }
    return "";
}

std::string ExtractArgument(const std::string &keyword, const std::string &line) {
    std::size_t start = 0;
    if (StartsWithIgnoreCase(line, keyword)) {
        start = keyword.size();
    }
    while (start < line.size() && IsTrimmable(line[start])) {
        ++start;
    }
    std::size_t end = line.size();
    while (end > start && IsTrimmable(line[end - 1])) {
        --end;
    }
    return line.substr(start, end - start);
}

std::string StripAngleBrackets(const std::string &text) {
    std::string stripped;
    stripped.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '<' && text[i] != '>') {
            stripped.push_back(text[i]);
        }
    }
    return stripped;
}

// local@X?+.label: local 과 label 은 비어 있지 않고, 도메인은 '.' 으로 시작하지 않으며
// 마지막 '.' 앞에 최소 두 글자가 있어야 한다.
bool IsAcceptableAddress(const std::string &address) {
    std::size_t at = address.find('@');
    if (at == std::string::npos || at == 0) {
        return false;
    }
    if (address.find('@', at + 1) != std::string::npos) {
        return false;
    }

    const std::string domain = address.substr(at + 1);
    if (domain.empty() || domain[0] == '.') {
        return false;
    }
    std::size_t last_dot = domain.rfind('.');
    if (last_dot == std::string::npos || last_dot < 2) {
        return false;
    }
    return last_dot + 1 < domain.size();
}

}  // namespace protocol
