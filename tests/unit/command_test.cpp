/*
 * 설명: 명령 식별 우선순위, 인자 추출, 주소 형식 검사를 확인한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Command Recognizer)
 * 테스트: 이 파일 자체
 */
#include "protocol/command.hpp"

#include <cassert>
#include <string>

void TestRecognizeKnownCommands() {
    assert(protocol::RecognizeCommand("EHLO client.example") == protocol::CommandId::kEhlo);
    assert(protocol::RecognizeCommand("helo client") == protocol::CommandId::kHelo);
    assert(protocol::RecognizeCommand("Mail From:<a@bb.co>") == protocol::CommandId::kMailFrom);
    assert(protocol::RecognizeCommand("rcpt to: <c@dd.co>") == protocol::CommandId::kRcptTo);
    assert(protocol::RecognizeCommand("DATA") == protocol::CommandId::kData);
    assert(protocol::RecognizeCommand("quit") == protocol::CommandId::kQuit);
    assert(protocol::RecognizeCommand("NOOP") == protocol::CommandId::kNoop);
    assert(protocol::RecognizeCommand("RSET") == protocol::CommandId::kRset);
    assert(protocol::RecognizeCommand("VRFY postmaster") == protocol::CommandId::kVrfy);
    assert(protocol::RecognizeCommand("EXPN list") == protocol::CommandId::kExpn);
    assert(protocol::RecognizeCommand("HELP") == protocol::CommandId::kHelp);
    assert(protocol::RecognizeCommand("STARTTLS") == protocol::CommandId::kStartTls);
    assert(protocol::RecognizeCommand("AUTH PLAIN") == protocol::CommandId::kAuth);
}

void TestUnrecognizedIsExplicit() {
    assert(protocol::RecognizeCommand("FOO") == protocol::CommandId::kUnrecognized);
    assert(protocol::RecognizeCommand("") == protocol::CommandId::kUnrecognized);
    assert(protocol::RecognizeCommand(" HELO x") == protocol::CommandId::kUnrecognized);
    assert(protocol::RecognizeCommand("MAIL TO:<a@bb.co>") == protocol::CommandId::kUnrecognized);
    assert(protocol::RecognizeCommand("EHL") == protocol::CommandId::kUnrecognized);

    // 직전 호출 결과가 다음 판정에 남지 않는다.
    assert(protocol::RecognizeCommand("HELO a") == protocol::CommandId::kHelo);
    assert(protocol::RecognizeCommand("BOGUS") == protocol::CommandId::kUnrecognized);
}

void TestKeywordLookup() {
    assert(protocol::CommandKeyword(protocol::CommandId::kMailFrom) == "MAIL FROM:");
    assert(protocol::CommandKeyword(protocol::CommandId::kUnrecognized).empty());
}

void TestExtractArgument() {
    assert(protocol::ExtractArgument("EHLO", "ehlo   client.example  \r\n") == "client.example");
    assert(protocol::ExtractArgument("MAIL FROM:", "MAIL FROM: <a@bb.co>") == "<a@bb.co>");
    assert(protocol::ExtractArgument("RCPT TO:", "RCPT TO:\t<c@dd.co>\t") == "<c@dd.co>");
    assert(protocol::ExtractArgument("HELO", "HELO") == "");
}

void TestStripAngleBrackets() {
    assert(protocol::StripAngleBrackets("<a@bb.co>") == "a@bb.co");
    assert(protocol::StripAngleBrackets("a@bb.co") == "a@bb.co");
    assert(protocol::StripAngleBrackets("<<a>@bb.co>") == "a@bb.co");
}

void TestAddressShape() {
    assert(protocol::IsAcceptableAddress("user@host.domain"));
    assert(protocol::IsAcceptableAddress("a@bb.co"));
    assert(protocol::IsAcceptableAddress("first.last@mail.example.org"));
    assert(protocol::IsAcceptableAddress("a@b..c"));

    assert(!protocol::IsAcceptableAddress("no-at-sign.example"));
    assert(!protocol::IsAcceptableAddress("@bb.co"));
    assert(!protocol::IsAcceptableAddress("a@b@cc.co"));
    assert(!protocol::IsAcceptableAddress("a@localhost"));
    assert(!protocol::IsAcceptableAddress("a@.bb.co"));
    assert(!protocol::IsAcceptableAddress("a@bb."));
    assert(!protocol::IsAcceptableAddress("a@b.co"));
    assert(!protocol::IsAcceptableAddress(""));
}

int main() {
    TestRecognizeKnownCommands();
    TestUnrecognizedIsExplicit();
    TestKeywordLookup();
    TestExtractArgument();
    TestStripAngleBrackets();
    TestAddressShape();
    return 0;
}
