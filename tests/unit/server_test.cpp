/*
 * 설명: PollServer 가 등록된 훅을 세션에 넘기는지, 다른 스레드의 작업을 루프에서 실행하는지,
 *       송신 큐 초과 시 세션을 끝내는지 socketpair 로 확인한다.
 * 버전: v0.7.0
 * 관련 문서: DESIGN.md (Server)
 * 테스트: 이 파일 자체
 */
#include "server.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <string>
#include <thread>
#include <vector>

namespace {
config::Settings QuietSettings() {
    config::Settings settings;
    settings.hostname = "mx.test";
    settings.log_level = config::LogLevel::kError;
    return settings;
}

// 루프를 몇 차례 돌리고 그 사이 peer 쪽에 도착한 바이트를 모두 모은다.
std::string Drive(PollServer &server, int peer, int rounds) {
    std::string out;
    for (int i = 0; i < rounds; ++i) {
        server.RunOnce(50);
        char buf[512];
        while (true) {
            ssize_t n = recv(peer, buf, sizeof(buf), MSG_DONTWAIT);
            if (n <= 0) {
                break;
            }
            out.append(buf, static_cast<std::size_t>(n));
        }
    }
    return out;
}

void WriteAll(int fd, const std::string &data) {
    ssize_t n = write(fd, data.data(), data.size());
    assert(n == static_cast<ssize_t>(data.size()));
}

void TestRegisteredHooksReachSessions() {
    PollServer server(0, QuietSettings(), "");
    int ehlo_calls = 0;
    std::string seen_host;
    server.hooks().Register(session::HookEvent::kEhlo,
                            [&](const std::string &argument, session::Continuation continuation,
                                session::Session &) {
                                ++ehlo_calls;
                                seen_host = argument;
                                session::HookAccept accept;
                                accept.capabilities.push_back("PIPELINING");
                                continuation.Accept(accept);
                            });
    int ended = 0;
    server.hooks().SetEndObserver([&](session::Session &) { ++ended; });

    int fds[2];
    assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    server.AdoptConnection(fds[0], "local");
    assert(server.client_count() == 1);

    WriteAll(fds[1], "EHLO client.test\r\n");
    std::string out = Drive(server, fds[1], 3);
    assert(out ==
           "220 mx.test ESMTP hook-smtpd\r\n"
           "250-mx.test Hello local\r\n"
           "250-PIPELINING\r\n"
           "250 8BITMIME\r\n");
    assert(ehlo_calls == 1);
    assert(seen_host == "client.test");

    close(fds[1]);
    Drive(server, fds[1], 2);
    assert(ended == 1);
    assert(server.client_count() == 0);
}

void TestPostedTaskResolvesOnLoop() {
    PollServer server(0, QuietSettings(), "");
    std::vector<session::Continuation> saved;
    server.hooks().Register(session::HookEvent::kHelo,
                            [&](const std::string &, session::Continuation continuation,
                                session::Session &) { saved.push_back(continuation); });

    int fds[2];
    assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    server.AdoptConnection(fds[0], "local");

    WriteAll(fds[1], "HELO client.test\r\n");
    std::string out = Drive(server, fds[1], 2);
    assert(out == "220 mx.test ESMTP hook-smtpd\r\n");
    assert(saved.size() == 1);

    std::thread worker([&]() {
        server.Post([&]() {
            session::Continuation continuation = saved[0];
            continuation.Accept();
        });
    });
    worker.join();

    // 깨우기 pipe 덕분에 긴 타임아웃이어도 곧바로 돌아온다.
    server.RunOnce(5000);
    out = Drive(server, fds[1], 2);
    assert(out == "250 mx.test Hello local\r\n");
    assert(saved[0].resolved());

    WriteAll(fds[1], "QUIT\r\n");
    out = Drive(server, fds[1], 2);
    assert(out == "221 mx.test closing connection\r\n");
    assert(server.client_count() == 0);
    close(fds[1]);
}

void TestFullOutboundQueueEndsSession() {
    config::Settings settings = QuietSettings();
    settings.outbound_lines = 1;
    PollServer server(0, settings, "");
    int ended = 0;
    server.hooks().SetEndObserver([&](session::Session &s) {
        ++ended;
        assert(s.state() == session::SessionState::kClosed);
    });

    int fds[2];
    assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    // 인사말이 큐의 유일한 자리를 차지한다.
    server.AdoptConnection(fds[0], "local");

    WriteAll(fds[1], "NOOP\r\n");
    std::string out = Drive(server, fds[1], 2);
    assert(out == "220 mx.test ESMTP hook-smtpd\r\n");
    assert(ended == 1);
    assert(server.client_count() == 0);

    char buf[16];
    assert(recv(fds[1], buf, sizeof(buf), MSG_DONTWAIT) == 0);
    close(fds[1]);
}
}  // namespace

int main() {
    TestRegisteredHooksReachSessions();
    TestPostedTaskResolvesOnLoop();
    TestFullOutboundQueueEndsSession();
    return 0;
}
