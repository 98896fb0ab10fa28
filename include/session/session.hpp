/*
 * 설명: 연결 하나의 SMTP 대화 상태(인사, 발신자, 수신자, DATA 단계)를 소유하고 명령 순서 검사,
 *       훅 호출, 응답 전송을 진행하는 세션 상태 기계를 정의한다.
 * 버전: v0.7.0
 * 관련 문서: DESIGN.md (Session State Machine)
 * 테스트: tests/unit/session_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "session/body_accumulator.hpp"
#include "session/hooks.hpp"
#include "utils/config.hpp"

class Logger;

namespace session {

// 세션이 바이트 스트림 쪽으로 내보내는 경계. Send 는 CRLF 없는 응답 한 줄을 받는다.
class Transport {
   public:
    virtual ~Transport() {}
    virtual void Send(const std::string &line) = 0;
    virtual void Close() = 0;
    virtual std::string PeerAddress() const = 0;
};

struct SessionOptions {
    std::string hostname;
    std::size_t max_line_length;
    std::size_t max_body_bytes;

    SessionOptions();
};

enum class SessionState { kInit, kAwaitCommand, kInData, kClosed };
enum class GreetingKind { kNone, kHelo, kEhlo };

class Session {
   public:
    Session(unsigned long id, Transport &transport, const SessionOptions &options,
            const HookRegistry &hooks, Logger *logger);
    ~Session();

    void Start();
    void Receive(const std::string &bytes);
    void OnEndOfStream();
    void OnTransportError(const std::string &reason);

    // 대기 중인 훅이 timeout 을 넘겼으면 451 로 거절하고 true 를 돌려준다.
    bool ExpirePendingHook(std::chrono::steady_clock::time_point now,
                           std::chrono::milliseconds timeout);

    unsigned long id() const { return id_; }
    SessionState state() const { return state_; }
    GreetingKind greeting_kind() const { return greeting_kind_; }
    bool esmtp() const { return esmtp_; }
    const std::string &helo_host() const { return helo_host_; }
    bool has_from_address() const { return has_from_; }
    const std::string &from_address() const { return from_address_; }
    const std::vector<std::string> &recipients() const { return recipients_; }
    const std::string &body() const { return body_; }
    const std::string &peer_address() const { return peer_; }
    const std::string &hostname() const { return options_.hostname; }
    bool hook_pending() const { return static_cast<bool>(pending_); }

   private:
    friend class Continuation;
    typedef std::function<void(const HookAccept &)> AcceptAction;
    typedef std::function<void()> RejectAction;

    Session(const Session &);
    Session &operator=(const Session &);

    void Pump();
    void ProcessLine(const std::string &line);
    void HandleEhlo(const std::string &line);
    void HandleHelo(const std::string &line);
    void HandleMailFrom(const std::string &line);
    void HandleRcptTo(const std::string &line);
    void HandleData();
    void HandleRset();

    void RunHook(HookEvent event, const std::string &argument, const AcceptAction &on_accept,
                 const RejectAction &on_reject);
    void ResolveHook(PendingHook *pending, bool accepted, const HookAccept &accept,
                     const HookReject &reject);
    void DropPendingHook();

    void StartBody();
    void FeedBody();
    void DispatchStreamChunk(const std::string &chunk);
    void FinishBody();
    void EndBody();
    void ResetDataState();

    void SendReply(const std::string &line);
    void SendOk();
    void SendError(int status_code, const std::string &message);
    void SendGreeting();
    void Quit();
    void Terminate(const std::string &reason);
    void LogEvent(config::LogLevel level, const std::string &event, const std::string &detail) const;

    unsigned long id_;
    Transport &transport_;
    SessionOptions options_;
    HookRegistry hooks_;
    Logger *logger_;
    std::string peer_;
    bool streaming_;

    SessionState state_;
    GreetingKind greeting_kind_;
    bool esmtp_;
    std::string helo_host_;
    bool has_from_;
    std::string from_address_;
    std::vector<std::string> recipients_;

    std::string input_;
    BodyAccumulator accumulator_;
    std::string body_;
    std::string residual_;
    std::deque<std::string> stream_queue_;
    bool body_finished_;
    bool body_rejected_;
    // data_available 대기 중 밀린 입력이 max_body_bytes 를 넘었다.
    bool stream_overflow_;
    bool discarding_line_;

    std::shared_ptr<PendingHook> pending_;
    AcceptAction pending_accept_;
    RejectAction pending_reject_;
    std::chrono::steady_clock::time_point pending_since_;
    bool pumping_;
};

}  // namespace session
