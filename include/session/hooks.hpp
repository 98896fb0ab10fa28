/*
 * 설명: 프로토콜 이정표(connect/ehlo/helo/mail_from/rcpt_to/data/data_available/data_end)마다
 *       외부 핸들러가 수락/거절을 결정하는 훅 레지스트리와 일회용 Continuation 을 정의한다.
 * 버전: v0.5.0
 * 관련 문서: DESIGN.md (Hook Continuation Protocol)
 * 테스트: tests/unit/hooks_test.cpp, tests/unit/session_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class Logger;

namespace session {

class Session;

enum class HookEvent {
    kConnect = 0,
    kEhlo,
    kHelo,
    kMailFrom,
    kRcptTo,
    kData,
    kDataAvailable,
    kDataEnd
};

const std::size_t kHookEventCount = 8;

std::string HookEventName(HookEvent event);

struct HookAccept {
    bool has_override;
    std::string override_value;
    // EHLO 전용: 250 8BITMIME 앞에 끼워 넣을 확장 줄.
    std::vector<std::string> capabilities;

    HookAccept();
};

struct HookReject {
    std::string message;
    int status_code;
    bool close_connection;

    HookReject();
    HookReject(const std::string &msg, bool close, int status = 500);
};

// 세션과 Continuation 이 공유하는 대기 상태. 세션이 사라지면 session 은 NULL 이 된다.
struct PendingHook {
    HookEvent event;
    bool resolved;
    Session *session;
    Logger *logger;
    unsigned long session_id;

    PendingHook(HookEvent ev, Session *owner, Logger *log, unsigned long id);
};

class Continuation {
   public:
    explicit Continuation(const std::shared_ptr<PendingHook> &pending);

    // 첫 번째 해결만 효력이 있다. 이후 호출이나 세션 종료 후 호출은 false 를 돌려준다.
    bool Accept();
    bool Accept(const std::string &override_value);
    bool Accept(const HookAccept &accept);
    bool Reject(const std::string &message, bool close_connection = false, int status_code = 500);
    bool Reject(const HookReject &reject);

    bool resolved() const;
    HookEvent event() const;

   private:
    bool Resolve(bool accepted, const HookAccept &accept, const HookReject &reject);

    std::shared_ptr<PendingHook> pending_;
};

typedef std::function<void(const std::string &argument, Continuation continuation, Session &session)>
    HookHandler;
typedef std::function<void(Session &session)> EndObserver;

class HookRegistry {
   public:
    void Register(HookEvent event, const HookHandler &handler);
    void Unregister(HookEvent event);
    bool Has(HookEvent event) const;
    const HookHandler *Find(HookEvent event) const;

    void SetEndObserver(const EndObserver &observer);
    const EndObserver &end_observer() const;

   private:
    HookHandler handlers_[kHookEventCount];
    EndObserver end_observer_;
};

}  // namespace session
