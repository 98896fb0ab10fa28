/*
 * 설명: 훅 레지스트리 조회와 Continuation 의 일회성 해결 규칙을 구현한다.
 * 버전: v0.5.0
 * 관련 문서: DESIGN.md (Hook Continuation Protocol)
 * 테스트: tests/unit/hooks_test.cpp
 */
#include "session/hooks.hpp"

#include "session/session.hpp"
#include "utils/logger.hpp"

namespace session {

std::string HookEventName(HookEvent event) {
    switch (event) {
        case HookEvent::kConnect:
            return "connect";
        case HookEvent::kEhlo:
            return "ehlo";
        case HookEvent::kHelo:
            return "helo";
        case HookEvent::kMailFrom:
            return "mail_from";
        case HookEvent::kRcptTo:
            return "rcpt_to";
        case HookEvent::kData:
            return "data";
        case HookEvent::kDataAvailable:
            return "data_available";
        case HookEvent::kDataEnd:
            return "data_end";
    }
    return "unknown";
}

HookAccept::HookAccept() : has_override(false) {}

HookReject::HookReject() : status_code(500), close_connection(false) {}

HookReject::HookReject(const std::string &msg, bool close, int status)
    : message(msg), status_code(status), close_connection(close) {}

PendingHook::PendingHook(HookEvent ev, Session *owner, Logger *log, unsigned long id)
    : event(ev), resolved(false), session(owner), logger(log), session_id(id) {}

Continuation::Continuation(const std::shared_ptr<PendingHook> &pending) : pending_(pending) {}

bool Continuation::Accept() { return Resolve(true, HookAccept(), HookReject()); }

bool Continuation::Accept(const std::string &override_value) {
    HookAccept accept;
    accept.has_override = true;
    accept.override_value = override_value;
    return Resolve(true, accept, HookReject());
}

bool Continuation::Accept(const HookAccept &accept) { return Resolve(true, accept, HookReject()); }

bool Continuation::Reject(const std::string &message, bool close_connection, int status_code) {
    return Resolve(false, HookAccept(), HookReject(message, close_connection, status_code));
}

bool Continuation::Reject(const HookReject &reject) { return Resolve(false, HookAccept(), reject); }

bool Continuation::resolved() const { return !pending_ || pending_->resolved; }

HookEvent Continuation::event() const {
    return pending_ ? pending_->event : HookEvent::kConnect;
}

bool Continuation::Resolve(bool accepted, const HookAccept &accept, const HookReject &reject) {
    std::shared_ptr<PendingHook> pending = pending_;
    if (!pending) {
        return false;
    }
    if (pending->resolved) {
        if (pending->logger != NULL) {
            pending->logger->LogEvent(config::LogLevel::kWarn, pending->session_id,
                                      "hook_double_resolve", HookEventName(pending->event));
        }
        return false;
    }
    pending->resolved = true;
    if (pending->session == NULL) {
        return false;
    }
    pending->session->ResolveHook(pending.get(), accepted, accept, reject);
    return true;
}

void HookRegistry::Register(HookEvent event, const HookHandler &handler) {
    handlers_[static_cast<std::size_t>(event)] = handler;
}

void HookRegistry::Unregister(HookEvent event) {
    handlers_[static_cast<std::size_t>(event)] = HookHandler();
}

bool HookRegistry::Has(HookEvent event) const {
    return static_cast<bool>(handlers_[static_cast<std::size_t>(event)]);
}

const HookHandler *HookRegistry::Find(HookEvent event) const {
    const HookHandler &handler = handlers_[static_cast<std::size_t>(event)];
    if (!handler) {
        return NULL;
    }
    return &handler;
}

void HookRegistry::SetEndObserver(const EndObserver &observer) { end_observer_ = observer; }

const EndObserver &HookRegistry::end_observer() const { return end_observer_; }

}  // namespace session
