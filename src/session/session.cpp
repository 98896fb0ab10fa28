/*
 * 설명: 세션 상태 기계. 명령 줄을 식별해 순서 조건을 검사하고, 등록된 훅이 있으면 Continuation 이
 *       해결될 때까지 입력 해석을 멈췄다가 기본 동작과 같은 효과를 적용한 뒤 응답한다.
 * 버전: v0.7.0
 * 관련 문서: DESIGN.md (Session State Machine, Body Accumulator)
 * 테스트: tests/unit/session_test.cpp
 */
#include "session/session.hpp"

#include <exception>
#include <sstream>

#include "protocol/command.hpp"
#include "protocol/framer.hpp"
#include "utils/logger.hpp"

namespace session {

namespace {
const char kDataPrompt[] = "354 Terminate with line containing only '.'";
const char kBadAddress[] = "keep address simpler, only user@host.domain is supported";

std::string StatusLine(int status_code, const std::string &message) {
    std::ostringstream oss;
    oss << status_code << " " << message;
    return oss.str();
}
}  // namespace

SessionOptions::SessionOptions() : hostname("localhost"), max_line_length(1000), max_body_bytes(0) {}

Session::Session(unsigned long id, Transport &transport, const SessionOptions &options,
                 const HookRegistry &hooks, Logger *logger)
    : id_(id),
      transport_(transport),
      options_(options),
      hooks_(hooks),
      logger_(logger),
      peer_(transport.PeerAddress()),
      streaming_(hooks.Has(HookEvent::kDataAvailable)),
      state_(SessionState::kInit),
      greeting_kind_(GreetingKind::kNone),
      esmtp_(false),
      has_from_(false),
      body_finished_(false),
      body_rejected_(false),
      stream_overflow_(false),
      discarding_line_(false),
      pumping_(false) {}

Session::~Session() { DropPendingHook(); }

void Session::Start() {
    if (state_ != SessionState::kInit || pending_) {
        return;
    }
    LogEvent(config::LogLevel::kInfo, "connect", "peer=" + peer_);
    RunHook(HookEvent::kConnect, peer_,
            [this](const HookAccept &) { SendGreeting(); },
            // 거절 후에도 QUIT 는 받을 수 있어야 한다.
            [this]() { state_ = SessionState::kAwaitCommand; });
    Pump();
}

void Session::Receive(const std::string &bytes) {
    if (state_ == SessionState::kClosed) {
        return;
    }
    input_.append(bytes);
    if (state_ == SessionState::kInData && streaming_ && pending_ && !body_finished_ &&
        options_.max_body_bytes != 0 && input_.size() > options_.max_body_bytes) {
        // 스트리밍 핸들러가 밀려 있으면 본문을 포기하고 종결자만 찾는다.
        if (!stream_overflow_) {
            LogEvent(config::LogLevel::kWarn, "stream_overflow", "");
        }
        stream_overflow_ = true;
        stream_queue_.clear();
        FeedBody();
    }
    Pump();
}

void Session::OnEndOfStream() { Terminate("end of stream"); }

void Session::OnTransportError(const std::string &reason) { Terminate("transport error: " + reason); }

bool Session::ExpirePendingHook(std::chrono::steady_clock::time_point now,
                                std::chrono::milliseconds timeout) {
    if (!pending_ || timeout.count() <= 0) {
        return false;
    }
    if (now - pending_since_ < timeout) {
        return false;
    }
    LogEvent(config::LogLevel::kWarn, "hook_timeout", HookEventName(pending_->event));
    std::shared_ptr<PendingHook> expired = pending_;
    expired->resolved = true;
    ResolveHook(expired.get(), false, HookAccept(), HookReject("hook timed out", false, 451));
    return true;
}

// 훅 대기 중에는 입력을 쌓기만 하고 해석하지 않으므로 명령 순서가 바뀌지 않는다.
void Session::Pump() {
    if (pumping_) {
        return;
    }
    pumping_ = true;
    while (state_ != SessionState::kClosed && !pending_) {
        if (state_ == SessionState::kInit) {
            break;
        }
        if (state_ == SessionState::kInData) {
            if (!stream_queue_.empty()) {
                std::string chunk = stream_queue_.front();
                stream_queue_.pop_front();
                DispatchStreamChunk(chunk);
                continue;
            }
            if (body_finished_) {
                FinishBody();
                continue;
            }
            if (input_.empty()) {
                break;
            }
            FeedBody();
            continue;
        }

        if (discarding_line_) {
            if (!protocol::SkipToLineEnd(input_)) {
                break;
            }
            discarding_line_ = false;
            continue;
        }
        protocol::LineResult res = protocol::ExtractLine(input_, options_.max_line_length);
        if (res.line_too_long) {
            // 현재 명령만 실패한다. 잘린 줄의 꼬리는 새 명령으로 읽지 않는다.
            discarding_line_ = res.line_cut;
            SendError(500, "line too long");
            continue;
        }
        if (!res.complete) {
            break;
        }
        ProcessLine(res.line);
    }
    pumping_ = false;
}

void Session::ProcessLine(const std::string &line) {
    protocol::CommandId command = protocol::RecognizeCommand(line);
    LogEvent(config::LogLevel::kDebug, "command",
             command == protocol::CommandId::kUnrecognized ? "unrecognized"
                                                           : protocol::CommandKeyword(command));

    switch (command) {
        case protocol::CommandId::kEhlo:
            HandleEhlo(line);
            return;
        case protocol::CommandId::kHelo:
            HandleHelo(line);
            return;
        case protocol::CommandId::kMailFrom:
            HandleMailFrom(line);
            return;
        case protocol::CommandId::kRcptTo:
            HandleRcptTo(line);
            return;
        case protocol::CommandId::kData:
            HandleData();
            return;
        case protocol::CommandId::kQuit:
            Quit();
            return;
        case protocol::CommandId::kNoop:
            SendOk();
            return;
        case protocol::CommandId::kRset:
            HandleRset();
            return;
        case protocol::CommandId::kVrfy:
        case protocol::CommandId::kExpn:
        case protocol::CommandId::kHelp:
        case protocol::CommandId::kStartTls:
        case protocol::CommandId::kAuth:
        case protocol::CommandId::kUnrecognized:
            break;
    }
    SendReply("500 not supported");
}

void Session::HandleEhlo(const std::string &line) {
    const std::string host = protocol::ExtractArgument("EHLO", line);
    RunHook(HookEvent::kEhlo, host,
            [this, host](const HookAccept &accept) {
                helo_host_ = accept.has_override ? accept.override_value : host;
                greeting_kind_ = GreetingKind::kEhlo;
                esmtp_ = true;
                SendReply("250-" + options_.hostname + " Hello " + peer_);
                for (std::size_t i = 0; i < accept.capabilities.size(); ++i) {
                    SendReply("250-" + accept.capabilities[i]);
                }
                SendReply("250 8BITMIME");
            },
            RejectAction());
}

void Session::HandleHelo(const std::string &line) {
    const std::string host = protocol::ExtractArgument("HELO", line);
    RunHook(HookEvent::kHelo, host,
            [this, host](const HookAccept &accept) {
                helo_host_ = accept.has_override ? accept.override_value : host;
                greeting_kind_ = GreetingKind::kHelo;
                SendReply("250 " + options_.hostname + " Hello " + peer_);
            },
            RejectAction());
}

void Session::HandleMailFrom(const std::string &line) {
    if (greeting_kind_ == GreetingKind::kNone) {
        SendError(503, "we require greeting");
        return;
    }
    const std::string address =
        protocol::StripAngleBrackets(protocol::ExtractArgument("MAIL FROM:", line));
    if (!protocol::IsAcceptableAddress(address)) {
        SendError(501, kBadAddress);
        return;
    }
    RunHook(HookEvent::kMailFrom, address,
            [this, address](const HookAccept &accept) {
                from_address_ = accept.has_override ? accept.override_value : address;
                has_from_ = true;
                SendOk();
            },
            RejectAction());
}

void Session::HandleRcptTo(const std::string &line) {
    if (!has_from_) {
        SendError(503, "provide sender first");
        return;
    }
    const std::string address =
        protocol::StripAngleBrackets(protocol::ExtractArgument("RCPT TO:", line));
    if (!protocol::IsAcceptableAddress(address)) {
        SendError(501, kBadAddress);
        return;
    }
    RunHook(HookEvent::kRcptTo, address,
            [this, address](const HookAccept &accept) {
                recipients_.push_back(accept.has_override ? accept.override_value : address);
                SendOk();
            },
            RejectAction());
}

void Session::HandleData() {
    if (recipients_.empty()) {
        SendError(503, "need recipient");
        return;
    }
    RunHook(HookEvent::kData, "", [this](const HookAccept &) { StartBody(); }, RejectAction());
}

void Session::HandleRset() {
    has_from_ = false;
    from_address_.clear();
    recipients_.clear();
    SendOk();
}

void Session::RunHook(HookEvent event, const std::string &argument, const AcceptAction &on_accept,
                      const RejectAction &on_reject) {
    const HookHandler *handler = hooks_.Find(event);
    if (handler == NULL) {
        on_accept(HookAccept());
        return;
    }

    std::shared_ptr<PendingHook> pending =
        std::make_shared<PendingHook>(event, this, logger_, id_);
    pending_ = pending;
    pending_accept_ = on_accept;
    pending_reject_ = on_reject;
    pending_since_ = std::chrono::steady_clock::now();
    LogEvent(config::LogLevel::kDebug, "hook", HookEventName(event));

    try {
        (*handler)(argument, Continuation(pending), *this);
    } catch (const std::exception &ex) {
        LogEvent(config::LogLevel::kWarn, "hook_exception",
                 HookEventName(event) + ": " + ex.what());
        if (!pending->resolved) {
            pending->resolved = true;
            ResolveHook(pending.get(), false, HookAccept(),
                        HookReject("local error in processing", false, 451));
        }
    }
}

void Session::ResolveHook(PendingHook *pending, bool accepted, const HookAccept &accept,
                          const HookReject &reject) {
    if (pending == NULL || pending_.get() != pending) {
        return;
    }
    pending->session = NULL;
    pending_.reset();
    AcceptAction on_accept;
    RejectAction on_reject;
    on_accept.swap(pending_accept_);
    on_reject.swap(pending_reject_);

    if (accepted) {
        LogEvent(config::LogLevel::kDebug, "hook_accept", HookEventName(pending->event));
        on_accept(accept);
    } else {
        std::ostringstream detail;
        detail << HookEventName(pending->event) << " status=" << reject.status_code
               << " close=" << (reject.close_connection ? "yes" : "no");
        LogEvent(config::LogLevel::kInfo, "hook_reject", detail.str());
        if (on_reject) {
            on_reject();
        }
        SendError(reject.status_code, reject.message);
        if (reject.close_connection) {
            Quit();
        }
    }
    Pump();
}

void Session::DropPendingHook() {
    if (pending_) {
        pending_->session = NULL;
        pending_.reset();
    }
    pending_accept_ = AcceptAction();
    pending_reject_ = RejectAction();
}

void Session::StartBody() {
    ResetDataState();
    body_.clear();
    accumulator_.Start(streaming_, options_.max_body_bytes);
    state_ = SessionState::kInData;
    SendReply(kDataPrompt);
}

void Session::FeedBody() {
    std::string chunk;
    chunk.swap(input_);
    BodyFeed feed = accumulator_.Feed(chunk);

    if (streaming_ && !body_rejected_ && !stream_overflow_) {
        // 마지막 호출은 비어 있어도 보내 스트리밍 핸들러가 끝을 알 수 있게 한다.
        if (feed.complete || !feed.emitted.empty()) {
            stream_queue_.push_back(feed.emitted);
        }
    }
    if (feed.complete) {
        residual_ = feed.emitted;
        body_finished_ = true;
        input_ = feed.remainder;
    }
}

void Session::DispatchStreamChunk(const std::string &chunk) {
    RunHook(HookEvent::kDataAvailable, chunk, [](const HookAccept &) {},
            [this]() {
                // 나머지 본문은 종결자까지 읽고 버린다. 응답은 이 거절로 끝난다.
                body_rejected_ = true;
                stream_queue_.clear();
            });
}

void Session::FinishBody() {
    body_finished_ = false;
    if (body_rejected_) {
        EndBody();
        return;
    }
    if (accumulator_.overflowed() || stream_overflow_) {
        LogEvent(config::LogLevel::kWarn, "body_overflow", "");
        EndBody();
        SendError(552, "message size exceeds fixed maximum");
        return;
    }

    std::size_t received = accumulator_.received_bytes();
    if (!streaming_) {
        body_ = accumulator_.ReleaseBody();
    }
    const std::string argument = streaming_ ? residual_ : body_;
    RunHook(HookEvent::kDataEnd, argument,
            [this, received](const HookAccept &) {
                std::ostringstream detail;
                detail << "bytes=" << received << " recipients=" << recipients_.size();
                LogEvent(config::LogLevel::kInfo, "message", detail.str());
                EndBody();
                SendOk();
            },
            [this]() { EndBody(); });
}

void Session::EndBody() {
    ResetDataState();
    state_ = SessionState::kAwaitCommand;
}

void Session::ResetDataState() {
    accumulator_.Reset();
    stream_queue_.clear();
    residual_.clear();
    body_finished_ = false;
    body_rejected_ = false;
    stream_overflow_ = false;
}

void Session::SendReply(const std::string &line) {
    if (state_ == SessionState::kClosed) {
        return;
    }
    LogEvent(config::LogLevel::kDebug, "reply", line);
    transport_.Send(line);
}

void Session::SendOk() { SendReply("250 OK"); }

void Session::SendError(int status_code, const std::string &message) {
    SendReply(StatusLine(status_code, message));
}

void Session::SendGreeting() {
    state_ = SessionState::kAwaitCommand;
    SendReply("220 " + options_.hostname + " ESMTP hook-smtpd");
}

void Session::Quit() {
    SendReply("221 " + options_.hostname + " closing connection");
    Terminate("quit");
}

void Session::Terminate(const std::string &reason) {
    if (state_ == SessionState::kClosed) {
        return;
    }
    state_ = SessionState::kClosed;
    DropPendingHook();
    input_.clear();
    discarding_line_ = false;
    ResetDataState();
    LogEvent(config::LogLevel::kInfo, "end", reason);
    transport_.Close();

    const EndObserver &observer = hooks_.end_observer();
    if (observer) {
        observer(*this);
    }
}

void Session::LogEvent(config::LogLevel level, const std::string &event,
                       const std::string &detail) const {
    if (logger_ == NULL) {
        return;
    }
    logger_->LogEvent(level, id_, event, detail);
}

}  // namespace session
