/*
 * 설명: poll 기반 TCP 서버로 연결마다 SMTP 세션을 만들고, 훅 레지스트리를 세션에 넘기며,
 *       응답 큐 송신, 훅 타임아웃 검사, SIGHUP 설정 리로드, 다른 스레드의 작업 전달을 처리한다.
 * 버전: v0.7.0
 * 관련 문서: DESIGN.md (Server/Registry)
 * 테스트: tests/unit/server_test.cpp
 */
#pragma once

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <poll.h>
#include <string>
#include <vector>

#include "session/hooks.hpp"
#include "session/session.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

class ConnectionTransport;

struct ClientConnection {
    int fd;
    std::string peer;
    std::deque<std::string> outbound_queue;
    std::size_t send_offset;
    bool marked_close;
    std::unique_ptr<ConnectionTransport> transport;
    std::unique_ptr<session::Session> session;

    ClientConnection();
    ~ClientConnection();
};

class PollServer {
   public:
    PollServer(int port, const config::Settings &settings, const std::string &config_path);
    ~PollServer();

    // Run() 전에 등록한 핸들러가 이후 생성되는 모든 세션에 복사된다.
    session::HookRegistry &hooks() { return hooks_; }
    void Run();

    // 다른 스레드에서 호출해도 된다. task 는 poll 루프 스레드에서 실행된다.
    // 저장해 둔 Continuation 은 이 경로로 해결해야 세션과 경합하지 않는다.
    void Post(const std::function<void()> &task);

    // 이미 연결된 소켓에 세션을 붙인다. accept 루프와 임베딩 코드가 함께 쓴다.
    void AdoptConnection(int fd, const std::string &peer);
    // poll 한 번과 그 결과 처리. Run() 은 이것을 반복한다.
    void RunOnce(int timeout_ms);
    std::size_t client_count() const { return clients_.size(); }

   private:
    friend class ConnectionTransport;

    PollServer(const PollServer &);
    PollServer &operator=(const PollServer &);

    void SetupWakePipe();
    void SetupListeningSocket();
    void EventLoop();
    void HandleListeningEvent(short revents);
    void AcceptNewClients();
    void HandleClientRead(int fd);
    void HandleClientWrite(int fd);
    void CloseClient(int fd);
    void CloseIfDrained(int fd);
    void CloseDrainedClients();
    bool EnqueueResponse(int fd, const std::string &line);
    void MarkClose(int fd);
    void FailConnection(int fd, const std::string &reason);
    void UpdatePollWriteInterest(int fd);
    void RunPostedTasks();
    void CheckHookTimeouts();
    int PollTimeout() const;
    session::SessionOptions BuildSessionOptions() const;
    void ApplyConfig(const config::Settings &settings);
    bool ReloadConfig(std::string &error);
    void HandlePendingReload();

    int listen_fd_;
    int wake_fds_[2];
    int port_;
    unsigned long next_session_id_;
    std::vector<struct pollfd> poll_fds_;
    std::map<int, ClientConnection> clients_;
    session::HookRegistry hooks_;

    std::mutex posted_mutex_;
    std::deque<std::function<void()> > posted_;

    config::Settings config_;
    std::string config_path_;
    Logger logger_;
};
