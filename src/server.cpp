/*
 * 설명: poll 기반 TCP 서버를 구성하고 연결별 SMTP 세션에 수신 바이트, 스트림 종료, 오류를 전달하며
 *       세션 응답을 비동기 송신 큐로 내보낸다. 다른 스레드의 작업은 self-pipe 로 루프를 깨워 실행한다.
 * 버전: v0.7.0
 * 관련 문서: DESIGN.md (Server/Registry)
 * 테스트: tests/unit/server_test.cpp
 */
#include "server.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <csignal>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace {
const int kListenBacklog = 64;
const int kTimeoutTickMs = 250;
volatile std::sig_atomic_t g_reload_requested = 0;

void HandleSighup(int) { g_reload_requested = 1; }

std::string FormatPeer(const sockaddr_in &addr) {
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf)) == NULL) {
        return "unknown";
    }
    return buf;
}
}  // namespace

// 세션이 보는 연결. Close() 는 즉시 닫지 않고 송신 큐를 비운 뒤 닫도록 표시만 한다.
class ConnectionTransport : public session::Transport {
   public:
    ConnectionTransport(PollServer *server, int fd, const std::string &peer)
        : server_(server), fd_(fd), peer_(peer) {}

    void Send(const std::string &line) {
        if (!server_->EnqueueResponse(fd_, line)) {
            server_->logger_.Log(config::LogLevel::kWarn, "송신 큐 초과, 연결 종료: " + peer_);
            server_->FailConnection(fd_, "outbound queue full");
        }
    }
    void Close() { server_->MarkClose(fd_); }
    std::string PeerAddress() const { return peer_; }

   private:
    PollServer *server_;
    int fd_;
    std::string peer_;
};

ClientConnection::ClientConnection() : fd(-1), send_offset(0), marked_close(false) {}

ClientConnection::~ClientConnection() {}

PollServer::PollServer(int port, const config::Settings &settings, const std::string &config_path)
    : listen_fd_(-1), port_(port), next_session_id_(1), config_path_(config_path) {
    wake_fds_[0] = -1;
    wake_fds_[1] = -1;
    ApplyConfig(settings);
    SetupWakePipe();
}

PollServer::~PollServer() {
    for (std::map<int, ClientConnection>::iterator it = clients_.begin(); it != clients_.end();
         ++it) {
        close(it->first);
    }
    clients_.clear();
    if (listen_fd_ >= 0) {
        close(listen_fd_);
    }
    if (wake_fds_[0] >= 0) {
        close(wake_fds_[0]);
    }
    if (wake_fds_[1] >= 0) {
        close(wake_fds_[1]);
    }
}

void PollServer::Run() {
    std::signal(SIGHUP, HandleSighup);
    std::signal(SIGPIPE, SIG_IGN);
    SetupListeningSocket();
    logger_.Log(config::LogLevel::kInfo, "SMTP 수신 대기: " + config_.bind_address + ":" +
                                             std::to_string(port_) + " 호스트명=" +
                                             config_.hostname);
    EventLoop();
}

void PollServer::SetupWakePipe() {
    if (pipe(wake_fds_) < 0) {
        throw std::runtime_error(std::string("wake pipe 생성 실패: ") + std::strerror(errno));
    }
    for (int i = 0; i < 2; ++i) {
        int flags = fcntl(wake_fds_[i], F_GETFL, 0);
        if (flags >= 0) {
            fcntl(wake_fds_[i], F_SETFL, flags | O_NONBLOCK);
        }
    }

    struct pollfd pfd;
    pfd.fd = wake_fds_[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    poll_fds_.push_back(pfd);
}

void PollServer::SetupListeningSocket() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error("소켓 생성 실패");
    }

    int flags = fcntl(listen_fd_, F_GETFL, 0);
    fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK);

    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("바인드 주소 오류: " + config_.bind_address);
    }

    if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error(std::string("바인드 실패: ") + std::strerror(errno));
    }

    if (listen(listen_fd_, kListenBacklog) < 0) {
        throw std::runtime_error("리스닝 실패");
    }

    struct pollfd pfd;
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    poll_fds_.push_back(pfd);
}

void PollServer::EventLoop() {
    while (true) {
        HandlePendingReload();
        RunOnce(PollTimeout());
    }
}

void PollServer::RunOnce(int timeout_ms) {
    int ret = poll(poll_fds_.data(), poll_fds_.size(), timeout_ms);
    if (ret < 0) {
        if (errno == EINTR) {
            return;
        }
        throw std::runtime_error("poll 실패");
    }

    for (std::size_t i = 0; i < poll_fds_.size(); ++i) {
        struct pollfd pfd = poll_fds_[i];
        if (pfd.revents == 0) {
            continue;
        }

        if (pfd.fd == listen_fd_) {
            HandleListeningEvent(pfd.revents);
            poll_fds_[i].revents = 0;
            continue;
        }

        if (pfd.fd == wake_fds_[0]) {
            char drain[64];
            while (read(wake_fds_[0], drain, sizeof(drain)) > 0) {
            }
            poll_fds_[i].revents = 0;
            continue;
        }

        if (pfd.revents & (POLLERR | POLLNVAL)) {
            std::map<int, ClientConnection>::iterator it = clients_.find(pfd.fd);
            if (it != clients_.end() && it->second.session) {
                it->second.session->OnTransportError("poll error");
            }
            CloseClient(pfd.fd);
            --i;
            continue;
        }

        // POLLHUP 이어도 남은 바이트를 먼저 읽고 recv()==0 으로 종료를 처리한다.
        if (pfd.revents & (POLLIN | POLLHUP)) {
            HandleClientRead(pfd.fd);
        }
        if (clients_.find(pfd.fd) != clients_.end() && (pfd.revents & POLLOUT)) {
            HandleClientWrite(pfd.fd);
        }

        if (clients_.find(pfd.fd) == clients_.end()) {
            --i;
        } else {
            poll_fds_[i].revents = 0;
        }
    }

    // 깨우기 바이트가 유실돼도 다음 회차에서 실행되도록 매 회차 큐를 확인한다.
    RunPostedTasks();
    CheckHookTimeouts();
}

void PollServer::Post(const std::function<void()> &task) {
    {
        std::lock_guard<std::mutex> lock(posted_mutex_);
        posted_.push_back(task);
    }
    // EAGAIN 은 pipe 에 깨우기 바이트가 이미 쌓여 있다는 뜻이다.
    const char byte = 1;
    while (write(wake_fds_[1], &byte, 1) < 0 && errno == EINTR) {
    }
}

void PollServer::RunPostedTasks() {
    std::deque<std::function<void()> > tasks;
    {
        std::lock_guard<std::mutex> lock(posted_mutex_);
        tasks.swap(posted_);
    }
    if (tasks.empty()) {
        return;
    }
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        tasks[i]();
    }
    CloseDrainedClients();
}

void PollServer::HandleListeningEvent(short revents) {
    if (revents & POLLIN) {
        AcceptNewClients();
    }
}

void PollServer::AcceptNewClients() {
    while (true) {
        sockaddr_in client_addr;
        socklen_t len = sizeof(client_addr);
        int client_fd = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            logger_.Log(config::LogLevel::kWarn,
                        std::string("accept 실패: ") + std::strerror(errno));
            break;
        }

        AdoptConnection(client_fd, FormatPeer(client_addr));
    }
}

void PollServer::AdoptConnection(int fd, const std::string &peer) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    poll_fds_.push_back(pfd);

    ClientConnection &conn = clients_[fd];
    conn.fd = fd;
    conn.peer = peer;
    conn.transport.reset(new ConnectionTransport(this, fd, conn.peer));
    conn.session.reset(new session::Session(next_session_id_++, *conn.transport,
                                            BuildSessionOptions(), hooks_, &logger_));
    conn.session->Start();
    CloseIfDrained(fd);
}

void PollServer::HandleClientRead(int fd) {
    char buf[4096];
    while (true) {
        std::map<int, ClientConnection>::iterator it = clients_.find(fd);
        if (it == clients_.end()) {
            return;
        }
        ClientConnection &conn = it->second;
        if (conn.marked_close) {
            CloseIfDrained(fd);
            return;
        }

        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            conn.session->Receive(std::string(buf, static_cast<std::size_t>(n)));
        } else if (n == 0) {
            conn.session->OnEndOfStream();
            CloseClient(fd);
            return;
        } else {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            conn.session->OnTransportError(std::strerror(errno));
            CloseClient(fd);
            return;
        }
    }
    CloseIfDrained(fd);
}

void PollServer::HandleClientWrite(int fd) {
    ClientConnection &conn = clients_[fd];
    while (!conn.outbound_queue.empty()) {
        std::string &front = conn.outbound_queue.front();
        const char *data = front.c_str() + conn.send_offset;
        std::size_t remaining = front.size() - conn.send_offset;

        ssize_t n = send(fd, data, remaining, 0);
        if (n > 0) {
            conn.send_offset += static_cast<std::size_t>(n);
            if (conn.send_offset >= front.size()) {
                conn.outbound_queue.pop_front();
                conn.send_offset = 0;
            }
        } else {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            conn.session->OnTransportError(std::strerror(errno));
            CloseClient(fd);
            return;
        }
    }

    UpdatePollWriteInterest(fd);
    CloseIfDrained(fd);
}

void PollServer::CloseClient(int fd) {
    std::map<int, ClientConnection>::iterator it = clients_.find(fd);
    if (it != clients_.end()) {
        // 세션이 스스로 끝나지 않았다면 종료 관찰자가 한 번은 불리도록 여기서 끝낸다.
        if (it->second.session && it->second.session->state() != session::SessionState::kClosed) {
            it->second.session->OnTransportError("connection closed");
        }
        close(fd);
        clients_.erase(it);
    }

    for (std::size_t i = 0; i < poll_fds_.size(); ++i) {
        if (poll_fds_[i].fd == fd) {
            poll_fds_[i] = poll_fds_.back();
            poll_fds_.pop_back();
            break;
        }
    }
}

void PollServer::CloseIfDrained(int fd) {
    std::map<int, ClientConnection>::iterator it = clients_.find(fd);
    if (it == clients_.end()) {
        return;
    }
    if (it->second.marked_close && it->second.outbound_queue.empty()) {
        CloseClient(fd);
    }
}

void PollServer::CloseDrainedClients() {
    std::vector<int> fds;
    for (std::map<int, ClientConnection>::iterator it = clients_.begin(); it != clients_.end();
         ++it) {
        fds.push_back(it->first);
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
        CloseIfDrained(fds[i]);
    }
}

bool PollServer::EnqueueResponse(int fd, const std::string &line) {
    ClientConnection &conn = clients_[fd];
    if (conn.outbound_queue.size() >= config_.outbound_lines) {
        return false;
    }
    conn.outbound_queue.push_back(line + "\r\n");
    UpdatePollWriteInterest(fd);
    return true;
}

void PollServer::MarkClose(int fd) {
    std::map<int, ClientConnection>::iterator it = clients_.find(fd);
    if (it != clients_.end()) {
        it->second.marked_close = true;
    }
}

// 세션을 곧바로 끝내 종료 관찰자와 로그가 남게 한다. 이미 쌓인 응답은 보낸 뒤 닫는다.
void PollServer::FailConnection(int fd, const std::string &reason) {
    std::map<int, ClientConnection>::iterator it = clients_.find(fd);
    if (it == clients_.end()) {
        return;
    }
    it->second.marked_close = true;
    if (it->second.session && it->second.session->state() != session::SessionState::kClosed) {
        it->second.session->OnTransportError(reason);
    }
}

void PollServer::UpdatePollWriteInterest(int fd) {
    for (std::size_t i = 0; i < poll_fds_.size(); ++i) {
        if (poll_fds_[i].fd == fd) {
            poll_fds_[i].events = POLLIN;
            if (!clients_[fd].outbound_queue.empty()) {
                poll_fds_[i].events |= POLLOUT;
            }
            poll_fds_[i].revents = 0;
            return;
        }
    }
}

void PollServer::CheckHookTimeouts() {
    if (config_.hook_timeout_ms == 0) {
        return;
    }
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
    std::chrono::milliseconds timeout(static_cast<long long>(config_.hook_timeout_ms));

    std::vector<int> fds;
    for (std::map<int, ClientConnection>::iterator it = clients_.begin(); it != clients_.end();
         ++it) {
        fds.push_back(it->first);
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
        std::map<int, ClientConnection>::iterator it = clients_.find(fds[i]);
        if (it == clients_.end() || !it->second.session) {
            continue;
        }
        it->second.session->ExpirePendingHook(now, timeout);
        CloseIfDrained(fds[i]);
    }
}

int PollServer::PollTimeout() const {
    if (config_.hook_timeout_ms == 0) {
        return -1;
    }
    if (config_.hook_timeout_ms < static_cast<std::size_t>(kTimeoutTickMs)) {
        return static_cast<int>(config_.hook_timeout_ms);
    }
    return kTimeoutTickMs;
}

session::SessionOptions PollServer::BuildSessionOptions() const {
    session::SessionOptions options;
    options.hostname = config_.hostname;
    options.max_line_length = config_.max_line_length;
    options.max_body_bytes = config_.max_body_bytes;
    return options;
}

void PollServer::ApplyConfig(const config::Settings &settings) {
    config_ = settings;
    logger_.SetLevel(config_.log_level);
    logger_.SetOutput(config_.log_file);
}

bool PollServer::ReloadConfig(std::string &error) {
    config::Settings updated;
    if (!config::LoadFromFile(config_path_, updated, error)) {
        return false;
    }
    // 이미 바인드한 주소는 바꿀 수 없다.
    updated.bind_address = config_.bind_address;
    ApplyConfig(updated);
    return true;
}

void PollServer::HandlePendingReload() {
    if (!g_reload_requested) {
        return;
    }
    g_reload_requested = 0;

    std::string error;
    if (!ReloadConfig(error)) {
        logger_.Log(config::LogLevel::kWarn, "SIGHUP 리로드 실패: " + error);
        return;
    }
    std::ostringstream oss;
    oss << "SIGHUP 리로드 성공: 호스트명=" << config_.hostname
        << " 레벨=" << config::LogLevelToString(config_.log_level)
        << " 본문한도=" << config_.max_body_bytes;
    logger_.Log(config::LogLevel::kInfo, oss.str());
}
