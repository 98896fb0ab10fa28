/*
 * 설명: INI 설정 파서가 기본값과 사용자 지정 값을 올바르게 해석하는지 확인한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md (Configuration)
 * 테스트: 이 파일 자체
 */
#include "utils/config.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

void TestDefaultsWhenFileMissing() {
    config::Settings settings;
    std::string error;
    bool ok = config::LoadFromFile("tests/unit/does_not_exist.ini", settings, error);
    assert(ok);
    assert(error.empty());
    assert(settings.hostname == "localhost");
    assert(settings.bind_address == "0.0.0.0");
    assert(settings.log_level == config::LogLevel::kInfo);
    assert(settings.log_file.empty());
    assert(settings.max_line_length == 1000);
    assert(settings.max_body_bytes == 0);
    assert(settings.outbound_lines == 64);
    assert(settings.hook_timeout_ms == 0);
}

void TestParseCustomValues() {
    const std::string path = "tests/unit/sample_config.ini";
    std::ofstream file(path.c_str());
    file << "# hook-smtpd\n";
    file << "[server]\n";
    file << "hostname=mx.example.org\n";
    file << "bind = 127.0.0.1\n";
    file << "[logging]\n";
    file << "level=debug\n";
    file << "file=logs/smtpd.log\n";
    file << "[limits]\n";
    file << "max_line_length=2048\n";
    file << "max_body_bytes=1048576\n";
    file << "outbound_lines=32\n";
    file << "; 5초\n";
    file << "hook_timeout_ms=5000\n";
    file.close();

    config::Settings settings;
    std::string error;
    bool ok = config::LoadFromFile(path, settings, error);
    assert(ok);
    assert(error.empty());
    assert(settings.hostname == "mx.example.org");
    assert(settings.bind_address == "127.0.0.1");
    assert(settings.log_level == config::LogLevel::kDebug);
    assert(settings.log_file == "logs/smtpd.log");
    assert(settings.max_line_length == 2048);
    assert(settings.max_body_bytes == 1048576);
    assert(settings.outbound_lines == 32);
    assert(settings.hook_timeout_ms == 5000);

    std::remove(path.c_str());
}

void ExpectRejected(const std::string &contents) {
    const std::string path = "tests/unit/bad_config.ini";
    std::ofstream file(path.c_str());
    file << contents;
    file.close();

    config::Settings settings;
    std::string error;
    bool ok = config::LoadFromFile(path, settings, error);
    assert(!ok);
    assert(!error.empty());

    std::remove(path.c_str());
}

void TestRejectInvalid() {
    ExpectRejected("[logging]\nlevel=verbose\n");
    ExpectRejected("[server]\nbind=256.0.0.1\n");
    ExpectRejected("[server]\nbind=localhost\n");
    ExpectRejected("[limits]\nmax_line_length=100\n");
    ExpectRejected("[limits]\noutbound_lines=0\n");
    ExpectRejected("[limits]\nmax_body_bytes=-1\n");
    ExpectRejected("hostname=orphan\n");
    ExpectRejected("[server]\nport=25\n");
}

int main() {
    TestDefaultsWhenFileMissing();
    TestParseCustomValues();
    TestRejectInvalid();
    return 0;
}
