/*
 * 설명: hook-smtpd 실행 진입점으로 설정 파일을 반영해 SMTP 서버를 초기화하고 실행한다.
 * 버전: v0.6.0
 * 관련 문서: DESIGN.md (Server/Registry, Configuration)
 * 테스트: tests/unit/config_parser_test.cpp
 */
#include <cstdlib>
#include <iostream>
#include <string>

#include "server.hpp"
#include "utils/config.hpp"

int main(int argc, char *argv[]) {
    if (argc != 2 && argc != 3) {
        std::cerr << "사용법: ./hook-smtpd <port> [config_path]\n";
        return 1;
    }

    int port = std::atoi(argv[1]);
    if (port <= 0 || port > 65535) {
        std::cerr << "포트 오류: " << argv[1] << "\n";
        return 1;
    }
    std::string config_path = argc == 3 ? argv[2] : "config/smtpd.ini";

    config::Settings settings;
    std::string error;
    if (!config::LoadFromFile(config_path, settings, error)) {
        std::cerr << "설정 파일 오류: " << error << "\n";
        return 1;
    }

    try {
        PollServer server(port, settings, config_path);
        server.Run();
    } catch (const std::exception &ex) {
        std::cerr << "서버 오류: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
