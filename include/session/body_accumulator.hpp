/*
 * 설명: DATA 단계에서 본문 바이트를 모으고 패킷 경계에 걸친 CRLF "." CRLF 종결자를 찾는다.
 * 버전: v0.5.0
 * 관련 문서: DESIGN.md (Body Accumulator)
 * 테스트: tests/unit/body_accumulator_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace session {

struct BodyFeed {
    bool complete;
    // 스트리밍 모드에서 이번 호출로 본문임이 확정된 바이트.
    std::string emitted;
    // 종결자 뒤에 붙어 온 바이트. 명령 버퍼로 돌려보낸다.
    std::string remainder;

    BodyFeed() : complete(false) {}
};

class BodyAccumulator {
   public:
    BodyAccumulator();

    void Start(bool streaming, std::size_t max_body_bytes);
    BodyFeed Feed(const std::string &chunk);
    void Reset();

    const std::string &body() const { return body_; }
    std::string ReleaseBody();
    std::size_t received_bytes() const { return received_; }
    bool overflowed() const { return overflowed_; }
    bool streaming() const { return streaming_; }

   private:
    void Commit(const std::string &bytes, BodyFeed &out);

    // 아직 종결자의 일부일 수 있어 보류 중인 최대 4바이트.
    std::string window_;
    // window_ 앞부분 중 DATA 줄의 CRLF 를 대신하는 가상 바이트 수.
    std::size_t seed_;
    std::string body_;
    bool streaming_;
    std::size_t max_body_bytes_;
    std::size_t received_;
    bool overflowed_;
};

}  // namespace session
