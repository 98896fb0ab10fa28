/*
 * 설명: 보류 창(window)과 새 조각을 이어 붙여 종결자를 검사하므로 조각 수와 무관하게
 *       분할된 종결자를 찾는다. 본문에는 종결자를 여는 CRLF 가 포함되지 않는다.
 * 버전: v0.5.0
 * 관련 문서: DESIGN.md (Body Accumulator)
 * 테스트: tests/unit/body_accumulator_test.cpp
 */
#include "session/body_accumulator.hpp"

#include <algorithm>

namespace session {

namespace {
const char kTerminator[] = "\r\n.\r\n";
const std::size_t kTerminatorLength = 5;
const std::size_t kWindowLength = kTerminatorLength - 1;
}  // namespace

BodyAccumulator::BodyAccumulator()
    : seed_(0), streaming_(false), max_body_bytes_(0), received_(0), overflowed_(false) {}

void BodyAccumulator::Start(bool streaming, std::size_t max_body_bytes) {
    Reset();
    streaming_ = streaming;
    max_body_bytes_ = max_body_bytes;
    // DATA 명령 줄을 끝낸 CRLF. 빈 본문(".\r\n")도 종결자로 인식된다.
    window_ = "\r\n";
    seed_ = 2;
}

BodyFeed BodyAccumulator::Feed(const std::string &chunk) {
    BodyFeed out;
    std::string combined = window_ + chunk;

    std::size_t pos = combined.find(kTerminator, 0, kTerminatorLength);
    if (pos != std::string::npos) {
        Commit(combined.substr(0, pos), out);
        out.remainder = combined.substr(pos + kTerminatorLength);
        out.complete = true;
        window_.clear();
        seed_ = 0;
        return out;
    }

    std::size_t keep = std::min(combined.size(), kWindowLength);
    Commit(combined.substr(0, combined.size() - keep), out);
    window_ = combined.substr(combined.size() - keep);
    return out;
}

void BodyAccumulator::Reset() {
    window_.clear();
    seed_ = 0;
    body_.clear();
    streaming_ = false;
    max_body_bytes_ = 0;
    received_ = 0;
    overflowed_ = false;
}

std::string BodyAccumulator::ReleaseBody() {
    std::string released;
    released.swap(body_);
    return released;
}

void BodyAccumulator::Commit(const std::string &bytes, BodyFeed &out) {
    std::size_t skip = std::min(seed_, bytes.size());
    seed_ -= skip;
    if (skip == bytes.size()) {
        return;
    }
    received_ += bytes.size() - skip;

    if (streaming_) {
        out.emitted.append(bytes, skip, std::string::npos);
        return;
    }
    if (overflowed_) {
        return;
    }
    if (max_body_bytes_ != 0 && body_.size() + (bytes.size() - skip) > max_body_bytes_) {
        // 종결자를 찾을 때까지는 계속 읽되 더 이상 쌓지 않는다.
        overflowed_ = true;
        body_.clear();
        return;
    }
    body_.append(bytes, skip, std::string::npos);
}

}  // namespace session
