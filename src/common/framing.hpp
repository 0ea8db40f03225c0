// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace arena::netutil {

// Payloads above this are treated as corrupt framing.
inline constexpr uint32_t kMaxFrameBytes = 1'000'000;

inline std::string build_frame(const std::string &payload)
{
    uint32_t len = static_cast<uint32_t>(payload.size());
    uint32_t net = htonl(len);
    std::string frame;
    frame.resize(4 + payload.size());
    std::memcpy(frame.data(), &net, 4);
    std::memcpy(frame.data() + 4, payload.data(), payload.size());
    return frame;
}

struct FrameParseState
{
    std::vector<char> buffer; // accumulated bytes
    uint32_t expected_len{0};
    bool have_len{false};
};

enum class FrameStatus
{
    NeedMore,
    Frame,
    Invalid
};

// Extracts at most one frame. On Invalid the receive buffer is discarded so the
// stream can resynchronize on the next write from the peer.
inline FrameStatus try_extract(FrameParseState &st, std::string &out)
{
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return FrameStatus::NeedMore;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        if (st.expected_len == 0 || st.expected_len > kMaxFrameBytes) {
            st.buffer.clear();
            st.expected_len = 0;
            return FrameStatus::Invalid;
        }
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + st.expected_len)
        return FrameStatus::NeedMore;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return FrameStatus::Frame;
}

} // namespace arena::netutil
