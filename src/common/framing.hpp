// SPDX-License-Identifier: Apache-2.0
// Length-prefixed frames: 4-byte big endian payload size followed by the
// serialized protobuf message.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace pong::netutil {

inline constexpr uint32_t kMaxFrameBytes = 1u << 20;

inline void append_frame(std::string &out, const std::string &payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    size_t at = out.size();
    out.resize(at + 4 + payload.size());
    std::memcpy(out.data() + at, &net, 4);
    std::memcpy(out.data() + at + 4, payload.data(), payload.size());
}

inline std::string build_frame(const std::string &payload)
{
    std::string frame;
    frame.reserve(4 + payload.size());
    append_frame(frame, payload);
    return frame;
}

// Serializes a protobuf message and appends it as one frame; false if the
// message could not be serialized.
template <typename Msg>
inline bool append_message(std::string &out, const Msg &msg)
{
    std::string payload;
    if (!msg.SerializeToString(&payload))
        return false;
    append_frame(out, payload);
    return true;
}

struct FrameParseState
{
    std::vector<char> buffer;
    uint32_t expected_len{0};
    bool have_len{false};
    bool corrupt{false}; // set once an impossible length prefix is seen
};

inline void feed(FrameParseState &st, const char *data, size_t n)
{
    st.buffer.insert(st.buffer.end(), data, data + n);
}

// Extracts one complete payload into out. Returns false when more bytes are
// needed or the stream is corrupt (check st.corrupt).
inline bool try_extract(FrameParseState &st, std::string &out)
{
    if (st.corrupt)
        return false;
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return false;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        if (st.expected_len == 0 || st.expected_len > kMaxFrameBytes) {
            st.corrupt = true;
            return false;
        }
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + static_cast<size_t>(st.expected_len))
        return false;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return true;
}

} // namespace pong::netutil
