// SPDX-License-Identifier: Apache-2.0
// unit_framing_fuzz.cpp
// Fuzz-style checks for the stream parser as the relay uses it: random chunk
// boundaries, truncation, impossible length prefixes and raw noise.
#include "common/framing.hpp"
#include "pong.pb.h"

#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace pong::netutil;

static uint32_t rnd32(std::mt19937 &rng)
{
    return std::uniform_int_distribution<uint32_t>{0, 0xffffffff}(rng);
}

static pong::ClientMessage random_update(std::mt19937 &rng)
{
    std::uniform_real_distribution<float> pos(0.f, 800.f);
    pong::ClientMessage m;
    auto *upd = m.mutable_game_update();
    if (rnd32(rng) % 2 == 0) {
        upd->mutable_paddle()->set_paddle_y(pos(rng));
    } else {
        auto *st = upd->mutable_sync_state();
        st->mutable_ball()->set_x(pos(rng));
        st->mutable_ball()->set_y(pos(rng) / 2.f);
        st->set_frame(rnd32(rng));
        st->set_rounds_played(rnd32(rng) % 5);
    }
    return m;
}

int main()
{
    std::mt19937 rng(12345);
    // 1. A burst of game updates survives any chunking.
    for (int caseId = 0; caseId < 200; ++caseId) {
        const int count = 1 + static_cast<int>(rnd32(rng) % 20);
        std::string stream;
        std::vector<std::string> sent;
        for (int i = 0; i < count; ++i) {
            auto m = random_update(rng);
            bool ok = append_message(stream, m);
            assert(ok);
            sent.push_back(m.SerializeAsString());
        }
        const size_t chunk = static_cast<size_t>(caseId % 17) + 1;
        FrameParseState st;
        std::vector<std::string> got;
        std::string out;
        for (size_t i = 0; i < stream.size(); i += chunk) {
            feed(st, stream.data() + i, std::min(chunk, stream.size() - i));
            while (try_extract(st, out))
                got.push_back(out);
        }
        assert(!st.corrupt);
        assert(got == sent);
        for (auto &g : got) {
            pong::ClientMessage back;
            bool parsed = back.ParseFromString(g);
            assert(parsed && back.has_game_update());
        }
    }
    // 2. Truncated frames never yield output.
    for (int caseId = 0; caseId < 100; ++caseId) {
        size_t len = std::uniform_int_distribution<size_t>{10, 4096}(rng);
        std::string payload(len, 'x');
        auto frame = build_frame(payload);
        frame.resize(frame.size() - std::uniform_int_distribution<size_t>{1, len}(rng));
        FrameParseState st;
        std::string out;
        feed(st, frame.data(), frame.size());
        assert(!try_extract(st, out));
        assert(!st.corrupt);
    }
    // 3. A length past the cap marks the stream corrupt for good.
    {
        FrameParseState st;
        uint32_t badLen = htonl(kMaxFrameBytes + 1);
        feed(st, reinterpret_cast<const char *>(&badLen), 4);
        std::string out;
        assert(!try_extract(st, out));
        assert(st.corrupt);
        auto good = build_frame("ok");
        feed(st, good.data(), good.size());
        assert(!try_extract(st, out));
    }
    // 4. Zero length is rejected too.
    {
        FrameParseState st;
        uint32_t badLen = htonl(0);
        feed(st, reinterpret_cast<const char *>(&badLen), 4);
        std::string out;
        assert(!try_extract(st, out));
        assert(st.corrupt);
    }
    // 5. Noise either stalls, turns corrupt, or yields payloads that the
    // relay then fails or succeeds to parse; it never yields an empty one.
    for (int caseId = 0; caseId < 300; ++caseId) {
        std::string noise(std::uniform_int_distribution<size_t>{1, 512}(rng), '\0');
        for (auto &c : noise)
            c = static_cast<char>(rnd32(rng));
        FrameParseState st;
        feed(st, noise.data(), noise.size());
        std::string out;
        while (try_extract(st, out)) {
            assert(!out.empty() && out.size() <= kMaxFrameBytes);
            pong::ClientMessage m;
            (void)m.ParseFromString(out);
        }
    }
    std::cout << "unit_framing_fuzz OK" << std::endl;
    return 0;
}
