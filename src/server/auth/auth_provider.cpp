// SPDX-License-Identifier: Apache-2.0
#include "server/auth/auth_provider.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>

namespace pong::auth {

namespace {
class DisabledProvider : public IAuthProvider
{
public:
    AuthResult validate(std::string_view nickname, std::string_view) override
    {
        AuthResult r;
        r.ok = true;
        r.player_id = "anon_" + std::string(nickname);
        return r;
    }
};

class StubProvider : public IAuthProvider
{
public:
    explicit StubProvider(std::string prefix) : m_prefix(std::move(prefix)) {}

    AuthResult validate(std::string_view nickname, std::string_view token) override
    {
        AuthResult r;
        if (token.empty()) {
            r.reason = "empty_token";
            return r;
        }
        if (token.size() > kMaxTokenLength) {
            r.reason = "token_too_long";
            return r;
        }
        r.ok = true;
        r.player_id = m_prefix + std::string(nickname);
        return r;
    }

private:
    std::string m_prefix;
};

std::atomic<IAuthProvider *> g_provider{nullptr};

bool valid_nickname(std::string_view n)
{
    if (n.empty() || n.size() > kMaxNicknameLength)
        return false;
    return std::all_of(n.begin(), n.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}
} // namespace

std::unique_ptr<IAuthProvider> make_provider(const std::string &mode, const std::string &stub_prefix)
{
    if (mode == "disabled")
        return std::make_unique<DisabledProvider>();
    if (mode == "stub")
        return std::make_unique<StubProvider>(stub_prefix);
    log::warn("[auth] unknown mode '{}', authentication disabled", mode);
    return std::make_unique<DisabledProvider>();
}

void set_provider(IAuthProvider *p) noexcept
{
    g_provider.store(p, std::memory_order_release);
}

IAuthProvider *provider() noexcept
{
    return g_provider.load(std::memory_order_acquire);
}

AuthResult check_join(std::string_view nickname, std::string_view token)
{
    if (!valid_nickname(nickname)) {
        AuthResult r;
        r.reason = "invalid_nickname";
        return r;
    }
    if (auto *p = provider())
        return p->validate(nickname, token);
    AuthResult r;
    r.ok = true;
    r.player_id = std::string(nickname);
    return r;
}

} // namespace pong::auth
