// SPDX-License-Identifier: Apache-2.0
// auth_provider.hpp
// Join-token verification for queue and tournament entry. The relay only
// checks the token it is handed; issuing tokens is someone else's job.
#pragma once
#include <memory>
#include <string>
#include <string_view>

namespace pong::auth {

struct AuthResult
{
    bool ok{false};
    std::string player_id; // filled when ok
    std::string reason; // error reason when !ok
};

class IAuthProvider
{
public:
    virtual ~IAuthProvider() = default;
    virtual AuthResult validate(std::string_view nickname, std::string_view token) = 0;
};

inline constexpr std::size_t kMaxNicknameLength = 16;
inline constexpr std::size_t kMaxTokenLength = 128;

// "disabled" accepts everyone, "stub" requires a non-empty token of sane size.
// Unknown modes fall back to "disabled".
std::unique_ptr<IAuthProvider> make_provider(const std::string &mode, const std::string &stub_prefix);

// Set once at startup before the listener runs.
void set_provider(IAuthProvider *p) noexcept;
IAuthProvider *provider() noexcept;

// Uses provider() when set, otherwise accepts; also enforces nickname rules.
AuthResult check_join(std::string_view nickname, std::string_view token);

} // namespace pong::auth
