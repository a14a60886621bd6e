#pragma once

#include <boost/beast/http/fields.hpp>

#include <string>
#include <string_view>

namespace rauth {
namespace codec {

inline constexpr std::string_view kDefaultAuthHeaderName = "R-Auth";

// Headers a consumer attaches next to the bearer credential when talking to
// the verifier (REST calls and the broadcasting auth endpoint alike).
struct AuthHeaders {
  std::string authorization;
  std::string r_auth;
  std::string accept;
};

// True when `name` is a non-empty RFC 7230 token (tchar only), so it can be
// emitted as a header field name without breaking the header block.
bool is_valid_header_name(std::string_view name);

AuthHeaders make_auth_headers(const std::string &jwt_token,
                              const std::string &rauth_token);

// Sets Authorization, <header_name> and Accept on `fields`, replacing any
// existing values.
void apply_auth_headers(boost::beast::http::fields &fields,
                        const AuthHeaders &headers,
                        std::string_view header_name = kDefaultAuthHeaderName);

} // namespace codec
} // namespace rauth
