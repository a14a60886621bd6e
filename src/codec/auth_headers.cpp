#include "codec/auth_headers.hpp"

#include <boost/beast/http/field.hpp>
#include <fmt/format.h>

namespace rauth {
namespace codec {

namespace http = boost::beast::http;

bool is_valid_header_name(std::string_view name) {
  if (name.empty()) {
    return false;
  }
  constexpr std::string_view kExtraTchars = "!#$%&'*+-.^_`|~";
  for (char c : name) {
    const bool alnum = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                       (c >= 'A' && c <= 'Z');
    if (!alnum && kExtraTchars.find(c) == std::string_view::npos) {
      return false;
    }
  }
  return true;
}

AuthHeaders make_auth_headers(const std::string &jwt_token,
                              const std::string &rauth_token) {
  return AuthHeaders{fmt::format("Bearer {}", jwt_token), rauth_token,
                     "application/json"};
}

void apply_auth_headers(http::fields &fields, const AuthHeaders &headers,
                        std::string_view header_name) {
  fields.set(http::field::authorization, headers.authorization);
  fields.set(boost::beast::string_view(header_name.data(), header_name.size()),
             headers.r_auth);
  fields.set(http::field::accept, headers.accept);
}

} // namespace codec
} // namespace rauth
