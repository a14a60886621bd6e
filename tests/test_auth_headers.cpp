#include <gtest/gtest.h>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>

#include <string>
#include <vector>

#include "codec/auth_headers.hpp"

namespace {

namespace http = boost::beast::http;
using namespace rauth::codec;

TEST(AuthHeadersTest, BuildsBearerAndJsonAccept) {
  auto h = make_auth_headers("jwt.abc.def", "AAATE0j+");
  EXPECT_EQ(h.authorization, "Bearer jwt.abc.def");
  EXPECT_EQ(h.r_auth, "AAATE0j+");
  EXPECT_EQ(h.accept, "application/json");
}

TEST(AuthHeadersTest, AppliesToBeastFields) {
  http::fields fields;
  apply_auth_headers(fields, make_auth_headers("t0k", "rauth-value"));
  EXPECT_EQ(fields[http::field::authorization], "Bearer t0k");
  EXPECT_EQ(fields["R-Auth"], "rauth-value");
  EXPECT_EQ(fields[http::field::accept], "application/json");
}

TEST(AuthHeadersTest, HeaderNameMustBeHttpToken) {
  EXPECT_TRUE(is_valid_header_name("R-Auth"));
  EXPECT_TRUE(is_valid_header_name("X-Device_Token.v2"));
  EXPECT_FALSE(is_valid_header_name(""));
  EXPECT_FALSE(is_valid_header_name("R-Auth\r\nX-Injected: 1"));
  EXPECT_FALSE(is_valid_header_name("R Auth"));
  EXPECT_FALSE(is_valid_header_name("R-Auth:"));
}

TEST(AuthHeadersTest, ReplacesExistingValues) {
  http::fields fields;
  fields.set(http::field::accept, "text/html");
  fields.insert("R-Auth", "stale");
  apply_auth_headers(fields, make_auth_headers("t", "fresh"));
  EXPECT_EQ(fields.count("R-Auth"), 1u);
  EXPECT_EQ(fields["R-Auth"], "fresh");
  EXPECT_EQ(fields[http::field::accept], "application/json");
}

TEST(AuthHeadersTest, CustomHeaderName) {
  http::fields fields;
  apply_auth_headers(fields, make_auth_headers("t", "v"), "X-Device-Token");
  EXPECT_EQ(fields["X-Device-Token"], "v");
  EXPECT_EQ(fields.count("R-Auth"), 0u);
}

TEST(AuthHeadersTest, HeaderLookupIsCaseInsensitive) {
  http::fields fields;
  apply_auth_headers(fields, make_auth_headers("t", "v"));
  EXPECT_EQ(fields["r-auth"], "v");
}

} // namespace
