#include "codec/rauth_token.hpp"

#include "codec/payload_builder.hpp"
#include "codec/stream_cipher.hpp"
#include "openssl/openssl_raii.hpp"

namespace rauth {
namespace codec {

TokenTrace trace_token(const TokenInput &input) {
  TokenTrace trace;
  trace.seed = derive_seed(input.timestamp);
  trace.field_string = build_field_string(input);

  auto buffer = build_plaintext(trace.seed, trace.field_string);
  apply_stream_cipher(buffer);
  trace.token = opensslutil::base64_encode(buffer);
  return trace;
}

std::string encode_token(const TokenInput &input) {
  return trace_token(input).token;
}

std::string encode_token(const TokenRequest &request,
                         const ResolveContext &ctx) {
  return encode_token(resolve_token_input(request, ctx));
}

} // namespace codec
} // namespace rauth
