// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "gcp_auth/internal/openssl_util.h"
#include "gcp_auth/internal/make_auth_error.h"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <memory>
#include <utility>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using PrivateKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

extern "C" int AppendSslError(char const* str, std::size_t len, void* u) {
  auto& out = *static_cast<std::string*>(u);
  if (!out.empty()) out += ", ";
  // Each line from OpenSSL ends in a newline.
  if (len > 0 && str[len - 1] == '\n') --len;
  out.append(str, len);
  return 1;
}

// Drains the OpenSSL error queue of the calling thread.
Status SslError(char const* what) {
  std::string details;
  ERR_print_errors_cb(&AppendSslError, &details);
  return CryptoError(
      std::string("Invalid service account key - ") + what + ": " + details,
      GCP_AUTH_ERROR_INFO());
}

StatusOr<PrivateKeyPtr> LoadPrivateKey(std::string const& pem_contents) {
  BioPtr bio(BIO_new_mem_buf(pem_contents.data(),
                             static_cast<int>(pem_contents.size())),
             &BIO_free);
  if (!bio) return SslError("could not create PEM buffer");
  // Service account keys are never password protected.
  PrivateKeyPtr key(
      PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr),
      &EVP_PKEY_free);
  if (!key) return SslError("could not parse PEM to get private key");
  return StatusOr<PrivateKeyPtr>(std::move(key));
}

}  // namespace

StatusOr<std::vector<std::uint8_t>> SignUsingSha256(
    std::string const& str, std::string const& pem_contents) {
  ERR_clear_error();
  auto key = LoadPrivateKey(pem_contents);
  if (!key) return std::move(key).status();

  DigestCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) return SslError("could not create context for OpenSSL digest");
  if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                         key->get()) != 1) {
    return SslError("could not initialize signing digest");
  }

  auto const* data = reinterpret_cast<unsigned char const*>(str.data());
  std::size_t size = 0;
  if (EVP_DigestSign(ctx.get(), nullptr, &size, data, str.size()) != 1) {
    return SslError("could not sign blob");
  }
  std::vector<std::uint8_t> signature(size);
  if (EVP_DigestSign(ctx.get(), signature.data(), &size, data, str.size()) !=
      1) {
    return SslError("could not sign blob");
  }
  signature.resize(size);
  return signature;
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
