#include "security/security_context.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <utility>

#include "core/errors.hpp"

namespace mission_agent::security {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const {
    if (ctx != nullptr) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::string openssl_error(const char* what) {
  const unsigned long code = ERR_get_error();
  if (code == 0) {
    return what;
  }
  char buffer[256]{};
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return std::string(what) + ": " + buffer;
}

std::string random_bytes(const std::size_t count) {
  std::string out(count, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
    throw CryptoError(openssl_error("RAND_bytes failed"));
  }
  return out;
}

std::optional<std::string> read_env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::mutex g_shared_mutex;
std::shared_ptr<const SecurityContext> g_shared_context;

}  // namespace

std::string encode_base64(const std::string_view data) {
  if (data.empty()) {
    return {};
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                      reinterpret_cast<const unsigned char*>(data.data()),
                                      static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::optional<std::string> decode_base64(const std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      continue;
    }
    if (c == '-') {
      normalized.push_back('+');
    } else if (c == '_') {
      normalized.push_back('/');
    } else {
      normalized.push_back(c);
    }
  }

  if (normalized.empty()) {
    return std::string{};
  }
  if (normalized.size() % 4 != 0) {
    return std::nullopt;
  }

  // Padding may only close the final quantum: at most "==" and nothing after it.
  const auto first_pad = normalized.find('=');
  if (first_pad != std::string::npos &&
      (first_pad < normalized.size() - 2 || normalized.find_first_not_of('=', first_pad) != std::string::npos)) {
    return std::nullopt;
  }

  std::string out(3 * normalized.size() / 4, '\0');
  const int decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                      reinterpret_cast<const unsigned char*>(normalized.data()),
                                      static_cast<int>(normalized.size()));
  if (decoded < 0) {
    return std::nullopt;
  }

  // EVP_DecodeBlock counts padding as zero bytes.
  std::size_t padding = 0;
  if (normalized.back() == '=') {
    ++padding;
    if (normalized[normalized.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<std::size_t>(decoded) - padding);
  return out;
}

SecurityContext::SecurityContext(std::string key, std::string salt) : key_(std::move(key)), salt_(std::move(salt)) {
  if (key_.size() != kKeySize) {
    throw CryptoError("key must be " + std::to_string(kKeySize) + " bytes, got " + std::to_string(key_.size()));
  }
  if (salt_.empty()) {
    throw CryptoError("salt must not be empty");
  }
}

std::shared_ptr<const SecurityContext> SecurityContext::create(const SecurityOptions& options) {
  std::optional<std::string> key_text = options.read_environment ? read_env(kKeyEnvVar) : std::nullopt;
  if (!key_text.has_value()) {
    key_text = options.key_base64;
  }
  std::optional<std::string> salt = options.read_environment ? read_env(kSaltEnvVar) : std::nullopt;
  if (!salt.has_value()) {
    salt = options.salt;
  }

  std::string key;
  if (key_text.has_value()) {
    auto decoded = decode_base64(*key_text);
    if (!decoded.has_value() || decoded->size() != kKeySize) {
      throw ConfigError("security key must be base64 of exactly 32 bytes");
    }
    key = std::move(*decoded);
  } else {
    key = random_bytes(kKeySize);
    std::cerr << "[security] no key configured; generated a process key\n";
  }

  return std::make_shared<const SecurityContext>(std::move(key),
                                                 salt.has_value() && !salt->empty() ? *salt : kDefaultSalt);
}

std::string SecurityContext::obfuscate(const std::string_view data) const {
  std::string out(data);
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<char>(static_cast<unsigned char>(out[i]) ^
                               static_cast<unsigned char>(salt_[i % salt_.size()]));
  }
  return out;
}

std::string SecurityContext::deobfuscate(const std::string_view data) const { return obfuscate(data); }

std::string SecurityContext::encrypt(const std::string_view data) const {
  const std::string iv = random_bytes(kIvSize);
  const std::string ciphertext = cipher(data, reinterpret_cast<const unsigned char*>(iv.data()), true);
  return encode_base64(iv + ciphertext);
}

std::string SecurityContext::decrypt(const std::string_view token) const {
  const auto raw = decode_base64(token);
  if (!raw.has_value()) {
    throw CryptoError("token is not valid base64");
  }
  if (raw->size() < kIvSize) {
    throw CryptoError("token shorter than the " + std::to_string(kIvSize) + "-byte IV");
  }

  const std::string_view body(*raw);
  return cipher(body.substr(kIvSize), reinterpret_cast<const unsigned char*>(raw->data()), false);
}

std::string SecurityContext::cipher(const std::string_view input, const unsigned char* iv, const bool encrypt) const {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (ctx == nullptr) {
    throw CryptoError("EVP_CIPHER_CTX_new failed");
  }

  if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cfb128(), nullptr,
                        reinterpret_cast<const unsigned char*>(key_.data()), iv, encrypt ? 1 : 0) != 1) {
    throw CryptoError(openssl_error("EVP_CipherInit_ex failed"));
  }

  std::string out(input.size(), '\0');
  int written = 0;
  if (!input.empty() &&
      EVP_CipherUpdate(ctx.get(), reinterpret_cast<unsigned char*>(out.data()), &written,
                       reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size())) != 1) {
    throw CryptoError(openssl_error("EVP_CipherUpdate failed"));
  }

  int tail = 0;
  if (EVP_CipherFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(out.data()) + written, &tail) != 1) {
    throw CryptoError(openssl_error("EVP_CipherFinal_ex failed"));
  }
  out.resize(static_cast<std::size_t>(written + tail));
  return out;
}

std::shared_ptr<const SecurityContext> shared_security_context(const SecurityOptions& options) {
  std::lock_guard<std::mutex> lock(g_shared_mutex);
  if (g_shared_context == nullptr) {
    g_shared_context = SecurityContext::create(options);
  }
  return g_shared_context;
}

}  // namespace mission_agent::security
