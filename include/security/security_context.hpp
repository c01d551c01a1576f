#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mission_agent::security {

inline constexpr std::size_t kKeySize = 32;
inline constexpr std::size_t kIvSize = 16;
inline constexpr const char* kDefaultSalt = "nexoptimia2025";
inline constexpr const char* kKeyEnvVar = "MISSION_AGENT_AES_KEY";
inline constexpr const char* kSaltEnvVar = "MISSION_AGENT_SALT";

struct SecurityOptions {
  // base64 (standard or url-safe alphabet) of exactly 32 bytes.
  std::optional<std::string> key_base64{};
  std::optional<std::string> salt{};
  bool read_environment{true};
};

// Key and salt shared by every communication path. Immutable after
// construction, so all member functions are safe to call concurrently.
class SecurityContext {
 public:
  SecurityContext(std::string key, std::string salt);

  // Resolves secrets from the environment, then `options`, and generates the
  // key from the CSPRNG when neither supplies one.
  static std::shared_ptr<const SecurityContext> create(const SecurityOptions& options = {});

  // XOR with the salt, cycling the salt over the input.
  [[nodiscard]] std::string obfuscate(std::string_view data) const;
  [[nodiscard]] std::string deobfuscate(std::string_view data) const;

  // AES-256-CFB128 under a fresh random IV; returns base64(iv || ciphertext).
  [[nodiscard]] std::string encrypt(std::string_view data) const;
  // Inverse of encrypt. Throws CryptoError on malformed or truncated tokens.
  [[nodiscard]] std::string decrypt(std::string_view token) const;

  [[nodiscard]] std::size_t salt_size() const noexcept { return salt_.size(); }

 private:
  std::string cipher(std::string_view input, const unsigned char* iv, bool encrypt) const;

  std::string key_;
  std::string salt_;
};

// Process-wide context, created on first call. Later calls return the same
// instance and ignore `options`.
std::shared_ptr<const SecurityContext> shared_security_context(const SecurityOptions& options = {});

std::string encode_base64(std::string_view data);
std::optional<std::string> decode_base64(std::string_view text);

}  // namespace mission_agent::security
