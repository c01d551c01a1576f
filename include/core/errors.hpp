#pragma once

#include <stdexcept>
#include <string>

namespace mission_agent {

// Malformed mission profile or trigger set. Raised by load paths only.
class InvalidMission : public std::runtime_error {
 public:
  explicit InvalidMission(const std::string& message) : std::runtime_error("invalid mission: " + message) {}
};

class UnsupportedDestination : public std::runtime_error {
 public:
  explicit UnsupportedDestination(const std::string& destination)
      : std::runtime_error("unsupported destination: " + destination), destination_(destination) {}

  const std::string& destination() const noexcept { return destination_; }

 private:
  std::string destination_;
};

// Malformed or truncated token, transport decode failure, or a libcrypto error.
class CryptoError : public std::runtime_error {
 public:
  explicit CryptoError(const std::string& message) : std::runtime_error("crypto error: " + message) {}
};

class SensorUnavailable : public std::runtime_error {
 public:
  explicit SensorUnavailable(const std::string& message) : std::runtime_error("sensor unavailable: " + message) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace mission_agent
