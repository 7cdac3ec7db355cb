#pragma once

#include <array>
#include <memory>
#include <string_view>

#include "core/model/types.hpp"

namespace kutyus::crypto {

// Private signing capability of one author. Implementations hold the secret
// key; the core never sees it.
class Signer {
public:
  virtual ~Signer() = default;

  [[nodiscard]] virtual const PublicKey& public_key() const = 0;
  [[nodiscard]] virtual Signature sign(std::string_view payload) const = 0;
};

class Verifier {
public:
  virtual ~Verifier() = default;

  [[nodiscard]] virtual bool verify(const PublicKey& public_key, std::string_view payload,
                                    const Signature& signature) const = 0;
};

// Returns false when libsodium cannot be initialized. Safe to call repeatedly
// from any thread.
bool initialize_crypto();

class Ed25519Signer final : public Signer {
public:
  // nullptr when libsodium is unavailable.
  static std::unique_ptr<Ed25519Signer> generate();
  static std::unique_ptr<Ed25519Signer> from_seed(const Seed& seed);

  ~Ed25519Signer() override;

  Ed25519Signer(const Ed25519Signer&) = delete;
  Ed25519Signer& operator=(const Ed25519Signer&) = delete;

  [[nodiscard]] const PublicKey& public_key() const override { return public_key_; }
  [[nodiscard]] Signature sign(std::string_view payload) const override;

private:
  Ed25519Signer() = default;

  PublicKey public_key_{};
  std::array<unsigned char, 64> secret_key_{};
};

class Ed25519Verifier final : public Verifier {
public:
  [[nodiscard]] bool verify(const PublicKey& public_key, std::string_view payload,
                            const Signature& signature) const override;
};

// Process-wide Ed25519 verifier used when callers do not supply one.
const Verifier& default_verifier();

}  // namespace kutyus::crypto
