#include "core/crypto/signer.hpp"

#include <sodium.h>

namespace kutyus::crypto {

static_assert(crypto_sign_PUBLICKEYBYTES == kPublicKeyBytes, "Ed25519 public key width");
static_assert(crypto_sign_BYTES == kSignatureBytes, "Ed25519 signature width");
static_assert(crypto_sign_SEEDBYTES == kSeedBytes, "Ed25519 seed width");
static_assert(crypto_sign_SECRETKEYBYTES == 64, "Ed25519 secret key width");

bool initialize_crypto() {
  static const bool ready = sodium_init() >= 0;
  return ready;
}

std::unique_ptr<Ed25519Signer> Ed25519Signer::generate() {
  if (!initialize_crypto()) {
    return nullptr;
  }

  std::unique_ptr<Ed25519Signer> signer{new Ed25519Signer()};
  crypto_sign_keypair(signer->public_key_.data(), signer->secret_key_.data());
  return signer;
}

std::unique_ptr<Ed25519Signer> Ed25519Signer::from_seed(const Seed& seed) {
  if (!initialize_crypto()) {
    return nullptr;
  }

  std::unique_ptr<Ed25519Signer> signer{new Ed25519Signer()};
  crypto_sign_seed_keypair(signer->public_key_.data(), signer->secret_key_.data(), seed.data());
  return signer;
}

Ed25519Signer::~Ed25519Signer() {
  sodium_memzero(secret_key_.data(), secret_key_.size());
}

Signature Ed25519Signer::sign(std::string_view payload) const {
  Signature signature{};
  crypto_sign_detached(signature.data(), nullptr,
                       reinterpret_cast<const unsigned char*>(payload.data()),
                       static_cast<unsigned long long>(payload.size()), secret_key_.data());
  return signature;
}

bool Ed25519Verifier::verify(const PublicKey& public_key, std::string_view payload,
                             const Signature& signature) const {
  if (!initialize_crypto()) {
    return false;
  }

  return crypto_sign_verify_detached(signature.data(),
                                     reinterpret_cast<const unsigned char*>(payload.data()),
                                     static_cast<unsigned long long>(payload.size()),
                                     public_key.data()) == 0;
}

const Verifier& default_verifier() {
  static const Ed25519Verifier verifier;
  return verifier;
}

}  // namespace kutyus::crypto
