#include "swapvault/auth/access_control.hpp"

#include <sodium.h>

#include <stdexcept>

namespace swapvault {
namespace auth {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

// Ensure sodium is initialized before any crypto operations
void ensure_sodium_init() {
  static SodiumInitializer init;
}

template <typename T>
void append_le(std::vector<std::byte>& out, T value) {
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8 * i)) & 0xFF));
  }
}

}  // namespace

std::vector<std::byte> AdminCommand::encode() const {
  std::vector<std::byte> out;
  out.reserve(1 + 8 + 8 + 4 + 8 + 8);
  out.push_back(static_cast<std::byte>(action));
  append_le(out, caller);
  append_le(out, nonce);
  append_le(out, asset);
  append_le(out, target);
  append_le(out, amount);
  return out;
}

AccessControl::AccessControl() {
  ensure_sodium_init();
}

AccessControl::~AccessControl() = default;

void AccessControl::grant_admin(common::AccountId account, const PublicKey& public_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  admins_[account] = AdminState{.key = public_key, .last_nonce = 0};
}

void AccessControl::revoke_admin(common::AccountId account) {
  std::lock_guard<std::mutex> lock(mutex_);
  admins_.erase(account);
}

bool AccessControl::is_admin(common::AccountId account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return admins_.find(account) != admins_.end();
}

std::size_t AccessControl::admin_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return admins_.size();
}

common::Status AccessControl::authorize(const AdminCommand& command, const Signature& signature) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = admins_.find(command.caller);
  if (it == admins_.end()) {
    return common::Status::kUnauthorized;
  }
  if (command.nonce <= it->second.last_nonce) {
    return common::Status::kUnauthorized;
  }
  const auto message = command.encode();
  if (!verify_with_key(it->second.key, message, signature)) {
    return common::Status::kUnauthorized;
  }
  it->second.last_nonce = command.nonce;
  return common::Status::kOk;
}

bool AccessControl::set_paused(bool paused) noexcept {
  return paused_.exchange(paused, std::memory_order_acq_rel);
}

bool AccessControl::restore_nonce(common::AccountId caller, std::uint64_t nonce) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = admins_.find(caller);
  if (it == admins_.end()) {
    return false;
  }
  if (nonce > it->second.last_nonce) {
    it->second.last_nonce = nonce;
  }
  return true;
}

bool AccessControl::verify_with_key(const PublicKey& public_key,
                                    std::span<const std::byte> message,
                                    const Signature& signature) {
  ensure_sodium_init();

  return crypto_sign_verify_detached(
             signature.data(),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             public_key.data()) == 0;
}

bool AccessControl::sign(const SecretKey& secret_key,
                         std::span<const std::byte> message,
                         Signature& out_signature) {
  ensure_sodium_init();

  return crypto_sign_detached(
             out_signature.data(),
             nullptr,
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             secret_key.data()) == 0;
}

Signature AccessControl::sign_command(const SecretKey& secret_key, const AdminCommand& command) {
  Signature signature{};
  const auto message = command.encode();
  if (!sign(secret_key, message, signature)) {
    throw std::runtime_error("failed to sign admin command");
  }
  return signature;
}

void AccessControl::generate_keypair(PublicKey& out_public, SecretKey& out_secret) {
  ensure_sodium_init();
  crypto_sign_keypair(out_public.data(), out_secret.data());
}

bool AccessControl::parse_public_key(std::string_view hex, PublicKey& out_key) {
  ensure_sodium_init();
  if (hex.size() != kPublicKeySize * 2) {
    return false;
  }
  std::size_t decoded = 0;
  if (sodium_hex2bin(out_key.data(), out_key.size(), hex.data(), hex.size(),
                     nullptr, &decoded, nullptr) != 0) {
    return false;
  }
  return decoded == kPublicKeySize;
}

bool AccessControl::parse_signature(std::string_view hex, Signature& out_signature) {
  ensure_sodium_init();
  if (hex.size() != kSignatureSize * 2) {
    return false;
  }
  std::size_t decoded = 0;
  if (sodium_hex2bin(out_signature.data(), out_signature.size(), hex.data(), hex.size(),
                     nullptr, &decoded, nullptr) != 0) {
    return false;
  }
  return decoded == kSignatureSize;
}

std::string AccessControl::to_hex(std::span<const std::byte> bytes) {
  ensure_sodium_init();
  std::string out(bytes.size() * 2 + 1, '\0');
  sodium_bin2hex(out.data(), out.size(), reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
  out.pop_back();
  return out;
}

}  // namespace auth
}  // namespace swapvault
