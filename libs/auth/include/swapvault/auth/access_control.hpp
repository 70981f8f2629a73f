#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "swapvault/common/status.hpp"
#include "swapvault/common/types.hpp"

namespace swapvault {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSignatureSize = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;

enum class AdminAction : std::uint8_t {
  kSetBankCap = 1,
  kPause = 2,
  kUnpause = 3,
  kRescue = 4,
};

// Signed admin instruction. The signature covers encode(), which is
// little-endian: [action:1][caller:8][nonce:8][asset:4][target:8][amount:8].
struct AdminCommand {
  AdminAction action{AdminAction::kPause};
  common::AccountId caller{common::kZeroAccount};
  std::uint64_t nonce{0};
  common::AssetId asset{0};
  common::AccountId target{common::kZeroAccount};
  common::Amount amount{0};

  [[nodiscard]] std::vector<std::byte> encode() const;
};

class AccessControl {
 public:
  AccessControl();
  ~AccessControl();

  void grant_admin(common::AccountId account, const PublicKey& public_key);
  void revoke_admin(common::AccountId account);
  [[nodiscard]] bool is_admin(common::AccountId account) const;
  [[nodiscard]] std::size_t admin_count() const;

  [[nodiscard]] bool is_paused() const noexcept { return paused_.load(std::memory_order_acquire); }

  // Returns kUnauthorized unless the caller is an admin, the signature is valid
  // for its key and the nonce is above the last one accepted from that caller.
  // Accepting a command consumes its nonce.
  common::Status authorize(const AdminCommand& command, const Signature& signature);

  // Only reached through an authorized kPause/kUnpause. Returns the previous flag.
  bool set_paused(bool paused) noexcept;

  // Marks nonces up to `nonce` as spent for a registered admin, as when a
  // journal is replayed. Returns false for an unknown caller.
  bool restore_nonce(common::AccountId caller, std::uint64_t nonce);

  static bool verify_with_key(const PublicKey& public_key,
                              std::span<const std::byte> message,
                              const Signature& signature);
  static bool sign(const SecretKey& secret_key,
                   std::span<const std::byte> message,
                   Signature& out_signature);
  static Signature sign_command(const SecretKey& secret_key, const AdminCommand& command);
  static void generate_keypair(PublicKey& out_public, SecretKey& out_secret);

  // Hex (64 chars) to key; false on malformed input.
  static bool parse_public_key(std::string_view hex, PublicKey& out_key);
  // Hex (128 chars) to signature; false on malformed input.
  static bool parse_signature(std::string_view hex, Signature& out_signature);
  // Lowercase hex, e.g. of AdminCommand::encode() for offline signing.
  static std::string to_hex(std::span<const std::byte> bytes);

 private:
  struct AdminState {
    PublicKey key{};
    std::uint64_t last_nonce{0};
  };

  mutable std::mutex mutex_;
  std::unordered_map<common::AccountId, AdminState> admins_;
  std::atomic<bool> paused_{false};
};

}  // namespace auth
}  // namespace swapvault
