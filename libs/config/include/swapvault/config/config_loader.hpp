#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace swapvault {
namespace config {

struct VaultConfig {
  std::uint64_t custody_account{1'000'000};
  std::uint32_t reference_asset{1};
  std::uint8_t reference_decimals{6};
  std::uint8_t cap_decimals{8};
  std::uint64_t bank_cap{1'000'000'00000000};  // cap units
};

struct NativeConfig {
  bool enabled{true};
  std::uint32_t wrapped_asset{2};
  std::uint64_t escrow_account{1'000'001};
};

struct AssetConfig {
  std::uint32_t id{0};
  std::string symbol;
  std::uint8_t decimals{18};
  std::uint32_t transfer_fee_basis_points{0};
};

struct PoolConfig {
  std::uint64_t account{0};
  std::uint32_t asset_a{0};
  std::uint32_t asset_b{0};
  std::uint64_t reserve_a{0};
  std::uint64_t reserve_b{0};
};

struct AdminConfig {
  std::uint64_t account{0};
  std::string public_key_hex;
};

struct GenesisConfig {
  std::uint64_t account{0};
  std::uint32_t asset{0};
  std::uint64_t amount{0};
};

struct JournalConfig {
  bool enabled{true};
  std::filesystem::path path{"data/vault.journal"};
  std::size_t flush_threshold{4096};
  bool replay_on_start{true};
};

struct TelemetryConfig {
  bool enabled{true};
};

struct ServiceConfig {
  VaultConfig vault;
  NativeConfig native;
  JournalConfig journal;
  TelemetryConfig telemetry;
  std::vector<AssetConfig> assets;
  std::vector<PoolConfig> pools;
  std::vector<AdminConfig> admins;
  std::vector<GenesisConfig> genesis;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  ServiceConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const ServiceConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace swapvault
