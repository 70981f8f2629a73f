#include "swapvault/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <cctype>
#include <limits>
#include <set>
#include <sstream>

namespace swapvault {
namespace config {

namespace {

using Errors = std::vector<ValidationError>;

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

template <typename T>
T get_unsigned_or(const toml::table& tbl, std::string_view key, T default_val,
                  const std::string& field, Errors& errors) {
  const std::int64_t raw = get_int_or(tbl, key, static_cast<std::int64_t>(default_val));
  if (raw < 0 || static_cast<std::uint64_t>(raw) > std::numeric_limits<T>::max()) {
    errors.push_back({field + "." + std::string(key), "out of range"});
    return default_val;
  }
  return static_cast<T>(raw);
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

std::string indexed(std::string_view name, std::size_t i) {
  return std::string(name) + "[" + std::to_string(i) + "]";
}

VaultConfig parse_vault(const toml::table& root, Errors& errors) {
  VaultConfig cfg;
  if (auto* vault = root["vault"].as_table()) {
    cfg.custody_account = get_unsigned_or(*vault, "custody_account", cfg.custody_account, "vault", errors);
    cfg.reference_asset = get_unsigned_or(*vault, "reference_asset", cfg.reference_asset, "vault", errors);
    cfg.reference_decimals = get_unsigned_or(*vault, "reference_decimals", cfg.reference_decimals, "vault", errors);
    cfg.cap_decimals = get_unsigned_or(*vault, "cap_decimals", cfg.cap_decimals, "vault", errors);
    cfg.bank_cap = get_unsigned_or(*vault, "bank_cap", cfg.bank_cap, "vault", errors);
  }
  return cfg;
}

NativeConfig parse_native(const toml::table& root, Errors& errors) {
  NativeConfig cfg;
  if (auto* native = root["native"].as_table()) {
    cfg.enabled = get_bool_or(*native, "enabled", cfg.enabled);
    cfg.wrapped_asset = get_unsigned_or(*native, "wrapped_asset", cfg.wrapped_asset, "native", errors);
    cfg.escrow_account = get_unsigned_or(*native, "escrow_account", cfg.escrow_account, "native", errors);
  }
  return cfg;
}

JournalConfig parse_journal(const toml::table& root, Errors& errors) {
  JournalConfig cfg;
  if (auto* journal = root["journal"].as_table()) {
    cfg.enabled = get_bool_or(*journal, "enabled", cfg.enabled);
    cfg.path = get_str_or(*journal, "path", cfg.path.string());
    cfg.flush_threshold = get_unsigned_or(*journal, "flush_threshold", cfg.flush_threshold, "journal", errors);
    cfg.replay_on_start = get_bool_or(*journal, "replay_on_start", cfg.replay_on_start);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

std::vector<AssetConfig> parse_assets(const toml::table& root, Errors& errors) {
  std::vector<AssetConfig> assets;
  if (auto* arr = root["assets"].as_array()) {
    for (std::size_t i = 0; i < arr->size(); ++i) {
      auto* tbl = (*arr)[i].as_table();
      if (!tbl) {
        errors.push_back({indexed("assets", i), "must be a table"});
        continue;
      }
      const std::string field = indexed("assets", i);
      AssetConfig asset;
      asset.id = get_unsigned_or(*tbl, "id", asset.id, field, errors);
      asset.symbol = get_str_or(*tbl, "symbol", asset.symbol);
      asset.decimals = get_unsigned_or(*tbl, "decimals", asset.decimals, field, errors);
      asset.transfer_fee_basis_points =
          get_unsigned_or(*tbl, "transfer_fee_bp", asset.transfer_fee_basis_points, field, errors);
      assets.push_back(std::move(asset));
    }
  }
  return assets;
}

std::vector<PoolConfig> parse_pools(const toml::table& root, Errors& errors) {
  std::vector<PoolConfig> pools;
  if (auto* arr = root["pools"].as_array()) {
    for (std::size_t i = 0; i < arr->size(); ++i) {
      auto* tbl = (*arr)[i].as_table();
      if (!tbl) {
        errors.push_back({indexed("pools", i), "must be a table"});
        continue;
      }
      const std::string field = indexed("pools", i);
      PoolConfig pool;
      pool.account = get_unsigned_or(*tbl, "account", pool.account, field, errors);
      pool.asset_a = get_unsigned_or(*tbl, "asset_a", pool.asset_a, field, errors);
      pool.asset_b = get_unsigned_or(*tbl, "asset_b", pool.asset_b, field, errors);
      pool.reserve_a = get_unsigned_or(*tbl, "reserve_a", pool.reserve_a, field, errors);
      pool.reserve_b = get_unsigned_or(*tbl, "reserve_b", pool.reserve_b, field, errors);
      pools.push_back(pool);
    }
  }
  return pools;
}

std::vector<AdminConfig> parse_admins(const toml::table& root, Errors& errors) {
  std::vector<AdminConfig> admins;
  if (auto* arr = root["admins"].as_array()) {
    for (std::size_t i = 0; i < arr->size(); ++i) {
      auto* tbl = (*arr)[i].as_table();
      if (!tbl) {
        errors.push_back({indexed("admins", i), "must be a table"});
        continue;
      }
      AdminConfig admin;
      admin.account = get_unsigned_or(*tbl, "account", admin.account, indexed("admins", i), errors);
      admin.public_key_hex = get_str_or(*tbl, "public_key", admin.public_key_hex);
      admins.push_back(std::move(admin));
    }
  }
  return admins;
}

std::vector<GenesisConfig> parse_genesis(const toml::table& root, Errors& errors) {
  std::vector<GenesisConfig> genesis;
  if (auto* arr = root["genesis"].as_array()) {
    for (std::size_t i = 0; i < arr->size(); ++i) {
      auto* tbl = (*arr)[i].as_table();
      if (!tbl) {
        errors.push_back({indexed("genesis", i), "must be a table"});
        continue;
      }
      const std::string field = indexed("genesis", i);
      GenesisConfig entry;
      entry.account = get_unsigned_or(*tbl, "account", entry.account, field, errors);
      entry.asset = get_unsigned_or(*tbl, "asset", entry.asset, field, errors);
      entry.amount = get_unsigned_or(*tbl, "amount", entry.amount, field, errors);
      genesis.push_back(entry);
    }
  }
  return genesis;
}

ServiceConfig parse_config(const toml::table& root, Errors& errors) {
  ServiceConfig cfg;
  cfg.vault = parse_vault(root, errors);
  cfg.native = parse_native(root, errors);
  cfg.journal = parse_journal(root, errors);
  cfg.telemetry = parse_telemetry(root);
  cfg.assets = parse_assets(root, errors);
  cfg.pools = parse_pools(root, errors);
  cfg.admins = parse_admins(root, errors);
  cfg.genesis = parse_genesis(root, errors);
  return cfg;
}

LoadResult finish(const toml::table& root) {
  LoadResult result;
  Errors parse_errors;
  result.config = parse_config(root, parse_errors);
  result.errors = std::move(parse_errors);
  auto validation = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.end(), validation.begin(), validation.end());
  result.success = result.errors.empty();
  return result;
}

bool is_hex_key(std::string_view hex) {
  if (hex.size() != 64) {
    return false;
  }
  for (char c : hex) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

std::vector<ValidationError> ConfigLoader::validate(const ServiceConfig& config) {
  std::vector<ValidationError> errors;

  if (config.vault.custody_account == 0) {
    errors.push_back({"vault.custody_account", "must be greater than 0"});
  }
  if (config.vault.reference_asset == 0) {
    errors.push_back({"vault.reference_asset", "asset 0 is reserved for native currency"});
  }
  if (config.vault.cap_decimals < config.vault.reference_decimals) {
    errors.push_back({"vault.cap_decimals", "must be >= reference_decimals"});
  } else if (config.vault.cap_decimals - config.vault.reference_decimals > 18) {
    errors.push_back({"vault.cap_decimals", "scale above 10^18"});
  }
  if (config.vault.bank_cap == 0) {
    errors.push_back({"vault.bank_cap", "must be greater than 0"});
  }

  std::set<std::uint32_t> asset_ids;
  for (std::size_t i = 0; i < config.assets.size(); ++i) {
    const auto& asset = config.assets[i];
    const std::string prefix = indexed("assets", i);
    if (asset.id == 0) {
      errors.push_back({prefix + ".id", "asset 0 is reserved for native currency"});
    }
    if (!asset_ids.insert(asset.id).second) {
      errors.push_back({prefix + ".id", "duplicate asset id"});
    }
    if (asset.symbol.empty()) {
      errors.push_back({prefix + ".symbol", "symbol cannot be empty"});
    }
    if (asset.transfer_fee_basis_points > 10'000) {
      errors.push_back({prefix + ".transfer_fee_bp", "must be <= 10000"});
    }
  }

  if (!asset_ids.contains(config.vault.reference_asset)) {
    errors.push_back({"vault.reference_asset", "not listed in [[assets]]"});
  }
  for (const auto& asset : config.assets) {
    if (asset.id == config.vault.reference_asset && asset.decimals != config.vault.reference_decimals) {
      errors.push_back({"vault.reference_decimals", "does not match the reference asset's decimals"});
    }
  }

  if (config.native.enabled) {
    if (!asset_ids.contains(config.native.wrapped_asset)) {
      errors.push_back({"native.wrapped_asset", "not listed in [[assets]]"});
    }
    if (config.native.wrapped_asset == config.vault.reference_asset) {
      errors.push_back({"native.wrapped_asset", "must differ from the reference asset"});
    }
    if (config.native.escrow_account == 0 || config.native.escrow_account == config.vault.custody_account) {
      errors.push_back({"native.escrow_account", "must be non-zero and differ from the custody account"});
    }
  }

  std::set<std::uint64_t> pool_accounts;
  for (std::size_t i = 0; i < config.pools.size(); ++i) {
    const auto& pool = config.pools[i];
    const std::string prefix = indexed("pools", i);
    if (pool.account == 0 || pool.account == config.vault.custody_account) {
      errors.push_back({prefix + ".account", "must be non-zero and differ from the custody account"});
    }
    if (!pool_accounts.insert(pool.account).second) {
      errors.push_back({prefix + ".account", "duplicate pool account"});
    }
    if (pool.asset_a == pool.asset_b) {
      errors.push_back({prefix, "asset_a and asset_b must differ"});
    }
    if (!asset_ids.contains(pool.asset_a) || !asset_ids.contains(pool.asset_b)) {
      errors.push_back({prefix, "pool assets must be listed in [[assets]]"});
    }
    if (pool.reserve_a == 0 || pool.reserve_b == 0) {
      errors.push_back({prefix, "initial reserves must be positive"});
    }
  }

  for (std::size_t i = 0; i < config.admins.size(); ++i) {
    const auto& admin = config.admins[i];
    const std::string prefix = indexed("admins", i);
    if (admin.account == 0) {
      errors.push_back({prefix + ".account", "must be greater than 0"});
    }
    if (!is_hex_key(admin.public_key_hex)) {
      errors.push_back({prefix + ".public_key", "must be 64 hex characters"});
    }
  }

  for (std::size_t i = 0; i < config.genesis.size(); ++i) {
    const auto& entry = config.genesis[i];
    const std::string prefix = indexed("genesis", i);
    if (entry.account == 0) {
      errors.push_back({prefix + ".account", "must be greater than 0"});
    }
    if (entry.asset != 0 && !asset_ids.contains(entry.asset)) {
      errors.push_back({prefix + ".asset", "not listed in [[assets]]"});
    }
    if (entry.asset == 0 && !config.native.enabled) {
      errors.push_back({prefix + ".asset", "native currency is disabled"});
    }
  }

  if (config.journal.enabled) {
    if (config.journal.path.empty()) {
      errors.push_back({"journal.path", "path cannot be empty"});
    }
    if (config.journal.flush_threshold == 0) {
      errors.push_back({"journal.flush_threshold", "must be greater than 0"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# swapvault configuration
# Generated default configuration

[vault]
custody_account = 1000000
reference_asset = 1
reference_decimals = 6
cap_decimals = 8
bank_cap = 100000000000000   # 1,000,000.00000000 in cap units

[native]
enabled = true
wrapped_asset = 2
escrow_account = 1000001

[journal]
enabled = true
path = "data/vault.journal"
flush_threshold = 4096
replay_on_start = true

[telemetry]
enabled = true

[[assets]]
id = 1
symbol = "USD"
decimals = 6

[[assets]]
id = 2
symbol = "WNATIVE"
decimals = 8

[[assets]]
id = 3
symbol = "FOT"
decimals = 6
transfer_fee_bp = 100   # 1% withheld on every transfer

[[pools]]
account = 2000001
asset_a = 2
asset_b = 1
reserve_a = 100000000000     # 1,000 WNATIVE
reserve_b = 2000000000000    # 2,000,000 USD

[[pools]]
account = 2000002
asset_a = 3
asset_b = 1
reserve_a = 1000000000000
reserve_b = 1000000000000

[[genesis]]
account = 42
asset = 1
amount = 10000000000

[[genesis]]
account = 42
asset = 0
amount = 1000000000

[[genesis]]
account = 42
asset = 3
amount = 10000000000
)";
}

}  // namespace config
}  // namespace swapvault
