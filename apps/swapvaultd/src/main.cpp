#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "swapvault/assets/native_wrapper.hpp"
#include "swapvault/assets/token_book.hpp"
#include "swapvault/auth/access_control.hpp"
#include "swapvault/common/status.hpp"
#include "swapvault/config/config_loader.hpp"
#include "swapvault/journal/journal.hpp"
#include "swapvault/ledger/ledger.hpp"
#include "swapvault/ledger/unit_converter.hpp"
#include "swapvault/pool/pair.hpp"
#include "swapvault/telemetry/telemetry_sink.hpp"
#include "swapvault/vault/events.hpp"
#include "swapvault/vault/journal_replay.hpp"
#include "swapvault/vault/vault.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./swapvault.toml or generates defaults\n";
}

void print_commands() {
  std::cout << "Commands:\n"
            << "  deposit <user> <asset> <amount> <min_out>\n"
            << "  deposit-native <user> <amount> <min_out>\n"
            << "  withdraw <user> <amount>\n"
            << "  quote <asset> <amount>\n"
            << "  balance <user>\n"
            << "  wallet <account> <asset>\n"
            << "  admin-message <caller> <nonce> <action> <asset> <target> <amount>\n"
            << "  admin <caller> <nonce> <action> <asset> <target> <amount> <signature_hex>\n"
            << "    action: set-cap | pause | unpause | rescue\n"
            << "  totals | events | metrics | help | quit\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./swapvault.toml",
      "/etc/swapvault/swapvault.toml",
      std::filesystem::path{home ? home : ""} / ".config/swapvault/swapvault.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

void print_status(std::string_view what, swapvault::common::Status status) {
  std::cout << what << ": " << swapvault::common::to_string(status);
  if (status != swapvault::common::Status::kOk) {
    std::cout << " (code " << swapvault::common::reject_code(status) << ")";
  }
  std::cout << "\n";
}

std::optional<swapvault::auth::AdminAction> parse_action(std::string_view name) {
  using swapvault::auth::AdminAction;
  if (name == "set-cap") {
    return AdminAction::kSetBankCap;
  }
  if (name == "pause") {
    return AdminAction::kPause;
  }
  if (name == "unpause") {
    return AdminAction::kUnpause;
  }
  if (name == "rescue") {
    return AdminAction::kRescue;
  }
  return std::nullopt;
}

// <caller> <nonce> <action> <asset> <target> <amount>
bool read_admin_command(std::istream& in, swapvault::auth::AdminCommand& command) {
  std::string action;
  if (!(in >> command.caller >> command.nonce >> action >> command.asset >> command.target >> command.amount)) {
    return false;
  }
  const auto parsed = parse_action(action);
  if (!parsed) {
    return false;
  }
  command.action = *parsed;
  return true;
}

void print_event(const swapvault::vault::Event& event) {
  using namespace swapvault::vault;
  std::visit(
      [](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, DepositCompleted>) {
          std::cout << "  deposit-completed user=" << ev.receipt.user << " asset=" << ev.receipt.asset_in
                    << " in=" << ev.receipt.amount_in << " credited=" << ev.receipt.reference_credited << "\n";
        } else if constexpr (std::is_same_v<T, DepositFailed>) {
          std::cout << "  deposit-failed user=" << ev.user << " asset=" << ev.asset_stranded
                    << " stranded=" << ev.amount_stranded << " reason=" << swapvault::common::to_string(ev.status)
                    << "\n";
        } else if constexpr (std::is_same_v<T, WithdrawalCompleted>) {
          std::cout << "  withdrawal-completed user=" << ev.user << " amount=" << ev.amount
                    << " balance=" << ev.balance_after << "\n";
        } else if constexpr (std::is_same_v<T, CapUpdated>) {
          std::cout << "  cap-updated " << ev.before << " -> " << ev.after << "\n";
        } else if constexpr (std::is_same_v<T, RescueCompleted>) {
          std::cout << "  rescue-completed asset=" << ev.asset << " to=" << ev.to << " amount=" << ev.amount << "\n";
        } else if constexpr (std::is_same_v<T, PauseChanged>) {
          std::cout << "  pause-changed paused=" << (ev.paused ? "true" : "false") << "\n";
        } else if constexpr (std::is_same_v<T, AdminAccepted>) {
          std::cout << "  admin-accepted caller=" << ev.caller << " nonce=" << ev.nonce
                    << " action=" << static_cast<int>(ev.action) << "\n";
        }
      },
      event);
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace swapvault;

  if (argc > 2) {
    print_usage(argv[0]);
    return 1;
  }

  auto config_path = find_config_path(argc, argv);
  config::ServiceConfig cfg;

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  std::cout << "Config loaded successfully\n";
  std::cout << "  Custody account: " << cfg.vault.custody_account << "\n";
  std::cout << "  Reference asset: " << cfg.vault.reference_asset << "\n";
  std::cout << "  Bank cap: " << cfg.vault.bank_cap << " cap units\n";

  try {
    assets::TokenBook book;
    for (const auto& asset : cfg.assets) {
      book.register_asset(asset.id, assets::AssetInfo{
                                        .symbol = asset.symbol,
                                        .decimals = asset.decimals,
                                        .transfer_fee_basis_points = asset.transfer_fee_basis_points,
                                    });
    }
    std::unique_ptr<assets::NativeWrapper> wrapper;
    if (cfg.native.enabled) {
      if (!book.has_asset(cfg.native.wrapped_asset)) {
        std::cerr << "Validation error [native.wrapped_asset]: asset " << cfg.native.wrapped_asset
                  << " is not registered\n";
        return 1;
      }
      book.register_asset(common::kNativeAsset, assets::AssetInfo{
                                                    .symbol = "NATIVE",
                                                    .decimals = book.info(cfg.native.wrapped_asset).decimals,
                                                    .transfer_fee_basis_points = 0,
                                                });
      wrapper = std::make_unique<assets::NativeWrapper>(book, cfg.native.wrapped_asset, cfg.native.escrow_account);
    }
    std::cout << "  Assets: " << cfg.assets.size() << (cfg.native.enabled ? " (+native)" : "") << "\n";

    // Opening repairs a torn tail, so the sequence reflects only complete records.
    std::unique_ptr<journal::Writer> journal_writer;
    if (cfg.journal.enabled) {
      if (cfg.journal.path.has_parent_path()) {
        std::filesystem::create_directories(cfg.journal.path.parent_path());
      }
      journal_writer = std::make_unique<journal::Writer>(cfg.journal.path, cfg.journal.flush_threshold);
      std::cout << "  Journal: " << cfg.journal.path << " (next sequence " << journal_writer->next_sequence()
                << ")\n";
    }
    const bool resuming = journal_writer && cfg.journal.replay_on_start && journal_writer->next_sequence() > 1;

    // Wallets were funded on first start; a resumed vault only rebuilds custody.
    if (resuming) {
      std::cout << "  Genesis: skipped, resuming from journal\n";
    } else {
      for (const auto& entry : cfg.genesis) {
        book.mint(entry.asset, entry.account, entry.amount);
      }
    }

    pool::PairRegistry pairs{book};
    for (const auto& pool_cfg : cfg.pools) {
      auto& pair = pairs.create_pair(pool_cfg.asset_a, pool_cfg.asset_b, pool_cfg.account);
      book.mint(pool_cfg.asset_a, pool_cfg.account, pool_cfg.reserve_a);
      book.mint(pool_cfg.asset_b, pool_cfg.account, pool_cfg.reserve_b);
      pair.sync();
      std::cout << "  Pool " << pool_cfg.account << ": " << pair.token0() << "/" << pair.token1() << " reserves "
                << pair.reserves().reserve0 << "/" << pair.reserves().reserve1 << "\n";
    }

    auth::AccessControl access;
    for (const auto& admin : cfg.admins) {
      auth::PublicKey key{};
      if (!auth::AccessControl::parse_public_key(admin.public_key_hex, key)) {
        std::cerr << "Validation error [admins]: bad public key for account " << admin.account << "\n";
        return 1;
      }
      access.grant_admin(admin.account, key);
    }
    std::cout << "  Auth: " << access.admin_count() << " registered admins\n";

    ledger::Ledger ledger{cfg.vault.bank_cap,
                          ledger::UnitConverter::from_decimals(cfg.vault.reference_decimals, cfg.vault.cap_decimals)};

    if (resuming) {
      const auto stats = vault::replay_journal(cfg.journal.path, ledger, access);
      std::cout << "  Journal replay: " << stats.records << " records, " << stats.deposits << " deposits, "
                << stats.withdrawals << " withdrawals, " << stats.cap_updates << " cap updates, "
                << stats.pause_changes << " pause changes, " << stats.admin_commands << " admin commands"
                << (access.is_paused() ? " [paused]" : "") << "\n";
      // Token balances are not persisted; custody is re-seeded with what the ledger owes.
      const auto held = ledger.totals().total_held;
      if (held > 0) {
        book.mint(cfg.vault.reference_asset, cfg.vault.custody_account, held);
      }
    }

    telemetry::TelemetrySink telemetry;

    vault::Vault vault{
        vault::VaultSettings{
            .custody_account = cfg.vault.custody_account,
            .reference_asset = cfg.vault.reference_asset,
        },
        ledger,
        book,
        pairs,
        access,
        vault::VaultServices{
            .native_wrapper = wrapper.get(),
            .journal = journal_writer.get(),
            .telemetry = cfg.telemetry.enabled ? &telemetry : nullptr,
        },
    };

    std::cout << "swapvaultd bootstrapped successfully\n";
    print_commands();

    std::string line;
    while (std::getline(std::cin, line)) {
      std::istringstream in(line);
      std::string command;
      if (!(in >> command)) {
        continue;
      }

      if (command == "quit" || command == "exit") {
        break;
      } else if (command == "help") {
        print_commands();
      } else if (command == "deposit") {
        common::AccountId user = 0;
        common::AssetId asset = 0;
        common::Amount amount = 0;
        common::Amount min_out = 0;
        if (!(in >> user >> asset >> amount >> min_out)) {
          std::cerr << "usage: deposit <user> <asset> <amount> <min_out>\n";
          continue;
        }
        const auto result = vault.deposit(user, asset, amount, min_out);
        print_status("deposit", result.status);
        if (result.status == common::Status::kOk) {
          std::cout << "  credited " << result.receipt.reference_credited << "\n";
        } else if (result.status == common::Status::kCapExceeded) {
          std::cout << "  new total " << result.credit.new_total << " > cap " << result.credit.cap << "\n";
        }
      } else if (command == "deposit-native") {
        common::AccountId user = 0;
        common::Amount amount = 0;
        common::Amount min_out = 0;
        if (!(in >> user >> amount >> min_out)) {
          std::cerr << "usage: deposit-native <user> <amount> <min_out>\n";
          continue;
        }
        const auto result = vault.deposit_native(user, amount, min_out);
        print_status("deposit-native", result.status);
        if (result.status == common::Status::kOk) {
          std::cout << "  credited " << result.receipt.reference_credited << "\n";
        }
      } else if (command == "withdraw") {
        common::AccountId user = 0;
        common::Amount amount = 0;
        if (!(in >> user >> amount)) {
          std::cerr << "usage: withdraw <user> <amount>\n";
          continue;
        }
        const auto result = vault.withdraw(user, amount);
        print_status("withdraw", result.status);
        std::cout << "  balance " << result.balance_after << "\n";
      } else if (command == "quote") {
        common::AssetId asset = 0;
        common::Amount amount = 0;
        if (!(in >> asset >> amount)) {
          std::cerr << "usage: quote <asset> <amount>\n";
          continue;
        }
        const auto result = vault.quote(asset, amount);
        print_status("quote", result.status);
        if (result.status == common::Status::kOk) {
          std::cout << "  reference " << result.reference_out << " (" << result.cap_units << " cap units, "
                    << (result.direct ? "direct" : "swap") << ")\n";
        }
      } else if (command == "balance") {
        common::AccountId user = 0;
        if (!(in >> user)) {
          std::cerr << "usage: balance <user>\n";
          continue;
        }
        std::cout << "balance " << user << ": " << vault.balance_of(user) << "\n";
      } else if (command == "wallet") {
        common::AccountId account = 0;
        common::AssetId asset = 0;
        if (!(in >> account >> asset)) {
          std::cerr << "usage: wallet <account> <asset>\n";
          continue;
        }
        std::cout << "wallet " << account << " asset " << asset << ": " << book.balance_of(asset, account) << "\n";
      } else if (command == "totals") {
        const auto totals = vault.totals();
        std::cout << "total_deposited " << totals.total_deposited << " / cap " << totals.bank_cap
                  << ", total_held " << totals.total_held << ", operations " << totals.operation_count
                  << (vault.is_paused() ? " [paused]" : "") << "\n";
      } else if (command == "events") {
        for (const auto& event : vault.drain_events()) {
          print_event(event);
        }
      } else if (command == "admin-message" || command == "admin") {
        auth::AdminCommand admin{};
        if (!read_admin_command(in, admin)) {
          std::cerr << "usage: " << command << " <caller> <nonce> <set-cap|pause|unpause|rescue> <asset> <target> <amount>"
                    << (command == "admin" ? " <signature_hex>" : "") << "\n";
          continue;
        }
        if (command == "admin-message") {
          std::cout << "sign: " << auth::AccessControl::to_hex(admin.encode()) << "\n";
          continue;
        }
        std::string signature_hex;
        auth::Signature signature{};
        if (!(in >> signature_hex) || !auth::AccessControl::parse_signature(signature_hex, signature)) {
          std::cerr << "admin: signature must be " << auth::kSignatureSize * 2 << " hex characters\n";
          continue;
        }
        const auto result = vault.administer(admin, signature);
        print_status("admin", result.status);
        if (result.status == common::Status::kOk || result.status == common::Status::kInsufficientBalance) {
          std::cout << "  before " << result.before << " after " << result.after << "\n";
        }
      } else if (command == "metrics") {
        std::array<std::uint64_t, 8> counted{};
        for (const auto& sample : telemetry.drain()) {
          const auto id = static_cast<std::size_t>(sample.metric);
          if (id < counted.size()) {
            ++counted[id];
          }
        }
        std::cout << "  samples since last report: deposits " << counted[1] + counted[2] << ", withdrawals "
                  << counted[3] + counted[4] << ", admin " << counted[5] + counted[6] << " (dropped "
                  << telemetry.dropped() << ")\n";
        for (const auto& summary : telemetry.drain_latency()) {
          std::cout << "  metric " << static_cast<int>(summary.metric) << ": count=" << summary.count
                    << " mean_ns=" << summary.mean_ns << " p99_ns=" << summary.p99_ns << "\n";
        }
        std::cout << "  deposits accepted=" << telemetry.total(telemetry::Metric::kDepositAccepted)
                  << " rejected=" << telemetry.total(telemetry::Metric::kDepositRejected)
                  << ", withdrawals accepted=" << telemetry.total(telemetry::Metric::kWithdrawalAccepted)
                  << " rejected=" << telemetry.total(telemetry::Metric::kWithdrawalRejected) << "\n";
      } else {
        std::cerr << "unknown command: " << command << "\n";
      }
    }

    if (journal_writer) {
      journal_writer->sync();
    }
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }

  std::cout << "swapvaultd stopped\n";
  return 0;
}
