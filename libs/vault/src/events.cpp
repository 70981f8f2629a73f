#include "swapvault/vault/events.hpp"

#include <type_traits>
#include <utility>

namespace swapvault {
namespace vault {

namespace {

class PayloadWriter {
 public:
  template <typename T>
  PayloadWriter& put(T value) {
    static_assert(std::is_unsigned_v<T>);
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      bytes_.push_back(static_cast<std::byte>((value >> (8 * i)) & 0xFF));
    }
    return *this;
  }

  std::vector<std::byte> take() { return std::move(bytes_); }

 private:
  std::vector<std::byte> bytes_{};
};

class PayloadReader {
 public:
  explicit PayloadReader(std::span<const std::byte> bytes) : bytes_(bytes) {}

  template <typename T>
  bool get(T& out) {
    static_assert(std::is_unsigned_v<T>);
    if (bytes_.size() - offset_ < sizeof(T)) {
      return false;
    }
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      value |= static_cast<T>(static_cast<T>(bytes_[offset_ + i]) << (8 * i));
    }
    offset_ += sizeof(T);
    out = value;
    return true;
  }

  [[nodiscard]] bool exhausted() const noexcept { return offset_ == bytes_.size(); }

 private:
  std::span<const std::byte> bytes_;
  std::size_t offset_{0};
};

}  // namespace

std::uint16_t event_kind(const Event& event) noexcept {
  return static_cast<std::uint16_t>(event.index() + 1);
}

std::vector<std::byte> encode_event(const Event& event) {
  PayloadWriter writer;
  std::visit(
      [&writer](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, DepositCompleted>) {
          writer.put(ev.receipt.user)
              .put(ev.receipt.asset_in)
              .put(ev.receipt.amount_in)
              .put(ev.receipt.reference_credited);
        } else if constexpr (std::is_same_v<T, DepositFailed>) {
          writer.put(ev.user)
              .put(ev.asset_stranded)
              .put(ev.amount_stranded)
              .put(static_cast<std::uint8_t>(ev.status));
        } else if constexpr (std::is_same_v<T, WithdrawalCompleted>) {
          writer.put(ev.user).put(ev.amount).put(ev.balance_after);
        } else if constexpr (std::is_same_v<T, CapUpdated>) {
          writer.put(ev.before).put(ev.after);
        } else if constexpr (std::is_same_v<T, RescueCompleted>) {
          writer.put(ev.asset).put(ev.to).put(ev.amount);
        } else if constexpr (std::is_same_v<T, PauseChanged>) {
          writer.put(static_cast<std::uint8_t>(ev.paused ? 1 : 0));
        } else if constexpr (std::is_same_v<T, AdminAccepted>) {
          writer.put(ev.caller).put(ev.nonce).put(static_cast<std::uint8_t>(ev.action));
        }
      },
      event);
  return writer.take();
}

std::optional<Event> decode_event(std::uint16_t kind, std::span<const std::byte> payload) {
  PayloadReader reader(payload);
  std::optional<Event> out;

  switch (kind) {
    case 1: {
      DepositCompleted ev;
      if (reader.get(ev.receipt.user) && reader.get(ev.receipt.asset_in) &&
          reader.get(ev.receipt.amount_in) && reader.get(ev.receipt.reference_credited)) {
        out = ev;
      }
      break;
    }
    case 2: {
      DepositFailed ev;
      std::uint8_t status = 0;
      if (reader.get(ev.user) && reader.get(ev.asset_stranded) && reader.get(ev.amount_stranded) &&
          reader.get(status)) {
        ev.status = static_cast<common::Status>(status);
        out = ev;
      }
      break;
    }
    case 3: {
      WithdrawalCompleted ev;
      if (reader.get(ev.user) && reader.get(ev.amount) && reader.get(ev.balance_after)) {
        out = ev;
      }
      break;
    }
    case 4: {
      CapUpdated ev;
      if (reader.get(ev.before) && reader.get(ev.after)) {
        out = ev;
      }
      break;
    }
    case 5: {
      RescueCompleted ev;
      if (reader.get(ev.asset) && reader.get(ev.to) && reader.get(ev.amount)) {
        out = ev;
      }
      break;
    }
    case 6: {
      std::uint8_t paused = 0;
      if (reader.get(paused)) {
        out = PauseChanged{.paused = paused != 0};
      }
      break;
    }
    case 7: {
      AdminAccepted ev;
      std::uint8_t action = 0;
      if (reader.get(ev.caller) && reader.get(ev.nonce) && reader.get(action)) {
        ev.action = static_cast<auth::AdminAction>(action);
        out = ev;
      }
      break;
    }
    default:
      return std::nullopt;
  }

  if (!reader.exhausted()) {
    return std::nullopt;
  }
  return out;
}

}  // namespace vault
}  // namespace swapvault
