#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <vector>

namespace swapvault {
namespace journal {

struct RecordHeader {
  std::uint32_t magic{0x4c4a5653};  // 'SVJL'
  std::uint16_t version{1};
  std::uint16_t kind{0};
  std::uint64_t sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

// The file ends partway through a record, as a crash mid-append leaves it.
class TornRecordError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct RecordView {
  std::uint16_t kind{0};
  std::span<const std::byte> payload{};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

// Append-only record log. Records are buffered and written once the buffer
// passes the flush threshold; sync() forces them to stable storage. Opening
// an existing log cuts a torn final record off before anything is appended.
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path,
                  std::size_t flush_threshold_bytes = 1 << 12);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  // Returns the sequence assigned to the record.
  std::uint64_t append(const RecordView& record);
  void flush();
  void sync();
  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::FILE* file_{nullptr};
  std::filesystem::path path_{};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  std::uint64_t next_sequence_{1};

  void open_and_recover();
  bool write_buffer() noexcept;
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  // False at a clean end of file. Throws TornRecordError when the file stops
  // inside a record, runtime_error on bad magic or checksum mismatch.
  bool next(Record& out_record);

  // Byte offset just past the last record next() returned.
  [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }

 private:
  std::FILE* file_{nullptr};
  std::filesystem::path path_{};
  std::uint64_t offset_{0};
};

}  // namespace journal
}  // namespace swapvault
