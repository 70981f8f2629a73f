#include "swapvault/journal/journal.hpp"

#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>

#include <unistd.h>

namespace swapvault {
namespace journal {

namespace {
constexpr std::uint32_t kMagic = 0x4c4a5653;  // 'SVJL'
constexpr std::uint16_t kVersion = 1;

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

}  // namespace

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : path_(path), flush_threshold_(flush_threshold_bytes) {
  buffer_.reserve(flush_threshold_bytes);
  try {
    open_and_recover();
  } catch (...) {
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
    throw;
  }
}

Writer::~Writer() {
  if (!write_buffer()) {
    std::fprintf(stderr, "journal %s: buffered records lost on close\n", path_.c_str());
  }
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Writer::open_and_recover() {
  file_ = std::fopen(path_.c_str(), "ab+");
  if (!file_) {
    throw std::runtime_error("failed to open journal: " + path_.string());
  }
  // Continue numbering after whatever is already on disk.
  std::uint64_t good_end = 0;
  bool torn = false;
  {
    Reader reader(path_);
    Record record;
    try {
      while (reader.next(record)) {
        next_sequence_ = record.header.sequence + 1;
      }
    } catch (const TornRecordError& e) {
      std::fprintf(stderr, "journal %s: %s, dropping tail after byte %llu\n", path_.c_str(), e.what(),
                   static_cast<unsigned long long>(reader.offset()));
      torn = true;
    }
    good_end = reader.offset();
  }
  if (torn && ::ftruncate(fileno(file_), static_cast<off_t>(good_end)) != 0) {
    throw std::system_error(errno, std::system_category(), "failed to truncate journal " + path_.string());
  }
  if (std::fseek(file_, 0, SEEK_END) != 0) {
    throw std::runtime_error("failed to seek journal: " + path_.string());
  }
}

std::uint64_t Writer::append(const RecordView& record) {
  if (!file_) {
    throw std::runtime_error("journal writer not open");
  }

  RecordHeader header{};
  header.magic = kMagic;
  header.version = kVersion;
  header.kind = record.kind;
  header.sequence = next_sequence_++;
  header.payload_size = static_cast<std::uint32_t>(record.payload.size());
  header.checksum = checksum32(record.payload);

  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  buffer_.insert(buffer_.end(), header_bytes.begin(), header_bytes.end());
  buffer_.insert(buffer_.end(), record.payload.begin(), record.payload.end());

  if (buffer_.size() >= flush_threshold_) {
    flush();
  }
  return header.sequence;
}

void Writer::flush() {
  if (!write_buffer()) {
    throw std::runtime_error("failed to write journal buffer: " + path_.string());
  }
}

void Writer::sync() {
  flush();
  if (!file_) {
    return;
  }
  if (::fsync(fileno(file_)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
}

bool Writer::write_buffer() noexcept {
  if (!file_ || buffer_.empty()) {
    return true;
  }
  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    return false;
  }
  buffer_.clear();
  return std::fflush(file_) == 0;
}

Reader::Reader(const std::filesystem::path& path)
    : path_(path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open journal for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  if (!file_) {
    return false;
  }

  RecordHeader header;
  const auto read_header = std::fread(&header, 1, sizeof(RecordHeader), file_);
  if (read_header == 0 && std::feof(file_)) {
    return false;
  }
  if (read_header != sizeof(RecordHeader)) {
    if (std::ferror(file_)) {
      throw std::runtime_error("failed to read journal: " + path_.string());
    }
    throw TornRecordError("truncated journal header");
  }
  if (header.magic != kMagic) {
    throw std::runtime_error("invalid journal magic in " + path_.string());
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    const auto read_payload = std::fread(out_record.payload.data(), 1, header.payload_size, file_);
    if (read_payload != header.payload_size) {
      throw TornRecordError("truncated journal record");
    }
  }
  if (header.checksum != checksum32(out_record.payload)) {
    throw std::runtime_error("journal checksum mismatch at sequence " + std::to_string(header.sequence));
  }
  offset_ += sizeof(RecordHeader) + header.payload_size;
  return true;
}

}  // namespace journal
}  // namespace swapvault
