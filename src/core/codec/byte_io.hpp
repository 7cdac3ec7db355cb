#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

namespace kutyus::codec {

// Appends fixed-width big-endian fields to a byte string.
class ByteWriter {
public:
  explicit ByteWriter(std::size_t reserve_bytes = 0) { out_.reserve(reserve_bytes); }

  void write_u8(std::uint8_t value);
  void write_u16(std::uint16_t value);
  void write_u32(std::uint32_t value);
  void write_u64(std::uint64_t value);
  void write_bytes(std::string_view bytes);

  template <std::size_t N>
  void write_array(const std::array<std::uint8_t, N>& bytes) {
    out_.append(reinterpret_cast<const char*>(bytes.data()), N);
  }

  [[nodiscard]] const std::string& bytes() const { return out_; }
  std::string take() { return std::move(out_); }

private:
  std::string out_;
};

// Cursor over an input buffer. Every read returns false, without moving the
// cursor, when fewer bytes remain than requested.
class ByteReader {
public:
  explicit ByteReader(std::string_view input) : input_(input) {}

  bool read_u8(std::uint8_t& out);
  bool read_u16(std::uint16_t& out);
  bool read_u32(std::uint32_t& out);
  bool read_u64(std::uint64_t& out);
  bool read_bytes(std::size_t count, std::string& out);

  template <std::size_t N>
  bool read_array(std::array<std::uint8_t, N>& out) {
    if (remaining() < N) {
      return false;
    }
    std::memcpy(out.data(), input_.data() + offset_, N);
    offset_ += N;
    return true;
  }

  [[nodiscard]] std::size_t remaining() const { return input_.size() - offset_; }
  [[nodiscard]] bool exhausted() const { return offset_ == input_.size(); }
  [[nodiscard]] std::size_t offset() const { return offset_; }

private:
  bool read_be(std::size_t width, std::uint64_t& out);

  std::string_view input_;
  std::size_t offset_ = 0;
};

}  // namespace kutyus::codec
