#include "core/codec/byte_io.hpp"

namespace kutyus::codec {

void ByteWriter::write_u8(std::uint8_t value) {
  out_.push_back(static_cast<char>(value));
}

void ByteWriter::write_u16(std::uint16_t value) {
  out_.push_back(static_cast<char>((value >> 8U) & 0xFFU));
  out_.push_back(static_cast<char>(value & 0xFFU));
}

void ByteWriter::write_u32(std::uint32_t value) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    out_.push_back(static_cast<char>((value >> static_cast<std::uint32_t>(shift)) & 0xFFU));
  }
}

void ByteWriter::write_u64(std::uint64_t value) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out_.push_back(static_cast<char>((value >> static_cast<std::uint64_t>(shift)) & 0xFFULL));
  }
}

void ByteWriter::write_bytes(std::string_view bytes) {
  out_.append(bytes);
}

bool ByteReader::read_be(std::size_t width, std::uint64_t& out) {
  if (remaining() < width) {
    return false;
  }
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    value = (value << 8U) | static_cast<unsigned char>(input_[offset_ + i]);
  }
  offset_ += width;
  out = value;
  return true;
}

bool ByteReader::read_u8(std::uint8_t& out) {
  std::uint64_t value = 0;
  if (!read_be(1, value)) {
    return false;
  }
  out = static_cast<std::uint8_t>(value);
  return true;
}

bool ByteReader::read_u16(std::uint16_t& out) {
  std::uint64_t value = 0;
  if (!read_be(2, value)) {
    return false;
  }
  out = static_cast<std::uint16_t>(value);
  return true;
}

bool ByteReader::read_u32(std::uint32_t& out) {
  std::uint64_t value = 0;
  if (!read_be(4, value)) {
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

bool ByteReader::read_u64(std::uint64_t& out) {
  return read_be(8, out);
}

bool ByteReader::read_bytes(std::size_t count, std::string& out) {
  if (remaining() < count) {
    return false;
  }
  out.assign(input_.data() + offset_, count);
  offset_ += count;
  return true;
}

}  // namespace kutyus::codec
