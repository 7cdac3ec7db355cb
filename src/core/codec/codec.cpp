#include "core/codec/codec.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include "core/codec/byte_io.hpp"

namespace kutyus::codec {
namespace {

void write_message(ByteWriter& writer, const Message& message) {
  writer.write_u8(kMessageFormatVersion);
  writer.write_array(message.author);
  writer.write_u64(message.sequence);
  writer.write_array(message.previous);
  writer.write_u64(static_cast<std::uint64_t>(message.timestamp));
  writer.write_u16(static_cast<std::uint16_t>(message.content.type.size()));
  writer.write_bytes(message.content.type);
  writer.write_u32(static_cast<std::uint32_t>(message.content.data.size()));
  writer.write_bytes(message.content.data);
}

void write_frame_head(ByteWriter& writer, const Digest& id, const std::string& message_bytes) {
  writer.write_u8(kFrameFormatVersion);
  writer.write_array(id);
  writer.write_u32(static_cast<std::uint32_t>(message_bytes.size()));
  writer.write_bytes(message_bytes);
}

Result truncated(std::string_view field) {
  return Result::failure(ErrorCode::TruncatedInput,
                         "Input ended while reading " + std::string{field} + ".");
}

Result invalid(std::string msg) {
  return Result::failure(ErrorCode::InvalidEncoding, std::move(msg));
}

}  // namespace

std::string encode_message(const Message& message) {
  ByteWriter writer(kMessageFixedBytes + message.content.type.size() + message.content.data.size());
  write_message(writer, message);
  return writer.take();
}

Result check_message(const Message& message, const ValidationLimits& limits) {
  if (message.sequence == 0) {
    return Result::failure(ErrorCode::MalformedMessage, "Message sequence must be at least 1.");
  }
  if (message.content.type.empty()) {
    return Result::failure(ErrorCode::MalformedMessage, "Message content type is empty.");
  }
  if (message.content.type.size() > limits.max_content_type_bytes ||
      message.content.type.size() > std::numeric_limits<std::uint16_t>::max()) {
    return Result::failure(ErrorCode::MalformedMessage, "Message content type exceeds limit.");
  }
  if (message.content.data.size() > limits.max_content_bytes ||
      message.content.data.size() > std::numeric_limits<std::uint32_t>::max()) {
    return Result::failure(ErrorCode::MalformedMessage, "Message content exceeds limit.");
  }
  return Result::success();
}

Result decode_message(std::string_view bytes, Message& out, const ValidationLimits& limits) {
  ByteReader reader(bytes);

  std::uint8_t version = 0;
  if (!reader.read_u8(version)) {
    return truncated("message version");
  }
  if (version != kMessageFormatVersion) {
    return invalid("Unsupported message format version " + std::to_string(version) + ".");
  }

  Message message;
  if (!reader.read_array(message.author)) {
    return truncated("author");
  }
  if (!reader.read_u64(message.sequence)) {
    return truncated("sequence");
  }
  if (!reader.read_array(message.previous)) {
    return truncated("previous");
  }
  std::uint64_t raw_timestamp = 0;
  if (!reader.read_u64(raw_timestamp)) {
    return truncated("timestamp");
  }
  message.timestamp = static_cast<std::int64_t>(raw_timestamp);

  std::uint16_t type_len = 0;
  if (!reader.read_u16(type_len)) {
    return truncated("content type length");
  }
  if (type_len > limits.max_content_type_bytes) {
    return invalid("Content type length " + std::to_string(type_len) + " exceeds limit.");
  }
  if (!reader.read_bytes(type_len, message.content.type)) {
    return truncated("content type");
  }

  std::uint32_t content_len = 0;
  if (!reader.read_u32(content_len)) {
    return truncated("content length");
  }
  if (content_len > limits.max_content_bytes) {
    return invalid("Content length " + std::to_string(content_len) + " exceeds limit.");
  }
  if (!reader.read_bytes(content_len, message.content.data)) {
    return truncated("content");
  }

  if (!reader.exhausted()) {
    return invalid(std::to_string(reader.remaining()) + " trailing bytes after message at offset " +
                   std::to_string(reader.offset()) + ".");
  }

  const Result fields = check_message(message, limits);
  if (!fields.ok) {
    return fields;
  }

  out = std::move(message);
  return Result::success();
}

std::string signing_payload(const Digest& id, const Message& message) {
  const std::string message_bytes = encode_message(message);
  ByteWriter writer(kFrameFixedBytes + message_bytes.size());
  write_frame_head(writer, id, message_bytes);
  return writer.take();
}

std::string encode_frame(const Frame& frame) {
  const std::string message_bytes = encode_message(frame.message);
  ByteWriter writer(kFrameFixedBytes + message_bytes.size());
  write_frame_head(writer, frame.id, message_bytes);
  writer.write_array(frame.signature);
  return writer.take();
}

Result decode_frame(std::string_view bytes, Frame& out, const ValidationLimits& limits) {
  ByteReader reader(bytes);

  std::uint8_t version = 0;
  if (!reader.read_u8(version)) {
    return truncated("frame version");
  }
  if (version != kFrameFormatVersion) {
    return invalid("Unsupported frame format version " + std::to_string(version) + ".");
  }

  Frame frame;
  if (!reader.read_array(frame.id)) {
    return truncated("frame id");
  }

  std::uint32_t message_len = 0;
  if (!reader.read_u32(message_len)) {
    return truncated("message length");
  }
  if (message_len > limits.max_message_bytes()) {
    return invalid("Embedded message length " + std::to_string(message_len) + " exceeds limit.");
  }
  std::string message_bytes;
  if (!reader.read_bytes(message_len, message_bytes)) {
    return truncated("embedded message");
  }
  if (!reader.read_array(frame.signature)) {
    return truncated("signature");
  }
  if (!reader.exhausted()) {
    return invalid(std::to_string(reader.remaining()) + " trailing bytes after frame.");
  }

  Result inner = decode_message(message_bytes, frame.message, limits);
  if (!inner.ok) {
    // The outer length was complete, so a short message is a framing defect.
    if (inner.code == ErrorCode::TruncatedInput) {
      return invalid("Embedded message shorter than its declared fields: " + inner.message);
    }
    return inner;
  }

  out = std::move(frame);
  return Result::success();
}

}  // namespace kutyus::codec
