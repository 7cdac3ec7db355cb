#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/chain/chain_validator.hpp"
#include "core/codec/byte_io.hpp"
#include "core/codec/codec.hpp"
#include "core/crypto/hasher.hpp"
#include "core/crypto/signer.hpp"
#include "core/frame/frame_builder.hpp"
#include "core/util/text.hpp"

namespace {

using kutyus::Content;
using kutyus::Digest;
using kutyus::ErrorCode;
using kutyus::FeedState;
using kutyus::Frame;
using kutyus::Message;
using kutyus::Result;
using kutyus::crypto::Ed25519Signer;

std::unique_ptr<Ed25519Signer> signer_for(std::uint8_t fill) {
  kutyus::Seed seed{};
  seed.fill(fill);
  auto signer = Ed25519Signer::from_seed(seed);
  assert(signer != nullptr);
  return signer;
}

Frame build(const Ed25519Signer& signer, std::uint64_t sequence, const Digest& previous,
            std::int64_t timestamp, const std::string& text) {
  Frame frame;
  const Result built = kutyus::build_frame(signer, signer.public_key(), sequence, previous,
                                           timestamp, Content::blob(text), frame);
  assert(built.ok);
  return frame;
}

std::vector<Frame> build_chain(const Ed25519Signer& signer, std::size_t length) {
  std::vector<Frame> frames;
  FeedState state;
  for (std::size_t i = 0; i < length; ++i) {
    Frame frame;
    const Result built = kutyus::build_next_frame(signer, state, 1000 + static_cast<std::int64_t>(i),
                                                  Content::blob("entry-" + std::to_string(i)), frame);
    assert(built.ok);
    state = FeedState::linked(frame);
    frames.push_back(std::move(frame));
  }
  return frames;
}

// Signs a message without going through the builder's field checks.
Frame sign_unchecked(const Ed25519Signer& signer, Message message) {
  Frame frame;
  frame.message = std::move(message);
  frame.id = kutyus::crypto::message_id(frame.message);
  frame.signature = signer.sign(kutyus::codec::signing_payload(frame.id, frame.message));
  return frame;
}

Message sample_message() {
  Message message;
  message.author.fill(0x11);
  message.sequence = 0x0102030405060708ULL;
  message.previous.fill(0x22);
  message.timestamp = -42;
  message.content.type = "post";
  message.content.data = std::string{"line one\nline\0two", 17};
  return message;
}

void test_message_round_trip() {
  const Message message = sample_message();
  Message decoded;
  const Result result = kutyus::codec::decode_message(kutyus::codec::encode_message(message), decoded);
  assert(result.ok);
  assert(decoded == message);

  Message empty_content = message;
  empty_content.content.data.clear();
  const Result empty_result =
      kutyus::codec::decode_message(kutyus::codec::encode_message(empty_content), decoded);
  assert(empty_result.ok);
  assert(decoded == empty_content);
}

void test_message_layout_is_fixed() {
  const Message message = sample_message();
  const std::string a = kutyus::codec::encode_message(message);
  const std::string b = kutyus::codec::encode_message(message);
  assert(a == b);
  assert(a.size() == kutyus::kMessageFixedBytes + message.content.type.size() +
                         message.content.data.size());
  assert(static_cast<unsigned char>(a[0]) == kutyus::kMessageFormatVersion);

  // sequence follows version and author, big-endian
  for (std::size_t i = 0; i < 8; ++i) {
    assert(static_cast<unsigned char>(a[33 + i]) == i + 1);
  }
  // timestamp -42 as two's complement
  const std::size_t ts_offset = 1 + 32 + 8 + 64;
  assert(static_cast<unsigned char>(a[ts_offset]) == 0xFF);
  assert(static_cast<unsigned char>(a[ts_offset + 7]) == 0xD6);
  // type length prefix
  assert(static_cast<unsigned char>(a[ts_offset + 8]) == 0x00);
  assert(static_cast<unsigned char>(a[ts_offset + 9]) == 0x04);
  assert(a.substr(ts_offset + 10, 4) == "post");
}

void test_decode_error_classes() {
  const Message message = sample_message();
  const std::string bytes = kutyus::codec::encode_message(message);
  Message out;

  for (std::size_t len = 0; len < bytes.size(); ++len) {
    const Result r = kutyus::codec::decode_message(bytes.substr(0, len), out);
    assert(!r.ok);
    assert(r.code == ErrorCode::TruncatedInput);
  }

  Result r = kutyus::codec::decode_message(bytes + std::string(1, '\0'), out);
  assert(r.code == ErrorCode::InvalidEncoding);

  std::string wrong_version = bytes;
  wrong_version[0] = 0x02;
  r = kutyus::codec::decode_message(wrong_version, out);
  assert(r.code == ErrorCode::InvalidEncoding);

  kutyus::ValidationLimits tight;
  tight.max_content_bytes = 2;
  r = kutyus::codec::decode_message(bytes, out, tight);
  assert(r.code == ErrorCode::InvalidEncoding);

  Message zero_sequence = message;
  zero_sequence.sequence = 0;
  r = kutyus::codec::decode_message(kutyus::codec::encode_message(zero_sequence), out);
  assert(r.code == ErrorCode::MalformedMessage);

  Message no_type = message;
  no_type.content.type.clear();
  r = kutyus::codec::decode_message(kutyus::codec::encode_message(no_type), out);
  assert(r.code == ErrorCode::MalformedMessage);
  assert(kutyus::is_encoding_error(r.code));

  // failed decodes leave the output untouched
  assert(out == Message{});
}

void test_digest_sensitivity() {
  assert(kutyus::util::to_hex(kutyus::crypto::digest("abc")) ==
         "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
         "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");

  const Message base = sample_message();
  const Digest id = kutyus::crypto::message_id(base);
  assert(id == kutyus::crypto::message_id(base));

  std::vector<Message> variants(6, base);
  variants[0].author[31] ^= 0x01;
  variants[1].sequence += 1;
  variants[2].previous[0] ^= 0x80;
  variants[3].timestamp += 1;
  variants[4].content.type = "posT";
  variants[5].content.data.push_back('!');
  for (const Message& variant : variants) {
    assert(kutyus::crypto::message_id(variant) != id);
  }

  assert(kutyus::crypto::is_genesis_previous(Digest{}));
  assert(!kutyus::crypto::is_genesis_previous(base.previous));
}

void test_ed25519_signer() {
  // RFC 8032 section 7.1, test 1
  const auto seed_bytes =
      kutyus::util::from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
  assert(seed_bytes.has_value());
  kutyus::Seed seed{};
  std::copy(seed_bytes->begin(), seed_bytes->end(), seed.begin());
  const auto signer = Ed25519Signer::from_seed(seed);
  assert(signer != nullptr);
  assert(kutyus::util::to_hex(signer->public_key()) ==
         "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
  assert(kutyus::util::to_hex(signer->sign("")) ==
         "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555"
         "fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");

  const auto& verifier = kutyus::crypto::default_verifier();
  const kutyus::Signature signature = signer->sign("payload");
  assert(verifier.verify(signer->public_key(), "payload", signature));
  assert(!verifier.verify(signer->public_key(), "payload-x", signature));
  assert(!verifier.verify(signer_for(0x07)->public_key(), "payload", signature));

  const auto generated = Ed25519Signer::generate();
  assert(generated != nullptr);
  assert(generated->public_key() != signer->public_key());
  assert(verifier.verify(generated->public_key(), "x", generated->sign("x")));
}

void test_build_frame_rules() {
  const auto signer = signer_for(0x01);
  Frame frame;

  Result r = kutyus::build_frame(*signer, signer->public_key(), 0, Digest{}, 1, Content::blob("x"),
                                 frame);
  assert(r.code == ErrorCode::InvalidSequence);

  r = kutyus::build_frame(*signer, signer_for(0x02)->public_key(), 1, Digest{}, 1,
                          Content::blob("x"), frame);
  assert(r.code == ErrorCode::AuthorKeyMismatch);

  r = kutyus::build_frame(*signer, signer->public_key(), 1, Digest{}, 1, Content{"", "x"}, frame);
  assert(r.code == ErrorCode::MalformedMessage);

  const Frame built = build(*signer, 1, Digest{}, 1000, "hello");
  assert(built.id == kutyus::crypto::message_id(built.message));
  assert(built.message.content.type == kutyus::kBlobContentType);
  assert(kutyus::crypto::default_verifier().verify(
      signer->public_key(), kutyus::codec::signing_payload(built.id, built.message),
      built.signature));
  // the signature never covers the raw content alone
  assert(!kutyus::crypto::default_verifier().verify(signer->public_key(), "hello",
                                                    built.signature));
}

void test_frame_round_trip_and_framing_errors() {
  const auto signer = signer_for(0x03);
  const Frame frame = build(*signer, 1, Digest{}, 5, "framed");
  const std::string bytes = kutyus::codec::encode_frame(frame);
  assert(bytes.size() == kutyus::kFrameFixedBytes + kutyus::codec::encode_message(frame.message).size());
  assert(bytes.substr(0, bytes.size() - kutyus::kSignatureBytes) ==
         kutyus::codec::signing_payload(frame.id, frame.message));

  Frame decoded;
  Result r = kutyus::codec::decode_frame(bytes, decoded);
  assert(r.ok);
  assert(decoded == frame);

  r = kutyus::codec::decode_frame(bytes.substr(0, bytes.size() - 1), decoded);
  assert(r.code == ErrorCode::TruncatedInput);
  r = kutyus::codec::decode_frame(bytes + "x", decoded);
  assert(r.code == ErrorCode::InvalidEncoding);

  // declared message length one byte short of the real message
  const std::string message_bytes = kutyus::codec::encode_message(frame.message);
  kutyus::codec::ByteWriter writer;
  writer.write_u8(kutyus::kFrameFormatVersion);
  writer.write_array(frame.id);
  writer.write_u32(static_cast<std::uint32_t>(message_bytes.size() - 1));
  writer.write_bytes(message_bytes.substr(0, message_bytes.size() - 1));
  writer.write_array(frame.signature);
  r = kutyus::codec::decode_frame(writer.bytes(), decoded);
  assert(r.code == ErrorCode::InvalidEncoding);
}

void test_two_frame_scenario() {
  const auto key = signer_for(0x4b);

  Frame frame1;
  Result r = kutyus::build_frame(*key, key->public_key(), 1, kutyus::crypto::genesis_previous(), 1000,
                                 Content::blob("hello"), frame1);
  assert(r.ok);
  const auto first = kutyus::validate_frame(frame1, FeedState::empty());
  assert(first.accepted);
  assert(first.state.last.has_value() && *first.state.last == frame1);

  const Digest link = kutyus::crypto::frame_digest(frame1);
  assert(link != frame1.id);
  Frame frame2;
  r = kutyus::build_frame(*key, key->public_key(), 2, link, 1001, Content::blob("world"), frame2);
  assert(r.ok);
  const auto second = kutyus::validate_frame(frame2, first.state);
  assert(second.accepted);
  assert(*second.state.last == frame2);

  const auto replay = kutyus::validate_frame(frame2, FeedState::empty());
  assert(!replay.accepted);
  assert(replay.reason == ErrorCode::InvalidGenesis);
  assert(replay.state.is_empty());
}

void test_chain_continuity() {
  const auto signer = signer_for(0x05);
  const std::vector<Frame> frames = build_chain(*signer, 12);

  const kutyus::ChainValidator validator;
  const auto chain = validator.validate_chain(frames, FeedState::empty());
  assert(chain.last.accepted);
  assert(chain.accepted_count == frames.size());
  assert(*chain.last.state.last == frames.back());

  std::vector<Frame> tampered = frames;
  tampered[7].message.content.data = "rewritten";
  const auto broken = validator.validate_chain(tampered, FeedState::empty());
  assert(!broken.last.accepted);
  assert(broken.accepted_count == 7);
  assert(broken.last.reason == ErrorCode::IdMismatch);
  assert(*broken.last.state.last == frames[6]);
}

void test_gap_fork_and_time_rules() {
  const auto signer = signer_for(0x06);
  const std::vector<Frame> frames = build_chain(*signer, 7);
  const FeedState at_five = FeedState::linked(frames[4]);

  auto outcome = kutyus::validate_frame(frames[6], at_five);
  assert(outcome.reason == ErrorCode::SequenceGap);
  assert(kutyus::is_missing_history(outcome.reason));

  outcome = kutyus::validate_frame(frames[3], at_five);
  assert(outcome.reason == ErrorCode::SequenceGap);

  const Frame fork = build(*signer, 6, kutyus::crypto::frame_digest(frames[3]), 2000, "fork");
  outcome = kutyus::validate_frame(fork, at_five);
  assert(outcome.reason == ErrorCode::BrokenLink);
  assert(!kutyus::is_missing_history(outcome.reason));

  // a link to the unsigned id instead of the full frame digest is a fork too
  const Frame id_link = build(*signer, 6, frames[4].id, 2000, "id-link");
  assert(kutyus::validate_frame(id_link, at_five).reason == ErrorCode::BrokenLink);

  const Frame older = build(*signer, 6, kutyus::crypto::frame_digest(frames[4]),
                            frames[4].message.timestamp - 1, "older");
  assert(kutyus::validate_frame(older, at_five).reason == ErrorCode::TimeRegression);

  const Frame same_time = build(*signer, 6, kutyus::crypto::frame_digest(frames[4]),
                                frames[4].message.timestamp, "same-time");
  assert(kutyus::validate_frame(same_time, at_five).accepted);

  const auto other = signer_for(0x16);
  const std::vector<Frame> other_frames = build_chain(*other, 2);
  assert(kutyus::validate_frame(other_frames[1], FeedState::linked(frames[0])).reason ==
         ErrorCode::AuthorMismatch);
}

void test_genesis_rules() {
  const auto signer = signer_for(0x08);
  const Frame not_first = build(*signer, 2, Digest{}, 1, "two");
  assert(kutyus::validate_frame(not_first, FeedState::empty()).reason == ErrorCode::InvalidGenesis);

  Digest non_sentinel{};
  non_sentinel[10] = 1;
  const Frame linked_first = build(*signer, 1, non_sentinel, 1, "one");
  assert(kutyus::validate_frame(linked_first, FeedState::empty()).reason ==
         ErrorCode::InvalidGenesis);
}

void test_bit_flips_are_rejected() {
  const auto signer = signer_for(0x09);
  const Frame frame = build(*signer, 1, Digest{}, 77, "integrity");
  const std::string bytes = kutyus::codec::encode_frame(frame);
  const kutyus::ChainValidator validator;

  std::size_t decoded_flips = 0;
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    std::string flipped = bytes;
    flipped[i] = static_cast<char>(flipped[i] ^ 0x01);
    const auto outcome = validator.validate_bytes(flipped, FeedState::empty());
    assert(!outcome.accepted);
    if (!kutyus::is_encoding_error(outcome.reason)) {
      ++decoded_flips;
      assert(outcome.reason == ErrorCode::IdMismatch || outcome.reason == ErrorCode::BadSignature);
    }
  }
  assert(decoded_flips > bytes.size() / 2);

  Frame mutated = frame;
  mutated.message.timestamp += 1;
  assert(validator.validate(mutated, FeedState::empty()).reason == ErrorCode::IdMismatch);
  mutated.id = kutyus::crypto::message_id(mutated.message);
  assert(validator.validate(mutated, FeedState::empty()).reason == ErrorCode::BadSignature);

  Frame bad_signature = frame;
  bad_signature.signature[63] ^= 0x40;
  assert(validator.validate(bad_signature, FeedState::empty()).reason == ErrorCode::BadSignature);
}

void test_field_constraints_are_validated() {
  const auto signer = signer_for(0x0b);
  Message genesis;
  genesis.author = signer->public_key();
  genesis.sequence = 1;
  genesis.timestamp = 5;
  genesis.content = Content{"", "x"};

  const kutyus::ChainValidator validator;
  const Frame untyped = sign_unchecked(*signer, genesis);
  auto outcome = validator.validate(untyped, FeedState::empty());
  assert(outcome.reason == ErrorCode::MalformedMessage);
  assert(outcome.state.is_empty());
  assert(kutyus::validate_frame(untyped, FeedState::empty()).reason == ErrorCode::MalformedMessage);

  Message zero = genesis;
  zero.content = Content::blob("x");
  zero.sequence = 0;
  assert(validator.validate(sign_unchecked(*signer, zero), FeedState::empty()).reason ==
         ErrorCode::MalformedMessage);

  // 65536 bytes would wrap the u16 length prefix
  Message wide = genesis;
  wide.content = Content{std::string(65536, 't'), "x"};
  assert(validator.validate(sign_unchecked(*signer, wide), FeedState::empty()).reason ==
         ErrorCode::MalformedMessage);

  const kutyus::ChainValidator strict(kutyus::crypto::default_verifier(),
                                      kutyus::ValidationLimits{.max_content_type_bytes = 4,
                                                               .max_content_bytes = 8});
  Message large = genesis;
  large.content = Content::blob("123456789");
  const Frame oversized = sign_unchecked(*signer, large);
  assert(strict.validate(oversized, FeedState::empty()).reason == ErrorCode::MalformedMessage);
  assert(validator.validate(oversized, FeedState::empty()).accepted);

  Message long_type = genesis;
  long_type.content = Content{"notes", "ok"};
  assert(strict.validate(sign_unchecked(*signer, long_type), FeedState::empty()).reason ==
         ErrorCode::MalformedMessage);

  // whatever validate() accepts decodes under the same limits
  Frame decoded;
  assert(kutyus::codec::decode_frame(kutyus::codec::encode_frame(oversized), decoded).ok);
  assert(!kutyus::codec::decode_frame(kutyus::codec::encode_frame(oversized), decoded,
                                      strict.limits())
              .ok);

  const auto chain = validator.validate_chain({build(*signer, 1, Digest{}, 1, "one"), untyped},
                                              FeedState::empty());
  assert(chain.accepted_count == 1);
  assert(chain.last.reason == ErrorCode::MalformedMessage);
}

void test_validate_bytes_reports_decode_errors() {
  const kutyus::ChainValidator validator;
  auto outcome = validator.validate_bytes("", FeedState::empty());
  assert(outcome.reason == ErrorCode::TruncatedInput);

  const auto signer = signer_for(0x0a);
  const std::string bytes = kutyus::codec::encode_frame(build(*signer, 1, Digest{}, 1, "x"));
  outcome = validator.validate_bytes(bytes + "tail", FeedState::empty());
  assert(outcome.reason == ErrorCode::InvalidEncoding);

  outcome = validator.validate_bytes(bytes, FeedState::empty());
  assert(outcome.accepted);
}

void test_parallel_validation_of_distinct_feeds() {
  std::vector<std::vector<Frame>> feeds;
  for (std::uint8_t i = 0; i < 4; ++i) {
    feeds.push_back(build_chain(*signer_for(static_cast<std::uint8_t>(0x30 + i)), 20));
  }

  const kutyus::ChainValidator validator;
  std::vector<int> accepted(feeds.size(), 0);
  std::vector<std::thread> workers;
  for (std::size_t f = 0; f < feeds.size(); ++f) {
    workers.emplace_back([&, f]() {
      FeedState state;
      for (const Frame& frame : feeds[f]) {
        auto outcome = validator.validate(frame, state);
        if (!outcome.accepted) {
          return;
        }
        state = std::move(outcome.state);
        ++accepted[f];
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  for (const int count : accepted) {
    assert(count == 20);
  }
}

}  // namespace

int main() {
  const bool crypto_ready = kutyus::crypto::initialize_crypto();
  assert(crypto_ready);
  (void)crypto_ready;

  test_message_round_trip();
  test_message_layout_is_fixed();
  test_decode_error_classes();
  test_digest_sensitivity();
  test_ed25519_signer();
  test_build_frame_rules();
  test_frame_round_trip_and_framing_errors();
  test_two_frame_scenario();
  test_chain_continuity();
  test_gap_fork_and_time_rules();
  test_genesis_rules();
  test_bit_flips_are_rejected();
  test_field_constraints_are_validated();
  test_validate_bytes_reports_decode_errors();
  test_parallel_validation_of_distinct_feeds();

  std::cout << "kutyus_core_tests passed\n";
  return 0;
}
