#include "core/api/core_api.hpp"

#include <utility>

#include "core/codec/codec.hpp"
#include "core/config/config.hpp"
#include "core/frame/frame_builder.hpp"
#include "core/observability/logging.hpp"

namespace kutyus {

CoreApi::CoreApi() : store_(std::make_unique<FeedStore>()) {}

Result CoreApi::init(const CoreConfig& config) {
  const Result checked = check_config(config);
  if (!checked.ok) {
    return checked;
  }

  observability::InitializeLogging(config.logging);
  if (!crypto::initialize_crypto()) {
    KUTYUS_LOG_ERROR("libsodium initialization failed");
    return Result::failure(ErrorCode::CryptoUnavailable, "libsodium initialization failed.");
  }

  auto store = std::make_unique<FeedStore>(crypto::default_verifier(), config.limits);
  const Result opened = store->open(config.store.directory, config.store.record_rejections);
  if (!opened.ok) {
    KUTYUS_LOG_ERROR("feed store open failed", {observability::StringField("detail", opened.message)});
    return opened;
  }

  config_ = config;
  store_ = std::move(store);
  KUTYUS_LOG_INFO("kutyus core ready",
                  {observability::StringField("library", kLibraryName),
                   observability::StringField("version", kLibraryVersion),
                   observability::StringField("store", config_.store.directory.empty()
                                                           ? std::string_view{"memory"}
                                                           : std::string_view{config_.store.directory})});
  return Result::success("Core initialized.");
}

std::string CoreApi::encode(const Message& message) const {
  return codec::encode_message(message);
}

Result CoreApi::decode(std::string_view bytes, Message& out) const {
  return codec::decode_message(bytes, out, config_.limits);
}

Result CoreApi::build_frame(const crypto::Signer& signer, const PublicKey& author,
                            std::uint64_t sequence, const Digest& previous, std::int64_t timestamp,
                            const Content& content, Frame& out) const {
  return kutyus::build_frame(signer, author, sequence, previous, timestamp, content, out,
                             config_.limits);
}

ValidationOutcome CoreApi::validate_frame(const Frame& candidate,
                                          const FeedState& last_accepted) const {
  return store_->validator().validate(candidate, last_accepted);
}

Result CoreApi::publish(const crypto::Signer& signer, std::int64_t timestamp,
                        const Content& content, Frame* published) {
  std::lock_guard lock(publish_mutex_);
  Frame frame;
  const Result built = build_next_frame(signer, store_->state(signer.public_key()), timestamp,
                                        content, frame, config_.limits);
  if (!built.ok) {
    return built;
  }

  Result appended = store_->append(frame);
  if (appended.ok && published != nullptr) {
    *published = std::move(frame);
  }
  return appended;
}

Result CoreApi::ingest(std::string_view frame_bytes) {
  return store_->append_bytes(frame_bytes);
}

std::optional<Frame> CoreApi::latest(const PublicKey& author) const {
  return store_->latest(author);
}

std::optional<Frame> CoreApi::get(const PublicKey& author, std::uint64_t sequence) const {
  return store_->get(author, sequence);
}

FeedCursor CoreApi::iterate(const PublicKey& author, std::uint64_t from_sequence) const {
  return store_->iterate(author, from_sequence);
}

StoreHealth CoreApi::health() const {
  return store_->health();
}

}  // namespace kutyus
