#include "qsm/security/replay_protection.hpp"
#include <algorithm>

namespace qsm::protocol::security {
    namespace {
        constexpr int64_t kCleanupIntervalMs = 60 * 1000;

        int64_t ToMillis(const std::chrono::system_clock::time_point time) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
        }

        size_t Fnv1a(size_t hash, std::string_view bytes) {
            for (const char c: bytes) {
                hash ^= static_cast<size_t>(static_cast<uint8_t>(c));
                hash *= CryptoHashConstants::FNV_PRIME;
            }
            return hash;
        }
    }

    size_t ReplayProtection::MessageKey::Hash::operator()(const MessageKey &key) const {
        size_t hash = Fnv1a(CryptoHashConstants::FNV_OFFSET_BASIS, key.sender_id);
        hash ^= 0xFF;
        hash *= CryptoHashConstants::FNV_PRIME;
        return Fnv1a(hash, key.message_id);
    }

    ReplayProtection::ReplayProtection()
        : ReplayProtection(configuration::ReplaySettings{}) {
    }

    ReplayProtection::ReplayProtection(const configuration::ReplaySettings &settings)
        : max_age_(settings.max_message_age)
          , clock_skew_(settings.allowed_clock_skew)
          , max_tracked_ids_(std::max<size_t>(settings.max_tracked_ids, 1)) {
    }

    Result<Unit, QuantumFailure> ReplayProtection::CheckAndRecordMessage(
        std::string_view sender_id,
        std::string_view message_id,
        const int64_t timestamp_ms) {
        return CheckAndRecordMessage(sender_id, message_id, timestamp_ms, std::chrono::system_clock::now());
    }

    Result<Unit, QuantumFailure> ReplayProtection::CheckAndRecordMessage(
        std::string_view sender_id,
        std::string_view message_id,
        const int64_t timestamp_ms,
        const std::chrono::system_clock::time_point now) {
        const int64_t now_ms = ToMillis(now);
        if (timestamp_ms < now_ms - max_age_.count()) {
            return Result<Unit, QuantumFailure>::Err(
                QuantumFailure::ReplayDetected("Message timestamp is older than the accepted window"));
        }
        if (timestamp_ms > now_ms + clock_skew_.count()) {
            return Result<Unit, QuantumFailure>::Err(
                QuantumFailure::ReplayDetected("Message timestamp is too far in the future"));
        }

        std::lock_guard guard(lock_);
        MessageKey key{
            .sender_id = std::string(sender_id),
            .message_id = std::string(message_id)
        };
        if (processed_messages_.contains(key)) {
            return Result<Unit, QuantumFailure>::Err(
                QuantumFailure::ReplayDetected("Message id already processed for this sender"));
        }

        if (now_ms - last_cleanup_ms_ >= kCleanupIntervalMs) {
            last_cleanup_ms_ = now_ms;
            CleanupExpiredInternal(now_ms);
        }
        processed_messages_.emplace(key, timestamp_ms);
        arrival_order_.push_back(std::move(key));
        EvictOverflow();
        return Result<Unit, QuantumFailure>::Ok(Unit{});
    }

    void ReplayProtection::CleanupExpired() {
        std::lock_guard guard(lock_);
        CleanupExpiredInternal(ToMillis(std::chrono::system_clock::now()));
    }

    void ReplayProtection::CleanupExpiredInternal(const int64_t now_ms) {
        const int64_t expiry_threshold = now_ms - max_age_.count();
        auto it = processed_messages_.begin();
        while (it != processed_messages_.end()) {
            if (it->second < expiry_threshold) {
                it = processed_messages_.erase(it);
            } else {
                ++it;
            }
        }
        std::erase_if(arrival_order_, [this](const MessageKey &key) {
            return !processed_messages_.contains(key);
        });
    }

    void ReplayProtection::EvictOverflow() {
        while (processed_messages_.size() > max_tracked_ids_ && !arrival_order_.empty()) {
            processed_messages_.erase(arrival_order_.front());
            arrival_order_.pop_front();
        }
    }

    size_t ReplayProtection::GetTrackedMessageCount() const {
        std::lock_guard guard(lock_);
        return processed_messages_.size();
    }

    void ReplayProtection::Reset() {
        std::lock_guard guard(lock_);
        processed_messages_.clear();
        arrival_order_.clear();
        last_cleanup_ms_ = 0;
    }
}
