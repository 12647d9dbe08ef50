#pragma once
#include "qsm/core/result.hpp"
#include "qsm/core/constants.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/configuration/protocol_config.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
namespace qsm::protocol::security {

/// Rejects a message id seen before from the same sender, and messages
/// whose timestamp lies outside [now - max_age, now + clock_skew].
///
/// Ids are forgotten once their timestamp leaves the age window, at which
/// point the age check alone rejects them. When more than max_tracked_ids
/// are held the oldest entries are evicted first.
class ReplayProtection {
public:
    ReplayProtection();
    explicit ReplayProtection(const configuration::ReplaySettings& settings);
    ReplayProtection(const ReplayProtection&) = delete;
    ReplayProtection& operator=(const ReplayProtection&) = delete;
    ReplayProtection(ReplayProtection&&) = delete;
    ReplayProtection& operator=(ReplayProtection&&) = delete;
    ~ReplayProtection() = default;

    /// Fails with ReplayDetected; records the id otherwise.
    Result<Unit, QuantumFailure> CheckAndRecordMessage(
        std::string_view sender_id,
        std::string_view message_id,
        int64_t timestamp_ms);

    /// Same check against an explicit clock reading.
    Result<Unit, QuantumFailure> CheckAndRecordMessage(
        std::string_view sender_id,
        std::string_view message_id,
        int64_t timestamp_ms,
        std::chrono::system_clock::time_point now);

    void CleanupExpired();
    size_t GetTrackedMessageCount() const;
    void Reset();
private:
    struct MessageKey {
        std::string sender_id;
        std::string message_id;
        bool operator==(const MessageKey& other) const {
            return sender_id == other.sender_id &&
                   message_id == other.message_id;
        }
        struct Hash {
            size_t operator()(const MessageKey& key) const;
        };
    };
    void CleanupExpiredInternal(int64_t now_ms);
    void EvictOverflow();

    std::chrono::milliseconds max_age_;
    std::chrono::milliseconds clock_skew_;
    size_t max_tracked_ids_;
    mutable std::mutex lock_;
    std::unordered_map<MessageKey, int64_t, MessageKey::Hash> processed_messages_;
    std::deque<MessageKey> arrival_order_;
    int64_t last_cleanup_ms_ = 0;
};
}
