#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cvforge::key {

using TimePoint = std::chrono::steady_clock::time_point;
using Clock = std::function<TimePoint()>;

enum class CredentialState {
    available,
    coolingDown
};

struct Credential {
    std::string value;
    CredentialState state{CredentialState::available};
    TimePoint cooldownUntil{};
    int consecutiveFailures{};
    std::optional<TimePoint> lastUsedAt;
    std::uint32_t cooldownCount{};
};

struct CredentialStatus {
    std::string maskedKey;
    CredentialState state{CredentialState::available};
    int consecutiveFailures{};
    std::chrono::milliseconds cooldownRemaining{0};
    std::optional<TimePoint> lastUsedAt;
    std::uint32_t cooldownCount{};

    bool operator==(const CredentialStatus&) const = default;
};

// Every field is read under one lock; takenAt is the clock reading used for
// cooldownRemaining and the available count.
struct PoolSnapshot {
    TimePoint takenAt{};
    std::vector<CredentialStatus> credentials;
    std::size_t available{};
};

struct KeyPoolOptions {
    std::chrono::seconds cooldown{std::chrono::minutes{5}};
    // Consecutive non-rate-limit failures that also bench a key; 0 disables.
    int failureThreshold{0};
};

class EmptyPoolError : public std::invalid_argument {
public:
    EmptyPoolError()
        : std::invalid_argument("no API keys configured") {}
};

class NoKeysAvailableError : public std::runtime_error {
public:
    NoKeysAvailableError(TimePoint earliestUntil, std::chrono::milliseconds retryAfter);

    [[nodiscard]] TimePoint earliestUntil() const noexcept { return earliestUntil_; }

    [[nodiscard]] std::chrono::milliseconds retryAfter() const noexcept { return retryAfter_; }

private:
    TimePoint earliestUntil_;
    std::chrono::milliseconds retryAfter_;
};

// Round-robin pool of API credentials with lazy cooldown expiry. All
// operations are serialized on one mutex and never perform I/O under it.
class KeyPool {
public:
    KeyPool(std::vector<std::string> keys, KeyPoolOptions options, Clock clock = {});

    KeyPool(const KeyPool&) = delete;
    KeyPool& operator=(const KeyPool&) = delete;

    // Returns the next available key after the cursor. Throws
    // NoKeysAvailableError when every key is cooling down.
    std::string acquire();
    void reportSuccess(const std::string& key);
    void reportFailure(const std::string& key, bool rateLimited);

    [[nodiscard]] PoolSnapshot snapshot() const;
    [[nodiscard]] std::vector<CredentialStatus> status() const;
    [[nodiscard]] std::size_t availableCount() const;
    [[nodiscard]] std::size_t size() const noexcept { return pool_.size(); }
    [[nodiscard]] const KeyPoolOptions& options() const noexcept { return options_; }

private:
    Credential* find(const std::string& key);

    KeyPoolOptions options_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::vector<Credential> pool_;
    std::size_t cursor_{};
};

std::string maskKey(std::string_view key);
const char* toString(CredentialState state);

} // namespace cvforge::key
