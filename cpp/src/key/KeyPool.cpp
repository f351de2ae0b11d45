#include "cvforge/key/KeyPool.hpp"
#include "cvforge/util/Logging.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace cvforge::key {
namespace {

constexpr std::size_t kMaskPrefix = 6;
constexpr std::size_t kMaskSuffix = 4;

bool coolingAt(const Credential& credential, TimePoint now) {
    return credential.state == CredentialState::coolingDown && credential.cooldownUntil > now;
}

std::vector<Credential> buildPool(std::vector<std::string> keys) {
    std::vector<Credential> pool;
    pool.reserve(keys.size());
    std::unordered_set<std::string> seen;
    for (auto& key : keys) {
        if (key.empty()) {
            continue;
        }
        if (!seen.insert(key).second) {
            util::log(util::LogLevel::warn, "Ignoring duplicate API key " + maskKey(key));
            continue;
        }
        Credential credential;
        credential.value = std::move(key);
        pool.push_back(std::move(credential));
    }
    return pool;
}

} // namespace

NoKeysAvailableError::NoKeysAvailableError(TimePoint earliestUntil, std::chrono::milliseconds retryAfter)
    : std::runtime_error("all API keys are cooling down")
    , earliestUntil_(earliestUntil)
    , retryAfter_(retryAfter) {}

KeyPool::KeyPool(std::vector<std::string> keys, KeyPoolOptions options, Clock clock)
    : options_(options)
    , clock_(clock ? std::move(clock) : Clock{[] { return std::chrono::steady_clock::now(); }})
    , pool_(buildPool(std::move(keys))) {
    if (pool_.empty()) {
        throw EmptyPoolError{};
    }
    if (options_.failureThreshold < 0) {
        options_.failureThreshold = 0;
    }
    util::log(util::LogLevel::info,
              "Key pool initialized with " + std::to_string(pool_.size()) + " API keys (cooldown " +
                  std::to_string(options_.cooldown.count()) + "s)");
}

std::string KeyPool::acquire() {
    std::optional<std::string> selected;
    std::vector<std::string> recovered;
    std::optional<TimePoint> earliest;
    TimePoint now;
    {
        std::scoped_lock lock(mutex_);
        now = clock_();
        for (std::size_t step = 0; step < pool_.size() && !selected; ++step) {
            auto index = (cursor_ + step) % pool_.size();
            auto& credential = pool_[index];
            if (credential.state == CredentialState::coolingDown) {
                if (credential.cooldownUntil > now) {
                    if (!earliest || credential.cooldownUntil < *earliest) {
                        earliest = credential.cooldownUntil;
                    }
                    continue;
                }
                credential.state = CredentialState::available;
                recovered.push_back(maskKey(credential.value));
            }
            cursor_ = (index + 1) % pool_.size();
            credential.lastUsedAt = now;
            selected = credential.value;
        }
    }

    for (const auto& masked : recovered) {
        util::log(util::LogLevel::info, "API key " + masked + " is back from cooldown");
    }
    if (selected) {
        return std::move(*selected);
    }

    auto retryAfter = std::chrono::duration_cast<std::chrono::milliseconds>(*earliest - now);
    util::log(util::LogLevel::warn,
              "All " + std::to_string(pool_.size()) + " API keys are cooling down, next one frees in " +
                  std::to_string(retryAfter.count()) + "ms");
    throw NoKeysAvailableError(*earliest, retryAfter);
}

void KeyPool::reportSuccess(const std::string& key) {
    {
        std::scoped_lock lock(mutex_);
        if (auto* credential = find(key)) {
            credential->consecutiveFailures = 0;
            return;
        }
    }
    util::log(util::LogLevel::warn, "Success reported for unknown API key " + maskKey(key));
}

void KeyPool::reportFailure(const std::string& key, bool rateLimited) {
    const char* benchReason = nullptr;
    int failures = 0;
    {
        std::scoped_lock lock(mutex_);
        auto* credential = find(key);
        if (!credential) {
            failures = -1;
        } else {
            credential->consecutiveFailures += 1;
            failures = credential->consecutiveFailures;
            if (rateLimited) {
                benchReason = "rate limited";
            } else if (options_.failureThreshold > 0 && failures >= options_.failureThreshold) {
                benchReason = "failure threshold reached";
            }
            if (benchReason) {
                credential->state = CredentialState::coolingDown;
                credential->cooldownUntil = clock_() + options_.cooldown;
                credential->cooldownCount += 1;
            }
        }
    }

    if (failures < 0) {
        util::log(util::LogLevel::warn, "Failure reported for unknown API key " + maskKey(key));
    } else if (benchReason) {
        util::log(util::LogLevel::warn,
                  "API key " + maskKey(key) + " cooling down for " + std::to_string(options_.cooldown.count()) +
                      "s (" + benchReason + ")");
    } else {
        util::log(util::LogLevel::debug,
                  "API key " + maskKey(key) + " failed (" + std::to_string(failures) + " in a row)");
    }
}

PoolSnapshot KeyPool::snapshot() const {
    std::scoped_lock lock(mutex_);
    PoolSnapshot result;
    result.takenAt = clock_();
    result.credentials.reserve(pool_.size());
    for (const auto& credential : pool_) {
        CredentialStatus entry;
        entry.maskedKey = maskKey(credential.value);
        entry.consecutiveFailures = credential.consecutiveFailures;
        entry.lastUsedAt = credential.lastUsedAt;
        entry.cooldownCount = credential.cooldownCount;
        if (coolingAt(credential, result.takenAt)) {
            entry.state = CredentialState::coolingDown;
            entry.cooldownRemaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(credential.cooldownUntil - result.takenAt);
        } else {
            ++result.available;
        }
        result.credentials.push_back(std::move(entry));
    }
    return result;
}

std::vector<CredentialStatus> KeyPool::status() const {
    return snapshot().credentials;
}

std::size_t KeyPool::availableCount() const {
    std::scoped_lock lock(mutex_);
    const auto now = clock_();
    return static_cast<std::size_t>(std::count_if(pool_.begin(), pool_.end(), [now](const Credential& credential) {
        return !coolingAt(credential, now);
    }));
}

Credential* KeyPool::find(const std::string& key) {
    auto it = std::find_if(pool_.begin(), pool_.end(), [&](const Credential& credential) {
        return credential.value == key;
    });
    return it == pool_.end() ? nullptr : &*it;
}

std::string maskKey(std::string_view key) {
    if (key.size() <= kMaskPrefix + kMaskSuffix) {
        return std::string(key.size(), '*');
    }
    return std::string(key.substr(0, kMaskPrefix)) + "..." + std::string(key.substr(key.size() - kMaskSuffix));
}

const char* toString(CredentialState state) {
    switch (state) {
    case CredentialState::available: return "available";
    case CredentialState::coolingDown: return "cooling_down";
    }
    return "available";
}

} // namespace cvforge::key
