#include <boundary/position_id_registry.hpp>
#include <cstring>
#include <new>

using tradeid::core::IdentifierErrc;
using identifiers::PositionId;

namespace boundary {

bool IsValidUtf8(const char* text, std::size_t len) noexcept {
    const auto* s = reinterpret_cast<const unsigned char*>(text);
    std::size_t i = 0;
    while (i < len) {
        const unsigned char c = s[i];
        if (c < 0x80) { ++i; continue; }

        std::size_t n = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF)      { n = 1; }
        else if (c == 0xE0)              { n = 2; lo = 0xA0; }
        else if (c == 0xED)              { n = 2; hi = 0x9F; }  // surrogates
        else if (c >= 0xE1 && c <= 0xEF) { n = 2; }
        else if (c == 0xF0)              { n = 3; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) { n = 3; }
        else if (c == 0xF4)              { n = 3; hi = 0x8F; }
        else return false;

        if (len - i <= n) return false;
        if (s[i + 1] < lo || s[i + 1] > hi) return false;
        for (std::size_t k = 2; k <= n; ++k) {
            if (s[i + k] < 0x80 || s[i + k] > 0xBF) return false;
        }
        i += n + 1;
    }
    return true;
}

PositionIdRegistry& PositionIdRegistry::Instance() {
    static PositionIdRegistry r;
    return r;
}

PositionIdRegistry::PositionIdRegistry() : PositionIdRegistry(BoundaryConfig{}) {}

PositionIdRegistry::PositionIdRegistry(const BoundaryConfig& cfg)
    : cfg_(cfg), log_(MakeLogger()) {}

PositionIdRegistry::LoggerPtr PositionIdRegistry::MakeLogger() {
    return std::make_shared<const tradeid::log::Logger>(
        tradeid::log::Logger::CreateLogger("PSID", "Position identifier table"));
}

// Sinks are caller code; they run only after mtx_ is released.
void PositionIdRegistry::Configure(const BoundaryConfig& cfg) {
    LoggerPtr fresh = MakeLogger();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        cfg_ = cfg;
        log_ = fresh;
    }
    TRADEID_LOGINFO(*fresh, "configured: max_live_ids={} validate_utf8={}",
                    cfg.max_live_ids, cfg.validate_utf8);
}

tradeid::core::Result<PositionIdRegistry::Handle>
PositionIdRegistry::Acquire(const char* text) noexcept {
    LoggerPtr log;
    bool validate;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        log = log_;
        validate = cfg_.validate_utf8;
    }
    if (text == nullptr) {
        TRADEID_LOGWARN(*log, "acquire rejected: null text");
        return IdentifierErrc::kNullArgument;
    }
    const std::size_t len = std::strlen(text);
    if (validate && !IsValidUtf8(text, len)) {
        TRADEID_LOGWARN(*log, "acquire rejected: malformed UTF-8 ({} bytes)", len);
        return IdentifierErrc::kInvalidText;
    }

    std::unique_ptr<PositionId> id;
    try {
        id = std::make_unique<PositionId>(std::string_view(text, len));
    } catch (const std::bad_alloc&) {
        // no logging here, formatting would allocate again
        return IdentifierErrc::kOutOfMemory;
    }
    return Insert(std::move(id));
}

tradeid::core::Result<PositionIdRegistry::Handle>
PositionIdRegistry::Adopt(PositionId&& id) noexcept {
    std::unique_ptr<PositionId> owned;
    try {
        owned = std::make_unique<PositionId>(std::move(id));
    } catch (const std::bad_alloc&) {
        return IdentifierErrc::kOutOfMemory;
    }
    return Insert(std::move(owned));
}

tradeid::core::Result<PositionIdRegistry::Handle>
PositionIdRegistry::Insert(std::unique_ptr<PositionId> id) noexcept {
    LoggerPtr log;
    std::size_t live = 0, limit = 0;
    Handle h = kInvalidHandle;
    const std::size_t bytes = id->Value().size();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        log = log_;
        live = map_.size();
        limit = cfg_.max_live_ids;
        if (limit == 0 || live < limit) {
            try {
                map_.emplace(next_handle_, std::move(id));
            } catch (const std::bad_alloc&) {
                return IdentifierErrc::kOutOfMemory;
            }
            h = next_handle_++;
        }
    }

    if (h == kInvalidHandle) {
        // still ours, safe to print outside the lock
        TRADEID_LOGWARN(*log, "rejected '{}': {} live identifiers (limit {})", *id, live, limit);
        return IdentifierErrc::kCapacityExceeded;
    }
    // the entry may already be released by another thread, so no text here
    TRADEID_LOGVERBOSE(*log, "acquired handle {} ({} bytes)", h, bytes);
    return h;
}

tradeid::core::Result<const PositionId*>
PositionIdRegistry::Borrow(Handle h) const noexcept {
    LoggerPtr log;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = map_.find(h);
        if (it != map_.end()) return static_cast<const PositionId*>(it->second.get());
        log = log_;
    }
    TRADEID_LOGWARN(*log, "borrow of unknown handle {}", h);
    return IdentifierErrc::kInvalidHandle;
}

tradeid::core::Result<bool>
PositionIdRegistry::Equals(Handle lhs, Handle rhs) const noexcept {
    LoggerPtr log;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto a = map_.find(lhs);
        auto b = map_.find(rhs);
        if (a != map_.end() && b != map_.end()) return *a->second == *b->second;
        log = log_;
    }
    TRADEID_LOGWARN(*log, "equals on unknown handle ({}, {})", lhs, rhs);
    return IdentifierErrc::kInvalidHandle;
}

tradeid::core::Result<std::uint64_t>
PositionIdRegistry::Hash(Handle h) const noexcept {
    LoggerPtr log;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = map_.find(h);
        if (it != map_.end()) return it->second->Hash();
        log = log_;
    }
    TRADEID_LOGWARN(*log, "hash of unknown handle {}", h);
    return IdentifierErrc::kInvalidHandle;
}

tradeid::core::Result<void> PositionIdRegistry::Release(Handle h) noexcept {
    LoggerPtr log;
    std::unique_ptr<PositionId> doomed;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        log = log_;
        auto it = map_.find(h);
        if (it != map_.end()) {
            doomed = std::move(it->second);
            map_.erase(it);
        }
    }
    if (!doomed) {
        TRADEID_LOGWARN(*log, "release of unknown or already released handle {}", h);
        return IdentifierErrc::kInvalidHandle;
    }
    TRADEID_LOGVERBOSE(*log, "released handle {} -> '{}'", h, *doomed);
    return {};
}

std::size_t PositionIdRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return map_.size();
}

bool PositionIdRegistry::Contains(Handle h) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return map_.find(h) != map_.end();
}

} // namespace boundary
