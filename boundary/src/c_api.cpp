#include <tradeid/c_api/position_id.h>
#include <boundary/boundary_config.hpp>
#include <boundary/position_id_registry.hpp>
#include <log.hpp>
#include <tradeid/core/result.hpp>
#include <exception>
#include <new>

using boundary::PositionIdRegistry;
using tradeid::core::IdentifierErrc;

static_assert(static_cast<int32_t>(IdentifierErrc::kUnknown) == TRADEID_ERR_UNKNOWN,
              "C error codes out of sync with IdentifierErrc");
static_assert(PositionIdRegistry::kInvalidHandle == TRADEID_POSITION_ID_INVALID,
              "invalid handle value out of sync");

namespace {

thread_local int32_t g_last_error = TRADEID_OK;

void SetLastError(IdentifierErrc e) noexcept { g_last_error = static_cast<int32_t>(e); }

template <typename T>
bool Record(const tradeid::core::Result<T>& r) noexcept {
    SetLastError(r.HasValue() ? IdentifierErrc::kSuccess : r.Error().value);
    return r.HasValue();
}

} // namespace

extern "C" {

void tradeid_position_id_free(tradeid_position_id_t position_id) {
    Record(PositionIdRegistry::Instance().Release(position_id));
}

tradeid_position_id_t tradeid_position_id_from_cstr(const char* ptr) {
    auto r = PositionIdRegistry::Instance().Acquire(ptr);
    return Record(r) ? r.Value() : TRADEID_POSITION_ID_INVALID;
}

const char* tradeid_position_id_to_cstr(tradeid_position_id_t position_id) {
    auto r = PositionIdRegistry::Instance().Borrow(position_id);
    return Record(r) ? r.Value()->CStr() : nullptr;
}

uint8_t tradeid_position_id_eq(tradeid_position_id_t lhs, tradeid_position_id_t rhs) {
    auto r = PositionIdRegistry::Instance().Equals(lhs, rhs);
    return (Record(r) && r.Value()) ? 1 : 0;
}

uint64_t tradeid_position_id_hash(tradeid_position_id_t position_id) {
    auto r = PositionIdRegistry::Instance().Hash(position_id);
    return Record(r) ? r.Value() : 0;
}

size_t tradeid_position_id_live_count(void) {
    SetLastError(IdentifierErrc::kSuccess);
    return PositionIdRegistry::Instance().Size();
}

int32_t tradeid_last_error(void) {
    return g_last_error;
}

const char* tradeid_error_message(int32_t code) {
    if (code < TRADEID_OK || code > TRADEID_ERR_UNKNOWN) code = TRADEID_ERR_UNKNOWN;
    // ToString returns views of string literals, so data() is NUL-terminated
    return tradeid::core::ToString(static_cast<IdentifierErrc>(code)).data();
}

int32_t tradeid_configure(const char* manifest_path) {
    if (manifest_path == nullptr) {
        SetLastError(IdentifierErrc::kNullArgument);
        return g_last_error;
    }
    // nothing may unwind into the host
    try {
        boundary::BoundaryConfig cfg;
        auto r = boundary::LoadBoundaryConfig(manifest_path, cfg);
        if (!Record(r)) return g_last_error;

        boundary::ApplyLoggingConfig(cfg.logging);
        PositionIdRegistry::Instance().Configure(cfg);

        auto log = tradeid::log::Logger::CreateLogger("CABI", "C boundary");
        TRADEID_LOGINFO(log, "configured from {}", manifest_path);
    } catch (const std::bad_alloc&) {
        SetLastError(IdentifierErrc::kOutOfMemory);
    } catch (const std::exception&) {
        SetLastError(IdentifierErrc::kUnknown);
    }
    return g_last_error;
}

} // extern "C"
