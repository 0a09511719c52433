#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <identifiers/position_id.hpp>
#include <boundary/boundary_config.hpp>
#include <log.hpp>
#include <tradeid/core/result.hpp>

namespace boundary {

// Owns every PositionId handed across the C boundary and names each one by an
// opaque integer handle. Handles are never reused, so a released handle keeps
// failing with kInvalidHandle instead of aliasing a newer identifier.
//
// The mutex guards the table only and is never held while a log sink runs.
// Pointers returned by Borrow() stay valid
// until Release() of the same handle; the host must not release while still
// reading through them.
class PositionIdRegistry {
public:
    using Handle = std::uint64_t;
    static constexpr Handle kInvalidHandle = 0;

    // Instance backing the C API
    static PositionIdRegistry& Instance();

    PositionIdRegistry();
    explicit PositionIdRegistry(const BoundaryConfig& cfg);
    PositionIdRegistry(const PositionIdRegistry&) = delete;
    PositionIdRegistry& operator=(const PositionIdRegistry&) = delete;

    // Copies NUL-terminated text into a new identifier owned by the table.
    tradeid::core::Result<Handle> Acquire(const char* text) noexcept;
    // Takes ownership of an identifier built on the C++ side.
    tradeid::core::Result<Handle> Adopt(identifiers::PositionId&& id) noexcept;

    tradeid::core::Result<const identifiers::PositionId*> Borrow(Handle h) const noexcept;
    tradeid::core::Result<bool> Equals(Handle lhs, Handle rhs) const noexcept;
    tradeid::core::Result<std::uint64_t> Hash(Handle h) const noexcept;

    // Terminal. A second release of the same handle reports kInvalidHandle.
    tradeid::core::Result<void> Release(Handle h) noexcept;

    std::size_t Size() const;
    bool Contains(Handle h) const;

    // Applies limits to future Acquire/Adopt calls and re-snapshots the
    // logger. Live identifiers are kept even above a lowered limit.
    void Configure(const BoundaryConfig& cfg);

private:
    using LoggerPtr = std::shared_ptr<const tradeid::log::Logger>;
    static LoggerPtr MakeLogger();

    tradeid::core::Result<Handle> Insert(std::unique_ptr<identifiers::PositionId> id) noexcept;

    mutable std::mutex mtx_;
    std::unordered_map<Handle, std::unique_ptr<identifiers::PositionId>> map_;
    Handle next_handle_{1};
    BoundaryConfig cfg_{};
    LoggerPtr log_;  // swapped whole by Configure
};

// Well-formed UTF-8 per RFC 3629 (no overlongs, no surrogates, <= U+10FFFF).
bool IsValidUtf8(const char* text, std::size_t len) noexcept;

} // namespace boundary
