#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace identifiers {

// Identifies a trading position. Owns its own copy of the text and never
// changes it; equality and hashing look at the text only.
//
// Move-only: a PositionId has exactly one owner. Copies are made by
// constructing a new instance from Value().
class PositionId {
public:
    // Precondition: `value` holds valid text without embedded NULs.
    // Not re-checked here, see PositionIdRegistry::Acquire.
    explicit PositionId(std::string_view value);

    PositionId(const PositionId&) = delete;
    PositionId& operator=(const PositionId&) = delete;
    PositionId(PositionId&&) noexcept = default;
    PositionId& operator=(PositionId&&) noexcept = default;
    ~PositionId() = default;

    const std::string& Value() const noexcept { return value_; }
    const char* CStr() const noexcept { return value_.c_str(); }

    // Exactly the constructed text.
    std::string ToString() const { return value_; }
    // PositionId('P-123456789')
    std::string Repr() const;

    // Process-local. Equal ids hash equal, but the value is not stable across
    // runs and must not be persisted or sent to another process.
    std::uint64_t Hash() const noexcept;

    friend bool operator==(const PositionId& a, const PositionId& b) noexcept { return a.value_ == b.value_; }
    friend bool operator!=(const PositionId& a, const PositionId& b) noexcept { return !(a == b); }
    friend bool operator<(const PositionId& a, const PositionId& b) noexcept { return a.value_ < b.value_; }

private:
    std::string value_;
};

std::ostream& operator<<(std::ostream& os, const PositionId& id);

} // namespace identifiers

template <>
struct std::hash<identifiers::PositionId> {
    std::size_t operator()(const identifiers::PositionId& id) const noexcept {
        return static_cast<std::size_t>(id.Hash());
    }
};
