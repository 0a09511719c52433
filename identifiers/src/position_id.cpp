#include <identifiers/position_id.hpp>

namespace identifiers {

PositionId::PositionId(std::string_view value) : value_(value) {}

std::string PositionId::Repr() const {
    std::string out;
    out.reserve(value_.size() + 14);
    out += "PositionId('";
    out += value_;
    out += "')";
    return out;
}

std::uint64_t PositionId::Hash() const noexcept {
    return static_cast<std::uint64_t>(std::hash<std::string>{}(value_));
}

std::ostream& operator<<(std::ostream& os, const PositionId& id) {
    return os << id.Value();
}

} // namespace identifiers
