#include <boundary/boundary_config.hpp>
#include <sinks_console.hpp>
#include <sinks_dlt.hpp>
#include <fstream>
#include <memory>
#include <new>
#include <sstream>
#include <nlohmann/json.hpp>

using nlohmann::json;
using tradeid::core::IdentifierErrc;

namespace boundary {

namespace {

tradeid::core::Result<void> FromJson(const json& j, BoundaryConfig& out) noexcept {
    BoundaryConfig cfg;
    try {
        if (!j.is_object()) return IdentifierErrc::kConfigCorruption;

        if (auto it = j.find("boundary"); it != j.end()) {
            const auto& b = *it;
            if (!b.is_object()) return IdentifierErrc::kConfigCorruption;
            if (auto m = b.find("max_live_ids"); m != b.end()) {
                // -1 or 2.9 would otherwise convert silently
                if (!m->is_number_unsigned()) return IdentifierErrc::kConfigCorruption;
                cfg.max_live_ids = m->get<std::size_t>();
            }
            cfg.validate_utf8 = b.value("validate_utf8", cfg.validate_utf8);
        }
        if (auto it = j.find("logging"); it != j.end()) {
            const auto& l = *it;
            cfg.logging.ecu_id  = l.value("ecu_id", cfg.logging.ecu_id);
            cfg.logging.app_id  = l.value("app_id", cfg.logging.app_id);
            cfg.logging.level   = tradeid::log::ParseLevel(l.value("level", std::string("warn")));
            cfg.logging.console = l.value("console", cfg.logging.console);
            cfg.logging.dlt     = l.value("dlt", cfg.logging.dlt);
        }
    } catch (const json::exception&) {
        // wrong value types, e.g. "console": "yes"
        return IdentifierErrc::kConfigCorruption;
    } catch (const std::bad_alloc&) {
        return IdentifierErrc::kOutOfMemory;
    }
    out = std::move(cfg);
    return {};
}

} // namespace

tradeid::core::Result<void> ParseBoundaryConfig(const std::string& text, BoundaryConfig& out) noexcept {
    json j;
    try {
        j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    } catch (const std::bad_alloc&) {
        return IdentifierErrc::kOutOfMemory;
    }
    if (j.is_discarded()) return IdentifierErrc::kConfigCorruption;
    return FromJson(j, out);
}

tradeid::core::Result<void> LoadBoundaryConfig(const std::string& path, BoundaryConfig& out) noexcept {
    std::ifstream in(path);
    if (!in) return IdentifierErrc::kConfigNotFound;

    std::string text;
    try {
        std::ostringstream buf;
        buf << in.rdbuf();
        text = buf.str();
    } catch (const std::bad_alloc&) {
        return IdentifierErrc::kOutOfMemory;
    }
    return ParseBoundaryConfig(text, out);
}

void ApplyLoggingConfig(const LoggingConfig& cfg) {
    auto& mgr = tradeid::log::LogManager::Instance();
    mgr.SetGlobalIds(cfg.ecu_id, cfg.app_id);
    mgr.SetDefaultLevel(cfg.level);
    mgr.ClearSinks();
    if (cfg.console) mgr.AddSink(std::make_shared<tradeid::log::ConsoleSink>());
    if (cfg.dlt)     mgr.AddSink(std::make_shared<tradeid::log::DltSink>());
}

} // namespace boundary
