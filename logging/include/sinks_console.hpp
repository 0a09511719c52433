#pragma once
#include "log.hpp"
#include <iostream>

namespace tradeid::log {

// "[WARN] ECU1/TRID/PSID: message"
struct ConsoleSink : ISink {
  void write(const LogRecord& r) noexcept override {
    std::cout << "[" << ToString(r.level) << "] "
              << r.ecu_id << "/" << r.app_id << "/" << r.ctx_id << ": "
              << r.message << std::endl;
  }
};

} // namespace tradeid::log
