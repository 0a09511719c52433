#pragma once
#include "log.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>
#include <string>

namespace tradeid::log {

// Forwards records to the DLT daemon. Without HAVE_DLT every write is dropped
// and a single notice goes to stderr.
class DltSink : public ISink {
public:
  explicit DltSink(std::string app_description = "Trading identifiers");
  ~DltSink() override;

  DltSink(const DltSink&) = delete;
  DltSink& operator=(const DltSink&) = delete;

  void write(const LogRecord& r) noexcept override;

  // Number of DLT contexts registered so far (one per ctx_id seen)
  std::size_t ContextCount() const;

private:
  struct Context;  // wraps DltContext, defined in the .cpp
  struct ContextDeleter { void operator()(Context* c) const noexcept; };
  using ContextPtr = std::unique_ptr<Context, ContextDeleter>;

  bool ensureAppRegistered(const std::string& app_id);
  Context* ensureCtxRegistered(const LogRecord& r);

  mutable std::mutex mu_;
  std::string app_desc_;
  std::string registered_app_id_;
  std::unordered_map<std::string, ContextPtr> ctx_by_id_;
};

} // namespace tradeid::log
