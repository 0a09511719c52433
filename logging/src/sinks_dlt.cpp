#include "sinks_dlt.hpp"
#include <iostream>

#ifdef HAVE_DLT
  #include <dlt/dlt_user.h>
#endif

namespace tradeid::log {

struct DltSink::Context {
#ifdef HAVE_DLT
  DltContext handle{};
#endif
};

#ifdef HAVE_DLT
static DltLogLevelType to_dlt_level(LogLevel l) {
  switch (l) {
    case LogLevel::kFatal:   return DLT_LOG_FATAL;
    case LogLevel::kError:   return DLT_LOG_ERROR;
    case LogLevel::kWarn:    return DLT_LOG_WARN;
    case LogLevel::kInfo:    return DLT_LOG_INFO;
    case LogLevel::kDebug:   return DLT_LOG_DEBUG;
    case LogLevel::kVerbose: return DLT_LOG_VERBOSE;
    default:                 return DLT_LOG_OFF;
  }
}
#endif

void DltSink::ContextDeleter::operator()(Context* c) const noexcept {
#ifdef HAVE_DLT
  if (c) dlt_unregister_context(&c->handle);
#endif
  delete c;
}

DltSink::DltSink(std::string app_description)
  : app_desc_(std::move(app_description)) {}

DltSink::~DltSink() {
  std::scoped_lock lk(mu_);
  ctx_by_id_.clear();
#ifdef HAVE_DLT
  if (!registered_app_id_.empty()) dlt_unregister_app();
#endif
}

std::size_t DltSink::ContextCount() const {
  std::scoped_lock lk(mu_);
  return ctx_by_id_.size();
}

bool DltSink::ensureAppRegistered(const std::string& app_id) {
#ifdef HAVE_DLT
  if (registered_app_id_ == app_id) return true;
  // libdlt keeps one application per process
  if (!registered_app_id_.empty()) {
    ctx_by_id_.clear();
    dlt_unregister_app();
    registered_app_id_.clear();
  }
  if (dlt_register_app(app_id.c_str(), app_desc_.c_str()) < DLT_RETURN_OK) return false;
  registered_app_id_ = app_id;
  return true;
#else
  (void)app_id;
  return false;
#endif
}

DltSink::Context* DltSink::ensureCtxRegistered(const LogRecord& r) {
  auto it = ctx_by_id_.find(r.ctx_id);
  if (it != ctx_by_id_.end()) return it->second.get();
#ifdef HAVE_DLT
  ContextPtr ctx(new Context());
  if (dlt_register_context(&ctx->handle, r.ctx_id.c_str(), r.ctx_desc.c_str()) < DLT_RETURN_OK) {
    return nullptr;
  }
  auto* raw = ctx.get();
  ctx_by_id_.emplace(r.ctx_id, std::move(ctx));
  return raw;
#else
  return nullptr;
#endif
}

void DltSink::write(const LogRecord& r) noexcept {
#ifdef HAVE_DLT
  std::scoped_lock lk(mu_);
  if (!ensureAppRegistered(r.app_id)) return;
  Context* ctx = ensureCtxRegistered(r);
  if (ctx == nullptr) return;

  if (r.file != nullptr) {
    DLT_LOG(ctx->handle, to_dlt_level(r.level),
            DLT_STRING(r.message.c_str()), DLT_STRING(r.file), DLT_UINT32(r.line));
  } else {
    DLT_LOG(ctx->handle, to_dlt_level(r.level), DLT_STRING(r.message.c_str()));
  }
#else
  static bool warned = false;
  if (!warned) {
    std::cerr << "[DLT] tradeid built without DLT support; record from "
              << r.ctx_id << " dropped. Install libdlt-dev and reconfigure.\n";
    warned = true;
  }
#endif
}

} // namespace tradeid::log
