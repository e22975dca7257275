#include "routegate/audit.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

#include "routegate/hash.hpp"
#include "routegate/jsonlite.hpp"
#include "routegate/version.hpp"

namespace routegate {

std::string audit_record_to_json(const AuditRecord& r) {
  std::ostringstream o;
  o << "{\"seq\":" << r.sequence << ",\"prev\":\"" << r.previous_digest << "\""
    << ",\"kind\":\"" << r.kind << "\""
    << ",\"organization_id\":\"" << jsonlite::escape(r.organization_id) << "\""
    << ",\"subject\":\"" << jsonlite::escape(r.subject) << "\""
    << ",\"error_code\":\"" << r.error_code << "\""
    << ",\"detail\":\"" << jsonlite::escape(r.detail) << "\""
    << ",\"cost_usd\":" << jsonlite::format_double(r.cost_usd)
    << ",\"engine_semver\":\"" << r.engine_semver << "\""
    << ",\"audit_log_version\":" << r.audit_log_version
    << ",\"hash_algorithm_version\":" << r.hash_algorithm_version
    << ",\"timestamp_unix_ms\":" << r.timestamp_unix_ms << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// ImmutableAuditLog
// ---------------------------------------------------------------------------

struct ImmutableAuditLog::Impl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t entry_count{0};
  uint64_t failure_count{0};
  std::string last_digest{"0000000000000000000000000000000000000000000000000000000000000000"};
};

ImmutableAuditLog::ImmutableAuditLog(const std::string& path) : path_(path), impl_(new Impl()) {
  if (!path_.empty()) impl_->file = std::fopen(path_.c_str(), "a");
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
  delete impl_;
}

bool ImmutableAuditLog::append(AuditRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  if (!impl_->file) {
    // A configured path that could not be opened is a failure; no path is not.
    if (path_.empty()) return true;
    ++impl_->failure_count;
    return false;
  }

  // Seek to end before writing so an external seek can never cause an overwrite.
  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  record.sequence = impl_->seq + 1;
  record.previous_digest = impl_->last_digest;
  record.audit_log_version = version::AUDIT_LOG_VERSION;
  record.hash_algorithm_version = version::HASH_ALGORITHM_VERSION;
  if (record.timestamp_unix_ms == 0) {
    using SC = std::chrono::system_clock;
    record.timestamp_unix_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
  }

  const std::string line = audit_record_to_json(record);
  const std::string final_line = line + "\n";
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size();
  std::fflush(impl_->file);

  if (!written) {
    ++impl_->failure_count;
    return false;
  }
  // The file must have grown by at least the line we wrote.
  const long post_write_pos = std::ftell(impl_->file);
  if (post_write_pos >= 0 && post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
    ++impl_->failure_count;
    return false;
  }

  // The chain only advances over lines that actually landed.
  impl_->seq = record.sequence;
  impl_->last_digest = deterministic_digest(line);
  ++impl_->entry_count;
  return true;
}

uint64_t ImmutableAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

bool ImmutableAuditLog::enabled() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->file != nullptr;
}

// ---------------------------------------------------------------------------
// Global singleton
// ---------------------------------------------------------------------------

namespace {
std::mutex g_audit_log_init_mu;
std::unique_ptr<ImmutableAuditLog> g_audit_log_instance;
// Replaced journals stay alive: callers may still hold a reference.
std::vector<std::unique_ptr<ImmutableAuditLog>> g_retired_audit_logs;
}  // namespace

void set_audit_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_audit_log_init_mu);
  if (g_audit_log_instance) g_retired_audit_logs.push_back(std::move(g_audit_log_instance));
  g_audit_log_instance = std::make_unique<ImmutableAuditLog>(path);
}

ImmutableAuditLog& global_audit_log() {
  std::lock_guard<std::mutex> lk(g_audit_log_init_mu);
  if (!g_audit_log_instance) {
    std::string path;
    const char* env = std::getenv("ROUTEGATE_AUDIT_LOG");
    if (env && env[0]) path = env;
    g_audit_log_instance = std::make_unique<ImmutableAuditLog>(path);
  }
  return *g_audit_log_instance;
}

}  // namespace routegate
