#include "codexbridge/sessions/store.hpp"

#include "codexbridge/common/fs.hpp"
#include "codexbridge/observability/global.hpp"

#include <algorithm>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace codexbridge::sessions {

namespace {

constexpr std::size_t DIGEST_SUFFIX_BYTES = 8;

std::string short_sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < DIGEST_SUFFIX_BYTES; ++i) {
    out << std::setw(2) << static_cast<int>(digest[i]);
  }
  return out.str();
}

bool is_safe_char(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '-' || ch == '_' || ch == '.';
}

void publish_count(const std::size_t count) {
  observability::record_metric(
      observability::ActiveSessionsMetric{.count = static_cast<std::uint64_t>(count)});
}

} // namespace

std::string session_file_stem(const std::string &thread_id) {
  std::string out;
  out.reserve(thread_id.size());
  bool changed = thread_id.empty();
  for (const char ch : thread_id) {
    if (is_safe_char(ch)) {
      out.push_back(ch);
    } else {
      out.push_back('_');
      changed = true;
    }
  }
  // "." and ".." would escape the directory.
  if (out.find_first_not_of('.') == std::string::npos) {
    changed = true;
  }
  if (changed) {
    out += "-" + short_sha256_hex(thread_id);
  }
  return out;
}

SessionStore::SessionStore(std::filesystem::path root_dir) : root_dir_(std::move(root_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(root_dir_, ec);
  if (ec) {
    observability::log_warning("sessions", "cannot create " + root_dir_.string() + ": " +
                                               ec.message());
  }
  load_all();
}

void SessionStore::load_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();

  std::error_code ec;
  std::filesystem::directory_iterator it(root_dir_, ec);
  if (ec) {
    return;
  }
  for (const auto &entry : it) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") {
      continue;
    }
    auto text = common::read_file(entry.path());
    if (!text.ok()) {
      observability::log_warning("sessions", "failed to read " + entry.path().string());
      continue;
    }
    auto json = common::parse_json(text.value());
    if (!json.ok()) {
      observability::log_warning("sessions", "failed to load session from " +
                                                 entry.path().string() + ": " + json.error());
      continue;
    }
    auto record = decode_record(json.value());
    if (!record.ok()) {
      observability::log_warning("sessions", "failed to load session from " +
                                                 entry.path().string() + ": " + record.error());
      continue;
    }
    records_[record.value().thread_id] = std::move(record.value());
  }
  observability::log_debug("sessions", "loaded " + std::to_string(records_.size()) +
                                           " sessions from " + root_dir_.string());
  publish_count(records_.size());
}

std::filesystem::path SessionStore::path_for(const std::string &thread_id) const {
  return root_dir_ / (session_file_stem(thread_id) + ".json");
}

common::Status SessionStore::persist(const SessionRecord &record) const {
  auto status = common::write_file_atomic(path_for(record.thread_id),
                                          encode_record(record).dump_pretty() + "\n");
  if (!status.ok()) {
    observability::log_warning("sessions",
                               "failed to save session " + record.thread_id + ": " + status.error());
  }
  return status;
}

void SessionStore::erase_file(const std::string &thread_id) const {
  std::error_code ec;
  std::filesystem::remove(path_for(thread_id), ec);
  if (ec) {
    observability::log_warning("sessions", "failed to delete file for " + thread_id + ": " +
                                               ec.message());
  }
}

bool SessionStore::exists(const std::string &thread_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.find(thread_id) != records_.end();
}

common::Result<SessionRecord, broker::BrokerError>
SessionStore::get(const std::string &thread_id) const {
  using R = common::Result<SessionRecord, broker::BrokerError>;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(thread_id);
  if (it == records_.end()) {
    return R::failure(broker::BrokerError::session_not_found(thread_id));
  }
  return R::success(it->second);
}

common::Result<SessionRecord> SessionStore::create(const std::string &thread_id,
                                                   const std::string &working_directory,
                                                   const std::string &sandbox_mode,
                                                   const std::optional<std::string> &model) {
  using R = common::Result<SessionRecord>;
  if (thread_id.empty()) {
    return R::failure("thread id is required");
  }

  SessionRecord record;
  record.thread_id = thread_id;
  record.created_at = std::chrono::system_clock::now();
  record.last_active = record.created_at;
  record.working_directory = working_directory;
  record.sandbox_mode = sandbox_mode;
  record.model = model;

  std::lock_guard<std::mutex> lock(mutex_);
  records_[thread_id] = record;
  auto status = persist(record);
  publish_count(records_.size());
  if (!status.ok()) {
    return R::failure(status.error());
  }
  observability::record_session("created", thread_id);
  return R::success(std::move(record));
}

common::Status SessionStore::update(SessionRecord &record) {
  if (record.thread_id.empty()) {
    return common::Status::error("thread id is required");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  record.last_active = std::chrono::system_clock::now();
  records_[record.thread_id] = record;
  return persist(record);
}

common::Status SessionStore::remove(const std::string &thread_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(thread_id);
  if (it == records_.end()) {
    return common::Status::success();
  }
  records_.erase(it);
  erase_file(thread_id);
  publish_count(records_.size());
  observability::record_session("deleted", thread_id);
  return common::Status::success();
}

std::vector<SessionRecord> SessionStore::list() const {
  std::vector<SessionRecord> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(records_.size());
    for (const auto &[id, record] : records_) {
      (void)id;
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const SessionRecord &a, const SessionRecord &b) {
    return a.last_active > b.last_active;
  });
  return out;
}

std::size_t SessionStore::sweep(const std::chrono::hours max_age) {
  const auto now = std::chrono::system_clock::now();
  std::size_t removed = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = records_.begin(); it != records_.end();) {
    if (now - it->second.last_active >= max_age) {
      erase_file(it->first);
      it = records_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    observability::log_info("sessions", "cleaned up " + std::to_string(removed) + " old sessions");
    publish_count(records_.size());
  }
  return removed;
}

common::Result<SessionRecord, broker::BrokerError>
SessionStore::modify(const std::string &thread_id, const Mutator &fn) {
  using R = common::Result<SessionRecord, broker::BrokerError>;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(thread_id);
  if (it == records_.end()) {
    return R::failure(broker::BrokerError::session_not_found(thread_id));
  }
  fn(it->second);
  it->second.last_active = std::chrono::system_clock::now();
  // A failed write is logged by persist(); the in-memory record stays authoritative.
  (void)persist(it->second);
  return R::success(it->second);
}

std::size_t SessionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

} // namespace codexbridge::sessions
