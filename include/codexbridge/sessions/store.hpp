#pragma once

#include "codexbridge/broker/types.hpp"
#include "codexbridge/common/result.hpp"
#include "codexbridge/sessions/record.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace codexbridge::sessions {

/// File name (without extension) for a thread id. Characters outside [A-Za-z0-9._-] become
/// '_'; when that changed anything, a short SHA-256 prefix of the id is appended.
[[nodiscard]] std::string session_file_stem(const std::string &thread_id);

/// One JSON file per thread under `root_dir`, all loaded at construction. Every operation
/// runs under a single mutex.
class SessionStore {
public:
  using Mutator = std::function<void(SessionRecord &)>;

  explicit SessionStore(std::filesystem::path root_dir);

  [[nodiscard]] bool exists(const std::string &thread_id) const;
  [[nodiscard]] common::Result<SessionRecord, broker::BrokerError>
  get(const std::string &thread_id) const;
  [[nodiscard]] common::Result<SessionRecord>
  create(const std::string &thread_id, const std::string &working_directory,
         const std::string &sandbox_mode, const std::optional<std::string> &model);
  /// Bumps `last_active` on `record` and writes it back.
  [[nodiscard]] common::Status update(SessionRecord &record);
  [[nodiscard]] common::Status remove(const std::string &thread_id);
  /// Newest `last_active` first.
  [[nodiscard]] std::vector<SessionRecord> list() const;
  /// Removes every record idle for at least `max_age`; returns how many went.
  std::size_t sweep(std::chrono::hours max_age);
  /// Read-modify-write under the lock. `fn` must not call back into the store.
  [[nodiscard]] common::Result<SessionRecord, broker::BrokerError>
  modify(const std::string &thread_id, const Mutator &fn);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] const std::filesystem::path &root_dir() const { return root_dir_; }

private:
  void load_all();
  [[nodiscard]] std::filesystem::path path_for(const std::string &thread_id) const;
  [[nodiscard]] common::Status persist(const SessionRecord &record) const;
  void erase_file(const std::string &thread_id) const;

  std::filesystem::path root_dir_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, SessionRecord> records_;
};

} // namespace codexbridge::sessions
