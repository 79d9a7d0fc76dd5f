#include "bench_common.hpp"

#include "codexbridge/sessions/store.hpp"

#include <filesystem>

void run_sessions_benchmark() {
  const auto root = std::filesystem::temp_directory_path() / "codexbridge-bench-sessions";
  std::error_code ec;
  std::filesystem::remove_all(root, ec);

  codexbridge::sessions::SessionStore store(root);
  (void)store.create("thread-bench", "/tmp", "read-only", std::nullopt);

  codexbridge::bench::run_bench("session_modify_append", 500, [&store] {
    (void)store.modify("thread-bench", [](codexbridge::sessions::SessionRecord &record) {
      codexbridge::sessions::append_turn(record, "user", "ping");
    });
  });

  codexbridge::bench::run_bench("session_file_stem", 20000, [] {
    (void)codexbridge::sessions::session_file_stem("thread/with:odd*chars");
  });

  std::filesystem::remove_all(root, ec);
}
