#include "test_framework.hpp"

#include "codexbridge/broker/broker.hpp"
#include "codexbridge/runtime/app.hpp"

#include "helpers/test_helpers.hpp"

#include <memory>

namespace {

namespace b = codexbridge::broker;
namespace s = codexbridge::sessions;
namespace t = codexbridge::testing;

b::AttemptResult answer(const std::string &text, std::optional<std::string> thread_id) {
  return b::AttemptResult::success(t::aggregate_with_messages({text}, std::move(thread_id), true));
}

} // namespace

void register_broker_integration_tests(std::vector<codexbridge::tests::TestCase> &tests) {
  using codexbridge::tests::require;

  tests.push_back({"broker_start_creates_session_with_two_turns", [] {
                     t::TempWorkspace ws;
                     auto runner = std::make_shared<t::ScriptedRunner>();
                     runner->push(answer("created the file", "th-new"));
                     auto config = t::temp_config(ws);
                     s::SessionStore store(config.sessions.storage_dir);
                     b::Broker broker(config, store, runner);

                     b::NewSessionRequest request;
                     request.prompt = "create a file";
                     request.sandbox = "workspace-write";
                     request.model = "gpt-5-codex";
                     auto result = broker.start(request);
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     require(result.value().thread_id == std::optional<std::string>("th-new"),
                             "thread id expected");
                     require(result.value().agent_messages == "created the file", "text expected");

                     const auto sent = runner->requests();
                     require(sent.size() == 1 && !sent[0].is_resume(), "one new-session call");
                     require(sent[0].sandbox_mode == b::SandboxMode::WorkspaceWrite,
                             "sandbox passed through");
                     require(sent[0].working_directory == ws.path().string(),
                             "default working directory used");
                     require(sent[0].timeout == std::chrono::seconds(30),
                             "configured timeout used");

                     auto record = store.get("th-new");
                     require(record.ok(), "session should be recorded");
                     require(record.value().turn_count == 2, "user and assistant turns");
                     require(record.value().history[0].content == "create a file", "user turn");
                     require(record.value().history[1].content == "created the file",
                             "assistant turn");
                     require(record.value().sandbox_mode == "workspace-write", "sandbox stored");
                   }});

  tests.push_back({"broker_start_without_thread_id_stores_nothing", [] {
                     t::TempWorkspace ws;
                     auto runner = std::make_shared<t::ScriptedRunner>();
                     runner->push(answer("no thread", std::nullopt));
                     auto config = t::temp_config(ws);
                     s::SessionStore store(config.sessions.storage_dir);
                     b::Broker broker(config, store, runner);
                     auto result = broker.start(b::NewSessionRequest{.prompt = "hi"});
                     require(result.ok(), "start should succeed");
                     require(store.size() == 0, "nothing to store without a thread id");
                   }});

  tests.push_back({"broker_invalid_sandbox_never_reaches_runner", [] {
                     t::TempWorkspace ws;
                     auto runner = std::make_shared<t::ScriptedRunner>();
                     auto config = t::temp_config(ws);
                     s::SessionStore store(config.sessions.storage_dir);
                     b::Broker broker(config, store, runner);
                     b::NewSessionRequest request;
                     request.prompt = "x";
                     request.sandbox = "full-access";
                     auto result = broker.start(request);
                     require(!result.ok(), "invalid sandbox should fail");
                     require(result.error().is(b::BrokerError::Kind::InvalidSandboxMode),
                             "invalid sandbox kind");
                     require(result.error().invalid_value == "full-access", "value carried");
                     require(runner->calls() == 0, "no attempt may be made");
                   }});

  tests.push_back({"broker_reply_uses_stored_session_settings", [] {
                     t::TempWorkspace ws;
                     auto runner = std::make_shared<t::ScriptedRunner>();
                     runner->push(answer("second answer", std::nullopt));
                     auto config = t::temp_config(ws);
                     s::SessionStore store(config.sessions.storage_dir);
                     require(store.create("th-1", "/srv/project", "danger-full-access", "o3").ok(),
                             "seed session");
                     b::Broker broker(config, store, runner);

                     auto result = broker.reply(b::ReplyRequest{
                         .thread_id = "th-1", .prompt = "and now?", .timeout = std::nullopt});
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     require(result.value().thread_id == std::optional<std::string>("th-1"),
                             "reply falls back to the requested thread id");

                     const auto sent = runner->requests();
                     require(sent.size() == 1, "one call");
                     require(sent[0].continuation_id == std::optional<std::string>("th-1"),
                             "resume requested");
                     require(sent[0].working_directory == "/srv/project", "stored cwd used");
                     require(sent[0].sandbox_mode == b::SandboxMode::DangerFullAccess,
                             "stored sandbox used");
                     require(sent[0].model == std::optional<std::string>("o3"), "stored model used");
                     require(store.get("th-1").value().turn_count == 2, "turns appended");
                   }});

  tests.push_back({"broker_reply_to_unknown_thread_uses_defaults", [] {
                     t::TempWorkspace ws;
                     auto runner = std::make_shared<t::ScriptedRunner>();
                     runner->push(answer("picked up", "th-remote"));
                     auto config = t::temp_config(ws);
                     s::SessionStore store(config.sessions.storage_dir);
                     b::Broker broker(config, store, runner);

                     auto result = broker.reply(b::ReplyRequest{
                         .thread_id = "th-remote", .prompt = "continue", .timeout =
                                                                       std::chrono::seconds(7)});
                     require(result.ok(), "reply to unknown thread should run");
                     const auto sent = runner->requests();
                     require(sent[0].sandbox_mode == b::SandboxMode::ReadOnly, "default sandbox");
                     require(sent[0].working_directory == ws.path().string(), "default cwd");
                     require(sent[0].timeout == std::chrono::seconds(7), "explicit timeout");
                     require(store.exists("th-remote"), "session recorded after success");
                     require(store.get("th-remote").value().turn_count == 2, "two turns");
                   }});

  tests.push_back({"broker_clamps_oversized_timeouts", [] {
                     t::TempWorkspace ws;
                     auto runner = std::make_shared<t::ScriptedRunner>();
                     runner->push(answer("one", std::nullopt));
                     runner->push(answer("two", std::nullopt));
                     auto config = t::temp_config(ws);
                     config.codex.default_timeout_secs = 9223372036854775ULL;
                     s::SessionStore store(config.sessions.storage_dir);
                     b::Broker broker(config, store, runner);

                     b::NewSessionRequest request;
                     request.prompt = "hi";
                     request.timeout = std::chrono::seconds(9223372036854775LL);
                     require(broker.start(request).ok(), "explicit timeout run");
                     require(broker.start(b::NewSessionRequest{.prompt = "hi"}).ok(),
                             "configured timeout run");

                     const auto sent = runner->requests();
                     require(sent.size() == 2, "two calls");
                     require(sent[0].timeout == b::MAX_INVOCATION_TIMEOUT,
                             "explicit timeout clamped");
                     require(sent[1].timeout == b::MAX_INVOCATION_TIMEOUT,
                             "configured timeout clamped");
                   }});

  tests.push_back({"broker_reply_requires_thread_id", [] {
                     t::TempWorkspace ws;
                     auto runner = std::make_shared<t::ScriptedRunner>();
                     auto config = t::temp_config(ws);
                     s::SessionStore store(config.sessions.storage_dir);
                     b::Broker broker(config, store, runner);
                     auto result = broker.reply(b::ReplyRequest{.thread_id = "  ", .prompt = "x"});
                     require(!result.ok() &&
                                 result.error().is(b::BrokerError::Kind::SessionNotFound),
                             "blank thread id is not found");
                     require(runner->calls() == 0, "no attempt may be made");
                   }});

  tests.push_back({"broker_failure_leaves_store_untouched", [] {
                     t::TempWorkspace ws;
                     auto runner = std::make_shared<t::ScriptedRunner>();
                     runner->push(b::AttemptResult::failure(
                         b::BrokerError::timed_out(std::chrono::seconds(30), "half")));
                     auto config = t::temp_config(ws);
                     s::SessionStore store(config.sessions.storage_dir);
                     require(store.create("th-1", "/a", "read-only", std::nullopt).ok(), "seed");
                     b::Broker broker(config, store, runner);
                     auto result = broker.reply(b::ReplyRequest{.thread_id = "th-1", .prompt = "x"});
                     require(!result.ok() && result.error().is(b::BrokerError::Kind::Timeout),
                             "timeout propagates");
                     require(store.get("th-1").value().turn_count == 0, "no turns recorded");
                   }});

#ifndef _WIN32
  tests.push_back({"broker_app_end_to_end_with_fake_codex", [] {
                     t::TempWorkspace ws;
                     const auto log = ws.path() / "calls.log";
                     const auto script = ws.write_fake_codex(
                         "codex.sh",
                         "echo \"$@\" >> '" + log.string() + "'\n"
                         "cat > /dev/null\n"
                         "case \"$2\" in\n"
                         "  resume) echo '{\"type\":\"item.completed\",\"item\":{\"type\":\"agent_message\",\"text\":\"resumed\"}}' ;;\n"
                         "  *) echo '{\"type\":\"thread.started\",\"thread_id\":\"e2e-1\"}'\n"
                         "     echo '{\"type\":\"item.completed\",\"item\":{\"type\":\"agent_message\",\"text\":\"started\"}}' ;;\n"
                         "esac\n"
                         "echo '{\"type\":\"turn.completed\"}'\n");
                     auto config = t::temp_config(ws);
                     config.codex.executable = script.string();
                     codexbridge::runtime::App app(config);

                     auto started = app.broker().start(b::NewSessionRequest{.prompt = "begin"});
                     require(started.ok(), started.ok() ? "" : started.error().to_string());
                     require(started.value().agent_messages == "started", "start text");
                     require(started.value().completed, "start completed");

                     auto replied = app.broker().reply(
                         b::ReplyRequest{.thread_id = "e2e-1", .prompt = "more"});
                     require(replied.ok(), replied.ok() ? "" : replied.error().to_string());
                     require(replied.value().agent_messages == "resumed", "reply text");
                     require(replied.value().thread_id == std::optional<std::string>("e2e-1"),
                             "reply keeps the thread id");

                     auto record = app.sessions().get("e2e-1");
                     require(record.ok() && record.value().turn_count == 4,
                             "four turns after start and reply");

                     s::SessionStore reloaded(config.sessions.storage_dir);
                     require(reloaded.get("e2e-1").value().turn_count == 4,
                             "turns persisted to disk");
                   }});
#endif
}
