#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "fake_zfs.hpp"

#include "zmd/io_utils.hpp"
#include "zmd/logger.hpp"
#include "zmd/pipeline.hpp"

#include <signal.h>     // for kill
#include <sys/types.h>  // for pid_t

#include <atomic>
#include <cerrno>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

using namespace std::chrono_literals;
using namespace std::string_literals;
using namespace std::string_view_literals;

using zmd::transfer::CancelIntent;
using zmd::transfer::PipelineCommands;
using zmd::transfer::PipelineRunner;
using zmd::transfer::StreamSource;

namespace {

struct CapturedLine {
    StreamSource source;
    std::string text;
};

auto shell(std::string script) -> std::vector<std::string> {
    return {"/bin/sh", "-c", std::move(script)};
}

auto process_gone(pid_t pid) -> bool {
    return ::kill(pid, 0) != 0 && errno == ESRCH;
}

}  // namespace

TEST_CASE("pipeline runner")
{
  auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  auto logger    = std::make_shared<spdlog::logger>("default", null_sink);
  spdlog::set_default_logger(logger);
  zmd::logger::set_logger(logger);

  zmd::test::TempDir dir{};
  const PipelineRunner runner{PipelineRunner::Config{.grace_period = 300ms, .poll_interval = 20ms}};

  std::vector<CapturedLine> lines{};
  const auto on_line = [&lines](StreamSource source, std::string_view text) {
    lines.emplace_back(CapturedLine{source, std::string{text}});
  };

  SECTION("stream flows from send into receive")
  {
    const auto out_path = dir.file("stream");
    const PipelineCommands commands{
      .send    = shell("printf 'full\\tpool/data@snap1\\t6\\n' >&2; printf 'stream'"),
      .receive = shell("cat > '" + out_path + "'; echo 'received 6B stream'"),
    };
    pid_t send_pid{};
    pid_t receive_pid{};
    const auto result = runner.run(commands, on_line, {}, [&](pid_t send, pid_t receive) {
      send_pid    = send;
      receive_pid = receive;
    });

    REQUIRE(result.success());
    REQUIRE(!result.launch_error.has_value());
    REQUIRE_EQ(result.send.exit_code, 0);
    REQUIRE_EQ(result.receive.exit_code, 0);
    REQUIRE_EQ(result.signaled_intent, CancelIntent::None);

    std::string content{};
    REQUIRE(zmd::utils::read_whole_file(out_path, content));
    REQUIRE_EQ(content, "stream");

    REQUIRE_EQ(lines.size(), 2);
    REQUIRE_EQ(lines[0].source, StreamSource::Send);
    REQUIRE_EQ(lines[0].text, "full\tpool/data@snap1\t6");
    REQUIRE_EQ(lines[1].source, StreamSource::Receive);
    REQUIRE_EQ(lines[1].text, "received 6B stream");
    REQUIRE_EQ(result.receive_tail.back(), "received 6B stream");

    REQUIRE(send_pid > 0);
    REQUIRE(receive_pid > 0);
    REQUIRE(process_gone(send_pid));
    REQUIRE(process_gone(receive_pid));
  }
  SECTION("failing receive is reported with its output")
  {
    const PipelineCommands commands{
      .send    = shell("printf 'stream'"),
      .receive = shell("cat > /dev/null; echo \"cannot receive new filesystem stream: destination 'backup/data' exists\" >&2; exit 1"),
    };
    const auto result = runner.run(commands, on_line);

    REQUIRE_FALSE(result.success());
    REQUIRE(result.send.success());
    REQUIRE_EQ(result.receive.exit_code, 1);
    REQUIRE_EQ(result.receive.describe(), "exit status 1");
    REQUIRE_EQ(result.receive_tail.size(), 1);
    REQUIRE(result.receive_tail.front().contains("exists"sv));
  }
  SECTION("unknown program")
  {
    const PipelineCommands commands{
      .send    = {dir.file("no-such-zfs"), "send", "pool/data@snap1"},
      .receive = shell("cat > /dev/null"),
    };
    const auto result = runner.run(commands, on_line);

    REQUIRE(result.launch_error.has_value());
    REQUIRE_FALSE(result.success());
    REQUIRE_FALSE(result.receive.launched);
  }
  SECTION("empty command")
  {
    const auto result = runner.run(PipelineCommands{.send = {}, .receive = shell("true")}, on_line);
    REQUIRE(result.launch_error.has_value());
  }
  SECTION("pause interrupts the process group")
  {
    std::atomic_bool started{false};
    const PipelineCommands commands{
      .send    = shell("while :; do echo data; sleep 0.05; done"),
      .receive = shell("cat > /dev/null"),
    };
    pid_t send_pid{};
    pid_t receive_pid{};
    const auto begin  = std::chrono::steady_clock::now();
    const auto result = runner.run(
      commands, on_line,
      [&started] {
        return started ? CancelIntent::PauseRequested : CancelIntent::None;
      },
      [&](pid_t send, pid_t receive) {
        send_pid    = send;
        receive_pid = receive;
        started     = true;
      });

    REQUIRE(std::chrono::steady_clock::now() - begin < 10s);
    REQUIRE_FALSE(result.success());
    REQUIRE_EQ(result.signaled_intent, CancelIntent::PauseRequested);
    REQUIRE(result.send.launched);
    REQUIRE(result.receive.launched);
    REQUIRE(process_gone(send_pid));
    REQUIRE(process_gone(receive_pid));
  }
  SECTION("stop escalates to SIGKILL after the grace period")
  {
    std::atomic_bool started{false};
    const PipelineCommands commands{
      .send    = shell("trap '' INT TERM; while :; do sleep 0.05; done"),
      .receive = shell("trap '' INT TERM; while :; do sleep 0.05; done"),
    };
    const auto result = runner.run(
      commands, on_line,
      [&started] {
        return started ? CancelIntent::StopRequested : CancelIntent::None;
      },
      [&started](pid_t, pid_t) { started = true; });

    REQUIRE(result.killed);
    REQUIRE_EQ(result.signaled_intent, CancelIntent::StopRequested);
    REQUIRE_EQ(result.send.term_signal, SIGKILL);
    REQUIRE_EQ(result.send.describe(), "killed by signal 9");
  }
}
