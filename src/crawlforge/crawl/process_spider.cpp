#include "crawlforge/core/asio_awaitable.hpp"
#include "crawlforge/crawl/spider.hpp"
#include "crawlforge/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <csignal>
#include <format>
#include <optional>
#include <signal.h>

namespace crawlforge {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kStderrTailSize = 2048;
inline constexpr std::size_t kMaxLineSize = 1 << 20;

[[nodiscard]] auto build_process_env(const SpiderRequest &request)
    -> bp::process_environment {
  const std::array<std::pair<std::string, std::string>, 3> custom{{
      {"CRAWL_TASK_ID", request.task_id.str()},
      {"CRAWL_SPIDER", request.spider_name},
      {"CRAWL_KWARGS", dump_json(request.kwargs)},
  }};

  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);
  for (const auto &entry : bp::environment::current()) {
    auto key_sv = entry.key();
    std::string key(key_sv.data(), key_sv.size());
    if (std::ranges::any_of(custom,
                            [&](const auto &kv) { return kv.first == key; })) {
      continue;
    }
    env_vec.emplace_back(entry);
  }
  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }
  return bp::process_environment(std::move(env_vec));
}

/// Keeps the trailing kStderrTailSize bytes of the child's stderr.
[[nodiscard]] auto read_stderr_tail(boost::asio::readable_pipe &pipe,
                                    std::string &tail) -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  while (true) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()), use_nothrow);
    if (ec) {
      co_return;
    }
    tail.append(buffer.data(), bytes);
    if (tail.size() > kStderrTailSize) {
      tail.erase(0, tail.size() - kStderrTailSize);
    }
  }
}

/// Shared between the spider coroutine and the stop escalation so that a
/// late SIGKILL never targets a reaped pid.
struct ChildState {
  pid_t pid{-1};
  bool exited{false};
  bool terminating{false};
};

/// Runs an external command; each JSON object written to stdout on its own
/// line is an item.
class ProcessSpider final : public ISpider {
public:
  ProcessSpider(ProcessSpiderConfig config, SpiderRequest request)
      : config_(std::move(config)), request_(std::move(request)) {}

  auto run(JobContext &ctx) -> task<Result<void>> override {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::readable_pipe stdout_pipe(executor);
    boost::asio::readable_pipe stderr_pipe(executor);

    std::optional<bp::process> proc;
    try {
      std::vector<std::string> args{"-c", config_.command};
      auto stdio = bp::process_stdio{
          .in = nullptr, .out = stdout_pipe, .err = stderr_pipe};
      if (config_.working_dir.empty()) {
        proc.emplace(executor, "/bin/sh", args, std::move(stdio),
                     build_process_env(request_));
      } else {
        proc.emplace(executor, "/bin/sh", args, std::move(stdio),
                     bp::process_start_dir{config_.working_dir},
                     build_process_env(request_));
      }
    } catch (const std::exception &ex) {
      ctx.set_failure(std::format("failed to start '{}': {}",
                                  config_.command, ex.what()));
      co_return fail(Error::LaunchFailed);
    }

    auto child = std::make_shared<ChildState>(ChildState{.pid = proc->id()});
    log::info("[{}] spider '{}' started pid={}", ctx.task_id(),
              request_.spider_name, child->pid);
    ctx.on_stop([this, &proc, child, executor] {
      terminate(*proc, child, executor);
    });

    std::string stderr_tail;
    using namespace boost::asio::experimental::awaitable_operators;
    auto ingest = co_await (read_items(ctx, stdout_pipe, *proc, child, executor) &&
                            read_stderr_tail(stderr_pipe, stderr_tail));

    auto [wait_ec, exit_code] = co_await proc->async_wait(use_nothrow);
    child->exited = true;
    log::info("[{}] spider '{}' exited pid={} code={}", ctx.task_id(),
              request_.spider_name, child->pid, exit_code);

    if (!ingest) {
      co_return ingest;
    }
    if (ctx.stop_requested()) {
      co_return ok();
    }
    if (wait_ec || exit_code != 0) {
      auto reason = wait_ec ? wait_ec.message()
                            : std::format("exit code {}", exit_code);
      if (!stderr_tail.empty()) {
        reason = std::format("{}: {}", reason, stderr_tail);
      }
      ctx.set_failure(std::move(reason));
      co_return fail(Error::Unknown);
    }
    co_return ok();
  }

private:
  auto read_items(JobContext &ctx, boost::asio::readable_pipe &pipe,
                  bp::process &proc, std::shared_ptr<ChildState> child,
                  boost::asio::any_io_executor executor) -> task<Result<void>> {
    std::string buffer;
    Result<void> status = ok();
    while (true) {
      auto [ec, n] = co_await boost::asio::async_read_until(
          pipe, boost::asio::dynamic_buffer(buffer, kMaxLineSize), '\n',
          use_nothrow);
      if (ec) {
        if (!buffer.empty() && status) {
          status = co_await handle_line(ctx, buffer);
        }
        co_return status;
      }
      std::string line = buffer.substr(0, n - 1);
      buffer.erase(0, n);
      if (!status || ctx.stop_requested()) {
        // Drain until the child exits.
        continue;
      }
      status = co_await handle_line(ctx, line);
      if (!status || ctx.stop_requested()) {
        terminate(proc, child, executor);
      }
    }
  }

  auto handle_line(JobContext &ctx, std::string_view line)
      -> task<Result<void>> {
    if (line.empty() || line.find_first_not_of(" \t\r") == line.npos) {
      co_return ok();
    }
    auto item = parse_json(line);
    if (!item) {
      log::debug("[{}] ignoring non-JSON line from '{}'", ctx.task_id(),
                 request_.spider_name);
      co_return ok();
    }
    co_return co_await ctx.emit(std::move(*item));
  }

  /// SIGTERM now, SIGKILL after the grace period if the child is still
  /// around.
  auto terminate(bp::process &proc, const std::shared_ptr<ChildState> &child,
                 boost::asio::any_io_executor executor) -> void {
    if (child->exited || child->terminating) {
      return;
    }
    child->terminating = true;
    boost::system::error_code ec;
    proc.request_exit(ec);
    if (ec) {
      log::warn("SIGTERM to pid={} failed: {}", child->pid, ec.message());
    }
    boost::asio::co_spawn(
        executor,
        [child, grace = std::chrono::seconds(config_.grace_period_sec),
         executor]() -> task<void> {
          boost::asio::steady_timer timer(executor, grace);
          co_await timer.async_wait(use_nothrow);
          if (!child->exited && child->pid > 0) {
            log::warn("pid={} ignored SIGTERM, sending SIGKILL", child->pid);
            (void)::kill(child->pid, SIGKILL);
          }
        },
        boost::asio::detached);
  }

  ProcessSpiderConfig config_;
  SpiderRequest request_;
};

} // namespace

auto create_process_spider(const ProcessSpiderConfig &config,
                           const SpiderRequest &request)
    -> Result<std::unique_ptr<ISpider>> {
  if (config.command.empty()) {
    return fail(Error::LaunchFailed);
  }
  return std::make_unique<ProcessSpider>(config, request);
}

} // namespace crawlforge
