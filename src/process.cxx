/*
  Copyright 2026 Lukáš Růžička

  This file is part of vault_fixture.

  vault_fixture is free software: you can redistribute it and/or modify it
  under the terms of the GNU Lesser General Public License as published by the
  Free Software Foundation, either version 3 of the License, or (at your option)
  any later version.

  vault_fixture is distributed in the hope that it will be useful, but WITHOUT
  ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
  FOR A PARTICULAR PURPOSE. See the GNU Lesser General Public License for more
  details.

  You should have received a copy of the GNU Lesser General Public License along
  with vault_fixture. If not, see <https://www.gnu.org/licenses/>.
*/

#include "vault_fixture/process.hxx"

#include <fcntl.h>
#include <poll.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <array>
#include <chrono>
#include <exception>
#include <initializer_list>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "impl/syscall_helper.hxx"
#include "vault_fixture/pipe_helper.hxx"

namespace vault_fixture::os_wrapper {

namespace {

// how long the destructor waits for the watcher after killing the child
auto constexpr watcher_join_timeout{std::chrono::seconds{5}};
// `fork` + `exec` (or its failure) is expected way sooner
auto constexpr spawn_timeout{std::chrono::seconds{10}};

int constexpr exec_failed_exit_code{127};

struct my_cstr_arr_deleter {
  void operator()(char *null_terminated_arr[]) const {
    if (null_terminated_arr != nullptr) {
      for (char **ptr = null_terminated_arr; *ptr != nullptr; ++ptr) {
        std::free(*ptr); // due to `strdup`
      }
      delete[] null_terminated_arr;
    }
  }
};

using cstr_arr_t = std::unique_ptr<char *[], my_cstr_arr_deleter>;

[[nodiscard]] cstr_arr_t build_cstr_arr(std::string const *const first,
                                        std::vector<std::string> const &rest) {
  auto const offset{first != nullptr ? std::size_t{1} : std::size_t{0}};
  auto const count{rest.size() + offset};

  cstr_arr_t arr{new char *[count + 1] {}};

  // https://man7.org/linux/man-pages/man3/exec.3.html -> "The first
  // argument, by convention, should point to the filename associated with
  // the file being executed"
  if (first != nullptr) {
    arr[0] = strdup(first->c_str());
  }
  for (std::size_t i{0}; i < rest.size(); ++i) {
    arr[i + offset] = strdup(rest[i].c_str());
  }
  arr[count] = nullptr;

  return arr;
}

// only async-signal-safe calls in here - it runs between `fork` & `exec` of a
// multi-threaded parent
[[noreturn]] void exec_in_child(char *argv[], char *envp[],
                                native_fd_t const stdout_fd,
                                native_fd_t const stderr_fd,
                                native_fd_t const exec_status_fd) noexcept {
  int const dev_null{open("/dev/null", O_RDONLY | O_CLOEXEC)};
  if ((dev_null != -1) && (dup2(dev_null, STDIN_FILENO) != -1) &&
      (dup2(stdout_fd, STDOUT_FILENO) != -1) &&
      (dup2(stderr_fd, STDERR_FILENO) != -1)) {
    execvpe(argv[0], argv, envp);
  }

  // the parent reads it from the pipe; on success the pipe is just closed by
  // the `exec` (`O_CLOEXEC`)
  int const errno_val{errno};
  [[maybe_unused]] auto const written{
      write(exec_status_fd, &errno_val, sizeof(errno_val))};

  // not `exit` - no atexit handlers or flushing of the parent's buffers here
  std::_Exit(exec_failed_exit_code);
}

[[nodiscard]] exit_status reap(process_handle_t const pid) {
  siginfo_t info{};
  // https://man7.org/linux/man-pages/man2/wait.2.html
  auto const ret{
      retry_on_eintr([&] { return waitid(P_PID, pid, &info, WEXITED); })};
  VAULT_FIXTURE_SYSCALL_HELPER(ret);

  if (info.si_pid != pid) {
    throw std::runtime_error{
        "waitid returned unexpected pid - different from the managed one!"};
  }

  exit_status status;
  status.launched = true;
  status.signaled = (info.si_code == CLD_KILLED) || (info.si_code == CLD_DUMPED);
  status.return_code = info.si_status;
  return status;
}

} // namespace

std::string exit_status::describe() const {
  if (!launched) {
    return error.empty() ? std::string{"not launched"} : error;
  } else if (signaled) {
    char const *const name{strsignal(return_code)};
    return "killed by signal " + std::to_string(return_code) +
           (name != nullptr ? " (" + std::string{name} + ")" : std::string{});
  } else {
    auto desc{"exited with code " + std::to_string(return_code)};
    if (!error.empty()) {
      desc += " (" + error + ")";
    }
    return desc;
  }
}

struct process::shared_state {
  shared_state(command &&aCmd, output_sink &&aStdout, output_sink &&aStderr)
      : cmd{std::move(aCmd)}, on_stdout{std::move(aStdout)},
        on_stderr{std::move(aStderr)} {}

  ~shared_state() noexcept {
    if (pid_fd != invalid_fd) {
      close(pid_fd);
    }
  }

  // on the caller's thread, so running out of descriptors is reported by
  // `start` itself
  void open_pipes() {
    stdout_pipe.init();
    stderr_pipe.init();
    exec_status_pipe.init();
  }

  // the watcher thread's body - both the spawn & the wait happen here
  void run() noexcept;

  // `true` -> child was `exec`-ed, `false` -> it wasn't
  one_shot<bool> spawned;
  one_shot<exit_status> completion;

  mutable std::mutex mtx;
  process_handle_t handle{invalid_process_handle};
  native_fd_t pid_fd{invalid_fd};

private:
  void spawn_and_wait();
  void pump_output(native_fd_t const child_pid_fd);
  void end_output() noexcept;

  // the completion goes first - once `start` returns, a launch failure must be
  // visible already
  void publish(exit_status &&status) {
    auto const launched{status.launched};
    if (!completion.set(std::move(status))) {
      spdlog::error("process {}: exit status was already published!",
                    cmd.path);
    }
    [[maybe_unused]] auto const s{spawned.set(launched)};
  }

  command cmd;
  output_sink on_stdout;
  output_sink on_stderr;

  pipe_helper stdout_pipe;
  pipe_helper stderr_pipe;
  pipe_helper exec_status_pipe;
};

void process::shared_state::run() noexcept {
  try {
    spawn_and_wait();
  } catch (std::exception const &e) {
    // the child, if any, is reaped already (or was never forked)
    exit_status status;
    status.launched = false;
    status.error = "failed to run `" + cmd.path + "`: " + e.what();
    publish(std::move(status));
  }
}

void process::shared_state::spawn_and_wait() {
  // it's safer to do as little after the `fork` and before `exec` as
  // possible:
  auto const argv{build_cstr_arr(&cmd.path, cmd.args)};
  auto const envp{build_cstr_arr(nullptr, cmd.env)};

  auto const pid{VAULT_FIXTURE_SYSCALL_HELPER(fork())};
  if (pid == 0) { // child process
    exec_in_child(argv.get(), envp.get(), stdout_pipe.get_in(),
                  stderr_pipe.get_in(), exec_status_pipe.get_in());
  } // else ... parent process

  stdout_pipe.close_in();
  stderr_pipe.close_in();
  exec_status_pipe.close_in();

  int exec_errno{0};
  auto const read_bytes{retry_on_eintr([&] {
    return read(exec_status_pipe.get_out(), &exec_errno, sizeof(exec_errno));
  })};
  VAULT_FIXTURE_SYSCALL_HELPER(read_bytes);

  if (read_bytes != 0) {
    auto status{reap(pid)};
    status.launched = false;
    status.error = "failed to execute `" + cmd.path +
                   "`: " + std::strerror(exec_errno);
    publish(std::move(status));
    return;
  }

  // https://man7.org/linux/man-pages/man2/pidfd_open.2.html
  auto const child_pid_fd{static_cast<native_fd_t>(
      syscall(static_cast<long>(SYS_pidfd_open), pid, 0))};
  if (child_pid_fd == invalid_fd) {
    auto const errno_val{current_errno()};
    VAULT_FIXTURE_SYSCALL_HELPER(kill(pid, SIGKILL));
    auto status{reap(pid)};
    status.error = std::string{"pidfd_open failed: "} + std::strerror(errno_val);
    publish(std::move(status));
    return;
  }

  {
    std::lock_guard<std::mutex> lck{mtx};
    handle = pid;
    pid_fd = child_pid_fd;
  }
  [[maybe_unused]] auto const s{spawned.set(true)};

  try {
    pump_output(child_pid_fd);
  } catch (std::exception const &e) {
    // keep waiting for the child regardless - its exit is what matters
    spdlog::error("process {} (pid {}): lost its output: {}", cmd.path, pid,
                  e.what());
  }
  end_output();

  publish(reap(pid));
}

void process::shared_state::end_output() noexcept {
  stdout_pipe.close_out();
  stderr_pipe.close_out();
  exec_status_pipe.close_out();

  for (auto const *const sink : {&on_stdout, &on_stderr}) {
    if (!*sink) {
      continue;
    }
    try {
      (*sink)(std::string_view{});
    } catch (std::exception const &e) {
      spdlog::error("process {}: failed to pass on the end of its output: {}",
                    cmd.path, e.what());
    }
  }
}

void process::shared_state::pump_output(native_fd_t const child_pid_fd) {
  // https://man7.org/linux/man-pages/man2/poll.2.html - negative `fd`s are
  // ignored, that's how a closed pipe or the reported exit gets "removed"
  std::array<pollfd, 3> fds{{{stdout_pipe.get_out(), POLLIN, 0},
                             {stderr_pipe.get_out(), POLLIN, 0},
                             {child_pid_fd, POLLIN, 0}}};
  std::array<output_sink const *, 2> const sinks{&on_stdout, &on_stderr};
  std::array<char, 4096> buffer;

  bool exited{false};
  while ((fds[0].fd != invalid_fd) || (fds[1].fd != invalid_fd)) {
    // once exited, only drain what's left in the pipes
    auto const poll_res{retry_on_eintr(
        [&] { return poll(fds.data(), fds.size(), exited ? 0 : -1); })};
    VAULT_FIXTURE_SYSCALL_HELPER(poll_res);
    if (poll_res == 0) {
      break;
    }

    for (std::size_t i{0}; i < sinks.size(); ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      auto const nbytes{retry_on_eintr(
          [&] { return read(fds[i].fd, buffer.data(), buffer.size()); })};
      VAULT_FIXTURE_SYSCALL_HELPER(nbytes);
      if (nbytes == 0) {
        fds[i].fd = invalid_fd; // EOF
      } else if (*sinks[i]) {
        (*sinks[i])(std::string_view{buffer.data(),
                                     static_cast<std::size_t>(nbytes)});
      }
    }

    if ((fds[2].revents & POLLIN) != 0) {
      exited = true;
      fds[2].fd = invalid_fd;
    }
  }
}

process::process(command aCmd, output_sink aStdout, output_sink aStderr)
    : state{std::make_shared<shared_state>(std::move(aCmd), std::move(aStdout),
                                           std::move(aStderr))} {}

process::~process() noexcept {
  if (!watcher.joinable()) {
    return;
  }

  try {
    [[maybe_unused]] auto const killed{do_kill()};
  } catch (std::exception const &e) {
    spdlog::error("failed to kill child process {}: {}",
                  get_process_handle(), e.what());
  }

  if (state->completion.wait_for(watcher_join_timeout)) {
    watcher.join();
  } else {
    // the watcher owns a reference to the state, so it may outlive us
    spdlog::critical("child process {} didn't terminate - abandoning it",
                     get_process_handle());
    watcher.detach();
  }
}

void process::start() {
  if (started()) {
    throw std::runtime_error{"cannot start - process was already started!"};
  }

  state->open_pipes();
  watcher = std::thread{[st = state] { st->run(); }};

  if (!state->spawned.wait_for(spawn_timeout)) {
    throw std::runtime_error{"timed out waiting for the process to spawn!"};
  }
}

bool process::launched() const {
  return state->spawned.is_set() && state->spawned.get();
}

one_shot<exit_status> const &process::completion() const {
  return state->completion;
}

bool process::do_kill() {
  std::lock_guard<std::mutex> lck{state->mtx};
  if (state->pid_fd == invalid_fd) {
    return false;
  }

  // a `pidfd` can't be "recycled" - once the child is reaped, this fails with
  // `ESRCH` instead of hitting some unrelated process
  // https://man7.org/linux/man-pages/man2/pidfd_send_signal.2.html
  auto const ret{syscall(static_cast<long>(SYS_pidfd_send_signal),
                         state->pid_fd, SIGKILL, nullptr, 0)};
  if ((ret == -1) && (current_errno() == ESRCH)) {
    return false;
  }
  VAULT_FIXTURE_SYSCALL_HELPER(ret);
  return true;
}

process_handle_t process::get_process_handle() const {
  std::lock_guard<std::mutex> lck{state->mtx};
  return state->handle;
}

} // namespace vault_fixture::os_wrapper
