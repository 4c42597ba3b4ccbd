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

#pragma once

#include <memory>
#include <string>
#include <thread>

#include "vault_fixture/command.hxx"
#include "vault_fixture/line_writer.hxx"
#include "vault_fixture/one_shot.hxx"
#include "vault_fixture/process_handle_t.hxx"

namespace vault_fixture::os_wrapper {

struct exit_status {
  // `false` if the program couldn't be executed at all - see `error`
  bool launched{false};
  bool signaled{false};
  // NOTE: if the process was terminated by a signal, holds that signal number
  int return_code{};
  std::string error;

  [[nodiscard]] bool success() const {
    return launched && !signaled && (return_code == 0);
  }

  [[nodiscard]] std::string describe() const;
};

// Owns one child process. `start` spawns a watcher thread which `fork`s &
// `exec`s the child, forwards its stdout/stderr into the sinks and blocks until
// it terminates; the result is then published, once, through `completion`.
// Both sinks get an empty chunk once the output ended, before `completion`.
//
// The spawn and the wait for its exit happen on the very same thread - they
// must not be split between threads.
struct process {
  explicit process(command aCmd, output_sink aStdout, output_sink aStderr);

  // kills the child if it's still running and waits (bounded) for the watcher
  ~process() noexcept;

  // returns once it's known whether the `exec` succeeded - a failure to
  // execute isn't thrown, it's reported through `completion`; throws if the
  // pipes or the watcher can't be created (or the spawn takes too long)
  void start();

  [[nodiscard]] bool started() const { return watcher.joinable(); }

  // `exec` succeeded (the child may have exited since)
  [[nodiscard]] bool launched() const;

  [[nodiscard]] one_shot<exit_status> const &completion() const;

  // sends `SIGKILL`; returns `false` if the child is already gone (or never
  // was launched)
  [[nodiscard]] bool do_kill();

  // `pid` of the child process
  [[nodiscard]] process_handle_t get_process_handle() const;

private:
  process(process const &) = delete;
  process &operator=(process const &) = delete;

  struct shared_state;

  std::shared_ptr<shared_state> state;
  std::thread watcher;
};

} // namespace vault_fixture::os_wrapper
