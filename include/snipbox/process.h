#ifndef INCLUDE_SNIPBOX_PROCESS_H_
#define INCLUDE_SNIPBOX_PROCESS_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

struct CommandResult {
  int exit_code; // -1 if not exited normally
  int term_signal;
  bool timed_out;
  bool spawn_failed;
  std::string out, err;

  CommandResult() : exit_code(-1), term_signal(0), timed_out(false), spawn_failed(false) {}
  bool Success() const { return !timed_out && !spawn_failed && exit_code == 0; }
  // stderr if any, otherwise stdout; trimmed
  std::string Message() const;
};

struct CommandOptions {
  std::optional<std::vector<std::string>> env; // unset: inherit
  std::string input;
  long timeout_ms; // 0: unlimited
  size_t max_output; // per stream, 0: unlimited
  std::filesystem::path workdir;

  CommandOptions() : timeout_ms(0), max_output(0) {}
};

// argv[0] is searched in PATH. On timeout the child is killed with SIGKILL.
CommandResult RunCommand(const std::vector<std::string>& argv,
                         const CommandOptions& opt = CommandOptions());

bool CommandExists(const std::string& name);

#endif  // INCLUDE_SNIPBOX_PROCESS_H_
