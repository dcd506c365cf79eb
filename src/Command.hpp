#pragma once

#include "Environment.hpp"
#include "Rustify/Result.hpp"

#include <cstdint>
#include <cstdlib>
#include <fmt/format.h>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace distbuild {

class ExitStatus {
  int rawStatus;  // Original status from waitpid

public:
  ExitStatus() noexcept : rawStatus(EXIT_SUCCESS) {}
  explicit ExitStatus(int status) noexcept : rawStatus(status) {}

  bool exitedNormally() const noexcept;
  bool killedBySignal() const noexcept;
  bool stoppedBySignal() const noexcept;
  int exitCode() const noexcept;
  int termSignal() const noexcept;
  int stopSignal() const noexcept;
  bool coreDumped() const noexcept;

  // Successful only if normally exited with code 0
  bool success() const noexcept;

  std::string toString() const;
};

struct CommandOutput {
  ExitStatus exitStatus;
  std::string stdOut;  // empty unless stdout was piped
  std::string stdErr;  // empty unless stderr was piped
};

class Child {
private:
  const pid_t pid;
  const int stdOutFd;
  const int stdErrFd;

  Child(pid_t pid, int stdOutFd, int stdErrFd) noexcept
      : pid(pid), stdOutFd(stdOutFd), stdErrFd(stdErrFd) {}

  friend struct Command;

public:
  Result<ExitStatus> wait() const noexcept;
  Result<CommandOutput> waitWithOutput() const noexcept;
};

struct Command {
  enum class IOConfig : uint8_t {
    Null,
    Inherit,
    Piped,
  };

  std::string command;
  std::vector<std::string> arguments;
  // When set, the child runs with exactly these variables instead of
  // inheriting the parent's.
  std::optional<Environment> environment;
  IOConfig stdOutConfig = IOConfig::Inherit;
  IOConfig stdErrConfig = IOConfig::Inherit;

  explicit Command(std::string_view cmd) : command(cmd) {}
  Command(std::string_view cmd, std::vector<std::string> args)
      : command(cmd), arguments(std::move(args)) {}

  // Splits an argv-style list into program and arguments.
  static Result<Command> fromArgv(std::span<const std::string> argv);

  Command& addArg(const std::string_view arg) {
    arguments.emplace_back(arg);
    return *this;
  }

  Command& setStdOutConfig(IOConfig config) noexcept {
    stdOutConfig = config;
    return *this;
  }
  Command& setStdErrConfig(IOConfig config) noexcept {
    stdErrConfig = config;
    return *this;
  }
  Command& setEnvironment(Environment env) noexcept {
    environment = std::move(env);
    return *this;
  }

  std::string toString() const;

  // Fails only when the program could not be started at all; how it exits is
  // reported by the returned Child.
  Result<Child> spawn() const noexcept;
  Result<CommandOutput> output() const noexcept;
};

}  // namespace distbuild

template <>
struct fmt::formatter<distbuild::ExitStatus> : formatter<std::string> {
  auto format(const distbuild::ExitStatus& v, format_context& ctx) const
      -> format_context::iterator;
};

template <>
struct fmt::formatter<distbuild::Command> : formatter<std::string> {
  auto format(const distbuild::Command& v, format_context& ctx) const
      -> format_context::iterator;
};
