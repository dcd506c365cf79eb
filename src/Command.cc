#include "Command.hpp"

#include "Rustify/Result.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <span>
#include <string>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#if defined(__APPLE__)
#  include <crt_externs.h>
#  define DISTBUILD_ENVIRON (*_NSGetEnviron())  // NOLINT
#else
extern char** environ;  // NOLINT(readability-redundant-declaration)
#  define DISTBUILD_ENVIRON environ  // NOLINT
#endif

namespace distbuild {

constexpr std::size_t BUFFER_SIZE = 128;

bool
ExitStatus::exitedNormally() const noexcept {
  return WIFEXITED(rawStatus);
}
bool
ExitStatus::killedBySignal() const noexcept {
  return WIFSIGNALED(rawStatus);
}
bool
ExitStatus::stoppedBySignal() const noexcept {
  return WIFSTOPPED(rawStatus);
}
int
ExitStatus::exitCode() const noexcept {
  return WEXITSTATUS(rawStatus);
}
int
ExitStatus::termSignal() const noexcept {
  return WTERMSIG(rawStatus);
}
int
ExitStatus::stopSignal() const noexcept {
  return WSTOPSIG(rawStatus);
}
bool
ExitStatus::coreDumped() const noexcept {
  return WCOREDUMP(rawStatus);
}

bool
ExitStatus::success() const noexcept {
  return exitedNormally() && exitCode() == 0;
}

std::string
ExitStatus::toString() const {
  if (exitedNormally()) {
    return fmt::format("exited with code {}", exitCode());
  } else if (killedBySignal()) {
    return fmt::format(
        "killed by signal {}{}", termSignal(),
        coreDumped() ? " (core dumped)" : ""
    );
  } else if (stoppedBySignal()) {
    return fmt::format("stopped by signal {}", stopSignal());
  }
  return "unknown status";
}

static void
closeIfOpen(const int fd) noexcept {
  if (fd != -1) {
    close(fd);
  }
}

static Result<int>
waitPid(const pid_t pid) noexcept {
  int status{};
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      Bail("waitpid() failed: {}", std::strerror(errno));
    }
  }
  return Ok(status);
}

Result<ExitStatus>
Child::wait() const noexcept {
  closeIfOpen(stdOutFd);
  closeIfOpen(stdErrFd);
  return Ok(ExitStatus{ Try(waitPid(pid)) });
}

Result<CommandOutput>
Child::waitWithOutput() const noexcept {
  std::string stdOutOutput;
  std::string stdErrOutput;

  int outFd = stdOutFd;
  int errFd = stdErrFd;
  const auto closeAll = [&]() noexcept {
    closeIfOpen(outFd);
    closeIfOpen(errFd);
    outFd = errFd = -1;
  };
  // Returns false on a read error; marks the fd closed on EOF.
  const auto drain = [](int& fd, std::string& sink) noexcept {
    std::array<char, BUFFER_SIZE> buffer{};
    const ssize_t count = read(fd, buffer.data(), buffer.size());
    if (count == -1) {
      return errno == EINTR;
    } else if (count == 0) {
      close(fd);
      fd = -1;
    } else {
      sink.append(buffer.data(), static_cast<std::size_t>(count));
    }
    return true;
  };

  while (outFd != -1 || errFd != -1) {
    fd_set readfds;
    FD_ZERO(&readfds);
    if (outFd != -1) {
      FD_SET(outFd, &readfds);
    }
    if (errFd != -1) {
      FD_SET(errFd, &readfds);
    }

    const int maxfd = std::max(outFd, errFd);
    if (select(maxfd + 1, &readfds, nullptr, nullptr, nullptr) == -1) {
      if (errno == EINTR) {
        continue;
      }
      closeAll();
      Bail("select() failed");
    }

    if (outFd != -1 && FD_ISSET(outFd, &readfds)
        && !drain(outFd, stdOutOutput)) {
      closeAll();
      Bail("read() failed on stdout");
    }
    if (errFd != -1 && FD_ISSET(errFd, &readfds)
        && !drain(errFd, stdErrOutput)) {
      closeAll();
      Bail("read() failed on stderr");
    }
  }

  const int status = Try(waitPid(pid));
  return Ok(CommandOutput{ .exitStatus = ExitStatus{ status },
                           .stdOut = std::move(stdOutOutput),
                           .stdErr = std::move(stdErrOutput) });
}

Result<Command>
Command::fromArgv(const std::span<const std::string> argv) {
  Ensure(!argv.empty(), "command must contain at least one entry");
  return Ok(Command(
      argv.front(), std::vector<std::string>(argv.begin() + 1, argv.end())
  ));
}

static void
redirect(const Command::IOConfig config, std::array<int, 2>& pipeFds, int target)
    noexcept {
  if (config == Command::IOConfig::Piped) {
    close(pipeFds[0]);  // Child doesn't read from its own output
    dup2(pipeFds[1], target);
    close(pipeFds[1]);
  } else if (config == Command::IOConfig::Null) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
    const int nullfd = open("/dev/null", O_WRONLY);
    dup2(nullfd, target);
    close(nullfd);
  }
}

Result<Child>
Command::spawn() const noexcept {
  // Everything the child needs is prepared before fork() so that the child
  // only calls async-signal-safe functions.
  std::vector<std::string> argStrs;
  argStrs.reserve(arguments.size() + 1);
  argStrs.push_back(command);
  argStrs.insert(argStrs.end(), arguments.begin(), arguments.end());
  std::vector<char*> argv;
  for (std::string& arg : argStrs) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::vector<std::string> envStrs;
  std::vector<char*> envp;
  if (environment.has_value()) {
    envStrs = environment->toEnvp();
    for (std::string& entry : envStrs) {
      envp.push_back(entry.data());
    }
    envp.push_back(nullptr);
  }

  // A close-on-exec pipe: it is closed silently when execvp() succeeds, and
  // carries errno back to the parent when it fails.
  std::array<int, 2> execErrPipe{};
  if (pipe(execErrPipe.data()) == -1) {
    Bail("pipe() failed for exec status");
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  fcntl(execErrPipe[0], F_SETFD, FD_CLOEXEC);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  fcntl(execErrPipe[1], F_SETFD, FD_CLOEXEC);

  std::array<int, 2> stdOutPipe{ -1, -1 };
  std::array<int, 2> stdErrPipe{ -1, -1 };
  const auto closePipes = [&]() noexcept {
    for (const int fd : { execErrPipe[0], execErrPipe[1], stdOutPipe[0],
                          stdOutPipe[1], stdErrPipe[0], stdErrPipe[1] }) {
      closeIfOpen(fd);
    }
  };

  if (stdOutConfig == IOConfig::Piped && pipe(stdOutPipe.data()) == -1) {
    closePipes();
    Bail("pipe() failed for stdout");
  }
  if (stdErrConfig == IOConfig::Piped && pipe(stdErrPipe.data()) == -1) {
    closePipes();
    Bail("pipe() failed for stderr");
  }

  const pid_t pid = fork();
  if (pid == -1) {
    closePipes();
    Bail("fork() failed");
  } else if (pid == 0) {
    // Child process
    close(execErrPipe[0]);
    redirect(stdOutConfig, stdOutPipe, STDOUT_FILENO);
    redirect(stdErrConfig, stdErrPipe, STDERR_FILENO);

    if (environment.has_value()) {
      // execvp() searches the PATH of the new environment.
      DISTBUILD_ENVIRON = envp.data();
    }
    execvp(argv[0], argv.data());

    const int err = errno;
    [[maybe_unused]] const ssize_t n =
        write(execErrPipe[1], &err, sizeof(err));
    _exit(127);
  }

  // Parent process
  close(execErrPipe[1]);
  if (stdOutConfig == IOConfig::Piped) {
    close(stdOutPipe[1]);  // Parent doesn't write to stdout pipe
  }
  if (stdErrConfig == IOConfig::Piped) {
    close(stdErrPipe[1]);  // Parent doesn't write to stderr pipe
  }

  int execErr = 0;
  ssize_t count{};
  do {
    count = read(execErrPipe[0], &execErr, sizeof(execErr));
  } while (count == -1 && errno == EINTR);
  close(execErrPipe[0]);

  if (count == static_cast<ssize_t>(sizeof(execErr))) {
    closeIfOpen(stdOutConfig == IOConfig::Piped ? stdOutPipe[0] : -1);
    closeIfOpen(stdErrConfig == IOConfig::Piped ? stdErrPipe[0] : -1);
    Try(waitPid(pid));  // reap
    Bail("could not execute `{}`: {}", command, std::strerror(execErr));
  }

  return Ok(Child{ pid, stdOutConfig == IOConfig::Piped ? stdOutPipe[0] : -1,
                   stdErrConfig == IOConfig::Piped ? stdErrPipe[0] : -1 });
}

Result<CommandOutput>
Command::output() const noexcept {
  Command cmd = *this;
  cmd.setStdOutConfig(IOConfig::Piped);
  cmd.setStdErrConfig(IOConfig::Piped);
  return Try(cmd.spawn()).waitWithOutput();
}

std::string
Command::toString() const {
  std::string res = command;
  for (const std::string& arg : arguments) {
    res += ' ' + arg;
  }
  return res;
}

}  // namespace distbuild

auto
fmt::formatter<distbuild::ExitStatus>::format(
    const distbuild::ExitStatus& v, format_context& ctx
) const -> format_context::iterator {
  return formatter<std::string>::format(v.toString(), ctx);
}

auto
fmt::formatter<distbuild::Command>::format(
    const distbuild::Command& v, format_context& ctx
) const -> format_context::iterator {
  return formatter<std::string>::format(v.toString(), ctx);
}

#ifdef DISTBUILD_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace distbuild;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testOutputCapturesBothStreams() {
  const CommandOutput out = Command("sh")
                                .addArg("-c")
                                .addArg("printf out; printf err >&2; exit 3")
                                .output()
                                .unwrap();
  assertFalse(out.exitStatus.success());
  assertEq(out.exitStatus.exitCode(), 3);
  assertEq(out.exitStatus.toString(), "exited with code 3");
  assertEq(out.stdOut, "out");
  assertEq(out.stdErr, "err");

  pass();
}

static void
testSpawnReportsExecFailure() {
  const auto res = Command("distbuild-no-such-program-xyz").spawn();
  assertTrue(res.is_err());
  assertContains(res.unwrap_err()->what(), "distbuild-no-such-program-xyz");
  assertContains(res.unwrap_err()->what(), std::strerror(ENOENT));

  pass();
}

static void
testSpawnUsesGivenEnvironment() {
  const Environment env{ { "PATH", "/usr/bin:/bin" },
                         { "DISTBUILD_PROBE", "from-env" } };
  const CommandOutput out = Command("sh")
                                .addArg("-c")
                                .addArg("printf \"$DISTBUILD_PROBE:$HOME\"")
                                .setEnvironment(env)
                                .output()
                                .unwrap();
  assertTrue(out.exitStatus.success());
  // Nothing leaks from the parent: HOME is unset in the child.
  assertEq(out.stdOut, "from-env:");

  pass();
}

static void
testFromArgv() {
  const std::vector<std::string> argv = { "make", "-j4", "dist" };
  const Command cmd = Command::fromArgv(argv).unwrap();
  assertEq(cmd.command, "make");
  assertEq(cmd.arguments.size(), 2UL);
  assertEq(cmd.toString(), "make -j4 dist");

  assertTrue(Command::fromArgv({}).is_err());

  pass();
}

static void
testExitStatusSignals() {
  const CommandOutput out =
      Command("sh").addArg("-c").addArg("kill -TERM $$").output().unwrap();
  assertTrue(out.exitStatus.killedBySignal());
  assertFalse(out.exitStatus.success());
  assertContains(out.exitStatus.toString(), "killed by signal");

  pass();
}

}  // namespace tests

int
main() {
  tests::testOutputCapturesBothStreams();
  tests::testSpawnReportsExecFailure();
  tests::testSpawnUsesGivenEnvironment();
  tests::testFromArgv();
  tests::testExitStatusSignals();
}

#endif
