#include "Cli.hpp"

#include "Cmd/Common.hpp"
#include "Diag.hpp"
#include "Rustify/Result.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cstdio>
#include <fmt/core.h>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace distbuild {

static constinit const std::string_view PADDING = "  ";

static std::string
formatLeft(const std::size_t offset, const std::string_view left) {
  return fmt::format("{}{:<{}}", PADDING, left, offset + PADDING.size());
}

static std::string
formatHeader(const std::string_view header) {
  return fmt::format("{}\n", Bold(Green(header)).toStr());
}

static std::size_t
calcOptMaxShortSize(const Opts& opts) noexcept {
  std::size_t maxShortSize = 0;
  for (const Opt& opt : opts) {
    if (!opt.isHidden) {
      maxShortSize = std::max(maxShortSize, opt.shortName.size());
    }
  }
  return maxShortSize;
}

static std::size_t
calcOptMaxOffset(const Opts& opts, const std::size_t maxShortSize) noexcept {
  std::size_t maxOffset = 0;
  for (const Opt& opt : opts) {
    if (!opt.isHidden) {
      maxOffset = std::max(maxOffset, opt.leftSize(maxShortSize));
    }
  }
  return maxOffset;
}

static std::string
formatOpts(
    const Opts& opts, const std::size_t maxShortSize,
    const std::size_t maxOffset
) {
  std::string str;
  for (const Opt& opt : opts) {
    if (!opt.isHidden) {
      str += opt.format(maxShortSize, maxOffset);
    }
  }
  return str;
}

std::string
Opt::format(const std::size_t maxShortSize, std::size_t maxOffset) const {
  std::string option;
  if (!shortName.empty()) {
    option += Bold(Cyan(shortName)).toStr();
    option += ", ";
    if (maxShortSize > shortName.size()) {
      option += std::string(maxShortSize - shortName.size(), ' ');
    }
  } else {
    // Colored too, so that every row carries the same escape overhead.
    option += Bold(Cyan(std::string(maxShortSize, ' '))).toStr();
    option += "  ";  // ", "
  }
  option += Bold(Cyan(name)).toStr();
  option += ' ';
  option += Cyan(placeholder).toStr();

  if (shouldColorStdout()) {
    // Escape sequences take room in the padding without being visible.
    constexpr std::size_t colorEscapeSeqLen = 31;
    maxOffset += colorEscapeSeqLen;
  }
  std::string str = formatLeft(maxOffset, option);
  str += desc;
  str += '\n';
  return str;
}

Subcmd&
Subcmd::setDesc(const std::string_view desc) noexcept {
  this->desc = desc;
  return *this;
}
Subcmd&
Subcmd::setArg(const std::string_view argName) noexcept {
  this->argName = argName;
  return *this;
}
Subcmd&
Subcmd::addOpt(Opt opt) {
  localOpts.push_back(opt);
  return *this;
}
Subcmd&
Subcmd::setMainFn(std::function<MainFn> mainFn) noexcept {
  this->mainFn = std::move(mainFn);
  return *this;
}

std::string
Subcmd::formatUsage(FILE* file) const {
  std::string str = Bold(Green("Usage: ")).toStr(file);
  str += Bold(Cyan(cmdName)).toStr(file);
  str += ' ';
  str += Bold(Cyan(name)).toStr(file);
  str += ' ';
  str += Cyan("[OPTIONS]").toStr(file);
  if (!argName.empty()) {
    str += ' ';
    str += Cyan(fmt::format("[{}]", argName)).toStr(file);
  }
  return str;
}

[[nodiscard]] AnyhowErr
Subcmd::noSuchArg(const std::string_view arg) const {
  return anyhow::anyhow(
      "unexpected argument '{}' found\n\n"
      "{}\n\n"
      "For more information, try '{}'",
      Bold(Yellow(arg)).toErrStr(), formatUsage(stderr),
      Bold(Cyan("--help")).toErrStr()
  );
}

[[nodiscard]] AnyhowErr
Subcmd::missingOptArgumentFor(const std::string_view arg) noexcept {
  return anyhow::anyhow("missing argument for `{}`", arg);
}

std::size_t
Subcmd::calcMaxShortSize() const noexcept {
  return std::max(
      calcOptMaxShortSize(globalOpts), calcOptMaxShortSize(localOpts)
  );
}
std::size_t
Subcmd::calcMaxOffset(const std::size_t maxShortSize) const noexcept {
  return std::max(
      calcOptMaxOffset(globalOpts, maxShortSize),
      calcOptMaxOffset(localOpts, maxShortSize)
  );
}

std::string
Subcmd::formatHelp() const {
  const std::size_t maxShortSize = calcMaxShortSize();
  const std::size_t maxOffset = calcMaxOffset(maxShortSize);

  std::string str = std::string(desc);
  str += "\n\n";
  str += formatUsage(stdout);
  str += "\n\n";
  str += formatHeader("Options:");
  str += formatOpts(globalOpts, maxShortSize, maxOffset);
  str += formatOpts(localOpts, maxShortSize, maxOffset);
  return str;
}

std::string
Subcmd::format(std::size_t maxOffset) const {
  const std::string cmdStr = Bold(Cyan(name)).toStr();
  if (shouldColorStdout()) {
    constexpr std::size_t colorEscapeSeqLen = 11;
    maxOffset += colorEscapeSeqLen;
  }
  std::string str = formatLeft(maxOffset, cmdStr);
  str += desc;
  str += '\n';
  return str;
}

Cli&
Cli::setDesc(const std::string_view desc) noexcept {
  this->desc = desc;
  return *this;
}
Cli&
Cli::addSubcmd(Subcmd subcmd) {
  subcmd.cmdName = name;
  subcmd.globalOpts = globalOpts;
  const std::string_view subcmdName = subcmd.name;
  subcmds.insert_or_assign(subcmdName, std::move(subcmd));
  return *this;
}
Cli&
Cli::addOpt(Opt opt) {
  if (opt.isGlobal) {
    globalOpts.push_back(opt);
  } else {
    localOpts.push_back(opt);
  }
  return *this;
}

bool
Cli::hasSubcmd(const std::string_view subcmd) const noexcept {
  return subcmds.contains(subcmd);
}

[[nodiscard]] AnyhowErr
Cli::noSuchArg(const std::string_view arg) const {
  return anyhow::anyhow(
      "unexpected argument '{}' found\n\n"
      "For a list of commands, try '{}'",
      Bold(Yellow(arg)).toErrStr(),
      Bold(Cyan(fmt::format("{} help", name))).toErrStr()
  );
}

[[nodiscard]] Result<void>
Cli::exec(const std::string_view subcmd, const CliArgsView args) const {
  return subcmds.at(subcmd).mainFn(args);
}

[[nodiscard]] Result<Cli::ControlFlow>
Cli::handleGlobalOpts(
    CliArgsView::iterator& itr, const CliArgsView::iterator end,
    const std::string_view subcmd
) {
  const std::string_view arg = *itr;

  if (arg == "-h" || arg == "--help") {
    if (!subcmd.empty()) {
      const std::vector<std::string> helpArgs{ std::string(subcmd) };
      return getCli().printHelp(helpArgs).map([] { return Return; });
    } else {
      return getCli().printHelp({}).map([] { return Return; });
    }
  } else if (arg == "-v" || arg == "--verbose") {
    setDiagLevel(DiagLevel::Verbose);
    return Ok(Continue);
  } else if (arg == "-vv") {
    setDiagLevel(DiagLevel::VeryVerbose);
    return Ok(Continue);
  } else if (arg == "-q" || arg == "--quiet") {
    setDiagLevel(DiagLevel::Off);
    return Ok(Continue);
  } else if (arg == "--color") {
    Ensure(itr + 1 < end, "missing argument for `--color`");
    setColorMode(*++itr);
    return Ok(Continue);
  } else if (arg == "--manifest-path") {
    Ensure(itr + 1 < end, "missing argument for `--manifest-path`");
    setManifestPath(*++itr);
    return Ok(Continue);
  }
  return Ok(Fallthrough);
}

Result<void>
Cli::parseArgs(
    const int argc, char* argv[]  // NOLINT(*-avoid-c-arrays)
) const noexcept {
  // Drop the first argument (program name)
  return parseArgs(Try(expandOpts({ argv + 1, argv + argc })));
}

Result<void>
Cli::parseArgs(const CliArgsView args) const noexcept {
  // Global options may come before the subcommand or after it:
  // distbuild --verbose build --target x86_64-apple-darwin --color never
  // ^^^^^^^^^^^^^^^^^^^ ^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^
  // [global]            [build, which handles globals again]
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = Try(Cli::handleGlobalOpts(itr, args.end()));
    if (control == Cli::Return) {
      return Ok();
    } else if (control == Cli::Continue) {
      continue;
    }

    if (arg == "-V" || arg == "--version") {
      return exec("version", { itr + 1, args.end() });
    } else if (hasSubcmd(arg)) {
      try {
        return exec(arg, { itr + 1, args.end() });
      } catch (const std::exception& e) {
        return Err(anyhow::anyhow(std::string(e.what())));
      }
    } else {
      return noSuchArg(arg);
    }
  }

  return printHelp({});
}

const Opt*
Cli::findOpt(const std::string_view name, const Subcmd* subcmd) const {
  const auto matches = [name](const Opt& opt) { return opt.matches(name); };
  if (const auto itr = std::ranges::find_if(globalOpts, matches);
      itr != globalOpts.end()) {
    return &*itr;
  }
  const Opts& local = subcmd != nullptr ? subcmd->localOpts : localOpts;
  if (const auto itr = std::ranges::find_if(local, matches);
      itr != local.end()) {
    return &*itr;
  }
  return nullptr;
}

Result<std::vector<std::string>>
Cli::expandOpts(const std::span<const char* const> args) const {
  const Subcmd* curSubcmd = nullptr;

  std::vector<std::string> expanded;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view arg = args[i];

    // The value of an option given as a separate argument:
    // "--color never" or "--manifest-path dist.toml"
    if (i > 0) {
      const Opt* prev = findOpt(args[i - 1], curSubcmd);
      if (prev != nullptr && prev->takesArg()) {
        expanded.emplace_back(arg);
        continue;
      }
    }

    if (curSubcmd == nullptr && !arg.starts_with("-")) {
      if (!hasSubcmd(arg)) {
        return noSuchArg(arg);
      }
      curSubcmd = &subcmds.at(arg);
      expanded.emplace_back(arg);
      continue;
    }

    // "--color=always" => ["--color", "always"]
    // "--color="       => error
    const std::size_t eqPos = arg.find('=');
    if (arg.starts_with("--") && eqPos != std::string_view::npos) {
      const std::string_view optName = arg.substr(0, eqPos);
      const Opt* opt = findOpt(optName, curSubcmd);
      if (opt != nullptr && opt->takesArg()) {
        if (eqPos + 1 == arg.size()) {
          return Subcmd::missingOptArgumentFor(optName);
        }
        expanded.emplace_back(optName);
        expanded.emplace_back(arg.substr(eqPos + 1));
        continue;
      }
    }

    // "--color" as the last argument
    if (const Opt* opt = findOpt(arg, curSubcmd);
        opt != nullptr && opt->takesArg() && i + 1 == args.size()) {
      return Subcmd::missingOptArgumentFor(arg);
    }

    // Anything else is checked by whoever consumes it.
    expanded.emplace_back(arg);
  }
  return Ok(std::move(expanded));
}

void
Cli::printSubcmdHelp(const std::string_view subcmd) const {
  fmt::print("{}", subcmds.at(subcmd).formatHelp());
}

std::size_t
Cli::calcMaxShortSize() const noexcept {
  return std::max(
      calcOptMaxShortSize(globalOpts), calcOptMaxShortSize(localOpts)
  );
}

std::size_t
Cli::calcMaxOffset(const std::size_t maxShortSize) const noexcept {
  std::size_t maxOffset = std::max(
      calcOptMaxOffset(globalOpts, maxShortSize),
      calcOptMaxOffset(localOpts, maxShortSize)
  );
  for (const auto& [subcmdName, subcmd] : subcmds) {
    maxOffset = std::max(maxOffset, subcmdName.size());
  }
  return maxOffset;
}

std::string
Cli::formatAllSubcmds(const std::size_t maxOffset) const {
  std::string str;
  for (const auto& [subcmdName, subcmd] : subcmds) {
    str += subcmd.format(maxOffset);
  }
  return str;
}

std::string
Cli::formatCmdHelp() const {
  const std::size_t maxShortSize = calcMaxShortSize();
  const std::size_t maxOffset = calcMaxOffset(maxShortSize);

  std::string str = std::string(desc);
  str += "\n\n";
  str += Bold(Green("Usage: ")).toStr();
  str += Bold(Cyan(name)).toStr();
  str += ' ';
  str += Cyan("[OPTIONS] [COMMAND]").toStr();
  str += "\n\n";
  str += formatHeader("Options:");
  str += formatOpts(globalOpts, maxShortSize, maxOffset);
  str += formatOpts(localOpts, maxShortSize, maxOffset);
  str += '\n';
  str += formatHeader("Commands:");
  str += formatAllSubcmds(maxOffset);
  str += '\n';
  str += fmt::format(
      "See '{} {} {}' for more information on a specific command.\n",
      Bold(Cyan(name)).toStr(), Bold(Cyan("help")).toStr(),
      Cyan("<command>").toStr()
  );
  return str;
}

[[nodiscard]] Result<void>
Cli::printHelp(const CliArgsView args) const {
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = Try(handleGlobalOpts(itr, args.end(), "help"));
    if (control == Return) {
      return Ok();
    } else if (control == Continue) {
      continue;
    } else if (hasSubcmd(arg)) {
      printSubcmdHelp(arg);
      return Ok();
    } else {
      return noSuchArg(arg);
    }
  }

  fmt::print("{}", formatCmdHelp());
  return Ok();
}

}  // namespace distbuild

#ifdef DISTBUILD_TEST

#  include "Rustify/Tests.hpp"

#  include <fmt/ranges.h>

namespace distbuild {

const Cli&
getCli() noexcept {
  static const Cli cli =  //
      Cli{ "test" }
          .addOpt(Opt{ "--verbose" }.setShort("-v").setGlobal(true))
          .addOpt(
              Opt{ "--color" }.setPlaceholder("<WHEN>").setGlobal(true)
          )
          .addOpt(Opt{ "--manifest-path" }
                      .setPlaceholder("<PATH>")
                      .setGlobal(true))
          .addSubcmd(Subcmd{ "plan" })
          .addSubcmd(Subcmd{ "build" }.addOpt(
              Opt{ "--target" }.setPlaceholder("<TRIPLE>")
          ));
  return cli;
}

}  // namespace distbuild

namespace tests {

using namespace distbuild;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testCliExpandOpts() {
  {
    const std::vector<const char*> args{ "-v", "build", "--target=this" };
    const std::vector<std::string> expected{ "-v", "build", "--target",
                                             "this" };
    assertEq(getCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "--color=never", "plan" };
    const std::vector<std::string> expected{ "--color", "never", "plan" };
    assertEq(getCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "--manifest-path", "x", "build" };
    const std::vector<std::string> expected{ "--manifest-path", "x",
                                             "build" };
    assertEq(getCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "--color", "never", "plan" };
    const std::vector<std::string> expected{ "--color", "never", "plan" };
    assertEq(getCli().expandOpts(args).unwrap(), expected);
  }
  {
    // The value of a global option is not mistaken for a subcommand.
    const std::vector<const char*> args{ "--color", "never", "deploy" };
    assertContains(
        getCli().expandOpts(args).unwrap_err()->what(),
        "unexpected argument 'deploy' found"
    );
  }
  {
    const std::vector<const char*> args{ "build", "--target", "this" };
    const std::vector<std::string> expected{ "build", "--target", "this" };
    assertEq(getCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "build", "--target=" };
    assertEq(
        std::string(getCli().expandOpts(args).unwrap_err()->what()),
        "missing argument for `--target`"
    );
  }
  {
    const std::vector<const char*> args{ "build", "--target" };
    assertEq(
        std::string(getCli().expandOpts(args).unwrap_err()->what()),
        "missing argument for `--target`"
    );
  }
  {
    // --target belongs to build only; plan sees it as is and rejects it
    // itself.
    const std::vector<const char*> args{ "plan", "--target=x" };
    const std::vector<std::string> expected{ "plan", "--target=x" };
    assertEq(getCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "biuld" };
    assertEq(
        std::string(getCli().expandOpts(args).unwrap_err()->what()),
        "unexpected argument 'biuld' found\n\n"
        "For a list of commands, try 'test help'"
    );
  }

  pass();
}

static void
testHandleGlobalOpts() {
  const DiagLevel prev = getDiagLevel();

  const std::vector<std::string> args{ "-q", "--color", "never", "--bogus" };
  auto itr = CliArgsView(args).begin();
  const auto end = CliArgsView(args).end();

  assertTrue(Cli::handleGlobalOpts(itr, end).unwrap() == Cli::Continue);
  assertTrue(isQuiet());
  ++itr;
  assertTrue(Cli::handleGlobalOpts(itr, end).unwrap() == Cli::Continue);
  assertEq(*itr, "never");
  ++itr;
  assertTrue(Cli::handleGlobalOpts(itr, end).unwrap() == Cli::Fallthrough);

  const std::vector<std::string> dangling{ "--color" };
  auto danglingItr = CliArgsView(dangling).begin();
  assertTrue(
      Cli::handleGlobalOpts(danglingItr, CliArgsView(dangling).end()).is_err()
  );

  setDiagLevel(prev);
  pass();
}

}  // namespace tests

int
main() {
  distbuild::setColorMode("never");

  tests::testCliExpandOpts();
  tests::testHandleGlobalOpts();
}

#endif
