#include <argparse/argparse.hpp>
#include <cstdio>
#include <exception>
#include <fmt/format.h>
#include <fstream>
#include <ios>
#include <iterator>
#include <string>

#include "script/Runner.hpp"
#include "support/Debug.hpp"
#include "support/Opt.hpp"

static multicol::cli::Opt<std::string> inputPath{
    "-i",
    "--input",
    [](argparse::Argument &arg) -> void { arg.help("script file").required(); },
};

static multicol::cli::Opt<std::string> outputPath{
    "-o",
    "--output",
    [](argparse::Argument &arg) -> void { arg.help("result file, stdout when omitted"); },
};

static multicol::cli::Flag verifyEachStep{"--verify-each-step", "check the container invariants after every command"};
static multicol::cli::Flag strict{"--strict", "exit with status 1 when any command failed"};

int main(int argc, char const *argv[]) {
  using namespace multicol;

  argparse::ArgumentParser program("multicol");
  if (cli::init(program, argc, argv))
    return 1;

  if (support::isDebug())
    fmt::print("[multicol] input: {}, output: {}, verify-each-step: {}, strict: {}\n", inputPath.get(),
               outputPath.get().empty() ? "<stdout>" : outputPath.get(), verifyEachStep.get(), strict.get());

  std::ifstream ifstream{inputPath.get(), std::ios::in};
  if (!ifstream.good()) {
    fmt::print(stderr, "ERROR: failed to open file: {}\n", inputPath.get());
    return 1;
  }
  std::string input{std::istreambuf_iterator<char>{ifstream}, {}};

  script::Output output{};
  try {
    output = script::runScript(input, script::Config{.verifyEachStep = verifyEachStep.get()});
  } catch (std::exception const &e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return 1;
  }

  if (outputPath.get().empty()) {
    fmt::print("{}", output.text);
  } else {
    std::ofstream of{outputPath.get(), std::ios::out};
    if (!of.good()) {
      fmt::print(stderr, "ERROR: failed to open file: {}\n", outputPath.get());
      return 1;
    }
    of.write(output.text.data(), static_cast<std::streamsize>(output.text.size()));
  }

  if (strict.get() && output.failedCommands != 0U) {
    fmt::print(stderr, "ERROR: {} commands failed\n", output.failedCommands);
    return 1;
  }
  return 0;
}
