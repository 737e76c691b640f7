#include <argparse/argparse.hpp>
#include <cstdio>
#include <exception>
#include <fmt/format.h>
#include <functional>
#include <sstream>
#include <vector>

#include "support/Opt.hpp"

namespace multicol::cli {

namespace {
struct OptRegistry {
  static OptRegistry &ins() {
    static OptRegistry instance{};
    return instance;
  }
  std::vector<std::function<void(argparse::ArgumentParser &)>> callbacks_;
};
} // namespace

void detail::registerCallback(std::function<void(argparse::ArgumentParser &)> &&fn) {
  OptRegistry::ins().callbacks_.push_back(std::move(fn));
}

bool init(argparse::ArgumentParser &program, int argc, char const *argv[]) {
  for (auto const &fn : OptRegistry::ins().callbacks_) {
    fn(program);
  }
  try {
    program.parse_args(argc, argv);
  } catch (const std::exception &e) {
    std::stringstream usage{};
    usage << program;
    fmt::print(stderr, "ERROR: {}\n{}", e.what(), usage.str());
    return true;
  }
  return false;
}

} // namespace multicol::cli
