#pragma once

#include <argparse/argparse.hpp>
#include <functional>
#include <utility>

namespace multicol::cli {

using Configure = std::function<void(argparse::Argument &)>;

namespace detail {
void registerCallback(std::function<void(argparse::ArgumentParser &)> &&fn);
}

/// @brief value of a command line option. Declared as a static object, bound when `cli::init` parses.
template <typename T> class Opt {
public:
  Opt(const char *name, Configure &&configure) { bind(std::move(configure), name); }
  Opt(const char *shortName, const char *longName, Configure &&configure) {
    bind(std::move(configure), shortName, longName);
  }

  T const &get() const { return v_; }

private:
  T v_{};

  template <typename... Names> void bind(Configure &&configure, Names... names) {
    detail::registerCallback(
        [configure = std::move(configure), names..., this](argparse::ArgumentParser &argparser) -> void {
          configure(argparser.add_argument(names...).store_into(v_));
        });
  }
};

/// @brief boolean switch, false unless given.
struct Flag : public Opt<bool> {
  Flag(const char *name, const char *help)
      : Opt<bool>(name, [help](argparse::Argument &arg) -> void { arg.help(help).flag(); }) {}
};

/// @return true when parsing failed, the reason and the usage are already printed to stderr.
[[nodiscard]] bool init(argparse::ArgumentParser &program, int argc, char const *argv[]);

} // namespace multicol::cli
