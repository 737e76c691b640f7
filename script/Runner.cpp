#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Tokenizer.hpp"
#include "collections/MultiDict.hpp"
#include "collections/Repr.hpp"
#include "script/Runner.hpp"
#include "support/Debug.hpp"

namespace multicol::script {

namespace {

constexpr char const *debugName = "Script";

using Dict = MultiDict<std::string, std::string>;
using Args = std::vector<std::string>;

std::string quote(std::string const &text) {
  std::string out{};
  appendQuoted(out, text);
  return out;
}

std::string formatList(std::vector<std::string> const &values) {
  std::vector<std::string> quoted{};
  quoted.reserve(values.size());
  for (std::string const &value : values)
    quoted.push_back(quote(value));
  return fmt::format("[{}]", fmt::join(quoted, ", "));
}

std::string formatItem(std::pair<std::string, std::string> const &item) {
  return fmt::format("({}, {})", quote(item.first), quote(item.second));
}

std::string formatItems(std::vector<std::pair<std::string, std::string>> const &items) {
  std::vector<std::string> formatted{};
  formatted.reserve(items.size());
  for (auto const &item : items)
    formatted.push_back(formatItem(item));
  return fmt::format("[{}]", fmt::join(formatted, ", "));
}

class Interpreter {
public:
  Interpreter() = default;

  /// @return result line of @param command without the line break.
  std::string execute(Command const &command);
  Dict const &dict() const { return dict_; }

private:
  using Handler = std::string (Interpreter::*)(Args const &);
  struct CommandInfo {
    std::string_view name;
    std::size_t minArgs;
    std::size_t maxArgs;
    /// whole rest of the line is the only argument
    bool raw;
    Handler handler;
  };
  static CommandInfo const *lookup(std::string_view name);

  Dict dict_;

  static std::vector<std::pair<std::string, std::string>> toPairs(Args const &args);

  std::string add(Args const &args) {
    dict_.add(args[0], args[1]);
    return "ok";
  }
  std::string set(Args const &args) {
    dict_.set(args[0], args[1]);
    return "ok";
  }
  std::string get(Args const &args) {
    if (args.size() == 2U)
      return quote(dict_.getFirst(args[0], args[1]));
    return quote(dict_.getFirst(args[0]));
  }
  std::string getAll(Args const &args) { return formatList(dict_.getAll(args[0])); }
  std::string popFirst(Args const &args) {
    if (args.size() == 2U)
      return quote(dict_.popFirst(args[0], args[1]));
    return quote(dict_.popFirst(args[0]));
  }
  std::string popAll(Args const &args) { return formatList(dict_.popAll(args[0])); }
  std::string erase(Args const &args) {
    dict_.erase(args[0]);
    return "ok";
  }
  std::string popItem(Args const &) { return formatItem(dict_.popItem()); }
  std::string setDefault(Args const &args) { return quote(dict_.setDefault(args[0], args[1])); }
  std::string contains(Args const &args) { return dict_.contains(args[0]) ? "True" : "False"; }
  std::string count(Args const &args) { return fmt::format("{}", dict_.count(args[0])); }
  std::string len(Args const &) { return fmt::format("{}", dict_.size()); }
  std::string clear(Args const &) {
    dict_.clear();
    return "ok";
  }
  std::string keys(Args const &) { return formatList(dict_.keys().toVector()); }
  std::string values(Args const &) { return formatList(dict_.values().toVector()); }
  std::string items(Args const &) { return formatItems(dict_.items().toVector()); }
  std::string print(Args const &) { return repr(dict_); }
  std::string load(Args const &args) {
    Dict loaded = Dict::fromRepr(args[0]);
    dict_.swap(loaded);
    return "ok";
  }
  std::string extend(Args const &args) {
    dict_.extend(toPairs(args));
    return "ok";
  }
  std::string merge(Args const &args) {
    dict_.merge(toPairs(args));
    return "ok";
  }
  std::string update(Args const &args) {
    dict_.update(toPairs(args));
    return "ok";
  }
};

Interpreter::CommandInfo const *Interpreter::lookup(std::string_view name) {
  constexpr std::size_t many = std::numeric_limits<std::size_t>::max();
  static CommandInfo const commands[] = {
      {"add", 2U, 2U, false, &Interpreter::add},
      {"set", 2U, 2U, false, &Interpreter::set},
      {"get", 1U, 2U, false, &Interpreter::get},
      {"getall", 1U, 1U, false, &Interpreter::getAll},
      {"popfirst", 1U, 2U, false, &Interpreter::popFirst},
      {"popall", 1U, 1U, false, &Interpreter::popAll},
      {"erase", 1U, 1U, false, &Interpreter::erase},
      {"popitem", 0U, 0U, false, &Interpreter::popItem},
      {"setdefault", 2U, 2U, false, &Interpreter::setDefault},
      {"contains", 1U, 1U, false, &Interpreter::contains},
      {"count", 1U, 1U, false, &Interpreter::count},
      {"len", 0U, 0U, false, &Interpreter::len},
      {"clear", 0U, 0U, false, &Interpreter::clear},
      {"keys", 0U, 0U, false, &Interpreter::keys},
      {"values", 0U, 0U, false, &Interpreter::values},
      {"items", 0U, 0U, false, &Interpreter::items},
      {"print", 0U, 0U, false, &Interpreter::print},
      {"load", 1U, 1U, true, &Interpreter::load},
      {"extend", 2U, many, false, &Interpreter::extend},
      {"merge", 2U, many, false, &Interpreter::merge},
      {"update", 2U, many, false, &Interpreter::update},
  };
  for (CommandInfo const &info : commands) {
    if (info.name == name)
      return &info;
  }
  return nullptr;
}

std::vector<std::pair<std::string, std::string>> Interpreter::toPairs(Args const &args) {
  if (args.size() % 2U != 0U)
    throw ScriptError(fmt::format("expected key value pairs, got {} arguments", args.size()));
  std::vector<std::pair<std::string, std::string>> pairs{};
  pairs.reserve(args.size() / 2U);
  for (std::size_t i = 0; i < args.size(); i += 2U)
    pairs.emplace_back(args[i], args[i + 1U]);
  return pairs;
}

std::string Interpreter::execute(Command const &command) {
  CommandInfo const *info = lookup(command.name);
  if (info == nullptr)
    throw ScriptError(fmt::format("unknown command '{}'", command.name));
  Args args{};
  if (info->raw) {
    if (!command.rest.empty())
      args.push_back(command.rest);
  } else {
    args = tokenize(command.rest);
  }
  if (args.size() < info->minArgs || args.size() > info->maxArgs) {
    if (info->minArgs == info->maxArgs)
      throw ScriptError(fmt::format("{} expects {} arguments, got {}", info->name, info->minArgs, args.size()));
    if (info->maxArgs == std::numeric_limits<std::size_t>::max())
      throw ScriptError(fmt::format("{} expects at least {} arguments, got {}", info->name, info->minArgs, args.size()));
    throw ScriptError(fmt::format("{} expects {} to {} arguments, got {}", info->name, info->minArgs, info->maxArgs,
                                  args.size()));
  }
  return (this->*(info->handler))(args);
}

} // namespace

Output runScript(std::string const &input, Config const &config) {
  Interpreter interpreter{};
  Output output{.text = {}, .failedCommands = 0U};
  auto const fail = [&output](std::exception const &e) -> std::string {
    ++output.failedCommands;
    return fmt::format("error: {}", e.what());
  };

  std::istringstream stream{input};
  std::string line{};
  std::size_t lineNumber = 0U;
  while (std::getline(stream, line)) {
    ++lineNumber;
    std::optional<Command> const command = parseLine(line);
    if (!command.has_value())
      continue;
    if (support::isDebug(debugName))
      fmt::print("[{}] line {}: {} {}\n", debugName, lineNumber, command->name, command->rest);
    std::string result{};
    try {
      result = interpreter.execute(*command);
    } catch (ScriptError const &e) {
      result = fail(e);
    } catch (std::out_of_range const &e) {
      result = fail(e);
    } catch (std::invalid_argument const &e) {
      result = fail(e);
    }
    output.text += result;
    output.text += '\n';
    if (config.verifyEachStep)
      interpreter.dict().verify();
  }
  return output;
}

} // namespace multicol::script

#ifdef MULTICOL_ENABLE_UNIT_TESTS
#include <gtest/gtest.h>

#include "collections/Errors.hpp"

namespace multicol::script::ut {

TEST(ScriptRunnerTest, ConcreteScenario) {
  std::string const script = R"(
# multiple values per key
add a 1
add b 2
add a 3
getall a
get a
set a 99
items
popfirst b
len
popall a
len
)";
  Output const output = runScript(script, Config{.verifyEachStep = true});
  EXPECT_EQ(output.text, "ok\n"
                         "ok\n"
                         "ok\n"
                         "['1', '3']\n"
                         "'1'\n"
                         "ok\n"
                         "[('a', '99'), ('b', '2')]\n"
                         "'2'\n"
                         "1\n"
                         "['99']\n"
                         "0\n");
  EXPECT_EQ(output.failedCommands, 0U);
}

TEST(ScriptRunnerTest, FallbacksAndQueries) {
  std::string const script = "add k v\n"
                             "get missing fallback\n"
                             "popfirst missing 'fall back'\n"
                             "getall missing\n"
                             "contains k\n"
                             "contains missing\n"
                             "count k\n"
                             "setdefault k other\n"
                             "setdefault n 'new value'\n"
                             "keys\n"
                             "values\n";
  Output const output = runScript(script, Config{});
  EXPECT_EQ(output.text, "ok\n"
                         "'fallback'\n"
                         "'fall back'\n"
                         "[]\n"
                         "True\n"
                         "False\n"
                         "1\n"
                         "'v'\n"
                         "'new value'\n"
                         "['k', 'n']\n"
                         "['v', 'new value']\n");
}

TEST(ScriptRunnerTest, BulkOperations) {
  std::string const script = "extend a 1 b 2 a 3\n"
                             "merge a 4 c 5 c 6\n"
                             "update a 9 a 10 d 7\n"
                             "print\n";
  Output const output = runScript(script, Config{.verifyEachStep = true});
  EXPECT_EQ(output.text, "ok\nok\nok\n"
                         "MultiDict([('a', '9'), ('b', '2'), ('c', '5'), ('c', '6'), ('a', '10'), ('d', '7')])\n");
}

TEST(ScriptRunnerTest, LoadAndPopItem) {
  std::string const script = "load MultiDict([('x', '1'), ('y', 'two words')])  # seeded\n"
                             "popitem\n"
                             "print\n"
                             "clear\n"
                             "clear\n"
                             "len\n";
  Output const output = runScript(script, Config{});
  EXPECT_EQ(output.text, "ok\n"
                         "('y', 'two words')\n"
                         "MultiDict([('x', '1')])\n"
                         "ok\nok\n"
                         "0\n");
  EXPECT_EQ(output.failedCommands, 0U);
}

TEST(ScriptRunnerTest, FailuresAreReportedAndExecutionContinues) {
  std::string const script = "get a\n"
                             "popitem\n"
                             "erase a\n"
                             "frobnicate\n"
                             "add a\n"
                             "extend a 1 b\n"
                             "load [('a', 1)]\n"
                             "add 'open\n"
                             "add a 1\n"
                             "len\n";
  Output const output = runScript(script, Config{.verifyEachStep = true});
  EXPECT_EQ(output.text, "error: getFirst: key not found\n"
                         "error: popItem: container is empty\n"
                         "error: erase: key not found\n"
                         "error: unknown command 'frobnicate'\n"
                         "error: add expects 2 arguments, got 1\n"
                         "error: expected key value pairs, got 3 arguments\n"
                         "error: invalid repr at offset 7: expected quoted string\n"
                         "error: column 6: malformed quoted token\n"
                         "ok\n"
                         "1\n");
  EXPECT_EQ(output.failedCommands, 8U);
}

TEST(ScriptRunnerTest, FailedLoadKeepsContent) {
  Output const output = runScript("add a 1\nload [('b', '2')\nprint\n", Config{});
  EXPECT_EQ(output.text, "ok\n"
                         "error: invalid repr at offset 11: expected ']'\n"
                         "MultiDict([('a', '1')])\n");
}

} // namespace multicol::script::ut

#endif // MULTICOL_ENABLE_UNIT_TESTS
