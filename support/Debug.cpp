#include <cstdlib>
#include <set>
#include <string>

#include "support/Debug.hpp"
#include "support/StringOperator.hpp"

namespace multicol {

namespace {

struct DebugHelper {
  static DebugHelper &ins() {
    static DebugHelper ins{};
    return ins;
  }

  bool isEnabledAll() const { return enabledAll; }
  bool isEnabledComponent(const char *component) const {
    return component != nullptr && enabledComponentName.contains(component);
  }

private:
  bool enabledAll;
  std::set<std::string> enabledComponentName;

  explicit DebugHelper() : enabledAll{false}, enabledComponentName{} {
    const char *multicolDebug = std::getenv("MULTICOL_DEBUG");
    enabledAll = multicolDebug != nullptr && std::string(multicolDebug) == "1";
    const char *multicolDebugComponents = std::getenv("MULTICOL_DEBUG_COMPONENTS");
    if (multicolDebugComponents != nullptr)
      enabledComponentName = splitString(multicolDebugComponents, ';');
  }
};

} // namespace

bool support::isDebug() { return DebugHelper::ins().isEnabledAll(); }

bool support::isDebug(const char *component) {
  if (DebugHelper::ins().isEnabledAll()) {
    return true;
  }
  return DebugHelper::ins().isEnabledComponent(component);
}

} // namespace multicol

#ifdef MULTICOL_ENABLE_UNIT_TESTS
#include <gtest/gtest.h>
namespace multicol::ut {

TEST(DebugTest, EnableAllCoversEveryComponent) {
  if (support::isDebug()) {
    EXPECT_TRUE(support::isDebug("MultiDict"));
    EXPECT_TRUE(support::isDebug("Script"));
  }
  EXPECT_EQ(support::isDebug(nullptr), support::isDebug());
}

} // namespace multicol::ut

#endif // MULTICOL_ENABLE_UNIT_TESTS
