#include <showlink/exit_codes.h>
#include <showlink/models.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include <gtest/gtest.h>

#include <yaml-cpp/yaml.h>

namespace showlink {
namespace {

TEST(ExitCodesTest, InvalidArgumentsAreUsageErrors) {
  EXPECT_EQ(ExitCodeForException(std::invalid_argument("bad flag")),
            kExitUsageError);
}

TEST(ExitCodesTest, MalformedYamlIsUsageError) {
  try {
    YAML::Load("source: [unterminated");
    FAIL() << "Expected YAML::ParserException";
  } catch (const YAML::Exception &error) {
    EXPECT_EQ(ExitCodeForException(error), kExitUsageError);
  }
}

TEST(ExitCodesTest, ConfigurationErrorsHaveTheirOwnCode) {
  EXPECT_EQ(ExitCodeForException(ConfigurationError("no destination")),
            kExitConfigurationError);
}

TEST(ExitCodesTest, EverythingElseIsRuntimeError) {
  EXPECT_EQ(ExitCodeForException(std::runtime_error("boom")),
            kExitRuntimeError);
  EXPECT_EQ(ExitCodeForException(std::filesystem::filesystem_error(
                "io", std::make_error_code(std::errc::io_error))),
            kExitRuntimeError);
}

} // namespace
} // namespace showlink
