// tests/unit/test_logger.cpp
#include <gtest/gtest.h>
#include "core/logger.hpp"
#include "fakes/temp_directory.hpp"

#include <fstream>
#include <sstream>

using namespace apguard;
using namespace apguard::core;

// ==================== Test Fixture ====================
class LoggerTest : public ::testing::Test
{
protected:
    fakes::TempDirectory dir;
    std::string log_path;

    void SetUp() override
    {
        log_path = dir.file("apguard.log");
    }

    std::string read_log()
    {
        std::ifstream in(log_path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

// ==================== LogContext Tests ====================
TEST_F(LoggerTest, ContextFormatsSortedKeyValuePairs)
{
    LogContext context;
    context.add("interface", "wlan0").add("actions", 2).add("alive", true);

    EXPECT_EQ(context.format(), "actions=2 alive=true interface=wlan0");
}

TEST_F(LoggerTest, ContextQuotesValuesWithSpaces)
{
    LogContext context;
    context.add("message", "rfkill blocked");

    EXPECT_EQ(context.format(), "message=\"rfkill blocked\"");
}

TEST_F(LoggerTest, SecretsAreNeverFormatted)
{
    LogContext context;
    context.add_secret("password", "hunter22secret").add_secret("unset", "");

    const std::string formatted = context.format();
    EXPECT_EQ(formatted.find("hunter22secret"), std::string::npos);
    EXPECT_NE(formatted.find("password=<set:14>"), std::string::npos);
    EXPECT_NE(formatted.find("unset=<unset>"), std::string::npos);
}

TEST_F(LoggerTest, EmptyContext)
{
    LogContext context;
    EXPECT_TRUE(context.empty());
    EXPECT_EQ(context.format(), "");
}

// ==================== Level Tests ====================
TEST_F(LoggerTest, StringToLevel)
{
    EXPECT_EQ(LoggerManager::string_to_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(LoggerManager::string_to_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(LoggerManager::string_to_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(LoggerManager::string_to_level("Error"), LogLevel::ERROR);
    EXPECT_EQ(LoggerManager::string_to_level("crit"), LogLevel::CRITICAL);
    EXPECT_EQ(LoggerManager::string_to_level("bogus"), LogLevel::WARNING);
}

TEST_F(LoggerTest, LevelToString)
{
    EXPECT_EQ(LoggerManager::level_to_string(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(LoggerManager::level_to_string(LogLevel::WARNING), "WARN");
    EXPECT_EQ(LoggerManager::level_to_string(LogLevel::CRITICAL), "CRIT");
}

// ==================== Output Tests ====================
TEST_F(LoggerTest, FileOutputRespectsLevel)
{
    Logger logger("Test", LogLevel::INFO);
    logger.set_console_output(false);
    logger.set_output_file(log_path);

    logger.debug("hidden detail");
    logger.info("Hotspot active", LogContext().add("interface", "wlan0"));
    logger.error("Command failed");

    const std::string contents = read_log();
    EXPECT_EQ(contents.find("hidden detail"), std::string::npos);
    EXPECT_NE(contents.find("[INFO] Test: Hotspot active interface=wlan0"), std::string::npos);
    EXPECT_NE(contents.find("[ERROR] Test: Command failed"), std::string::npos);
}

TEST_F(LoggerTest, IsEnabled)
{
    Logger logger("Test", LogLevel::WARNING);
    EXPECT_FALSE(logger.is_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_enabled(LogLevel::WARNING));
    EXPECT_TRUE(logger.is_enabled(LogLevel::CRITICAL));

    logger.set_level(LogLevel::DEBUG);
    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG));
}

TEST_F(LoggerTest, ManagerReturnsSameInstancePerName)
{
    auto first = get_logger("SameName");
    auto second = get_logger("SameName");
    auto other = get_logger("OtherName");

    EXPECT_EQ(first.get(), second.get());
    EXPECT_NE(first.get(), other.get());
    EXPECT_EQ(first->name(), "SameName");
}

TEST_F(LoggerTest, SetupRetargetsExistingLoggers)
{
    auto early = get_logger("CreatedBeforeSetup");

    setup_logging(LogLevel::INFO, log_path, false);
    early->info("Written after setup", LogContext().add("note", "two words"));
    get_logger("CreatedAfterSetup")->debug("below level");
    setup_logging();

    const std::string contents = read_log();
    EXPECT_NE(contents.find("[INFO] CreatedBeforeSetup: Written after setup note=\"two words\""), std::string::npos);
    EXPECT_EQ(contents.find("below level"), std::string::npos);
}

TEST_F(LoggerTest, ContextQuotesEmptyValues)
{
    EXPECT_EQ(LogContext().add("upstream", "").format(), "upstream=\"\"");
}
