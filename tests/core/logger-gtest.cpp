#include "l2db/core/logger.h"
#include <gtest/gtest.h>
#include <sstream>

using namespace l2db;

namespace {

class PartitionedThing
{
public:
    static LogPartition&
    get_log_partition()
    {
        static LogPartition partition("thing", LogLevel::INHERIT);
        return partition;
    }

    void
    warn()
    {
        OLOGW("something odd");
    }

    void
    debug()
    {
        OLOGD("detail");
    }
};

class LoggerTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        Logger::set_level(LogLevel::NONE);
        Logger::set_output_stream(&out_);
        Logger::set_error_stream(&err_);
    }

    void
    TearDown() override
    {
        Logger::reset_streams();
        Logger::set_level(LogLevel::ERROR);
        PartitionedThing::get_log_partition().set_level(LogLevel::INHERIT);
    }

    std::ostringstream out_;
    std::ostringstream err_;
};

}  // namespace

TEST_F(LoggerTest, ParsesLevelNames)
{
    EXPECT_TRUE(Logger::set_level(std::string("WARN")));
    EXPECT_EQ(Logger::get_level(), LogLevel::WARNING);
    EXPECT_TRUE(Logger::set_level(std::string("debug")));
    EXPECT_EQ(Logger::get_level(), LogLevel::DEBUG);
    EXPECT_FALSE(Logger::set_level(std::string("verbose")));
    EXPECT_EQ(Logger::get_level(), LogLevel::DEBUG);
}

TEST_F(LoggerTest, WarningsGoToErrorStream)
{
    Logger::set_level(LogLevel::WARNING);
    err_.str("");
    LOGW("careful ", 42);
    LOGI("not shown");

    EXPECT_NE(err_.str().find("[WARN]"), std::string::npos);
    EXPECT_NE(err_.str().find("careful 42"), std::string::npos);
    EXPECT_EQ(out_.str().find("not shown"), std::string::npos);
}

TEST_F(LoggerTest, InfoGoesToOutputStream)
{
    Logger::set_level(LogLevel::INFO);
    LOGI("hello");
    EXPECT_NE(out_.str().find("[INFO]"), std::string::npos);
    EXPECT_NE(out_.str().find("hello"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesEverything)
{
    LOGE("boom");
    EXPECT_TRUE(err_.str().empty());
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(LoggerTest, PartitionPrefixesItsName)
{
    Logger::set_level(LogLevel::WARNING);
    err_.str("");
    PartitionedThing thing;
    thing.warn();
    EXPECT_NE(err_.str().find("[thing] something odd"), std::string::npos);
}

TEST_F(LoggerTest, PartitionLevelOverridesGlobal)
{
    Logger::set_level(LogLevel::ERROR);
    PartitionedThing::get_log_partition().set_level(LogLevel::DEBUG);
    PartitionedThing thing;
    thing.debug();
    EXPECT_NE(out_.str().find("detail"), std::string::npos);

    out_.str("");
    PartitionedThing::get_log_partition().set_level(LogLevel::NONE);
    thing.warn();
    thing.debug();
    EXPECT_TRUE(out_.str().empty());
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(LoggerTest, PartitionLogsWhileGlobalLoggingIsOff)
{
    Logger::set_level(LogLevel::NONE);
    PartitionedThing::get_log_partition().set_level(LogLevel::WARNING);
    PartitionedThing thing;
    thing.warn();
    thing.debug();
    EXPECT_NE(err_.str().find("[thing] something odd"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}
