#include <gtest/gtest.h>

#include "permsnap/logger.hpp"

#include <sstream>
#include <string>

using namespace permsnap;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = Logger::instance().level();
        Logger::instance().set_output(&stream_);
    }

    void TearDown() override {
        Logger::instance().set_output(nullptr);
        Logger::instance().set_level(previous_);
    }

    std::ostringstream stream_;
    Logger::Level previous_{Logger::Level::Warning};
};

TEST_F(LoggerTest, FormatsPlaceholders) {
    Logger::instance().set_level(Logger::Level::Info);
    Logger::instance().info("wrote {} entries to {}", 42, "linux_files.json");

    const auto text = stream_.str();
    EXPECT_NE(text.find("info | wrote 42 entries to linux_files.json"), std::string::npos);
    EXPECT_EQ(text.back(), '\n');
}

TEST_F(LoggerTest, MessagesAboveLevelAreDropped) {
    Logger::instance().set_level(Logger::Level::Warning);
    Logger::instance().debug("visiting {}", "/var/ossec");
    Logger::instance().info("plain message");
    EXPECT_TRUE(stream_.str().empty());

    Logger::instance().warn("cannot list {}", "/var/ossec/queue");
    EXPECT_NE(stream_.str().find("warn | cannot list /var/ossec/queue"), std::string::npos);
}

TEST_F(LoggerTest, MessageWithoutArgumentsIsWrittenVerbatim) {
    Logger::instance().set_level(Logger::Level::Error);
    Logger::instance().error("braces {} stay as written");
    EXPECT_NE(stream_.str().find("braces {} stay as written"), std::string::npos);
}
