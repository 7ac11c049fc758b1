#include "courier/Log.h"

#include "gtest/gtest.h"

#include <string>
#include <vector>


TEST(Log, LevelString)
{
    EXPECT_STREQ("EMERG",   courier::Log::levelString(courier::Log::Level::Emerg));
    EXPECT_STREQ("ERR",     courier::Log::levelString(courier::Log::Level::Err));
    EXPECT_STREQ("DEBUG",   courier::Log::levelString(courier::Log::Level::Debug));

    EXPECT_STREQ("INVALID", courier::Log::levelString(-1));
    EXPECT_STREQ("INVALID", courier::Log::levelString(8));
}

TEST(Log, LogBuffer)
{
    courier::LogBuffer<16> buffer;
    EXPECT_STREQ("", buffer.c_str());
    EXPECT_EQ(16, buffer.capacity());

    buffer.print("%s[%d]", "abc", 1).print("|").print("xyz");
    EXPECT_STREQ("abc[1]|xyz", buffer.c_str());
    EXPECT_EQ(6, buffer.capacity());

    // Truncated (with the terminating '\0' kept)
    buffer.print("0123456789");
    EXPECT_STREQ("abc[1]|xyz01234", buffer.c_str());
    EXPECT_EQ(1, buffer.capacity());

    buffer.print("more");
    EXPECT_STREQ("abc[1]|xyz01234", buffer.c_str());

    buffer.clear();
    EXPECT_STREQ("", buffer.c_str());
    EXPECT_EQ(16, buffer.capacity());
}

TEST(Log, GlobalLogger)
{
    struct Record { int level; std::string msg; };
    std::vector<Record> records;

    courier::setGlobalLogger([&records](int level, const char* /*filename*/, int /*lineno*/, const char* msg) {
        records.push_back(Record{level, msg});
    });

    COURIER_API_LOG(courier::Log::Level::Warning, "record[%d] of topic[%s]", 3, "orders");
    COURIER_API_LOG(courier::Log::Level::Info, "no argument");

    ASSERT_EQ(2, records.size());
    EXPECT_EQ(courier::Log::Level::Warning, records[0].level);
    EXPECT_EQ("record[3] of topic[orders]", records[0].msg);
    EXPECT_EQ("no argument", records[1].msg);

    // Silenced
    courier::setGlobalLogger(courier::NullLogger);
    COURIER_API_LOG(courier::Log::Level::Err, "dropped");
    EXPECT_EQ(2, records.size());

    courier::setGlobalLogger(courier::DefaultLogger);
}
