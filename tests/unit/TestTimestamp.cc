#include "courier/Timestamp.h"

#include "librdkafka/rdkafka.h"

#include "gtest/gtest.h"

#include <iostream>
#include <regex>


TEST(Timestamp, Basic)
{
    std::int64_t msSinceEpoch = 1577966461123;

    courier::Timestamp naTypeTime(msSinceEpoch);
    EXPECT_EQ(courier::Timestamp::Type::NotAvailable, naTypeTime.type);
    EXPECT_EQ(msSinceEpoch, naTypeTime.msSinceEpoch);
    // E.g, "2020-01-02 12:01:01.123"
    std::regex reMatch(R"(2020-01-.. ..:..:01\.123)");
    EXPECT_TRUE(std::regex_match(naTypeTime.toString(), reMatch));
    std::cout << naTypeTime.toString() << std::endl;

    courier::Timestamp createTime(msSinceEpoch, courier::Timestamp::Type::CreateTime);
    // E.g, "CreateTime[2020-01-02 12:01:01.123]"
    std::regex reMatchCreateTime(R"(CreateTime\[2020-01-.. ..:..:01\.123\])");
    EXPECT_TRUE(std::regex_match(createTime.toString(), reMatchCreateTime));
    std::cout << createTime.toString() << std::endl;

    courier::Timestamp logAppendTime(msSinceEpoch, courier::Timestamp::Type::LogAppendTime);
    // E.g, "LogAppendTime[2020-01-02 12:01:01.123]"
    std::regex reMatchLogAppendTime(R"(LogAppendTime\[2020-01-.. ..:..:01\.123\])");
    EXPECT_TRUE(std::regex_match(logAppendTime.toString(), reMatchLogAppendTime));
    std::cout << logAppendTime.toString() << std::endl;
}

TEST(Timestamp, FromLibRdkafka)
{
    std::int64_t msSinceEpoch = 1577966461123;

    courier::Timestamp naTypeTime(msSinceEpoch, RD_KAFKA_TIMESTAMP_NOT_AVAILABLE);
    EXPECT_EQ(courier::Timestamp::Type::NotAvailable, naTypeTime.type);
    // E.g, "2020-01-02 12:01:01.123"
    std::regex reMatch(R"(2020-01-.. ..:..:01\.123)");
    EXPECT_TRUE(std::regex_match(naTypeTime.toString(), reMatch));
    std::cout << naTypeTime.toString() << std::endl;

    courier::Timestamp createTime(msSinceEpoch, RD_KAFKA_TIMESTAMP_CREATE_TIME);
    EXPECT_EQ(courier::Timestamp::Type::CreateTime, createTime.type);
    // E.g, "CreateTime[2020-01-02 12:01:01.123]"
    std::regex reMatchCreateTime(R"(CreateTime\[2020-01-.. ..:..:01\.123\])");
    EXPECT_TRUE(std::regex_match(createTime.toString(), reMatchCreateTime));
    std::cout << createTime.toString() << std::endl;

    courier::Timestamp logAppendTime(msSinceEpoch, RD_KAFKA_TIMESTAMP_LOG_APPEND_TIME);
    EXPECT_EQ(courier::Timestamp::Type::LogAppendTime, logAppendTime.type);
    // E.g, "LogAppendTime[2020-01-02 12:01:01.123]"
    std::regex reMatchLogAppendTime(R"(LogAppendTime\[2020-01-.. ..:..:01\.123\])");
    EXPECT_TRUE(std::regex_match(logAppendTime.toString(), reMatchLogAppendTime));
    std::cout << logAppendTime.toString() << std::endl;
}


TEST(Timestamp, Comparison)
{
    const courier::Timestamp createTime(1577966461123, courier::Timestamp::Type::CreateTime);

    EXPECT_EQ(createTime, courier::Timestamp(1577966461123, RD_KAFKA_TIMESTAMP_CREATE_TIME));
    EXPECT_NE(createTime, courier::Timestamp(1577966461123, courier::Timestamp::Type::LogAppendTime));
    EXPECT_NE(createTime, courier::Timestamp(1577966461124, courier::Timestamp::Type::CreateTime));

    const std::chrono::time_point<std::chrono::system_clock> timePoint = createTime;
    EXPECT_EQ(1577966461123, std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count());
}
