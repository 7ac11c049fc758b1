#include "../utils/TestUtility.h"

#include "courier/RecordBuilder.h"
#include "courier/Serializer.h"
#include "courier/Topic.h"

#include "gtest/gtest.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace courier;
using namespace courier::clients::producer;
using CourierTestUtility::ToBytes;


namespace {

// Serializer which records the topic names it was called with
template <typename T>
struct CountingSerializer
{
    Serializer<T> serializer;
    std::shared_ptr<std::vector<std::string>> calledWith = std::make_shared<std::vector<std::string>>();

    explicit CountingSerializer(Serializer<T> inner)
    {
        auto calls = calledWith;
        serializer = [inner = std::move(inner), calls](const TopicName& topic, const T& value) {
            calls->push_back(topic);
            return inner(topic, value);
        };
    }
};

Serializer<std::string> failingOn(const std::string& badValue)
{
    return [badValue](const TopicName& /*topic*/, const std::string& value) {
        if (value == badValue) throw std::invalid_argument("could not serialize [" + value + "]");
        return Bytes(value.cbegin(), value.cend());
    };
}

} // end of namespace


TEST(RecordBuilder, NoTargetWithValueOnly)
{
    const Topic<std::string, std::string> topic("orders");

    const WireRecord record = recordFrom(topic, "hello", target::none(), stringSerializer());

    EXPECT_EQ("orders", record.topic());
    EXPECT_EQ((Bytes{0x68, 0x65, 0x6C, 0x6C, 0x6F}), record.value());
    EXPECT_FALSE(record.key());
    EXPECT_FALSE(record.partition());
    EXPECT_TRUE(record.headers().empty());
}

TEST(RecordBuilder, PartitionTargetWithNoKey)
{
    const Topic<std::string, std::string> topic("orders");

    const WireRecord record = recordFrom(topic, "hello", target::partition(3), stringSerializer());

    EXPECT_EQ("orders", record.topic());
    EXPECT_EQ(ToBytes("hello"), record.value());
    EXPECT_FALSE(record.key());
    ASSERT_TRUE(record.partition());
    EXPECT_EQ(3, *record.partition());
}

TEST(RecordBuilder, KeyTargetSerializesBothWithTopicName)
{
    const Topic<std::string, std::int64_t> topic("payments");

    CountingSerializer<std::string>  keySerializer(stringSerializer());
    CountingSerializer<std::int64_t> valueSerializer(int64Serializer());

    const WireRecord record = recordFrom(topic, 258, target::key(std::string("k1"), keySerializer.serializer), valueSerializer.serializer);

    EXPECT_EQ((std::vector<std::string>{"payments"}), *keySerializer.calledWith);
    EXPECT_EQ((std::vector<std::string>{"payments"}), *valueSerializer.calledWith);

    ASSERT_TRUE(record.key());
    EXPECT_EQ(ToBytes("k1"), *record.key());
    EXPECT_EQ((Bytes{0, 0, 0, 0, 0, 0, 0x01, 0x02}), record.value());
    EXPECT_FALSE(record.partition());
}

TEST(RecordBuilder, ValueSerializerFailure)
{
    const Topic<std::string, std::string> topic("orders");

    const ProduceTarget<std::string> targets[] = { target::none(), target::partition(1), target::key(std::string("k1"), stringSerializer()) };

    for (const auto& target: targets)
    {
        try
        {
            recordFrom(topic, "bad", target, failingOn("bad"));
            EXPECT_FALSE(true);
        }
        catch (const SerializationException& e)
        {
            std::cout << e.what() << std::endl;
            ASSERT_TRUE(e.cause());
            EXPECT_THROW(std::rethrow_exception(e.cause()), std::invalid_argument);
            EXPECT_EQ("could not serialize [bad]", SerializationException::describe(e.cause()));
        }
    }
}

TEST(RecordBuilder, KeySerializerFailureShortCircuitsValue)
{
    const Topic<std::string, std::string> topic("orders");

    CountingSerializer<std::string> valueSerializer(stringSerializer());

    EXPECT_THROW(recordFrom(topic, "hello", target::key(std::string("bad"), failingOn("bad")), valueSerializer.serializer),
                 SerializationException);

    EXPECT_TRUE(valueSerializer.calledWith->empty());
}

TEST(RecordBuilder, EmptySerializer)
{
    const Topic<std::string, std::string> topic("orders");

    try
    {
        recordFrom(topic, "hello", target::none(), Serializer<std::string>{});
        EXPECT_FALSE(true);
    }
    catch (const SerializationException& e)
    {
        EXPECT_THROW(std::rethrow_exception(e.cause()), std::bad_function_call);
    }
}

TEST(RecordBuilder, HeadersKeepTheOrder)
{
    const Topic<std::string, std::string> topic("orders");

    const Headers headers = { Header{"z-first", ToBytes("1")}, Header{"a-second", ToBytes("2")}, Header{"z-first", ToBytes("3")} };

    const WireRecord record = recordFrom(topic, "hello", target::none(), stringSerializer(), headers);

    EXPECT_EQ(headers, record.headers());
    EXPECT_EQ("orders-NA: headers[z-first:1,a-second:2,z-first:3], [null]/hello", record.toString());
}

