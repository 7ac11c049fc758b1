#include "../utils/TestUtility.h"

#include "courier/Producer.h"
#include "courier/RdKafkaBrokerClient.h"
#include "courier/RdKafkaHelper.h"

#include "gtest/gtest.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace courier;
using namespace courier::clients::producer;


namespace {

// Nothing would be listening on it
const std::string UNREACHABLE_BROKER = "127.0.0.1:1";

} // end of namespace


TEST(RdKafkaHelper, NonNullData)
{
    const Bytes empty;
    EXPECT_NE(nullptr, nonNullData(empty));

    const Bytes hello = {'h', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(hello.data(), nonNullData(hello));
}

TEST(RdKafkaBrokerClient, NoBootstrapServers)
{
    EXPECT_COURIER_THROW(RdKafkaBrokerClient client(Properties{}), RD_KAFKA_RESP_ERR__INVALID_ARG);

    const Properties emptyServers
    {{
        { Config::BOOTSTRAP_SERVERS, { "" } }
    }};
    EXPECT_COURIER_THROW(RdKafkaBrokerClient client(emptyServers), RD_KAFKA_RESP_ERR__INVALID_ARG);

    // Same for a ProducerConfig with no endpoint
    EXPECT_COURIER_THROW(Producer producer(ProducerConfig(std::set<std::string>{})), RD_KAFKA_RESP_ERR__INVALID_ARG);
}

TEST(RdKafkaBrokerClient, DefaultProperties)
{
    RdKafkaBrokerClient client(ProducerConfig({UNREACHABLE_BROKER}).properties());

    // A random client.id is generated
    EXPECT_FALSE(client.clientId().empty());
    EXPECT_EQ("Producer[" + client.clientId() + "]", client.name());
    EXPECT_EQ(client.clientId(), *client.properties().getProperty(Config::CLIENT_ID));

    EXPECT_EQ("5", *client.getProperty(Config::LOG_LEVEL));
    EXPECT_EQ(UNREACHABLE_BROKER, *client.getProperty(Config::BOOTSTRAP_SERVERS));

    // Fetched from librdkafka
    EXPECT_TRUE(client.getProperty(Config::MESSAGE_TIMEOUT_MS));
    EXPECT_FALSE(client.getProperty("no.such.property"));

    client.close(std::chrono::seconds(1));
}

TEST(RdKafkaBrokerClient, InvalidLogLevel)
{
    for (const auto& logLevel: std::vector<std::string>{"abc", "-1", "8"})
    {
        const Properties props
        {{
            { Config::BOOTSTRAP_SERVERS, { UNREACHABLE_BROKER } },
            { Config::LOG_LEVEL,         { logLevel           } }
        }};

        EXPECT_COURIER_THROW(RdKafkaBrokerClient client(props), RD_KAFKA_RESP_ERR__INVALID_ARG);
    }
}

TEST(RdKafkaBrokerClient, InvalidPartitioner)
{
    const Properties props
    {{
        { Config::BOOTSTRAP_SERVERS, { UNREACHABLE_BROKER } },
        { Config::PARTITIONER,       { "round_robin"      } }
    }};

    EXPECT_COURIER_THROW(RdKafkaBrokerClient client(props), RD_KAFKA_RESP_ERR__INVALID_ARG);
}

TEST(RdKafkaBrokerClient, IdempotenceConstraints)
{
    const Properties tooManyInFlight
    {{
        { Config::BOOTSTRAP_SERVERS,  { UNREACHABLE_BROKER } },
        { Config::ENABLE_IDEMPOTENCE, { "true"             } },
        { Config::MAX_IN_FLIGHT,      { "10"               } }
    }};
    EXPECT_COURIER_THROW(RdKafkaBrokerClient client(tooManyInFlight), RD_KAFKA_RESP_ERR__INVALID_ARG);

    const Properties wrongAcks
    {{
        { Config::BOOTSTRAP_SERVERS,  { UNREACHABLE_BROKER } },
        { Config::ENABLE_IDEMPOTENCE, { "true"             } },
        { Config::ACKS,               { "1"                } }
    }};
    EXPECT_COURIER_THROW(RdKafkaBrokerClient client(wrongAcks), RD_KAFKA_RESP_ERR__INVALID_ARG);
}

TEST(RdKafkaBrokerClient, WithLogCallback)
{
    std::mutex               logsMutex;
    std::vector<std::string> logs;

    Properties props = ProducerConfig({UNREACHABLE_BROKER}).properties();
    props.put(Config::CLIENT_ID, "log-test");
    props.put(Config::LOG_CB, [&logsMutex, &logs](int /*level*/, const char* /*filename*/, int /*lineno*/, const char* msg) {
                                  const std::lock_guard<std::mutex> lock(logsMutex);
                                  logs.emplace_back(msg);
                              });
    props.put(Config::ERROR_CB, [](const Error& error) { std::cout << "error_cb: " << error.toString() << std::endl; });

    {
        RdKafkaBrokerClient client(props);
        client.setLogLevel(Log::Level::Err);
        client.close(std::chrono::seconds(1));
    }

    // "Producer[log-test] initializes with properties[...]" (logged at Notice level, before the log level was changed)
    const std::lock_guard<std::mutex> lock(logsMutex);
    EXPECT_TRUE(std::any_of(logs.cbegin(), logs.cend(),
                            [](const auto& log) { return log.find("Producer[log-test] initializes with properties[") == 0; }));
}

TEST(RdKafkaBrokerClient, SendAfterClose)
{
    RdKafkaBrokerClient client(ProducerConfig({UNREACHABLE_BROKER}).properties());
    client.close(std::chrono::seconds(0));

    // A second close would do nothing
    client.close(std::chrono::seconds(0));

    const WireRecord record("orders", CourierTestUtility::ToBytes("hello"));
    EXPECT_COURIER_THROW(client.send(record, [](const RecordMetadata& /*metadata*/, const Error& /*error*/) {}), RD_KAFKA_RESP_ERR__STATE);
}

TEST(Producer, DeliveryTimedOutWithUnreachableBroker)
{
    const Properties extraProps
    {{
        { Config::MESSAGE_TIMEOUT_MS, { "1000" } }
    }};

    Producer producer(ProducerConfig({UNREACHABLE_BROKER}, extraProps));

    const Topic<std::string, std::string> topic("orders");
    auto future = producer.produce(topic, "k1", "hello", stringSerializer(), stringSerializer());

    ASSERT_EQ(std::future_status::ready, future.wait_for(CourierTestUtility::MAX_DELIVERY_TIMEOUT));

    const auto result = future.get();
    std::cout << result.toString() << std::endl;
    ASSERT_FALSE(result.ok());
    ASSERT_TRUE(result.error().isDispatchError());
    EXPECT_TRUE(result.error().dispatchError().error);
}

TEST(Producer, OutstandingRecordsPurgedWhileClosing)
{
    Producer producer(ProducerConfig({UNREACHABLE_BROKER}));

    const Topic<std::string, std::string> topic("orders");

    std::vector<std::future<ProduceResult>> futures;
    for (int i = 0; i < 10; ++i)
    {
        futures.emplace_back(producer.produce(topic, "hello" + std::to_string(i), stringSerializer(), target::partition(0)));
    }

    // No time to wait for the outstanding records
    producer.close(std::chrono::milliseconds(0));
    EXPECT_FALSE(producer.isOpen());

    // Every record has its result
    for (auto& future: futures)
    {
        ASSERT_EQ(std::future_status::ready, future.wait_for(std::chrono::seconds(0)));

        const auto result = future.get();
        ASSERT_TRUE(result.error().isDispatchError());

        const auto errorValue = result.error().dispatchError().error.value();
        EXPECT_TRUE(errorValue == RD_KAFKA_RESP_ERR__PURGE_QUEUE || errorValue == RD_KAFKA_RESP_ERR__PURGE_INFLIGHT) << errorValue;
    }
}

TEST(Producer, ConcurrentProduceWhileClosing)
{
    Producer producer(ProducerConfig({UNREACHABLE_BROKER}));

    const Topic<std::string, std::string> topic("orders");

    constexpr int THREAD_COUNT       = 4;
    constexpr int RECORDS_PER_THREAD = 200;

    std::vector<std::vector<std::future<ProduceResult>>> futuresPerThread(THREAD_COUNT);
    std::atomic<int> started = {0};

    {
        std::vector<CourierTestUtility::JoiningThread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t)
        {
            threads.emplace_back([&producer, &topic, &started, &futures = futuresPerThread[t]]() {
                ++started;
                for (int i = 0; i < RECORDS_PER_THREAD; ++i)
                {
                    futures.emplace_back(producer.produce(topic, "hello" + std::to_string(i), stringSerializer(), target::partition(0)));
                }
            });
        }

        while (started < THREAD_COUNT) std::this_thread::yield();

        // Close while the others are still producing
        producer.close(std::chrono::milliseconds(0));
    }

    // Every record has its result, either purged while closing or rejected after that
    for (auto& futures: futuresPerThread)
    {
        ASSERT_EQ(RECORDS_PER_THREAD, futures.size());

        for (auto& future: futures)
        {
            ASSERT_EQ(std::future_status::ready, future.wait_for(std::chrono::seconds(0)));

            const auto result = future.get();
            ASSERT_TRUE(result.error().isDispatchError());

            const auto errorValue = result.error().dispatchError().error.value();
            EXPECT_TRUE(errorValue == RD_KAFKA_RESP_ERR__PURGE_QUEUE
                        || errorValue == RD_KAFKA_RESP_ERR__PURGE_INFLIGHT
                        || errorValue == RD_KAFKA_RESP_ERR__STATE) << errorValue;
        }
    }
}
