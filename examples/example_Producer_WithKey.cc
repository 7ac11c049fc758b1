#include <courier/Producer.h>

#include <cstdint>
#include <cstdlib>
#include <future>
#include <iostream>
#include <string>
#include <vector>


struct Order
{
    std::int64_t id;
    std::string  item;
};

int main()
{
    using namespace courier;
    using namespace courier::clients::producer;

    const std::string brokers = getenv("KAFKA_BROKER_LIST"); // NOLINT
    const Topic<std::int64_t, Order> topic(getenv("TOPIC_FOR_TEST"));  // NOLINT

    // Serialize an order as "id:item"
    const Serializer<Order> orderSerializer = contramap<std::string, Order>(stringSerializer(),
                                                                            [](const Order& order) { return std::to_string(order.id) + ":" + order.item; });

    Properties extraProps;
    extraProps.put(Config::ACKS,      "all");
    extraProps.put(Config::LINGER_MS, "10");

    Producer producer(ProducerConfig({brokers}, extraProps));

    const std::vector<Order> orders = { {1, "apple"}, {2, "banana"}, {1, "cherry"} };

    std::vector<std::future<ProduceResult>> futures;
    for (const auto& order: orders)
    {
        // Records with the same key would go to the same partition
        futures.emplace_back(producer.produce(topic, order.id, order, int64Serializer(), orderSerializer));
    }

    // Records with headers, sent to an explicit partition
    const Headers headers = { Header{"origin", Bytes{'e', 'x', 'a', 'm', 'p', 'l', 'e'}} };
    futures.emplace_back(producer.produce(topic, Order{3, "durian"}, orderSerializer, target::partition(0), headers));

    for (auto& future: futures)
    {
        std::cout << future.get().toString() << std::endl;
    }
}
