#include <courier/Producer.h>

#include <cstdlib>
#include <iostream>
#include <string>


int main()
{
    using namespace courier;
    using namespace courier::clients::producer;

    // E.g. KAFKA_BROKER_LIST: "192.168.0.1:9092,192.168.0.2:9092,192.168.0.3:9092"
    const std::string brokers = getenv("KAFKA_BROKER_LIST"); // NOLINT
    const Topic<std::string, std::string> topic(getenv("TOPIC_FOR_TEST"));  // NOLINT

    // Prepare the configuration (the bootstrap servers would be joined with ",")
    const ProducerConfig config({brokers});

    // Acquire a producer
    Producer producer(config);

    // Prepare a message
    std::cout << "Type message value and hit enter to produce message..." << std::endl;
    std::string line;
    std::getline(std::cin, line);

    // Send a message (with no key and no partition)
    auto future = producer.produce(topic, line, stringSerializer());

    // Wait for the delivery result
    const auto result = future.get();
    if (result) {
        std::cout << "Message delivered: " << result.metadata().toString() << std::endl;
    } else {
        std::cerr << "Message failed to be delivered: " << result.error().toString() << std::endl;
    }

    // Close the producer explicitly(or not, since RAII will take care of it)
    producer.close();
}
