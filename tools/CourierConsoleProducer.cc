#include "courier/Producer.h"

#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>


struct Arguments
{
    std::vector<std::string>              brokerList;
    std::string                           topic;
    courier::Optional<courier::Partition> partition;
    courier::Optional<std::string>        keySeparator;
    std::map<std::string, std::string>    props;
};

std::unique_ptr<Arguments> ParseArguments(int argc, char **argv)
{
    auto args = std::make_unique<Arguments>();
    std::vector<std::string> propList;
    std::string keySeparator;
    int partition = -1;

    namespace po = boost::program_options;
    po::options_description desc("Options description");
    desc.add_options()
            ("help,h",
                "Print usage information.")
            ("broker-list",
                po::value<std::vector<std::string>>(&args->brokerList)->multitoken()->required(),
                "REQUIRED: The server(s) to connect to.")
            ("topic",
                po::value<std::string>(&args->topic)->required(),
                "REQUIRED: The topic to publish to.")
            ("partition",
                po::value<int>(&partition),
                "The partition to publish to.")
            ("key-separator",
                po::value<std::string>(&keySeparator),
                "Read each line as key/value, split by the separator (could not be used together with --partition).")
            ("props",
                po::value<std::vector<std::string>>(&propList)->multitoken(),
                "Producer properties in key=value format.");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);

    if (vm.count("help") || argc == 1)
    {
        std::cout << "Read data from the standard input and send it to the given topic" << std::endl;
        std::cout << "    (with librdkafka v" << courier::utility::getLibRdKafkaVersion() << ")" << std::endl;
        std::cout << desc << std::endl;
        return nullptr;
    }

    po::notify(vm);

    if (partition >= 0)
    {
        args->partition = partition;
    }

    if (!keySeparator.empty())
    {
        if (args->partition)
        {
            throw std::invalid_argument("Unexpected --key-separator with --partition! A record could not be sent with both a key and a partition");
        }
        args->keySeparator = keySeparator;
    }

    for (const auto& prop: propList)
    {
        std::vector<std::string> keyValue;
        boost::algorithm::split(keyValue, prop, boost::is_any_of("="));
        if (keyValue.size() != 2)
        {
            throw std::invalid_argument("Unexpected --props value! Expected key=value format");
        }
        args->props[keyValue[0]] = keyValue[1];
    }

    return args;
}


int main (int argc, char **argv)
{
    using namespace courier;
    using namespace courier::clients::producer;

    try
    {
        // Parse input arguments
        std::unique_ptr<Arguments> args;
        args = ParseArguments(argc, argv);
        if (!args) return EXIT_SUCCESS;  // Only for "help"

        // Prepare producer properties
        Properties extraProps;
        // Get client id
        std::ostringstream oss;
        oss << "producer-" << std::this_thread::get_id();
        extraProps.put(Config::CLIENT_ID, oss.str());
        // For other properties user assigned
        for (const auto& prop: args->props)
        {
            extraProps.put(prop.first, prop.second);
        }

        // Only print warnings (or more severe ones)
        setGlobalLogger([](int level, const char* filename, int lineno, const char* msg) {
            if (level <= Log::Level::Warning) DefaultLogger(level, filename, lineno, msg);
        });

        const std::set<std::string> bootstrapServers(args->brokerList.cbegin(), args->brokerList.cend());
        Producer producer(ProducerConfig(bootstrapServers, extraProps));

        const Topic<std::string, std::string> topic(args->topic);

        auto startPromptLine = []() { std::cout << "> "; };

        // Keep reading lines and send them towards the brokers
        startPromptLine();

        std::string line;
        while (std::getline(std::cin, line))
        {
            ProduceTarget<std::string> produceTarget = NoTarget{};
            std::string                value  = line;

            if (args->partition)
            {
                produceTarget = target::partition(*args->partition);
            }
            else if (args->keySeparator)
            {
                const auto pos = line.find(*args->keySeparator);
                if (pos != std::string::npos)
                {
                    produceTarget = target::key(line.substr(0, pos), stringSerializer());
                    value  = line.substr(pos + args->keySeparator->size());
                }
            }

            std::cout << "Current Local Time [" << utility::getCurrentTime() << "]" << std::endl;

            auto future = producer.produce(topic, value, stringSerializer(), produceTarget);

            // Wait for the result (line by line)
            const auto result = future.get();
            if (result)
            {
                std::cout << "Just Sent Value[" << value.size() << " B] ==> " << result.metadata().toString() << std::endl;
            }
            else
            {
                std::cout << "Failed to send Value[" << value.size() << " B] ==> " << result.error().toString() << std::endl;
            }

            std::cout << "--------------------" << std::endl;
            startPromptLine();
        }

        producer.close();
    }
    catch (const std::exception& e)
    {
        std::cout << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
