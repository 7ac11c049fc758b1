#pragma once

#include <courier/Project.h>

#include <courier/ClientConfig.h>
#include <courier/Properties.h>

#include <boost/algorithm/string/join.hpp>

#include <set>
#include <string>


namespace COURIER_API { namespace clients { namespace producer {

/**
 * Configuration keys for producers.
 */
class Config: public clients::Config
{
public:
    Config() = default;
    Config(const Config&) = default;
    explicit Config(const PropertiesMap& kvMap): clients::Config(kvMap) {}

    /**
     * The acks parameter controls how many partition replicas must receive the record before the producer can consider the write successful.
     *    1) "0": The producer will not wait for a reply from the broker before assuming the message was sent successfully.
     *    2) "1": It will wait for the leader replica to receive the message.
     *    3) "all" (default): The producer will receive a success response from the broker once all in-sync replicas received the message.
     * Note: if "enable.idempotence=true", "acks" must be "all".
     */
    static const constexpr char* ACKS                          = "acks";

    /**
     * Delay in milliseconds to wait for messages in the producer queue, to accumulate before constructing messages batches to transmit to brokers.
     * Default value: 5 (since librdkafka v1.5.0)
     */
    static const constexpr char* LINGER_MS                     = "linger.ms";

    /**
     * This value is enforced locally and limits the time a produced message waits for successful delivery.
     * A time of 0 is infinite.
     * Default value: 300000
     */
    static const constexpr char* MESSAGE_TIMEOUT_MS            = "message.timeout.ms";

    /**
     * The default partitioner for a record (only applies with no explicit partition).
     * Available options: murmur2_random (default), murmur2, random, consistent, consistent_random, fnv1a, fnv1a_random.
     */
    static const constexpr char* PARTITIONER                   = "partitioner";

    /**
     * Maximum number of in-flight requests per broker connection.
     * Default value: 1000000 (while `enable.idempotence=false`); 5 (while `enable.idempotence=true`)
     */
    static const constexpr char* MAX_IN_FLIGHT                 = "max.in.flight";

    /**
     * When set to `true`, the producer will ensure that messages are succefully sent exactly once and in the original order.
     * Default value: false
     */
    static const constexpr char* ENABLE_IDEMPOTENCE            = "enable.idempotence";
};


/**
 * The configuration to acquire a producer with: the bootstrap endpoints (host:port), plus any other client properties.
 */
class ProducerConfig
{
public:
    explicit ProducerConfig(std::set<std::string> bootstrapServers, Properties extraProperties = Properties{})
        : _bootstrapServers(std::move(bootstrapServers)), _extraProperties(std::move(extraProperties))
    {}

    const std::set<std::string>& bootstrapServers() const { return _bootstrapServers; }

    const Properties&            extraProperties()  const { return _extraProperties; }

    /**
     * The properties for the underlying client (the bootstrap servers are joined with ",", and take precedence over the extra ones).
     */
    Properties properties() const
    {
        Properties props = _extraProperties;
        props.put(Config::BOOTSTRAP_SERVERS, boost::algorithm::join(_bootstrapServers, ","));
        return props;
    }

private:
    const std::set<std::string> _bootstrapServers;
    const Properties            _extraProperties;
};

} } } // end of COURIER_API::clients::producer

