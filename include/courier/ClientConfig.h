#pragma once

#include <courier/Project.h>

#include <courier/Properties.h>


namespace COURIER_API { namespace clients {

/**
 * Configuration keys for broker clients.
 */
class Config: public Properties
{
public:
    Config() = default;
    Config(const Config&) = default;
    explicit Config(const PropertiesMap& kvMap): Properties(kvMap) {}

    /**
     * Log callback.
     * Type: `std::function<void(int, const char*, int, const char* msg)>`
     */
    static const constexpr char* LOG_CB                    = "log_cb";

    /**
     * Error callback.
     * Type: `std::function<void(const Error&)>`
     */
    static const constexpr char* ERROR_CB                  = "error_cb";

    /**
     * The string contains host:port pairs of brokers (splitted by ",") that the client will use to establish initial connection to the cluster.
     * Note: It's mandatory.
     */
    static const constexpr char* BOOTSTRAP_SERVERS         = "bootstrap.servers";

    /**
     * Client identifier.
     */
    static const constexpr char* CLIENT_ID                 = "client.id";

    /**
     * Log level (syslog(3) levels).
     */
    static const constexpr char* LOG_LEVEL                 = "log_level";
};

} } // end of COURIER_API::clients

