#pragma once

#include <courier/Project.h>

#include <courier/BrokerClient.h>
#include <courier/ClientConfig.h>
#include <courier/ClientException.h>
#include <courier/Error.h>
#include <courier/Log.h>
#include <courier/ProducerConfig.h>
#include <courier/Properties.h>
#include <courier/RdKafkaHelper.h>
#include <courier/RecordMetadata.h>
#include <courier/Timestamp.h>
#include <courier/Types.h>
#include <courier/Utility.h>
#include <courier/WireRecord.h>

#include <librdkafka/rdkafka.h>

#include <atomic>
#include <cassert>
#include <climits>
#include <functional>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>


namespace COURIER_API { namespace clients { namespace producer {

/**
 * The broker client built on librdkafka.
 */
class RdKafkaBrokerClient: public BrokerClient
{
public:
    /**
     * The constructor for RdKafkaBrokerClient.
     *
     * Throws ClientException with errors:
     *   - RD_KAFKA_RESP_ERR__INVALID_ARG      : Invalid BOOTSTRAP_SERVERS property, or other invalid options
     *   - RD_KAFKA_RESP_ERR__CRIT_SYS_RESOURCE: Fail to create internal threads
     */
    explicit RdKafkaBrokerClient(const Properties& properties);

    /**
     * The destructor for RdKafkaBrokerClient.
     */
    ~RdKafkaBrokerClient() override { if (_opened) close(InfiniteTimeout); }

    RdKafkaBrokerClient(const RdKafkaBrokerClient&) = delete;
    RdKafkaBrokerClient& operator=(const RdKafkaBrokerClient&) = delete;

    /**
     * Get the client id.
     */
    const std::string& clientId()   const { return _clientId; }

    /**
     * Get the client name (i.e. client type + id).
     */
    const std::string& name()       const override { return _clientName; }

    /**
     * Set log level for the client (the default value: 5).
     */
    void setLogLevel(int level);

    /**
     * Return the properties which took effect.
     */
    const Properties& properties() const { return _properties; }

    /**
     * Fetch the effected property (including the property internally set by librdkafka).
     */
    Optional<std::string> getProperty(const std::string& name) const;

    /**
     * Asynchronously send a record (the key/value/headers are copied, thus the record could be released right after it returns).
     *
     * Throws ClientException with errors:
     *   - RD_KAFKA_RESP_ERR__UNKNOWN_TOPIC:     The topic doesn't exist
     *   - RD_KAFKA_RESP_ERR__UNKNOWN_PARTITION: The partition doesn't exist
     *   - RD_KAFKA_RESP_ERR__INVALID_ARG:       Invalid topic(topic is null, or the length is too long (> 512)
     *   - RD_KAFKA_RESP_ERR__STATE:             The client has been closed
     *   Broker errors would be reported with the delivery callback.
     */
    void send(const WireRecord& record, const DeliveryCallback& deliveryCb) override;

    /**
     * Invoking this method makes all buffered records immediately available to send, and blocks on the completion of the requests associated with these records.
     *
     * Possible error values:
     *   - RD_KAFKA_RESP_ERR__TIMED_OUT: The `timeout` was reached before all outstanding requests were completed.
     */
    Error flush(std::chrono::milliseconds timeout = InfiniteTimeout);

    /**
     * Purge messages currently handled by the client.
     */
    Error purge();

    /**
     * Close the client. This method would wait up to timeout for the client to complete the sending of all incomplete requests (before purging them).
     * All outstanding delivery callbacks are triggered before it returns.
     */
    void close(std::chrono::milliseconds timeout) override;

    template<class ...Args>
    void doLog(int level, const char* filename, int lineno, const char* format, Args... args) const
    {
        if (level >= 0 && level <= _logLevel && _logCb)
        {
            LogBuffer<LOG_BUFFER_SIZE> logBuffer;
            logBuffer.print("%s ", name().c_str()).print(format, args...);
            _logCb(level, filename, lineno, logBuffer.c_str());
        }
    }

    void doLog(int level, const char* filename, int lineno, const char* msg) const
    {
        doLog(level, filename, lineno, "%s", msg);
    }

#define COURIER_API_DO_LOG(lvl, ...) doLog(lvl, __FILE__, __LINE__, ##__VA_ARGS__)

private:
    // Buffer size for single line logging
    static const constexpr int LOG_BUFFER_SIZE = 1024;

    static constexpr int TIMEOUT_INFINITE = -1;

    static int convertMsDurationToInt(std::chrono::milliseconds ms)
    {
        return ms > std::chrono::milliseconds(INT_MAX) ? TIMEOUT_INFINITE : static_cast<int>(ms.count());
    }

    rd_kafka_t* getClientHandle() const { return _rk.get(); }

    static RdKafkaBrokerClient& brokerClient(rd_kafka_t* rk)             { return *static_cast<RdKafkaBrokerClient*>(rd_kafka_opaque(rk)); }
    static const RdKafkaBrokerClient& brokerClient(const rd_kafka_t* rk) { return *static_cast<const RdKafkaBrokerClient*>(rd_kafka_opaque(rk)); }

    // Validate properties (and fix it if necesary)
    static Properties validateAndReformProperties(const Properties& properties);

    // Define datatypes for "opaque" (as an input for rd_kafka_produceva), in order to handle the delivery callback
    class DeliveryCbOpaque
    {
    public:
        explicit DeliveryCbOpaque(DeliveryCallback cb): _deliveryCb(std::move(cb)) {}

        void operator()(rd_kafka_t* /*rk*/, const rd_kafka_message_t* rkmsg)
        {
            rd_kafka_timestamp_type_t tstype = RD_KAFKA_TIMESTAMP_NOT_AVAILABLE;
            const Timestamp::Value    tsValue = rd_kafka_message_timestamp(rkmsg, &tstype);

            const RecordMetadata metadata(rkmsg->rkt ? rd_kafka_topic_name(rkmsg->rkt) : "",
                                          rkmsg->partition,
                                          rkmsg->offset,
                                          Timestamp{tsValue, tstype});

            _deliveryCb(metadata, Error{rkmsg->err});
        }

    private:
        const DeliveryCallback _deliveryCb;
    };

    // Delivery callback (for librdkafka)
    static void deliveryCallback(rd_kafka_t* rk, const rd_kafka_message_t* rkmsg, void* opaque);

    // Log callback (for librdkafka)
    static void logCallback(const rd_kafka_t* rk, int level, const char* fac, const char* buf);

    // Error callback (for librdkafka)
    static void errorCallback(rd_kafka_t* rk, int err, const char* reason, void* opaque);

    // Log callback (for class instance)
    void onLog(int level, const char* fac, const char* buf) const;

    // Error callback (for class instance)
    void onError(const Error& error);

    class PollThread
    {
    public:
        using PollCb = std::function<void(int)>;

        explicit PollThread(PollCb pollCb)
            : _running(true), _thread(keepPolling, std::ref(_running), std::move(pollCb))
        {
        }

        ~PollThread()
        {
            _running = false;

            if (_thread.joinable()) _thread.join();
        }

    private:
        static void keepPolling(std::atomic_bool& running, const PollCb& pollCb)
        {
            while (running.load())
            {
                pollCb(CALLBACK_POLLING_INTERVAL_MS);
            }
        }

        static constexpr int CALLBACK_POLLING_INTERVAL_MS = 10;

        std::atomic_bool _running;
        std::thread      _thread;
    };

    void startBackgroundPolling()
    {
        _pollThread = std::make_unique<PollThread>([this](int timeoutMs) { rd_kafka_poll(getClientHandle(), timeoutMs); });
    }

    void stopBackgroundPolling()
    {
        _pollThread.reset(); // Join the polling thread (in case it's running)
    }

    // Serve the delivery reports (e.g. for the purged messages) which are still pending
    void drainDeliveryReports();

    static constexpr int DRAIN_POLL_INTERVAL_MS   = 10;

    // To avoid double-close
    std::atomic_bool    _opened = {false};

    // Senders share it while enqueuing; close() takes it exclusively to flip "_opened",
    // so no record could be enqueued after close() started draining
    std::shared_mutex   _sendCloseMutex;

    // Accepted properties
    Properties          _properties;

    std::string         _clientId;
    std::string         _clientName;

    std::atomic<int>    _logLevel = {Log::Level::Notice};

    LogCallback         _logCb = DefaultLogger;
    ErrorCallback       _errorCb;

    rd_kafka_unique_ptr _rk;

    std::unique_ptr<PollThread> _pollThread;
};


inline
RdKafkaBrokerClient::RdKafkaBrokerClient(const Properties& properties)
{
    const Properties props = validateAndReformProperties(properties);

    // Save clientID
    _clientId   = *props.getProperty(Config::CLIENT_ID);
    _clientName = "Producer[" + _clientId + "]";

    // Log Callback
    if (props.contains(Config::LOG_CB))
    {
        _logCb = props.get<LogCallback>(Config::LOG_CB);
    }

    // Save LogLevel
    if (auto logLevel = props.getProperty(Config::LOG_LEVEL))
    {
        try
        {
            _logLevel = std::stoi(*logLevel);
        }
        catch (const std::exception& e)
        {
            COURIER_THROW_ERROR(Error(RD_KAFKA_RESP_ERR__INVALID_ARG, std::string("Invalid log_level[").append(*logLevel).append("], which must be an number!").append(e.what())));
        }

        if (_logLevel < Log::Level::Emerg || _logLevel > Log::Level::Debug)
        {
            COURIER_THROW_ERROR(Error(RD_KAFKA_RESP_ERR__INVALID_ARG, std::string("Invalid log_level[").append(*logLevel).append("], which must be a value between 0 and 7!")));
        }
    }

    LogBuffer<LOG_BUFFER_SIZE> errInfo;

    auto rk_conf = rd_kafka_conf_unique_ptr(rd_kafka_conf_new());

    for (const auto& prop: props.map())
    {
        const auto& k = prop.first;
        const auto& v = props.getProperty(k);
        if (!v) continue;   // Callbacks are not for librdkafka's string settings

        const rd_kafka_conf_res_t result = rd_kafka_conf_set(rk_conf.get(),
                                                             k.c_str(),
                                                             v->c_str(),
                                                             errInfo.clear().str(),
                                                             errInfo.capacity());
        if (result == RD_KAFKA_CONF_OK)
        {
            _properties.put(prop.first, prop.second.toString());
        }
        else
        {
            COURIER_API_DO_LOG(Log::Level::Err, "failed to be initialized with property[%s:%s], result[%d]: %s", k.c_str(), v->c_str(), result, errInfo.c_str());
        }
    }

    // Save the raw pointer to the "opaque" field, thus we could fetch it later (for kinds of callbacks)
    rd_kafka_conf_set_opaque(rk_conf.get(), this);

    // Log Callback
    rd_kafka_conf_set_log_cb(rk_conf.get(), RdKafkaBrokerClient::logCallback);

    // Error Callback
    if (props.contains(Config::ERROR_CB))
    {
        _errorCb = props.get<ErrorCallback>(Config::ERROR_CB);
    }
    rd_kafka_conf_set_error_cb(rk_conf.get(), RdKafkaBrokerClient::errorCallback);

    // Delivery Callback
    rd_kafka_conf_set_dr_msg_cb(rk_conf.get(), RdKafkaBrokerClient::deliveryCallback);

    // Set client handler
    _rk.reset(rd_kafka_new(RD_KAFKA_PRODUCER,
                           rk_conf.get(),
                           errInfo.clear().str(),
                           errInfo.capacity()));
    if (!_rk)
    {
        COURIER_THROW_ERROR(Error(RD_KAFKA_RESP_ERR__INVALID_ARG, std::string("Failed to create producer: ") + errInfo.c_str()));
    }
    rk_conf.release();  // rk_conf's ownship has been transferred to rk, after a successful "rd_kafka_new()" call

    // Add brokers
    auto brokers = props.getProperty(Config::BOOTSTRAP_SERVERS);
    if (rd_kafka_brokers_add(getClientHandle(), brokers->c_str()) == 0)
    {
        COURIER_THROW_ERROR(Error(RD_KAFKA_RESP_ERR__INVALID_ARG,\
                                  "No broker could be added successfully, BOOTSTRAP_SERVERS=[" + *brokers + "]"));
    }

    _opened = true;

    // Start background polling (the delivery callbacks would be triggered within this thread)
    startBackgroundPolling();

    const auto propStr = _properties.toString();
    COURIER_API_DO_LOG(Log::Level::Notice, "initializes with properties[%s]", propStr.c_str());
}

inline Properties
RdKafkaBrokerClient::validateAndReformProperties(const Properties& properties)
{
    auto newProperties = properties;

    // BOOTSTRAP_SERVERS property is mandatory
    const auto brokers = newProperties.getProperty(Config::BOOTSTRAP_SERVERS);
    if (!brokers || brokers->empty())
    {
        COURIER_THROW_ERROR(Error(RD_KAFKA_RESP_ERR__INVALID_ARG,\
                                  "Validation failed! With no property [" + std::string(Config::BOOTSTRAP_SERVERS) + "]"));
    }

    // If no "client.id" configured, generate a random one for user
    if (!newProperties.getProperty(Config::CLIENT_ID))
    {
        newProperties.put(Config::CLIENT_ID, utility::getRandomString());
    }

    // If no "log_level" configured, use Log::Level::Notice as default
    if (!newProperties.getProperty(Config::LOG_LEVEL))
    {
        newProperties.put(Config::LOG_LEVEL, std::to_string(static_cast<int>(Log::Level::Notice)));
    }

    // Check whether it's an available partitioner
    const std::set<std::string> availPartitioners = {"murmur2_random", "murmur2", "random", "consistent", "consistent_random", "fnv1a", "fnv1a_random"};
    auto partitioner = newProperties.getProperty(Config::PARTITIONER);
    if (partitioner && !availPartitioners.count(*partitioner))
    {
        std::string errMsg = "Invalid partitioner [" + *partitioner + "]! Valid options: ";
        bool isTheFirst = true;
        for (const auto& availPartitioner: availPartitioners)
        {
            errMsg += (std::string(isTheFirst ? (isTheFirst = false, "") : ", ") + availPartitioner);
        }
        errMsg += ".";

        COURIER_THROW_ERROR(Error(RD_KAFKA_RESP_ERR__INVALID_ARG, errMsg));
    }

    // For "idempotence" feature
    constexpr int KAFKA_IDEMP_MAX_INFLIGHT = 5;
    const auto enableIdempotence = newProperties.getProperty(Config::ENABLE_IDEMPOTENCE);
    if (enableIdempotence && *enableIdempotence == "true")
    {
        if (const auto maxInFlight = newProperties.getProperty(Config::MAX_IN_FLIGHT))
        {
            if (std::stoi(*maxInFlight) > KAFKA_IDEMP_MAX_INFLIGHT)
            {
                COURIER_THROW_ERROR(Error(RD_KAFKA_RESP_ERR__INVALID_ARG,\
                                          "`max.in.flight` must be set <= " + std::to_string(KAFKA_IDEMP_MAX_INFLIGHT) + " when `enable.idempotence` is `true`"));
            }
        }

        if (const auto acks = newProperties.getProperty(Config::ACKS))
        {
            if (*acks != "all" && *acks != "-1")
            {
                COURIER_THROW_ERROR(Error(RD_KAFKA_RESP_ERR__INVALID_ARG,\
                                          "`acks` must be set to `all`/`-1` when `enable.idempotence` is `true`"));
            }
        }
    }

    return newProperties;
}

inline Optional<std::string>
RdKafkaBrokerClient::getProperty(const std::string& name) const
{
    // Find it in pre-saved properties
    if (auto property = _properties.getProperty(name)) return *property;

    const rd_kafka_conf_t* conf = rd_kafka_conf(getClientHandle());

    constexpr int DEFAULT_BUF_SIZE = 512;

    std::vector<char> valueBuf(DEFAULT_BUF_SIZE);
    std::size_t       valueSize = valueBuf.size();

    // Try with a default buf size. If could not find the property, return immediately.
    if (rd_kafka_conf_get(conf, name.c_str(), valueBuf.data(), &valueSize) != RD_KAFKA_CONF_OK) return Optional<std::string>{};

    // If the default buf size is not big enough, retry with a larger one
    if (valueSize > valueBuf.size())
    {
        valueBuf.resize(valueSize);
        [[maybe_unused]] const rd_kafka_conf_res_t result = rd_kafka_conf_get(conf, name.c_str(), valueBuf.data(), &valueSize);
        assert(result == RD_KAFKA_CONF_OK);
    }

    return std::string(valueBuf.data());
}

inline void
RdKafkaBrokerClient::setLogLevel(int level)
{
    _logLevel = level < Log::Level::Emerg ? Log::Level::Emerg : (level > Log::Level::Debug ? Log::Level::Debug : level);
    rd_kafka_set_log_level(getClientHandle(), _logLevel);
}

inline void
RdKafkaBrokerClient::onLog(int level, const char* fac, const char* buf) const
{
    doLog(level, "LIBRDKAFKA", 0, "%s | %s", fac, buf); // The log is coming from librdkafka
}

inline void
RdKafkaBrokerClient::logCallback(const rd_kafka_t* rk, int level, const char* fac, const char* buf)
{
    brokerClient(rk).onLog(level, fac, buf);
}

inline void
RdKafkaBrokerClient::onError(const Error& error)
{
    if (_errorCb)
    {
        _errorCb(error);
    }
    else
    {
        const auto errStr = error.toString();
        COURIER_API_DO_LOG(Log::Level::Err, "met error[%s]", errStr.c_str());
    }
}

inline void
RdKafkaBrokerClient::errorCallback(rd_kafka_t* rk, int err, const char* reason, void* /*opaque*/)
{
    auto respErr = static_cast<rd_kafka_resp_err_t>(err);

    Error error;
    if (respErr != RD_KAFKA_RESP_ERR__FATAL)
    {
        error = Error{respErr, reason};
    }
    else
    {
        LogBuffer<LOG_BUFFER_SIZE> errInfo;
        respErr = rd_kafka_fatal_error(rk, errInfo.str(), errInfo.capacity());
        error = Error{respErr, errInfo.c_str(), true};
    }

    brokerClient(rk).onError(error);
}

// Delivery Callback (for librdkafka)
inline void
RdKafkaBrokerClient::deliveryCallback(rd_kafka_t* rk, const rd_kafka_message_t* rkmsg, void* /*opaque*/)
{
    if (auto* deliveryCbOpaque = static_cast<DeliveryCbOpaque*>(rkmsg->_private))
    {
        (*deliveryCbOpaque)(rk, rkmsg);
        delete deliveryCbOpaque;
    }
}

inline void
RdKafkaBrokerClient::send(const WireRecord& record, const DeliveryCallback& deliveryCb)
{
    const std::shared_lock<std::shared_mutex> lock(_sendCloseMutex);

    if (!_opened)
    {
        COURIER_THROW_ERROR(Error(RD_KAFKA_RESP_ERR__STATE, "The client has been closed"));
    }

    auto deliveryCbOpaque = std::make_unique<DeliveryCbOpaque>(deliveryCb);

    const auto* topic     = record.topic().c_str();
    const auto  partition = record.partition() ? *record.partition() : RD_KAFKA_PARTITION_UA;
    const auto  msgFlags  = (static_cast<unsigned int>(RD_KAFKA_MSG_F_COPY) | static_cast<unsigned int>(RD_KAFKA_MSG_F_BLOCK));
    // An empty (but present) key must not be taken as a null key
    const auto* keyPtr    = record.key() ? nonNullData(*record.key()) : nullptr;
    const auto  keyLen    = record.key() ? record.key()->size() : 0;
    const auto* valuePtr  = nonNullData(record.value());
    const auto  valueLen  = record.value().size();

    auto* rk        = getClientHandle();
    auto* opaquePtr = deliveryCbOpaque.get();

    constexpr std::size_t VU_LIST_SIZE_WITH_NO_HEADERS = 6;
    std::vector<rd_kafka_vu_t> rkVUs(VU_LIST_SIZE_WITH_NO_HEADERS + record.headers().size());

    std::size_t uvCount = 0;

    {   // Topic
        auto& vu = rkVUs[uvCount++];
        vu.vtype  = RD_KAFKA_VTYPE_TOPIC;
        vu.u.cstr = topic;
    }

    {   // Partition
        auto& vu = rkVUs[uvCount++];
        vu.vtype = RD_KAFKA_VTYPE_PARTITION;
        vu.u.i32 = partition;
    }

    {   // Message flags
        auto& vu = rkVUs[uvCount++];
        vu.vtype = RD_KAFKA_VTYPE_MSGFLAGS;
        vu.u.i   = static_cast<int>(msgFlags);
    }

    {   // Key
        auto& vu = rkVUs[uvCount++];
        vu.vtype      = RD_KAFKA_VTYPE_KEY;
        vu.u.mem.ptr  = const_cast<std::uint8_t*>(keyPtr);      // NOLINT
        vu.u.mem.size = keyLen;
    }

    {   // Value
        auto& vu = rkVUs[uvCount++];
        vu.vtype      = RD_KAFKA_VTYPE_VALUE;
        vu.u.mem.ptr  = const_cast<std::uint8_t*>(valuePtr);    // NOLINT
        vu.u.mem.size = valueLen;
    }

    {   // Opaque
        auto& vu = rkVUs[uvCount++];
        vu.vtype = RD_KAFKA_VTYPE_OPAQUE;
        vu.u.ptr = opaquePtr;
    }

    // Headers
    for (const auto& header: record.headers())
    {
        auto& vu = rkVUs[uvCount++];
        vu.vtype         = RD_KAFKA_VTYPE_HEADER;
        vu.u.header.name = header.key.c_str();
        vu.u.header.val  = header.value.data();
        vu.u.header.size = static_cast<int64_t>(header.value.size());
    }

    assert(uvCount == rkVUs.size());

    rd_kafka_error_t* rkError = rd_kafka_produceva(rk, rkVUs.data(), rkVUs.size());
    if (rkError)
    {
        const Error sendResult{rd_kafka_error_code(rkError), rd_kafka_error_string(rkError), static_cast<bool>(rd_kafka_error_is_fatal(rkError))};
        rd_kafka_error_destroy(rkError);
        COURIER_THROW_ERROR(sendResult);
    }

    // RdKafkaBrokerClient::deliveryCallback would delete the "opaque"
    deliveryCbOpaque.release();
}

inline Error
RdKafkaBrokerClient::flush(std::chrono::milliseconds timeout)
{
    return Error{rd_kafka_flush(getClientHandle(), convertMsDurationToInt(timeout))};
}

inline Error
RdKafkaBrokerClient::purge()
{
    return Error{rd_kafka_purge(getClientHandle(),
                                (static_cast<unsigned>(RD_KAFKA_PURGE_F_QUEUE) | static_cast<unsigned>(RD_KAFKA_PURGE_F_INFLIGHT)))};
}

inline void
RdKafkaBrokerClient::drainDeliveryReports()
{
    // Each pending record has a delivery report, either acknowledged or purged
    while (rd_kafka_outq_len(getClientHandle()) > 0)
    {
        rd_kafka_poll(getClientHandle(), DRAIN_POLL_INTERVAL_MS);
    }
}

inline void
RdKafkaBrokerClient::close(std::chrono::milliseconds timeout)
{
    {
        const std::unique_lock<std::shared_mutex> lock(_sendCloseMutex);

        if (!_opened.exchange(false)) return;
    }

    stopBackgroundPolling();

    const Error result = flush(timeout);
    if (result.value() == RD_KAFKA_RESP_ERR__TIMED_OUT)
    {
        COURIER_API_DO_LOG(Log::Level::Notice, "purge messages before close, outQLen[%d]", rd_kafka_outq_len(getClientHandle()));
        purge();
    }

    rd_kafka_poll(getClientHandle(), 0);

    drainDeliveryReports();

    COURIER_API_DO_LOG(Log::Level::Notice, "closed");
}

} } } // end of COURIER_API::clients::producer

