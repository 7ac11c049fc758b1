#pragma once

#include <courier/Project.h>

#include <courier/BrokerClient.h>
#include <courier/ClientException.h>
#include <courier/DeliveryPromise.h>
#include <courier/Error.h>
#include <courier/Log.h>
#include <courier/ProduceResult.h>
#include <courier/ProduceTarget.h>
#include <courier/ProducerConfig.h>
#include <courier/ProducerError.h>
#include <courier/RdKafkaBrokerClient.h>
#include <courier/RecordBuilder.h>
#include <courier/Serializer.h>
#include <courier/Topic.h>
#include <courier/Types.h>
#include <courier/Utility.h>
#include <courier/WireRecord.h>

#include <atomic>
#include <exception>
#include <future>
#include <memory>


namespace COURIER_API { namespace clients { namespace producer {

/**
 * Producer handle.
 *
 * It owns exactly one underlying broker client, and closes it exactly once (with `close()`, or within the destructor).
 * `produce` could be called concurrently; no extra locking is added around the broker client.
 */
class Producer
{
public:
    /**
     * Acquire a producer (with a librdkafka client) for the configuration.
     * It's blocking, and throws ClientException if the client could not be set up.
     */
    explicit Producer(const ProducerConfig& config)
        : Producer(std::make_unique<RdKafkaBrokerClient>(config.properties()))
    {}

    /**
     * Acquire a producer with a given broker client.
     */
    explicit Producer(std::unique_ptr<BrokerClient> client);

    /**
     * The destructor would close the underlying client (if not yet).
     */
    ~Producer() { close(); }

    Producer(const Producer&) = delete;
    Producer& operator=(const Producer&) = delete;

    /**
     * Get the name of the underlying client.
     */
    const std::string& name() const { return _client->name(); }

    /**
     * Show whether it's still open for producing.
     */
    bool isOpen() const { return _opened.load(); }

    /**
     * Asynchronously produce a record.
     *
     * The returned future resolves to,
     *   - RecordMetadata:     the record has been acknowledged by the broker.
     *   - SerializationError: the key or value serializer failed (and nothing was sent).
     *   - DispatchError:      the broker client reported a failure (or the producer has been closed).
     * Nothing would be thrown from here.
     */
    template <typename K, typename V>
    std::future<ProduceResult> produce(const Topic<K, V>&                              topic,
                                       const utility::TypeIdentityT<V>&                value,
                                       const utility::TypeIdentityT<Serializer<V>>&    valueSerializer,
                                       const utility::TypeIdentityT<ProduceTarget<K>>& target  = NoTarget{},
                                       const Headers&                                  headers = Headers{});

    /**
     * Asynchronously produce a record with a key (the partition would be decided by the broker).
     */
    template <typename K, typename V>
    std::future<ProduceResult> produce(const Topic<K, V>&                           topic,
                                       const utility::TypeIdentityT<K>&             key,
                                       const utility::TypeIdentityT<V>&             value,
                                       const utility::TypeIdentityT<Serializer<K>>& keySerializer,
                                       const utility::TypeIdentityT<Serializer<V>>& valueSerializer)
    {
        return produce(topic, value, valueSerializer, ProduceTarget<K>{target::key(key, keySerializer)});
    }

    /**
     * Close the underlying client, waiting up to `timeout` for the outstanding records.
     * Only the first call takes effect. Failures are logged, not thrown.
     */
    void close(std::chrono::milliseconds timeout = InfiniteTimeout);

private:
    void dispatch(const WireRecord& record, const std::shared_ptr<DeliveryPromise>& promise);

    std::unique_ptr<BrokerClient> _client;
    std::atomic_bool              _opened = {false};
};


inline
Producer::Producer(std::unique_ptr<BrokerClient> client)
    : _client(std::move(client))
{
    if (!_client)
    {
        COURIER_THROW_ERROR(Error(RD_KAFKA_RESP_ERR__INVALID_ARG, "No broker client for the producer!"));
    }

    _opened = true;
}

template <typename K, typename V>
std::future<ProduceResult>
Producer::produce(const Topic<K, V>&                              topic,
                  const utility::TypeIdentityT<V>&                value,
                  const utility::TypeIdentityT<Serializer<V>>&    valueSerializer,
                  const utility::TypeIdentityT<ProduceTarget<K>>& target,
                  const Headers&                                  headers)
{
    auto promise = std::make_shared<DeliveryPromise>();
    auto result  = promise->future();

    try
    {
        const WireRecord record = recordFrom(topic, value, target, valueSerializer, headers);

        dispatch(record, promise);
    }
    catch (const SerializationException& e)
    {
        promise->resolve(ProduceResult{ProducerError::serialization(e.cause())});
    }

    return result;
}

inline void
Producer::dispatch(const WireRecord& record, const std::shared_ptr<DeliveryPromise>& promise)
{
    if (!_opened)
    {
        promise->resolve(ProduceResult{ProducerError::dispatch(Error{RD_KAFKA_RESP_ERR__STATE, "The producer has been closed"})});
        return;
    }

    auto deliveryCb = [promise](const RecordMetadata& metadata, const Error& error) {
        promise->resolve(error ? ProduceResult{ProducerError::dispatch(error)} : ProduceResult{metadata});
    };

    try
    {
        _client->send(record, deliveryCb);
    }
    catch (const ClientException& e)
    {
        promise->resolve(ProduceResult{ProducerError::dispatch(e.error())});
    }
    catch (const std::exception& e)
    {
        promise->resolve(ProduceResult{ProducerError::dispatch(Error{RD_KAFKA_RESP_ERR__FAIL, e.what()})});
    }
}

inline void
Producer::close(std::chrono::milliseconds timeout)
{
    if (!_opened.exchange(false)) return;

    try
    {
        _client->close(timeout);
    }
    catch (const std::exception& e)
    {
        COURIER_API_LOG(Log::Level::Err, "%s failed to close! error[%s]", name().c_str(), e.what());
    }
    catch (...)
    {
        COURIER_API_LOG(Log::Level::Err, "%s failed to close! error[non-standard exception]", name().c_str());
    }
}

} // end of producer

using Producer = producer::Producer;

} } // end of COURIER_API::clients

