#pragma once

#include <courier/Project.h>

#include <courier/Error.h>
#include <courier/RecordMetadata.h>
#include <courier/WireRecord.h>

#include <chrono>
#include <functional>
#include <string>


namespace COURIER_API { namespace clients { namespace producer {

/**
 * Callback type for delivery reports. An empty `Error` means the record has been acknowledged.
 */
using DeliveryCallback = std::function<void(const RecordMetadata& metadata, const Error& error)>;

/**
 * The underlying broker client, which owns the connections and does the real sending.
 */
class BrokerClient
{
public:
    virtual ~BrokerClient() = default;

    /**
     * Get the client name.
     */
    virtual const std::string& name() const = 0;

    /**
     * Asynchronously send a record.
     *
     * Note:
     *   - It must be safe to be called concurrently.
     *   - Once it returns, the `deliveryCb` is guaranteed to be triggered exactly once (before `close` returns), possibly from another thread.
     *   - Throws ClientException if the record could not even be enqueued (and then the `deliveryCb` would never be triggered).
     */
    virtual void send(const WireRecord& record, const DeliveryCallback& deliveryCb) = 0;

    /**
     * Blocking close, which waits up to `timeout` for the outstanding records.
     */
    virtual void close(std::chrono::milliseconds timeout) = 0;
};

} } } // end of COURIER_API::clients::producer

