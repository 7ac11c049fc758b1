#pragma once

#include <courier/Project.h>

#include <courier/Types.h>

#include <string>


namespace COURIER_API { namespace clients { namespace producer {

/**
 * The serialized (broker-ready) form of a record.
 * It's immutable once built.
 */
class WireRecord
{
public:
    WireRecord(TopicName topic, Bytes value, Optional<Bytes> key = {}, Optional<Partition> partition = {}, Headers headers = {})
        : _topic(std::move(topic)),
          _value(std::move(value)),
          _key(std::move(key)),
          _partition(partition),
          _headers(std::move(headers))
    {}

    /**
     * The topic this record is being sent to.
     */
    const TopicName&           topic()     const { return _topic; }

    /**
     * The serialized value.
     */
    const Bytes&               value()     const { return _value; }

    /**
     * The serialized key (if any).
     */
    const Optional<Bytes>&     key()       const { return _key; }

    /**
     * The partition to which the record will be sent (if specified).
     */
    const Optional<Partition>& partition() const { return _partition; }

    /**
     * The headers.
     */
    const Headers&             headers()   const { return _headers; }

    /**
     * Obtains explanatory string.
     */
    std::string toString() const
    {
        return _topic + "-" + (_partition ? std::to_string(*_partition) : "NA")
               + (_headers.empty() ? "" : ": headers[" + COURIER_API::toString(_headers) + "]")
               + (_headers.empty() ? ": " : ", ")
               + (_key ? COURIER_API::toString(*_key) : "[null]") + "/" + COURIER_API::toString(_value);
    }

private:
    const TopicName           _topic;
    const Bytes               _value;
    const Optional<Bytes>     _key;
    const Optional<Partition> _partition;
    const Headers             _headers;
};

} } } // end of COURIER_API::clients::producer

