#pragma once

#include <courier/Project.h>

#include <courier/Timestamp.h>
#include <courier/Types.h>

#include <string>


namespace COURIER_API { namespace clients { namespace producer {

/**
 * The metadata for a record that has been acknowledged by the broker.
 */
class RecordMetadata
{
public:
    RecordMetadata() = default;

    RecordMetadata(TopicName topic, Partition partition, Offset offset, Timestamp timestamp)
        : _topic(std::move(topic)), _partition(partition), _offset(offset), _timestamp(timestamp)
    {}

    bool operator==(const RecordMetadata& rhs) const
    {
        return _topic == rhs._topic && _partition == rhs._partition && _offset == rhs._offset && _timestamp == rhs._timestamp;
    }

    /**
     * The topic the record was appended to.
     */
    const TopicName& topic()     const { return _topic; }

    /**
     * The partition the record was sent to.
     */
    Partition        partition() const { return _partition; }

    /**
     * The offset of the record in the topic/partition.
     */
    Offset           offset()    const { return _offset; }

    /**
     * The timestamp of the record in the topic/partition.
     */
    Timestamp        timestamp() const { return _timestamp; }

    /**
     * Obtains explanatory string.
     */
    std::string toString() const
    {
        return _topic + "-" + std::to_string(_partition) + "@" + std::to_string(_offset) + ", " + _timestamp.toString();
    }

private:
    TopicName _topic;
    Partition _partition = RD_KAFKA_PARTITION_UA;
    Offset    _offset    = RD_KAFKA_OFFSET_INVALID;
    Timestamp _timestamp;
};

} } } // end of COURIER_API::clients::producer

