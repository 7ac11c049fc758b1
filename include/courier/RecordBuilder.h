#pragma once

#include <courier/Project.h>

#include <courier/ProduceTarget.h>
#include <courier/Serializer.h>
#include <courier/Topic.h>
#include <courier/Types.h>
#include <courier/Utility.h>
#include <courier/WireRecord.h>

#include <variant>


namespace COURIER_API { namespace clients { namespace producer {

/**
 * Build the wire record for a target.
 *
 *   - NoTarget:        value only, no key, no partition.
 *   - PartitionTarget: value only, no key, with the partition.
 *   - KeyTarget:       key first, then value (the value serializer is not called if the key fails), no partition.
 *
 * Throws `SerializationException` if any serializer fails (and no record would be built).
 */
template <typename K, typename V>
WireRecord recordFrom(const Topic<K, V>&                                   topic,
                      const utility::TypeIdentityT<V>&                     value,
                      const utility::TypeIdentityT<ProduceTarget<K>>&      target,
                      const utility::TypeIdentityT<Serializer<V>>&         valueSerializer,
                      Headers                                              headers = Headers{})
{
    const TopicName& name = topic.name();

    return std::visit(utility::Overloaded{
                          [&](const NoTarget&) {
                              return WireRecord(name, serialize(valueSerializer, name, value), {}, {}, std::move(headers));
                          },
                          [&](const PartitionTarget& t) {
                              return WireRecord(name, serialize(valueSerializer, name, value), {}, t.partition, std::move(headers));
                          },
                          [&](const KeyTarget<K>& t) {
                              auto keyBytes   = serialize(t.serializer, name, t.key);
                              auto valueBytes = serialize(valueSerializer, name, value);
                              return WireRecord(name, std::move(valueBytes), std::move(keyBytes), {}, std::move(headers));
                          }
                      }, target);
}

} } } // end of COURIER_API::clients::producer

