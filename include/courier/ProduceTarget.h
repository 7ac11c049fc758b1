#pragma once

#include <courier/Project.h>

#include <courier/Serializer.h>
#include <courier/Types.h>

#include <variant>


namespace COURIER_API { namespace clients { namespace producer {

/**
 * No key, and the broker picks the partition.
 */
struct NoTarget {};

/**
 * An explicit partition (with no key).
 */
struct PartitionTarget
{
    Partition partition;
};

/**
 * A key (with its serializer), and the partition would be decided from the broker side.
 */
template <typename K>
struct KeyTarget
{
    K             key;
    Serializer<K> serializer;
};

/**
 * How the key/partition of a record is determined. Exactly one of the alternatives applies.
 *
 * Note: a key together with an explicit partition is not supported.
 */
template <typename K>
using ProduceTarget = std::variant<NoTarget, PartitionTarget, KeyTarget<K>>;


namespace target {

inline NoTarget none() { return NoTarget{}; }

inline PartitionTarget partition(Partition p) { return PartitionTarget{p}; }

template <typename K>
KeyTarget<K> key(K k, Serializer<K> serializer) { return KeyTarget<K>{std::move(k), std::move(serializer)}; }

} // end of target

} } } // end of COURIER_API::clients::producer

