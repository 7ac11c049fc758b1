#pragma once

#include <courier/Project.h>

#include <courier/Types.h>

#include <librdkafka/rdkafka.h>

#include <memory>


namespace COURIER_API {

// Deleters for the librdkafka handles
struct RkDeleter     { void operator()(rd_kafka_t* p)      { rd_kafka_destroy(p);      } };
struct RkConfDeleter { void operator()(rd_kafka_conf_t* p) { rd_kafka_conf_destroy(p); } };

using rd_kafka_unique_ptr      = std::unique_ptr<rd_kafka_t,      RkDeleter>;
using rd_kafka_conf_unique_ptr = std::unique_ptr<rd_kafka_conf_t, RkConfDeleter>;

/**
 * Never returns nullptr, since librdkafka takes a null pointer as a null key/value (with an empty buffer).
 */
inline const Bytes::value_type* nonNullData(const Bytes& bytes)
{
    static const Bytes::value_type EMPTY = 0;
    return bytes.empty() ? &EMPTY : bytes.data();
}

} // end of COURIER_API

