#pragma once

#include <courier/Project.h>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>


namespace COURIER_API {

template <class T>
using Optional = std::optional<T>;

/**
 * Topic name.
 */
using TopicName = std::string;

/**
 * Partition number.
 */
using Partition = std::int32_t;

/**
 * Record offset.
 */
using Offset    = std::int64_t;

/**
 * Serialized (wire) bytes, owned.
 */
using Bytes     = std::vector<std::uint8_t>;

const inline std::chrono::milliseconds InfiniteTimeout = (std::chrono::milliseconds::max)();

/**
 * Obtains explanatory string for bytes (non-printable characters are shown as hex).
 */
inline std::string toString(const Bytes& bytes)
{
    if (bytes.empty()) return "[]";

    std::ostringstream oss;
    for (const auto byte: bytes)
    {
        if (std::isprint(static_cast<int>(byte)))
        {
            oss << static_cast<char>(byte);
        }
        else
        {
            oss << "[0x" << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte) << "]" << std::dec;
        }
    }
    return oss.str();
}

/**
 * Message Header (with a key value pair).
 */
struct Header
{
    using Key   = std::string;
    using Value = Bytes;

    Header() = default;
    Header(Key k, Value v): key(std::move(k)), value(std::move(v)) {}

    bool operator==(const Header& rhs) const { return key == rhs.key && value == rhs.value; }

    /**
     * Obtains explanatory string.
     */
    std::string toString() const
    {
        return (key.empty() ? "[null]" : key) + ":" + COURIER_API::toString(value);
    }

    Key   key;
    Value value;
};

/**
 * Message Headers (the insertion order is kept).
 */
using Headers = std::vector<Header>;

/**
 * Obtains explanatory string for Headers.
 */
inline std::string toString(const Headers& headers)
{
    std::string ret;
    for (const auto& header: headers)
    {
        ret.append(ret.empty() ? "" : ",").append(header.toString());
    }
    return ret;
}

} // end of COURIER_API

