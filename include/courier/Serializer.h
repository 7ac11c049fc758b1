#pragma once

#include <courier/Project.h>

#include <courier/Types.h>

#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>


namespace COURIER_API {

/**
 * Converts a typed value into wire bytes, for a given topic.
 * It reports a failure by throwing (any exception).
 */
template <typename T>
using Serializer = std::function<Bytes(const TopicName& topic, const T& value)>;


/**
 * The exception to show that a key/value could not be serialized.
 */
class SerializationException: public std::exception
{
public:
    SerializationException(std::string topic, std::exception_ptr cause)
        : _cause(std::move(cause))
    {
        _what = "Failed to serialize record for topic[" + topic + "]: " + describe(_cause);
    }

    /**
     * The exception thrown by the serializer.
     */
    const std::exception_ptr& cause() const { return _cause; }

    const char* what() const noexcept override { return _what.c_str(); }

    /**
     * Readable string for a caught exception.
     */
    static std::string describe(const std::exception_ptr& cause)
    {
        if (!cause) return "unknown cause";

        try
        {
            std::rethrow_exception(cause);
        }
        catch (const std::exception& e)
        {
            return e.what();
        }
        catch (...)
        {
            return "non-standard exception";
        }
    }

private:
    std::exception_ptr _cause;
    std::string        _what;
};


/**
 * Run a serializer. Whatever it throws would be wrapped within a `SerializationException`.
 */
template <typename T>
Bytes serialize(const Serializer<T>& serializer, const TopicName& topic, const T& value)
{
    try
    {
        return serializer(topic, value);
    }
    catch (...)
    {
        throw SerializationException(topic, std::current_exception());
    }
}


/**
 * Serializer for strings (the raw characters, no terminator).
 */
inline Serializer<std::string> stringSerializer()
{
    return [](const TopicName& /*topic*/, const std::string& value) { return Bytes(value.cbegin(), value.cend()); };
}

/**
 * Serializer for bytes (as they are).
 */
inline Serializer<Bytes> bytesSerializer()
{
    return [](const TopicName& /*topic*/, const Bytes& value) { return value; };
}

namespace detail {

template <typename T>
Bytes toBigEndian(T value)
{
    using Unsigned = std::make_unsigned_t<T>;
    auto u = static_cast<Unsigned>(value);

    Bytes bytes(sizeof(T));
    for (std::size_t i = 0; i < sizeof(T); ++i)
    {
        bytes[sizeof(T) - 1 - i] = static_cast<std::uint8_t>(u & 0xFFU);
        u = static_cast<Unsigned>(u >> 8U);
    }
    return bytes;
}

} // end of detail

/**
 * Serializer for 32-bit integers (4 bytes, big-endian).
 */
inline Serializer<std::int32_t> int32Serializer()
{
    return [](const TopicName& /*topic*/, const std::int32_t& value) { return detail::toBigEndian(value); };
}

/**
 * Serializer for 64-bit integers (8 bytes, big-endian).
 */
inline Serializer<std::int64_t> int64Serializer()
{
    return [](const TopicName& /*topic*/, const std::int64_t& value) { return detail::toBigEndian(value); };
}

/**
 * Adapt a serializer for `A` into one for `B`, with a conversion applied first.
 */
template <typename A, typename B>
Serializer<B> contramap(Serializer<A> serializer, std::function<A(const B&)> convert)
{
    return [serializer = std::move(serializer), convert = std::move(convert)](const TopicName& topic, const B& value) {
        return serializer(topic, convert(value));
    };
}

} // end of COURIER_API

