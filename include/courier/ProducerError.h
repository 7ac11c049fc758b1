#pragma once

#include <courier/Project.h>

#include <courier/Error.h>
#include <courier/Serializer.h>
#include <courier/Utility.h>

#include <exception>
#include <string>
#include <variant>


namespace COURIER_API { namespace clients { namespace producer {

/**
 * The key or value could not be serialized (no network interaction was attempted).
 */
struct SerializationError
{
    std::exception_ptr cause;

    std::string message() const { return SerializationException::describe(cause); }
};

/**
 * The record was handed over to the broker client, which reported a failure.
 */
struct DispatchError
{
    Error error;

    std::string message() const { return error.toString(); }
};


/**
 * The failure of a `produce` call.
 */
class ProducerError
{
public:
    ProducerError(SerializationError e): _error(std::move(e)) {}  // NOLINT
    ProducerError(DispatchError e): _error(std::move(e)) {}       // NOLINT

    static ProducerError serialization(std::exception_ptr cause) { return SerializationError{std::move(cause)}; }
    static ProducerError dispatch(const Error& error)            { return DispatchError{error}; }

    bool isSerializationError() const { return std::holds_alternative<SerializationError>(_error); }
    bool isDispatchError()      const { return std::holds_alternative<DispatchError>(_error); }

    /**
     * Get the serialization failure.
     * Throws `std::bad_variant_access` if it's not one.
     */
    const SerializationError& serializationError() const { return std::get<SerializationError>(_error); }

    /**
     * Get the dispatch failure.
     * Throws `std::bad_variant_access` if it's not one.
     */
    const DispatchError&      dispatchError()      const { return std::get<DispatchError>(_error); }

    const std::variant<SerializationError, DispatchError>& variant() const { return _error; }

    /**
     * Obtains explanatory string.
     */
    std::string toString() const
    {
        return std::visit(utility::Overloaded{
                              [](const SerializationError& e) { return "SerializationError: " + e.message(); },
                              [](const DispatchError& e)      { return "DispatchError: " + e.message(); }
                          }, _error);
    }

private:
    std::variant<SerializationError, DispatchError> _error;
};

} } } // end of COURIER_API::clients::producer

