#pragma once

#include <courier/Project.h>

#include <courier/ProducerError.h>
#include <courier/RecordMetadata.h>

#include <string>
#include <variant>


namespace COURIER_API { namespace clients { namespace producer {

/**
 * The outcome of a `produce` call: either the metadata acknowledged by the broker, or a `ProducerError`.
 */
class ProduceResult
{
public:
    explicit ProduceResult(RecordMetadata metadata): _result(std::move(metadata)) {}
    explicit ProduceResult(ProducerError error):     _result(std::move(error))    {}

    /**
     * Show whether the record has been acknowledged.
     */
    explicit operator bool() const { return ok(); }

    bool ok() const { return std::holds_alternative<RecordMetadata>(_result); }

    /**
     * Get the metadata.
     * Throws `std::bad_variant_access` if it failed.
     */
    const RecordMetadata& metadata() const { return std::get<RecordMetadata>(_result); }

    /**
     * Get the error.
     * Throws `std::bad_variant_access` if it succeeded.
     */
    const ProducerError&  error()    const { return std::get<ProducerError>(_result); }

    /**
     * Obtains explanatory string.
     */
    std::string toString() const
    {
        return ok() ? metadata().toString() : error().toString();
    }

private:
    std::variant<RecordMetadata, ProducerError> _result;
};

} } } // end of COURIER_API::clients::producer

