#pragma once

#include <courier/Project.h>

#include <courier/Types.h>

#include <librdkafka/rdkafka.h>

#include <functional>
#include <sstream>
#include <string>
#include <system_error>


namespace COURIER_API {

struct ErrorCategory: public std::error_category
{
    const char* name() const noexcept override { return "BrokerError"; }
    std::string message(int ev) const override { return rd_kafka_err2str(static_cast<rd_kafka_resp_err_t>(ev)); }

    template <typename T = void>
    struct Global { static ErrorCategory category; };
};

template <typename T>
ErrorCategory ErrorCategory::Global<T>::category;


/**
 * Unified error type (for both the local errors and the ones reported by brokers).
 */
class Error
{
public:
    // The error with brief info
    explicit Error(rd_kafka_resp_err_t respErr = RD_KAFKA_RESP_ERR_NO_ERROR): _respErr(respErr) {}
    // The error with detailed message
    Error(rd_kafka_resp_err_t respErr, std::string message, bool fatal = false)
        : _respErr(respErr), _message(std::move(message)), _isFatal(fatal) {}

    /**
     * Check if the error is valid.
     */
    explicit operator bool() const { return static_cast<bool>(value()); }

    /**
     * Conversion to `std::error_code`
     */
    explicit operator std::error_code() const
    {
        return {value(), ErrorCategory::Global<>::category};
    }

    bool operator==(const Error& rhs) const
    {
        return _respErr == rhs._respErr && _message == rhs._message && _isFatal == rhs._isFatal;
    }
    bool operator!=(const Error& rhs) const { return !(*this == rhs); }

    /**
     * Obtains the underlying error code value.
     *
     * Actually, it's the same as 'rd_kafka_resp_err_t', which is defined by librdkafka.
     * 1. The negative values are for internal errors.
     * 2. Non-negative values are for errors reported by the brokers.
     */
    int             value()        const { return static_cast<int>(_respErr); }

    /**
     * Readable error string.
     */
    std::string     message()     const
    {
        return _message ? *_message : rd_kafka_err2str(_respErr);
    }

    /**
     * Detailed error string.
     */
    std::string     toString()     const
    {
        std::ostringstream oss;

        oss << rd_kafka_err2str(_respErr) << " [" << value() << "]" << (isFatal() ? " fatal" : "");
        if (_message) oss << " | " << *_message;

        return oss.str();
    }

    /**
     * Fatal error indicates that the client instance is no longer usable.
     */
    bool            isFatal()     const { return _isFatal; }

private:
    rd_kafka_resp_err_t   _respErr{};
    Optional<std::string> _message;     // Additional detailed message (if any)
    bool                  _isFatal = false;
};


namespace clients {

    /**
     * Callback type for error notification (from the broker client's internal threads).
     */
    using ErrorCallback = std::function<void(const Error&)>;

} // end of clients

} // end of COURIER_API

