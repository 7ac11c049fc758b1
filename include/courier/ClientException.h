#pragma once

#include <courier/Project.h>

#include <courier/Error.h>
#include <courier/Utility.h>

#include <chrono>
#include <exception>
#include <memory>
#include <string>


namespace COURIER_API {

/**
 * Specific exception for the broker clients (e.g. failed to set up a client, or failed to enqueue a record).
 */
class ClientException: public std::exception
{
public:
    ClientException(const char* filename, std::size_t lineno, const Error& error)
        : _when(std::chrono::system_clock::now()),
          _filename(filename),
          _lineno(lineno),
          _error(std::make_shared<Error>(error))
    {}

    /**
     * Obtains the underlying error.
     */
    const Error& error() const { return *_error; }

    /**
     * Obtains explanatory string.
     */
    const char* what() const noexcept override
    {
        _what = utility::getLocalTimeString(_when) + ": " + _error->toString() + " (" + _filename + ":" + std::to_string(_lineno) + ")";
        return _what.c_str();
    }

private:
    using TimePoint = std::chrono::system_clock::time_point;

    const   TimePoint               _when;
    const   std::string             _filename;
    const   std::size_t             _lineno;
    const   std::shared_ptr<Error>  _error;
    mutable std::string             _what;
};


#define COURIER_THROW_ERROR(error)          throw COURIER_API::ClientException(__FILE__, __LINE__, error)
#define COURIER_THROW_IF_WITH_ERROR(error)  if (error) COURIER_THROW_ERROR(error)

} // end of COURIER_API

