#pragma once

#include <courier/Project.h>

#include <courier/ClientException.h>
#include <courier/Error.h>
#include <courier/Log.h>
#include <courier/Types.h>
#include <courier/Utility.h>

#include <algorithm>
#include <map>
#include <regex>
#include <stdexcept>
#include <string>
#include <variant>


namespace COURIER_API {

/**
 * The properties for broker clients.
 * Most values are strings (passed through to librdkafka), while `log_cb` and `error_cb` hold callbacks.
 */
class Properties
{
public:
    using LogCallback   = clients::LogCallback;
    using ErrorCallback = clients::ErrorCallback;

    /**
     * A property value, which is either a string, or a callback bound to its own key.
     */
    class Value
    {
    public:
        Value() = default;
        Value(std::string str):    _value(std::move(str)) {}            // NOLINT
        Value(const char* str):    _value(std::string(str)) {}          // NOLINT
        Value(LogCallback cb):     _value(std::move(cb)) {}             // NOLINT
        Value(ErrorCallback cb):   _value(std::move(cb)) {}             // NOLINT

        /**
         * Throws `std::runtime_error` if the value could not be used for the key.
         */
        const Value& validateFor(const std::string& key) const
        {
            const bool matched = std::visit(utility::Overloaded {
                                                [&key](const std::string&)   { return key != LOG_CB_KEY && key != ERROR_CB_KEY; },
                                                [&key](const LogCallback&)   { return key == LOG_CB_KEY; },
                                                [&key](const ErrorCallback&) { return key == ERROR_CB_KEY; }
                                            },
                                            _value);
            if (!matched)
            {
                throw std::runtime_error("Invalid key/value for configuration: " + key);
            }
            return *this;
        }

        template <typename T>
        const T* getIf() const { return std::get_if<T>(&_value); }

        std::string toString() const
        {
            return std::visit(utility::Overloaded {
                                  [](const std::string& str) { return str; },
                                  [](const LogCallback&)     { return std::string("[log callback]"); },
                                  [](const ErrorCallback&)   { return std::string("[error callback]"); }
                              },
                              _value);
        }

        // Callbacks are compared by kind only
        bool operator==(const Value& rhs) const { return toString() == rhs.toString(); }

    private:
        static const constexpr char* LOG_CB_KEY   = "log_cb";
        static const constexpr char* ERROR_CB_KEY = "error_cb";

        std::variant<std::string, LogCallback, ErrorCallback> _value;
    };

    // Keys are printed in order
    using PropertiesMap = std::map<std::string, Value>;

    Properties() = default;
    Properties(PropertiesMap kvMap): _kvMap(std::move(kvMap))   // NOLINT
    {
        for (const auto& kv: _kvMap) kv.second.validateFor(kv.first);
    }
    virtual ~Properties() = default;

    bool operator==(const Properties& rhs) const { return map() == rhs.map(); }

    /**
     * Set a property, replacing the old value (if any).
     */
    template <class T>
    Properties& put(const std::string& key, const T& value)
    {
        Value v(value);
        _kvMap[key] = v.validateFor(key);
        return *this;
    }

    /**
     * Merge all properties from another one (the ones from `other` win).
     */
    Properties& putAll(const Properties& other)
    {
        for (const auto& kv: other.map()) _kvMap[kv.first] = kv.second;
        return *this;
    }

    bool contains(const std::string& key) const { return _kvMap.count(key) > 0; }

    /**
     * Get a property value of the type `T`.
     * Throws `ClientException` (RD_KAFKA_RESP_ERR__INVALID_ARG) if it doesn't exist, or is not a `T`.
     */
    template <class T>
    const T& get(const std::string& key) const
    {
        const auto found = _kvMap.find(key);
        const T* value = (found != _kvMap.end()) ? found->second.template getIf<T>() : nullptr;
        if (!value)
        {
            COURIER_THROW_ERROR(Error(RD_KAFKA_RESP_ERR__INVALID_ARG, "Failed to get \"" + key + "\" from Properties!"));
        }
        return *value;
    }

    /**
     * Get a string property. Empty if it doesn't exist, or it's a callback.
     */
    Optional<std::string> getProperty(const std::string& key) const
    {
        const auto found = _kvMap.find(key);
        if (found == _kvMap.end()) return {};

        const auto* str = found->second.getIf<std::string>();
        return str ? Optional<std::string>{*str} : Optional<std::string>{};
    }

    void eraseProperty(const std::string& key) { _kvMap.erase(key); }

    /**
     * E.g, "bootstrap.servers=b1:9092|sasl.password=*". Values of credential-like keys are masked.
     */
    std::string toString() const
    {
        static const std::regex reSensitiveKey(R"(.+\.password|.+\.username|.+secret|.+key|.+pem)");

        std::string ret;
        for (const auto& kv: _kvMap)
        {
            const bool isSensitive = std::regex_match(kv.first, reSensitiveKey);
            ret.append(ret.empty() ? "" : "|").append(kv.first).append("=").append(isSensitive ? "*" : kv.second.toString());
        }
        return ret;
    }

    const PropertiesMap& map() const { return _kvMap; }

private:
    PropertiesMap _kvMap;
};

} // end of COURIER_API

