#pragma once

#include <courier/Project.h>

#include <courier/Log.h>
#include <courier/ProduceResult.h>

#include <atomic>
#include <future>


namespace COURIER_API { namespace clients { namespace producer {

/**
 * One-shot bridge from a delivery callback (fired from the broker client's thread) to a `std::future`.
 *
 * Only the first `resolve` takes effect, the later ones are dropped (with an error log).
 */
class DeliveryPromise
{
public:
    DeliveryPromise() = default;
    DeliveryPromise(const DeliveryPromise&) = delete;
    DeliveryPromise& operator=(const DeliveryPromise&) = delete;

    /**
     * Get the future (could only be called once).
     */
    std::future<ProduceResult> future() { return _promise.get_future(); }

    /**
     * Resolve with the result. Returns `false` if it has already been resolved.
     */
    bool resolve(ProduceResult result)
    {
        if (_resolved.exchange(true))
        {
            const auto dropped = result.toString();
            COURIER_API_LOG(Log::Level::Err, "delivery result already resolved, dropping [%s]", dropped.c_str());
            return false;
        }

        _promise.set_value(std::move(result));
        return true;
    }

    bool resolved() const { return _resolved.load(); }

private:
    std::promise<ProduceResult> _promise;
    std::atomic_bool            _resolved = {false};
};

} } } // end of COURIER_API::clients::producer

