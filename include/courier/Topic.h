#pragma once

#include <courier/Project.h>

#include <courier/Types.h>

#include <string>


namespace COURIER_API {

/**
 * A destination stream, with the types of the keys and values it carries.
 *
 * Only the name is kept at runtime. The key/value types just pick the serializers at compile time.
 */
template <typename K, typename V>
class Topic
{
public:
    using KeyType   = K;
    using ValueType = V;

    explicit Topic(TopicName name): _name(std::move(name)) {}

    const TopicName& name() const { return _name; }

    bool operator==(const Topic& rhs) const { return _name == rhs._name; }

private:
    TopicName _name;
};

} // end of COURIER_API

