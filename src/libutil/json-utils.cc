#include "arbor/util/json-utils.hh"

namespace arbor {

using nlohmann::json;

const json * optionalValueAt(const json::object_t & map, std::string_view key)
{
    auto i = map.find(std::string(key));
    return i == map.end() ? nullptr : &i->second;
}

const json & valueAt(const json::object_t & map, std::string_view key)
{
    auto value = optionalValueAt(map, key);
    if (!value)
        throw Error("JSON object %s has no member '%s'", json(map).dump(), key);
    return *value;
}

template<typename T>
static const T & expect(const json & value, json::value_t type, std::string_view description)
{
    if (value.type() != type)
        throw Error("expected %s in JSON but got %s: %s", description, value.type_name(), value.dump());
    return value.get_ref<const T &>();
}

const json::object_t & getObject(const json & value)
{
    return expect<json::object_t>(value, json::value_t::object, "an object");
}

const json::array_t & getArray(const json & value)
{
    return expect<json::array_t>(value, json::value_t::array, "an array");
}

const json::string_t & getString(const json & value)
{
    return expect<json::string_t>(value, json::value_t::string, "a string");
}

const json::boolean_t & getBoolean(const json & value)
{
    return expect<json::boolean_t>(value, json::value_t::boolean, "a boolean");
}

const json::number_unsigned_t & getUnsigned(const json & value)
{
    /* nlohmann parses non-negative integers as unsigned, so a signed
       integer here is always negative. */
    return expect<json::number_unsigned_t>(value, json::value_t::number_unsigned, "a non-negative integer");
}

StringSet getStringSet(const json & value)
{
    StringSet res;
    for (auto & elem : getArray(value))
        res.insert(getString(elem));
    return res;
}

std::string canonicalJSON(const json & value)
{
    /* Objects are std::maps, so keys come out sorted. */
    return value.dump(-1, ' ', true, json::error_handler_t::strict);
}

} // namespace arbor
