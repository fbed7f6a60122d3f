#pragma once
/**
 * @file
 *
 * Checked access to parsed JSON. Each accessor throws `Error` naming
 * the expected and actual types instead of letting nlohmann's
 * `type_error` escape.
 */

#include <nlohmann/json.hpp>

#include "arbor/util/types.hh"
#include "arbor/util/error.hh"

namespace arbor {

/**
 * @throws Error if `map` has no member `key`.
 */
const nlohmann::json & valueAt(const nlohmann::json::object_t & map, std::string_view key);

/**
 * @return nullptr if `map` has no member `key`.
 */
const nlohmann::json * optionalValueAt(const nlohmann::json::object_t & map, std::string_view key);

const nlohmann::json::object_t & getObject(const nlohmann::json & value);
const nlohmann::json::array_t & getArray(const nlohmann::json & value);
const nlohmann::json::string_t & getString(const nlohmann::json & value);
const nlohmann::json::boolean_t & getBoolean(const nlohmann::json & value);

/**
 * Negative and fractional numbers are rejected.
 */
const nlohmann::json::number_unsigned_t & getUnsigned(const nlohmann::json & value);

/**
 * An array of strings, duplicates removed.
 */
StringSet getStringSet(const nlohmann::json & value);

/**
 * Serialise `value` the same way every time: keys sorted, no
 * whitespace, non-ASCII escaped. Everything that is hashed goes
 * through this.
 */
std::string canonicalJSON(const nlohmann::json & value);

} // namespace arbor
