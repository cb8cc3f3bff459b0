#pragma once
/**
 * @file json_text.h
 * @brief Minimal JSON text helpers for the wire protocol
 *
 * Values are handled as raw JSON text. Lookups are scope-aware: only members
 * of the outermost object are matched, so a key nested inside a child object
 * never shadows a top-level one.
 */

#include "nightfall/core/types.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nightfall::net::json {

/**
 * @brief Members of a JSON object as (key, raw value) pairs in document order
 * @return std::nullopt if the text is not a well-formed object
 */
std::optional<std::vector<std::pair<std::string, std::string>>>
object_members(const std::string& object_text);

/**
 * @brief Elements of a JSON array as raw values
 * @return std::nullopt if the text is not a well-formed array
 */
std::optional<std::vector<std::string>> array_elements(const std::string& array_text);

/**
 * @brief Raw value of a top-level member
 */
std::optional<std::string> find_raw(const std::string& object_text, const std::string& key);

std::string find_string(const std::string& object_text, const std::string& key,
                        const std::string& fallback = "");
Int64 find_int(const std::string& object_text, const std::string& key, Int64 fallback = 0);
bool find_bool(const std::string& object_text, const std::string& key, bool fallback = false);

/**
 * @brief Decode a raw JSON string token (with quotes) into its text
 *
 * Non-string tokens are returned unchanged, so numbers and literals can be
 * read with the same call.
 */
std::string unquote(const std::string& raw);

/**
 * @brief Encode text as a quoted JSON string token
 */
std::string quote(const std::string& text);

bool is_string_token(const std::string& raw);

/**
 * @brief Read an integer from a raw number or numeric string token
 */
Int64 to_int(const std::string& raw, Int64 fallback = 0);

/**
 * @brief Incremental writer for a JSON object
 */
class ObjectBuilder {
public:
    ObjectBuilder& add(const std::string& key, const std::string& value);
    ObjectBuilder& add(const std::string& key, const char* value);
    ObjectBuilder& add_int(const std::string& key, Int64 value);
    ObjectBuilder& add_bool(const std::string& key, bool value);
    ObjectBuilder& add_raw(const std::string& key, const std::string& raw_value);

    std::string str() const;

private:
    std::string body_;
};

/**
 * @brief Join raw values into a JSON array
 */
std::string make_array(const std::vector<std::string>& raw_values);

} // namespace nightfall::net::json
