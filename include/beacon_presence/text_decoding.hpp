// === Text Decoding ===========================================================
//
// Older receiver firmware wrote non-ASCII names as literal "\uXXXX" escape
// sequences that survived JSON encoding as plain text. These helpers turn
// such sequences back into UTF-8, either in a single string or uniformly over
// every string inside a JSON value.

#pragma once

#include <string>
#include <string_view>

#include <json/json.h>

namespace beacon_presence {

/** @brief Replace literal \uXXXX sequences in @p text by their UTF-8 encoding. */
[[nodiscard]] std::string decode_unicode_escapes(std::string_view text);

/** @brief Copy of @p value with every string (keys excluded) decoded. */
[[nodiscard]] Json::Value decode_text_fields(const Json::Value& value);

}  // namespace beacon_presence
