#pragma once

#include <string>
#include <string_view>

#include <boost/json/value.hpp>

namespace archive {

// Parses one serialized measurement. Throws domain::DecodeError naming
// context when the bytes are not a JSON document.
boost::json::value parseRecord(std::string_view text, const std::string& context);

// Last component of a listing prefix: "raw/20210526/" -> "20210526".
std::string_view lastComponent(std::string_view prefix);

// Directory holding a key: "raw/20210526/00/VE/webconnectivity/x.jsonl.gz" -> "webconnectivity".
std::string_view parentComponent(std::string_view key);

bool endsWith(std::string_view text, std::string_view suffix);

}  // namespace archive
