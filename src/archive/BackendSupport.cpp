#include "archive/BackendSupport.hpp"

#include <boost/json.hpp>

#include "domain/Errors.hpp"

namespace archive {

boost::json::value parseRecord(std::string_view text, const std::string& context) {
    boost::json::error_code ec;
    auto value = boost::json::parse(boost::json::string_view{text.data(), text.size()}, ec);
    if (ec) {
        throw domain::DecodeError(context + ": measurement is not valid JSON (" + ec.message() + ")", 1);
    }
    return value;
}

std::string_view lastComponent(std::string_view prefix) {
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.remove_suffix(1);
    }
    const auto slash = prefix.rfind('/');
    return slash == std::string_view::npos ? prefix : prefix.substr(slash + 1);
}

std::string_view parentComponent(std::string_view key) {
    const auto slash = key.rfind('/');
    if (slash == std::string_view::npos) {
        return {};
    }
    return lastComponent(key.substr(0, slash));
}

bool endsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace archive
