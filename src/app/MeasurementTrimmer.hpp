#pragma once

#include <cstddef>

#include <boost/json/value.hpp>

namespace app {

// Removes, at any depth, every object member whose value is a string longer
// than maxStringSize bytes. Strings inside arrays are kept. Returns the
// number of members removed.
std::size_t trimMeasurement(boost::json::value& measurement, std::size_t maxStringSize);

}  // namespace app
