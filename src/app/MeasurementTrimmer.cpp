#include "app/MeasurementTrimmer.hpp"

#include <utility>

#include <boost/json.hpp>

namespace app {

namespace {

bool tooLong(const boost::json::value& value, std::size_t maxStringSize) {
    const auto* text = value.if_string();
    return text && text->size() > maxStringSize;
}

}  // namespace

std::size_t trimMeasurement(boost::json::value& measurement, std::size_t maxStringSize) {
    std::size_t removed = 0;
    if (auto* object = measurement.if_object()) {
        std::size_t dropped = 0;
        for (auto& member : *object) {
            if (tooLong(member.value(), maxStringSize)) {
                ++dropped;
                continue;
            }
            removed += trimMeasurement(member.value(), maxStringSize);
        }
        if (dropped > 0) {
            // object::erase swaps the last member into the hole; rebuild to keep member order.
            boost::json::object kept(object->storage());
            kept.reserve(object->size() - dropped);
            for (auto& member : *object) {
                if (!tooLong(member.value(), maxStringSize)) {
                    kept.emplace(member.key(), std::move(member.value()));
                }
            }
            *object = std::move(kept);
        }
        removed += dropped;
    } else if (auto* array = measurement.if_array()) {
        for (auto& element : *array) {
            removed += trimMeasurement(element, maxStringSize);
        }
    }
    return removed;
}

}  // namespace app
