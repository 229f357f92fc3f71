#pragma once

#include <amzstream/core/codec/frame.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace AmzStream {

/**
 * @brief Application-level view of one frame
 *
 * `type` comes from the :event-type header (empty when missing or not a
 * string). `data` is null for an absent or empty payload, the parsed JSON
 * value when the payload is valid JSON, and otherwise the payload text.
 */
struct AppEvent {
    std::string type;
    nlohmann::json data;
};

/**
 * @brief Map a decoded frame to an application event
 *
 * Never throws for a well-formed Frame. A frame still wrapping a nested
 * frame is mapped through the nested frame.
 */
AppEvent toEvent(const Frame& frame);

/**
 * @brief Render {"type":..,"data":..} on one line
 *
 * Invalid UTF-8 in payload text is replaced rather than rejected.
 */
std::string toJsonLine(const AppEvent& event);

} // namespace AmzStream
