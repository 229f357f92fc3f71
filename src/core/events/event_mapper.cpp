#include <amzstream/core/events/event_mapper.hpp>

namespace AmzStream {

AppEvent toEvent(const Frame& frame) {
    if (frame.nested)
        return toEvent(*frame.nested);

    AppEvent event;
    if (const std::string* type = frame.header(kEventTypeHeader))
        event.type = *type;

    if (!frame.payload || frame.payload->empty())
        return event;  // data stays null

    std::string text(frame.payload->begin(), frame.payload->end());

    // allow_exceptions=false yields a discarded value instead of throwing
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded())
        event.data = std::move(text);
    else
        event.data = std::move(parsed);

    return event;
}

std::string toJsonLine(const AppEvent& event) {
    nlohmann::json line = {
        {"type", event.type},
        {"data", event.data}
    };
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace AmzStream
