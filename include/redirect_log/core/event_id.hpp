#ifndef REDIRECT_LOG_EVENT_ID_HPP
#define REDIRECT_LOG_EVENT_ID_HPP

#include <string>
#include <utility>

namespace relog {
    struct EventId {
        EventId(int eventId = 0, std::string eventName = std::string())
            : id(eventId), name(std::move(eventName)) {}

        int id;
        std::string name;
    };
} // namespace relog

#endif // REDIRECT_LOG_EVENT_ID_HPP
