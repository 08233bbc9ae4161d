#include "engine.h"

#include <iterator>
#include <ostream>

namespace rendergate {

static const char* wait_until_names[] = {
    "commit", "domcontentloaded", "load", "networkidle"
};

static const char* resource_type_names[] = {
    "document", "stylesheet", "image", "media", "font", "script", "texttrack",
    "xhr", "fetch", "eventsource", "websocket", "manifest", "other"
};

boost::optional<WaitUntil> parse_wait_until(boost::string_view s)
{
    for (size_t i = 0; i < std::size(wait_until_names); ++i) {
        if (s == wait_until_names[i]) return WaitUntil(i);
    }
    return boost::none;
}

boost::optional<ResourceType> parse_resource_type(boost::string_view s)
{
    for (size_t i = 0; i < std::size(resource_type_names); ++i) {
        if (s == resource_type_names[i]) return ResourceType(i);
    }
    return boost::none;
}

std::ostream& operator<<(std::ostream& os, WaitUntil w)
{
    return os << wait_until_names[static_cast<size_t>(w)];
}

std::ostream& operator<<(std::ostream& os, ResourceType t)
{
    return os << resource_type_names[static_cast<size_t>(t)];
}

} // rendergate namespace
