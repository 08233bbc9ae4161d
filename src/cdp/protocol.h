#pragma once

#include <string>

#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>
#include <nlohmann/json.hpp>

#include "../engine.h"

namespace rendergate { namespace cdp {

using Json = nlohmann::json;

// Maps the DevTools `Network.ResourceType` names ("Image", "XHR", ...)
// onto ours; anything we do not know is `other`.
ResourceType resource_type_from_protocol(boost::string_view);

// Name of the `Page.lifecycleEvent` completing a navigation, none for
// `WaitUntil::commit` which completes with the `Page.navigate` reply.
boost::optional<std::string> lifecycle_event_name(WaitUntil);

// Script returning the doctype and the serialized document element.
const std::string& content_expression();

// Script returning whether `selector` matches a visible element.
std::string selector_visible_expression(const std::string& selector);

// Member lookups that never throw.
const Json* member(const Json&, const char* key);
boost::optional<std::string> string_member(const Json&, const char* key);

}} // rendergate::cdp namespace
