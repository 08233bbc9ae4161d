#include "protocol.h"

#include <boost/algorithm/string/case_conv.hpp>

namespace rendergate { namespace cdp {

ResourceType resource_type_from_protocol(boost::string_view name)
{
    auto lower = boost::algorithm::to_lower_copy(name.to_string());
    auto type = parse_resource_type(lower);
    return type ? *type : ResourceType::other;
}

boost::optional<std::string> lifecycle_event_name(WaitUntil w)
{
    switch (w) {
        case WaitUntil::commit:           return boost::none;
        case WaitUntil::domcontentloaded: return std::string("DOMContentLoaded");
        case WaitUntil::load:             return std::string("load");
        case WaitUntil::networkidle:      return std::string("networkIdle");
    }
    return std::string("load");
}

const std::string& content_expression()
{
    static const std::string expr =
        "(() => {"
        "  let html = '';"
        "  if (document.doctype)"
        "    html = new XMLSerializer().serializeToString(document.doctype);"
        "  if (document.documentElement)"
        "    html += document.documentElement.outerHTML;"
        "  return html;"
        "})()";
    return expr;
}

std::string selector_visible_expression(const std::string& selector)
{
    // `dump` gives a properly quoted and escaped JS string literal.
    return "(() => {"
           "  const e = document.querySelector(" + Json(selector).dump() + ");"
           "  if (!e) return false;"
           "  const s = window.getComputedStyle(e);"
           "  if (s.visibility === 'hidden') return false;"
           "  const r = e.getBoundingClientRect();"
           "  return r.width > 0 && r.height > 0;"
           "})()";
}

const Json* member(const Json& j, const char* key)
{
    if (!j.is_object()) return nullptr;
    auto i = j.find(key);
    if (i == j.end()) return nullptr;
    return &*i;
}

boost::optional<std::string> string_member(const Json& j, const char* key)
{
    auto m = member(j, key);
    if (!m || !m->is_string()) return boost::none;
    return m->get<std::string>();
}

}} // rendergate::cdp namespace
