#include "whitelist.h"

#include <fnmatch.h>

#include "logger.h"
#include "util/url.h"

namespace rendergate {

bool glob_match(const std::string& pattern, const std::string& subject)
{
    return ::fnmatch(pattern.c_str(), subject.c_str(), 0) == 0;
}

WhitelistStore::WhitelistStore(std::set<std::string> patterns)
    : _patterns(std::move(patterns))
{}

void WhitelistStore::update(const std::set<std::string>& patterns)
{
    _patterns.insert(patterns.begin(), patterns.end());
}

bool WhitelistStore::matches(boost::string_view url_s) const
{
    auto url = util::Url::from(url_s);

    if (!url) {
        LOG_DEBUG("[Whitelist] URL: ", url_s, " is not a web URL, no match");
        return false;
    }

    const std::string& host = url->host;
    const std::string target = host + url->path;

    bool match = false;

    for (const auto& pattern : _patterns) {
        if (glob_match(pattern, host) || glob_match(pattern, target)) {
            match = true;
            break;
        }
    }

    LOG_DEBUG("[Whitelist] URL: ", url_s, " -> Host: ", host, ", Match: ", match);
    return match;
}

} // rendergate namespace
