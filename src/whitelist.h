#pragma once

#include <set>
#include <string>

#include <boost/utility/string_view.hpp>

namespace rendergate {

/*
 * Glob patterns selecting the URLs that go through the proxy.
 *
 * A URL matches when any pattern matches either its host name alone
 * (`*.example.com`) or its host name followed by its path
 * (`example.com/path*`). Patterns use shell wildcards, where `*` also
 * spans `/`.
 *
 * The store only grows. `matches` does not synchronize with `update`:
 * a lookup may or may not see patterns added concurrently.
 */
class WhitelistStore {
public:
    WhitelistStore() = default;
    explicit WhitelistStore(std::set<std::string> patterns);

    void update(const std::set<std::string>& patterns);

    bool matches(boost::string_view url) const;

    const std::set<std::string>& patterns() const { return _patterns; }

    size_t size() const { return _patterns.size(); }

private:
    std::set<std::string> _patterns;
};

// Shell-style wildcard match of the whole `subject`.
bool glob_match(const std::string& pattern, const std::string& subject);

} // rendergate namespace
