#include "url.h"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/regex.hpp>

namespace rendergate::util {

std::string Url::target() const {
    std::string t = path.empty() ? "/" : path;
    if (!query.empty()) t += '?' + query;
    return t;
}

std::string Url::port_or_default() const {
    if (!port.empty()) return port;
    if (scheme == "https" || scheme == "wss") return "443";
    return "80";
}

std::optional<Url> Url::from(const boost::string_view url_s) {
    static const boost::regex urlrx( "^(https?|wss?)://"  // 1: scheme
                                     "(?:[^@/?#]*@)?"  // userinfo (dropped)
                                     "([-\\.a-z0-9_]+|\\[[:0-9a-f]+\\])"  // 2: host
                                     "(:[0-9]{1,5})?"  // 3: :port (or empty)
                                     "(/[^?#]*)?"  // 4: /path
                                     "(\\?[^#]*)?"  // 5: ?query (or empty)
                                     "(#.*)?"  // 6: #fragment (or empty)
                                   , boost::regex::normal | boost::regex::icase);
    boost::cmatch m;

    if (!boost::regex_match(url_s.begin(), url_s.end(), m, urlrx)) {
        return {};
    }

    return Url {
        boost::algorithm::to_lower_copy(std::string(m[1])),
        m[2],
        m[3].length() > 0 ? std::string(m[3], 1) : "",  // drop colon
        m[4],
        m[5].length() > 0 ? std::string(m[5], 1) : "", // drop qmark
        m[6].length() > 0 ? std::string(m[6], 1) : "", // drop hash
    };
}

} // namespace rendergate::util
