#pragma once

#include <sstream>
#include <string>

#include <boost/system/error_code.hpp>

namespace rendergate { namespace util {

// Error codes print as their quoted message.
inline
void arg_to_stream(std::ostream& s, const boost::system::error_code& ec) {
    s << '"' << ec.message() << '"';
}

// This allows overriding the format of a given type
// without having to override `operator<<`.
template<class Arg>
inline
void arg_to_stream(std::ostream& s, Arg&& arg) {
    s << arg;
}

inline
void args_to_stream(std::ostream&) { }

template<class Arg, class... Args>
inline
void args_to_stream(std::ostream& s, Arg&& arg, Args&&... args) {
    arg_to_stream(s, std::forward<Arg>(arg));
    args_to_stream(s, std::forward<Args>(args)...);
}

template<class... Args>
inline
std::string str(Args&&... args) {
    std::ostringstream ss;
    args_to_stream(ss, std::forward<Args>(args)...);
    return ss.str();
}

}} // namespaces
