#pragma once

#include <string>
#include <type_traits>

#include <boost/system/error_code.hpp>

namespace rendergate { namespace error {
    enum error_t {
        // 0 means success
        navigation_timeout = 1,
        transient_fetch_error,
        provisioning_failure,
        cleanup_error,
        not_ready,
        cdp_protocol_error,
        browser_exited,
    };

    struct rendergate_category : public boost::system::error_category {
        const char* name() const noexcept override {
            return "rendergate_errors";
        }

        std::string message(int e) const override {
            switch (e) {
                case navigation_timeout:
                    return "navigation or selector wait timed out";
                case transient_fetch_error:
                    return "page could not be loaded";
                case provisioning_failure:
                    return "browser provisioning failed";
                case cleanup_error:
                    return "failed to close browser resource";
                case not_ready:
                    return "session is not ready";
                case cdp_protocol_error:
                    return "devtools protocol error";
                case browser_exited:
                    return "browser process exited";
                default:
                    return "unknown rendergate error";
            }
        }
    };

    inline
    const boost::system::error_category& category() {
        static rendergate_category c;
        return c;
    }

    inline
    boost::system::error_code
    make_error_code(::rendergate::error::error_t e) {
        return boost::system::error_code(static_cast<int>(e), category());
    }
}} // rendergate::error namespace

namespace boost { namespace system {
    template<>
    struct is_error_code_enum<::rendergate::error::error_t>
        : public std::true_type {};
}} // boost::system namespace
