#pragma once

namespace boost {
    namespace asio  {}
    namespace beast { namespace http {} namespace websocket {} }
    namespace system {};
    namespace filesystem {};
}

namespace rendergate {

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace asio      = boost::asio;
namespace sys       = boost::system;
namespace fs        = boost::filesystem;

} // rendergate namespace
