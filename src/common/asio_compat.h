// Boost.Asio / standalone Asio selection.
// With ASIO_STANDALONE defined the standalone headers are used and aliased into
// boost::asio so the rest of the code base spells everything one way.
#pragma once

#ifdef ASIO_STANDALONE
    #include <asio.hpp>
    #include <asio/steady_timer.hpp>
    #include <asio/signal_set.hpp>
    #include <asio/ip/udp.hpp>
    #include <asio/ip/multicast.hpp>
    #include <asio/ip/address_v4.hpp>

    namespace boost {
        namespace asio = ::asio;
        namespace system {
            using ::asio::error_code;
            using ::asio::system_error;
            using ::asio::system_category;
        }
    }
#else
    #include <boost/asio.hpp>
    #include <boost/asio/steady_timer.hpp>
    #include <boost/asio/signal_set.hpp>
    #include <boost/asio/ip/udp.hpp>
    #include <boost/asio/ip/multicast.hpp>
    #include <boost/asio/ip/address_v4.hpp>
#endif
