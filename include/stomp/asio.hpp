#ifndef STOMP_ASIO_HPP
#define STOMP_ASIO_HPP

// Networking backend switch.
// Define STOMP_USE_BOOST_ASIO to build against Boost.Asio; standalone asio otherwise.
// Either way the library code refers to the `asio` namespace.

#if defined(STOMP_USE_BOOST_ASIO)
#include <utility> // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
namespace asio = boost::asio;
namespace stomp {
using AsioErrorCode = boost::system::error_code;
} // namespace stomp
#else
#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif
#include <asio.hpp>
namespace stomp {
using AsioErrorCode = asio::error_code;
} // namespace stomp
#endif

#endif // STOMP_ASIO_HPP
