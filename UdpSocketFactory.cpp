#include <stdexcept>

#include "UdpSocketFactory.hpp"

#if defined LINUX || defined MACOS
#include "PosixUdpSocket.hpp"
#endif

//=============================================================================================
UdpSocket* UdpSocketFactory::createUdpSocket()
{
#if defined LINUX || defined MACOS
    return new PosixUdpSocket();
#else
    throw std::runtime_error("No UdpSocket available for this platform");
#endif
}
