#include <arpa/inet.h>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <netinet/in.h>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "PosixUdpSocket.hpp"

//=============================================================================================
PosixUdpSocket::PosixUdpSocket() :
    socket_fd(-1)
{
}

//=============================================================================================
PosixUdpSocket::~PosixUdpSocket()
{
    close();
}

//=============================================================================================
bool PosixUdpSocket::open(std::string& error)
{
    if (socket_fd != -1)
    {
        return true;
    }

    socket_fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_fd == -1)
    {
        error = describeErrno("Could not create UDP socket");
        return false;
    }

    // Broadcast destinations are rejected by the kernel unless this is set first
    int enable = 1;
    if (setsockopt(socket_fd, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) == -1)
    {
        error = describeErrno("Could not enable SO_BROADCAST");
        close();
        return false;
    }

    // Address reuse is a nicety; the send works without it
    if (setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) == -1)
    {
        error = describeErrno("Could not enable SO_REUSEADDR");
    }

    return true;
}

//=============================================================================================
bool PosixUdpSocket::sendTo(const std::uint8_t* data,
                            std::size_t         length,
                            const std::string&  address,
                            std::uint16_t       port,
                            std::string&        error)
{
    if (socket_fd == -1)
    {
        error = "Socket is not open";
        return false;
    }

    sockaddr_in destination;
    std::memset(&destination, 0, sizeof(destination));
    destination.sin_family = AF_INET;
    destination.sin_port   = htons(port);

    if (inet_pton(AF_INET, address.c_str(), &destination.sin_addr) != 1)
    {
        error = "Invalid IPv4 address " + address;
        return false;
    }

    ssize_t bytes_sent = sendto(socket_fd,
                                data,
                                length,
                                0,
                                reinterpret_cast<const sockaddr*>(&destination),
                                sizeof(destination));

    if (bytes_sent == -1)
    {
        error = describeErrno("sendto failed");
        return false;
    }

    if (static_cast<std::size_t>(bytes_sent) != length)
    {
        std::ostringstream message;
        message << "Short write, " << bytes_sent << " of " << length << " bytes sent";
        error = message.str();
        return false;
    }

    return true;
}

//=============================================================================================
void PosixUdpSocket::close()
{
    if (socket_fd != -1)
    {
        ::close(socket_fd);
        socket_fd = -1;
    }
}

//=============================================================================================
std::string PosixUdpSocket::describeErrno(const std::string& what)
{
    return what + ": " + std::strerror(errno);
}
