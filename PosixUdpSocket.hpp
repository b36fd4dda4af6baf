#if !defined POSIX_UDP_SOCKET_HPP
#define POSIX_UDP_SOCKET_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "UdpSocket.hpp"

class PosixUdpSocket : public UdpSocket
{
public:

    PosixUdpSocket();

    virtual ~PosixUdpSocket();

    virtual bool open(std::string& error);

    virtual bool sendTo(const std::uint8_t* data,
                        std::size_t         length,
                        const std::string&  address,
                        std::uint16_t       port,
                        std::string&        error);

    virtual void close();

private:

    // Builds an error message from what and the current value of errno
    static std::string describeErrno(const std::string& what);

    int socket_fd;
};

#endif
