#if !defined UDP_SOCKET_HPP
#define UDP_SOCKET_HPP

#include <cstddef>
#include <cstdint>
#include <string>

// Broadcast-capable IPv4 datagram socket.  Implementations are platform-specific and obtained
// through UdpSocketFactory.
class UdpSocket
{
public:

    UdpSocket();

    virtual ~UdpSocket();

    // Acquires the underlying socket and enables broadcasting on it
    virtual bool open(std::string& error) = 0;

    // Sends length bytes from data as a single datagram to the given dotted-quad IPv4 address
    // and port.  Succeeds only if the whole datagram was accepted.
    virtual bool sendTo(const std::uint8_t* data,
                        std::size_t         length,
                        const std::string&  address,
                        std::uint16_t       port,
                        std::string&        error) = 0;

    // Releases the underlying socket; safe to call more than once
    virtual void close() = 0;

private:

    UdpSocket(const UdpSocket&);
    UdpSocket& operator=(const UdpSocket&);
};

#endif
