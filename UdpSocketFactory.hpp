#if !defined UDP_SOCKET_FACTORY_HPP
#define UDP_SOCKET_FACTORY_HPP

class UdpSocket;

// Provides a platform-independent way of acquiring platform-specific UDP sockets.
class UdpSocketFactory
{
public:

    // Caller owns the returned socket; it is not yet open
    static UdpSocket* createUdpSocket();

private:

    // Disallowed, only static functions here
    UdpSocketFactory();
    ~UdpSocketFactory();

    UdpSocketFactory(const UdpSocketFactory&);
    UdpSocketFactory& operator=(const UdpSocketFactory&);
};

#endif
