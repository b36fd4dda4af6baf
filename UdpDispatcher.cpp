#include <chrono>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "UdpDispatcher.hpp"

#include "Log.hpp"
#include "UdpSocket.hpp"
#include "UdpSocketFactory.hpp"

namespace
{
    // Owns a socket for the duration of one send.  However the scope is left, the socket is
    // held open for the grace period, then closed and deleted.
    class SocketLinger
    {
    public:

        SocketLinger(UdpSocket* socket, const std::chrono::milliseconds& grace_period) :
            socket(socket),
            grace_period(grace_period)
        {
        }

        ~SocketLinger()
        {
            std::this_thread::sleep_for(grace_period);

            socket->close();
            delete socket;
        }

    private:

        UdpSocket* socket;

        std::chrono::milliseconds grace_period;

        SocketLinger(const SocketLinger&);
        SocketLinger& operator=(const SocketLinger&);
    };
}

const std::chrono::milliseconds UdpDispatcher::DEFAULT_CLOSE_GRACE_PERIOD(300);

//=============================================================================================
UdpDispatcher::UdpDispatcher(Log& log, const std::chrono::milliseconds& close_grace_period) :
    log(log),
    close_grace_period(close_grace_period)
{
}

//=============================================================================================
UdpDispatcher::~UdpDispatcher()
{
}

//=============================================================================================
bool UdpDispatcher::send(const std::vector<std::uint8_t>& payload,
                         const std::string&               address,
                         std::uint16_t                    port)
{
    std::ostringstream destination;
    destination << address << ":" << port;

    std::string error;
    bool sent = false;

    try
    {
        UdpSocket* socket = createSocket();
        if (!socket)
        {
            log.write("ERROR - No UDP socket available to send to " + destination.str());
            return false;
        }

        SocketLinger linger(socket, close_grace_period);

        if (socket->open(error))
        {
            // open() may succeed with a warning about an optional socket option
            if (!error.empty())
            {
                log.write("Warning while opening socket for " + destination.str() + ": " +
                          error);
                error.clear();
            }

            sent = socket->sendTo(payload.data(), payload.size(), address, port, error);
        }
    }
    catch (std::exception& ex)
    {
        error = ex.what();
    }

    if (!sent)
    {
        log.write("ERROR - Could not send to " + destination.str() + ": " + error);
    }

    return sent;
}

//=============================================================================================
const std::chrono::milliseconds& UdpDispatcher::getCloseGracePeriod() const
{
    return close_grace_period;
}

//=============================================================================================
UdpSocket* UdpDispatcher::createSocket()
{
    return UdpSocketFactory::createUdpSocket();
}
