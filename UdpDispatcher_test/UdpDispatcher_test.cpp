#include <arpa/inet.h>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <vector>

#include "UdpDispatcher_test.hpp"

#include "Log.hpp"
#include "Test.hpp"
#include "TestMacros.hpp"
#include "UdpDispatcher.hpp"
#include "UdpSocket.hpp"

TEST_PROGRAM_MAIN(UdpDispatcher_test);

namespace
{
    typedef std::chrono::steady_clock Clock;

    // What a stub socket saw
    struct SocketRecord
    {
        SocketRecord() :
            opened(false),
            sent(false),
            closed(false),
            sent_length(0),
            port(0)
        {
        }

        bool opened;
        bool sent;
        bool closed;
        std::size_t sent_length;
        std::string address;
        std::uint16_t port;
        Clock::time_point send_time;
        Clock::time_point close_time;
    };

    enum StubBehavior
    {
        SEND_OK,
        OPEN_FAILS,
        SEND_FAILS,
        SEND_THROWS
    };

    class StubSocket : public UdpSocket
    {
    public:

        StubSocket(SocketRecord& record, StubBehavior behavior) :
            record(record),
            behavior(behavior)
        {
        }

        virtual bool open(std::string& error)
        {
            record.opened = true;
            if (behavior == OPEN_FAILS)
            {
                error = "socket() failed";
                return false;
            }
            return true;
        }

        virtual bool sendTo(const std::uint8_t*,
                            std::size_t        length,
                            const std::string& address,
                            std::uint16_t      port,
                            std::string&       error)
        {
            record.send_time = Clock::now();
            record.address = address;
            record.port = port;

            if (behavior == SEND_THROWS)
            {
                throw std::runtime_error("sendto blew up");
            }
            if (behavior == SEND_FAILS)
            {
                error = "Short write, 50 of 102 bytes sent";
                return false;
            }

            record.sent = true;
            record.sent_length = length;
            return true;
        }

        virtual void close()
        {
            record.closed = true;
            record.close_time = Clock::now();
        }

    private:

        SocketRecord& record;

        StubBehavior behavior;
    };

    class StubDispatcher : public UdpDispatcher
    {
    public:

        StubDispatcher(Log&                             log,
                       const std::chrono::milliseconds& grace_period,
                       SocketRecord&                    record,
                       StubBehavior                     behavior) :
            UdpDispatcher(log, grace_period),
            record(record),
            behavior(behavior)
        {
        }

    protected:

        virtual UdpSocket* createSocket()
        {
            return new StubSocket(record, behavior);
        }

    private:

        SocketRecord& record;

        StubBehavior behavior;
    };

    // Sends through a stub socket and checks the socket is closed only after the grace period
    Test::Result checkGracePeriod(StubBehavior behavior, bool expect_sent)
    {
        std::ostringstream log_output;
        Log log;
        log.setOutputStream(log_output);

        const std::chrono::milliseconds grace_period(100);

        SocketRecord record;
        StubDispatcher dispatcher(log, grace_period, record, behavior);

        const std::vector<std::uint8_t> payload(102, 0xff);
        const Clock::time_point start = Clock::now();
        const bool sent = dispatcher.send(payload, "192.168.1.255", 9);
        const Clock::time_point end = Clock::now();

        if (sent != expect_sent || !record.closed || end - start < grace_period)
        {
            return Test::FAILED;
        }

        // Closed no sooner than the grace period after sending
        if (behavior != OPEN_FAILS && record.close_time - record.send_time < grace_period)
        {
            return Test::FAILED;
        }

        if (expect_sent)
        {
            if (record.sent_length != payload.size() ||
                record.address != "192.168.1.255" ||
                record.port != 9)
            {
                return Test::FAILED;
            }
        }
        else if (log_output.str().find("ERROR") == std::string::npos)
        {
            return Test::FAILED;
        }

        return Test::PASSED;
    }

    // A UDP socket bound to an ephemeral loopback port, closed on destruction
    class LoopbackReceiver
    {
    public:

        LoopbackReceiver() :
            fd(socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP)),
            port(0)
        {
            if (fd < 0)
            {
                return;
            }

            sockaddr_in bind_address;
            std::memset(&bind_address, 0, sizeof(bind_address));
            bind_address.sin_family = AF_INET;
            bind_address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            bind_address.sin_port = 0;

            socklen_t address_length = sizeof(bind_address);
            timeval receive_timeout;
            receive_timeout.tv_sec = 2;
            receive_timeout.tv_usec = 0;

            sockaddr* address = reinterpret_cast<sockaddr*>(&bind_address);
            if (bind(fd, address, sizeof(bind_address)) != 0 ||
                getsockname(fd, address, &address_length) != 0 ||
                setsockopt(fd,
                           SOL_SOCKET,
                           SO_RCVTIMEO,
                           &receive_timeout,
                           sizeof(receive_timeout)) != 0)
            {
                ::close(fd);
                fd = -1;
                return;
            }

            port = ntohs(bind_address.sin_port);
        }

        ~LoopbackReceiver()
        {
            if (fd >= 0)
            {
                ::close(fd);
            }
        }

        int fd;

        std::uint16_t port;
    };
}

//==============================================================================
void UdpDispatcher_test::addTestCases()
{
    ADD_TEST_CASE(DefaultGracePeriod);
    ADD_TEST_CASE(GracePeriodAfterSuccess);
    ADD_TEST_CASE(GracePeriodAfterShortWrite);
    ADD_TEST_CASE(GracePeriodAfterException);
    ADD_TEST_CASE(GracePeriodAfterOpenFailure);
    ADD_TEST_CASE(Loopback);
    ADD_TEST_CASE(MalformedDestinations);
}

//==============================================================================
Test::Result UdpDispatcher_test::DefaultGracePeriod::body()
{
    std::ostringstream log_output;
    Log log;
    log.setOutputStream(log_output);

    UdpDispatcher dispatcher(log);

    if (dispatcher.getCloseGracePeriod() != std::chrono::milliseconds(300))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result UdpDispatcher_test::GracePeriodAfterSuccess::body()
{
    return checkGracePeriod(SEND_OK, true);
}

//==============================================================================
Test::Result UdpDispatcher_test::GracePeriodAfterShortWrite::body()
{
    return checkGracePeriod(SEND_FAILS, false);
}

//==============================================================================
Test::Result UdpDispatcher_test::GracePeriodAfterException::body()
{
    return checkGracePeriod(SEND_THROWS, false);
}

//==============================================================================
Test::Result UdpDispatcher_test::GracePeriodAfterOpenFailure::body()
{
    return checkGracePeriod(OPEN_FAILS, false);
}

//==============================================================================
// Sends a real datagram over loopback and reads it back
//==============================================================================
Test::Result UdpDispatcher_test::Loopback::body()
{
    LoopbackReceiver receiver;
    if (receiver.fd < 0)
    {
        std::cout << "Loopback UDP unavailable\n";
        return Test::SKIPPED;
    }

    std::ostringstream log_output;
    Log log;
    log.setOutputStream(log_output);

    UdpDispatcher dispatcher(log, std::chrono::milliseconds(10));

    std::vector<std::uint8_t> payload(102, 0xff);
    for (std::size_t i = 6; i < payload.size(); i++)
    {
        payload[i] = static_cast<std::uint8_t>(i);
    }

    if (!dispatcher.send(payload, "127.0.0.1", receiver.port))
    {
        return Test::FAILED;
    }

    std::uint8_t received[512];
    const ssize_t bytes_received = recv(receiver.fd, received, sizeof(received), 0);

    if (bytes_received != static_cast<ssize_t>(payload.size()) ||
        std::memcmp(received, payload.data(), payload.size()) != 0)
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
// Refused without anything being sent
//==============================================================================
Test::Result UdpDispatcher_test::MalformedDestinations::body()
{
    std::ostringstream log_output;
    Log log;
    log.setOutputStream(log_output);

    UdpDispatcher dispatcher(log, std::chrono::milliseconds(10));

    const std::vector<std::uint8_t> payload(102, 0xff);

    if (dispatcher.send(payload, "999.1.1.1", 9) ||
        dispatcher.send(payload, "not-an-address", 9))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}
