#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include <boost/beast/http.hpp>

#include "WakeRelay_test.hpp"

#include "AsioHttpTransport.hpp"
#include "CancellationToken.hpp"
#include "HttpMessage.hpp"
#include "RelayRequestHandler.hpp"
#include "Test.hpp"
#include "TestMacros.hpp"
#include "WakeRelay.hpp"

TEST_PROGRAM_MAIN(WakeRelay_test);

namespace
{
    namespace http = boost::beast::http;

    // Mutable argv built from strings
    class Arguments
    {
    public:

        explicit Arguments(const std::vector<std::string>& arguments) :
            storage(arguments)
        {
            for (std::vector<std::string>::iterator i = storage.begin();
                 i != storage.end();
                 ++i)
            {
                pointers.push_back(&(*i)[0]);
            }
            pointers.push_back(0);
        }

        int argc()
        {
            return static_cast<int>(storage.size());
        }

        char** argv()
        {
            return &pointers[0];
        }

    private:

        std::vector<std::string> storage;

        std::vector<char*> pointers;
    };

    // Default, log and PID file names unique to this process, removed on destruction
    struct DaemonFiles
    {
        DaemonFiles()
        {
            std::ostringstream prefix;
            prefix << "/tmp/wakerelayd_test_" << getpid();
            default_filename = prefix.str() + ".config";
            log_filename     = prefix.str() + ".log";
            pid_filename     = prefix.str() + ".pid";

            std::ofstream default_file(default_filename.c_str());
            default_file << "# Test relay\n"
                         << "LISTEN_ADDRESS=127.0.0.1\n"
                         << "PORT=0\n"
                         << "API_KEY=secret\n"
                         << "LOG_FILE=" << log_filename << "\n";
        }

        ~DaemonFiles()
        {
            std::remove(default_filename.c_str());
            std::remove(log_filename.c_str());
            std::remove(pid_filename.c_str());
        }

        std::string default_filename;
        std::string log_filename;
        std::string pid_filename;
    };

    std::string readFile(const std::string& filename)
    {
        std::ifstream in(filename.c_str());
        std::ostringstream contents;
        contents << in.rdbuf();
        return contents.str();
    }

    // The daemon only makes progress when stepped, so the client runs on its own thread
    HttpTransport::Outcome exchange(WakeRelay&         wake_relay,
                                    const HttpRequest& request,
                                    HttpResponse&      response)
    {
        const std::uint16_t port = wake_relay.getPort();

        AsioHttpTransport transport;
        CancellationToken cancellation;
        const HttpTimeouts timeouts(std::chrono::milliseconds(2000),
                                    std::chrono::milliseconds(4000));

        std::atomic<bool> finished(false);
        HttpTransport::Outcome outcome = HttpTransport::CONNECTION_FAILED;
        std::string error;

        std::thread client([&]()
                           {
                               outcome = transport.perform("127.0.0.1",
                                                           port,
                                                           request,
                                                           timeouts,
                                                           cancellation,
                                                           response,
                                                           error);
                               finished = true;
                           });

        while (!finished)
        {
            wake_relay.step();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        client.join();

        return outcome;
    }
}

//==============================================================================
void WakeRelay_test::addTestCases()
{
    ADD_TEST_CASE(MissingDefaultFile);
    ADD_TEST_CASE(ServesUntilDestroyed);
}

//==============================================================================
// Without its default file the daemon refuses to start
//==============================================================================
Test::Result WakeRelay_test::MissingDefaultFile::body()
{
    std::vector<std::string> arguments;
    arguments.push_back("wakerelayd");
    arguments.push_back("-d");
    arguments.push_back("/nonexistent/wakerelay/config");
    Arguments args(arguments);

    try
    {
        WakeRelay wake_relay(args.argc(), args.argv(), std::chrono::milliseconds(20));
    }
    catch (std::runtime_error&)
    {
        return Test::PASSED;
    }

    std::cout << "Started without a default file\n";
    return Test::FAILED;
}

//==============================================================================
// Answers requests while stepped, then removes its PID file and logs the stop
//==============================================================================
Test::Result WakeRelay_test::ServesUntilDestroyed::body()
{
    DaemonFiles files;

    std::vector<std::string> arguments;
    arguments.push_back("wakerelayd");
    arguments.push_back("-d");
    arguments.push_back(files.default_filename);
    arguments.push_back("--pidfile");
    arguments.push_back(files.pid_filename);
    Arguments args(arguments);

    try
    {
        WakeRelay wake_relay(args.argc(), args.argv(), std::chrono::milliseconds(20));

        std::ostringstream expected_pid;
        expected_pid << getpid() << "\n";
        if (readFile(files.pid_filename) != expected_pid.str() || wake_relay.getPort() == 0)
        {
            return Test::FAILED;
        }

        HttpResponse response;
        if (exchange(wake_relay, HttpRequest(http::verb::get, "/health", 11), response) !=
            HttpTransport::COMPLETED ||
            response.result_int() != 200 ||
            response.body().find("\"ok\"") == std::string::npos)
        {
            std::cout << "Health check not answered\n";
            return Test::FAILED;
        }

        HttpRequest status(http::verb::get, "/status", 11);
        if (exchange(wake_relay, status, response) != HttpTransport::COMPLETED ||
            response.result_int() != 401)
        {
            std::cout << "Status answered without the API key\n";
            return Test::FAILED;
        }

        status.set("X-API-Key", "secret");
        if (exchange(wake_relay, status, response) != HttpTransport::COMPLETED ||
            response.result_int() != 200)
        {
            std::cout << "Status not answered with the API key\n";
            return Test::FAILED;
        }

        if (wake_relay.getCounters().requests_total.load() != 3 ||
            wake_relay.getCounters().authentication_failures.load() != 1 ||
            wake_relay.getTerminate())
        {
            return Test::FAILED;
        }
    }
    catch (std::runtime_error& ex)
    {
        // Nowhere to bind or log
        std::cout << ex.what() << "\n";
        return Test::SKIPPED;
    }

    std::ifstream pid_file(files.pid_filename.c_str());
    if (!pid_file.fail())
    {
        std::cout << "PID file left behind\n";
        return Test::FAILED;
    }

    const std::string log_contents = readFile(files.log_filename);
    if (log_contents.find("Service starting") == std::string::npos ||
        log_contents.find("Service stopping") == std::string::npos)
    {
        std::cout << "Start and stop not logged\n";
        return Test::FAILED;
    }

    return Test::PASSED;
}
