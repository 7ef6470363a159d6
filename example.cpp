// Example usage of the STOMP client
// Connects to a broker, subscribes to a queue, sends a message to it and
// disconnects once the message comes back.

#include <stomp/client.hpp>
#include <chrono>
#include <iostream>

int main(int argc, char** argv) {
    using namespace stomp;

    const std::string host = argc > 1 ? argv[1] : "localhost";
    const std::string destination = "/queue/stomp-example";

    asio::io_context io_context;

    // 1. Configure the client
    ClientConfig config;
    config.heartbeat = "10000,10000";
    config.login = "guest";
    config.passcode = "guest";

    Client client(io_context, config);

    // 2. Set up listeners
    client.OnConnected([&](const HeaderMap& headers) {
        std::cout << "Connected to " << headers.GetOr("server", "unknown broker") << std::endl;
        std::cout << "  Session: " << client.GetSessionId() << std::endl;
        std::cout << "  Version: " << client.GetVersion() << std::endl;

        auto intervals = client.GetHeartbeatIntervals();
        std::cout << "  Heart-beat: send every " << intervals.outgoing_ms
                  << "ms, expect data every " << intervals.incoming_ms << "ms" << std::endl;

        // 3. Subscribe and send once the session is up
        std::string id = client.Subscribe(destination, AckMode::ClientIndividual);
        std::cout << "Subscribed to " << destination << " as " << id << std::endl;

        client.Send(destination, {{"content-type", "text/plain"}}, "hello from stomp_example");
    });

    client.OnMessage([&](const HeaderMap& headers, const std::string& body) {
        std::cout << "Received message: " << body << std::endl;
        std::cout << "  Destination: " << headers.GetOr("destination") << std::endl;
        std::cout << "  Message id: " << headers.GetOr("message-id") << std::endl;

        client.Ack(headers.GetOr("ack"));

        // 4. Disconnect
        std::cout << "Disconnecting..." << std::endl;
        client.Disconnect();
    });

    client.OnError([](const HeaderMap& headers, const std::string& body) {
        std::cerr << "Broker error: " << headers.GetOr("message") << std::endl;
        if (!body.empty()) {
            std::cerr << body << std::endl;
        }
    });

    client.OnProtocolError([](int code, const std::string& message) {
        std::cerr << "Protocol error " << code << ": " << message << std::endl;
    });

    client.OnDisconnected([]() {
        std::cout << "Disconnected from broker" << std::endl;
    });

    // 5. Connect and run until the session ends
    std::cout << "Connecting to " << host << ":" << protocol::DEFAULT_PORT << "..." << std::endl;
    client.Connect(host);

    io_context.run_for(std::chrono::seconds(30));

    if (client.IsConnected()) {
        std::cerr << "No echo received within 30s" << std::endl;
        client.Disconnect();
        io_context.run_for(std::chrono::seconds(1));
        return 1;
    }

    std::cout << "Example completed" << std::endl;
    return 0;
}
