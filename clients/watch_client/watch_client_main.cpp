/*
 * File: clients/watch_client/watch_client_main.cpp
 * Project: Receipt Event Relay
 * Purpose: Example WebSocket consumer that prints relayed receipt events
 * Notes:
 *  - The relay sends every event to every client; --user filters locally
 * Last updated: 2026-10-17
 */

#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace websocket = boost::beast::websocket;

static void parse_ws_url(const std::string &ws_url,
                         std::string &host, std::string &port, std::string &target)
{
    // expect ws://host:port/path
    auto scheme_pos = ws_url.find("://");
    auto rest = (scheme_pos == std::string::npos) ? ws_url : ws_url.substr(scheme_pos + 3);
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    target = (slash == std::string::npos) ? "/" : rest.substr(slash);
    auto colon = hp.find(':');
    if (colon == std::string::npos)
    {
        host = hp;
        port = "80";
    }
    else
    {
        host = hp.substr(0, colon);
        port = hp.substr(colon + 1);
    }
}

int main(int argc, char **argv)
{
    std::string ws_url = "ws://localhost:8765/";
    std::string user;
    bool pretty = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--ws" && i + 1 < argc)
            ws_url = argv[++i];
        else if (a == "--user" && i + 1 < argc)
            user = argv[++i];
        else if (a == "--pretty")
            pretty = true;
    }

    try
    {
        std::string host, port, target;
        parse_ws_url(ws_url, host, port, target);

        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto const results = res.resolve(host, port);
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.handshake(host + ":" + port, target);
        std::cerr << "watch: connected to " << ws_url << "\n";

        boost::beast::flat_buffer buf;
        while (true)
        {
            ws.read(buf);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            auto j = json::parse(s, nullptr, false);
            if (!j.is_object())
            {
                std::cerr << "watch: ignoring non-JSON frame\n";
                continue;
            }
            if (!user.empty() && j.value("user_uid", std::string()) != user)
                continue;
            std::cout << (pretty ? j.dump(2) : j.dump()) << std::endl;
        }
    }
    catch (const boost::system::system_error &e)
    {
        if (e.code() == websocket::error::closed)
        {
            std::cerr << "watch: relay closed the connection\n";
            return 0;
        }
        std::cerr << "watch: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "watch: " << e.what() << "\n";
        return 1;
    }
}
