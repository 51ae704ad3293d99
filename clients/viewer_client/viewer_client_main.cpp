/*
 * File: clients/viewer_client/viewer_client_main.cpp
 * Project: Display Relay
 * Purpose: Example viewer: listens for relay events and claims new media
 * Notes:
 *  - "media"/"video" events trigger GET /v1/media/last for this client
 * Last updated: 2026-10-18
 */

#include <iostream>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include "common/events.hpp"

using json = nlohmann::json;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

// ws://host:port/path or http://host:port
static void split_url(const std::string &url, std::string &host, std::string &port, std::string &target)
{
    auto scheme = url.find("://");
    auto rest = (scheme == std::string::npos) ? url : url.substr(scheme + 3);
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    target = (slash == std::string::npos) ? "/" : rest.substr(slash);
    auto colon = hp.find(':');
    host = hp.substr(0, colon);
    port = (colon == std::string::npos) ? "80" : hp.substr(colon + 1);
}

static void claim_last_media(boost::asio::io_context &ioc, const std::string &base)
{
    std::string host, port, target;
    split_url(base, host, port, target);
    boost::asio::ip::tcp::resolver res{ioc};
    boost::asio::ip::tcp::socket sock{ioc};
    boost::asio::connect(sock, res.resolve(host, port));

    http::request<http::empty_body> req{http::verb::get, "/v1/media/last", 11};
    req.set(http::field::host, host);
    http::write(sock, req);

    boost::beast::flat_buffer buf;
    http::response<http::string_body> resp;
    http::read(sock, buf, resp);
    if (resp.result() == http::status::no_content)
        std::cout << "[viewer] nothing new for us\n";
    else
        std::cout << "[viewer] claimed " << resp.body() << "\n";

    boost::system::error_code ec;
    sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
}

int main(int argc, char **argv)
{
    std::string http_base = "http://localhost:8080";
    std::string ws_url = "ws://localhost:8090/ws";
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            http_base = argv[++i];
        else if (a == "--ws" && i + 1 < argc)
            ws_url = argv[++i];
    }

    try
    {
        boost::asio::io_context ioc;
        std::string host, port, target;
        split_url(ws_url, host, port, target);
        boost::asio::ip::tcp::resolver res{ioc};
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, res.resolve(host, port));
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.handshake(host, target);
        std::cerr << "[viewer] connected to " << ws_url << "\n";

        // anything already in the slot
        claim_last_media(ioc, http_base);

        boost::beast::flat_buffer buf;
        while (true)
        {
            ws.read(buf);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            auto j = json::parse(s, nullptr, false);
            if (!j.is_object() || !j.contains("event"))
                continue;
            try
            {
                HubEvent e = event_from_json(j);
                std::cout << "[viewer] " << to_string(e.kind) << " " << e.url << "\n";
                if (e.kind == EventKind::Media || e.kind == EventKind::Video)
                    claim_last_media(ioc, http_base);
            }
            catch (const std::exception &ex)
            {
                std::cout << "[viewer] ignoring " << j.dump() << " (" << ex.what() << ")\n";
            }
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "viewer error: " << e.what() << "\n";
        return 1;
    }
}
