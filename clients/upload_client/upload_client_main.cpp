/*
 * File: clients/upload_client/upload_client_main.cpp
 * Project: Display Relay
 * Purpose: Example producer: uploads a file (or pushes a raw URL) to the relay
 * Last updated: 2026-10-18
 */

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace http = boost::beast::http;
namespace fs = std::filesystem;
using json = nlohmann::json;

static std::string query_escape(const std::string &s)
{
    std::string out;
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            out += static_cast<char>(c);
        else
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

int main(int argc, char **argv)
{
    bool pretty = false;
    bool sound = false;
    std::string base = "http://localhost:8080";
    std::string file, caption, raw_url;
    std::string duration = "5";
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--file" && i + 1 < argc)
            file = argv[++i];
        else if (a == "--duration" && i + 1 < argc)
            duration = argv[++i];
        else if (a == "--caption" && i + 1 < argc)
            caption = argv[++i];
        else if (a == "--raw-url" && i + 1 < argc)
            raw_url = argv[++i];
        else if (a == "--sound")
            sound = true;
        else if (a == "--pretty")
            pretty = true;
    }
    if (file.empty() && raw_url.empty())
    {
        std::cerr << "usage: upload_client [--http url] (--file path [--sound] [--duration s] [--caption text] | --raw-url url) [--pretty]\n";
        return 2;
    }

    try
    {
        http::request<http::string_body> req;
        req.version(11);
        req.method(http::verb::post);
        if (!raw_url.empty())
        {
            req.target("/v1/raw-url");
            req.set(http::field::content_type, "application/json");
            req.body() = json{{"url", raw_url}}.dump();
        }
        else
        {
            std::ifstream in(file, std::ios::binary);
            if (!in)
                throw std::runtime_error("cannot open " + file);
            std::ostringstream ss;
            ss << in.rdbuf();
            const std::string name = query_escape(fs::path(file).filename().string());
            if (sound)
                req.target("/v1/sound?name=" + name);
            else
                req.target("/v1/media?name=" + name + "&duration=" + query_escape(duration) + "&caption=" + query_escape(caption));
            req.set(http::field::content_type, "application/octet-stream");
            req.body() = ss.str();
        }

        auto pos = base.find("//");
        auto hp = (pos == std::string::npos) ? base : base.substr(pos + 2);
        auto host = hp.substr(0, hp.find(':'));
        auto port = (hp.find(':') == std::string::npos) ? std::string("80") : hp.substr(hp.find(':') + 1);
        req.set(http::field::host, host);
        req.prepare_payload();

        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, res.resolve(host, port));
        http::write(sock, req);
        boost::beast::flat_buffer buf;
        http::response<http::string_body> resp;
        http::read(sock, buf, resp);

        auto j = json::parse(resp.body(), nullptr, false);
        std::cout << "[upload] status=" << resp.result_int() << " body:\n"
                  << (j.is_discarded() ? resp.body() : j.dump(pretty ? 2 : -1)) << std::endl;

        boost::system::error_code ec;
        sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        return resp.result_int() < 300 ? 0 : 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "upload error: " << e.what() << "\n";
        return 1;
    }
}
