/*
 * File: src/relay_http.hpp
 * Project: Display Relay
 * Purpose: HTTP routing and handlers (uploads, claim, raw URL push, health)
 * Notes:
 *  - Uploads are raw request bodies; metadata travels in the query string
 *  - Files land on disk before the slot is updated and viewers are notified
 *  - Every response is JSON; one request per connection
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "atomic_write.hpp"
#include "common/events.hpp"
#include "common/media.hpp"
#include "relay_log.hpp"
#include "relay_state.hpp"
#include "relay_upload.hpp"

namespace http = boost::beast::http;
namespace fs = std::filesystem;

// -------- query helpers --------

inline std::string url_decode(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    auto hex = [](char c) -> int
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '+')
            out += ' ';
        else if (s[i] == '%' && i + 2 < s.size() && hex(s[i + 1]) >= 0 && hex(s[i + 2]) >= 0)
        {
            out += static_cast<char>(hex(s[i + 1]) * 16 + hex(s[i + 2]));
            i += 2;
        }
        else
            out += s[i];
    }
    return out;
}

inline std::string target_path(const std::string &target)
{
    return target.substr(0, target.find('?'));
}

inline std::optional<std::string> query_param(const std::string &target, const std::string &key)
{
    auto qpos = target.find('?');
    if (qpos == std::string::npos)
        return std::nullopt;
    std::string qs = target.substr(qpos + 1);
    size_t pos = 0;
    while (pos <= qs.size())
    {
        auto amp = qs.find('&', pos);
        std::string pair = qs.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = pair.find('=');
        if (url_decode(pair.substr(0, eq)) == key)
            return eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1));
        if (amp == std::string::npos)
            break;
        pos = amp + 1;
    }
    return std::nullopt;
}

inline std::string trim(const std::string &s)
{
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    RelayState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, RelayState &s)
        : ioc_(ioc), acceptor_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    void stop()
    {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec)
            Log::warn("http", "acceptor close: " + ec.message());
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_),
                               [this](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket)
                               {
                                   if (ec == boost::asio::error::operation_aborted)
                                       return;
                                   if (ec)
                                       Log::warn("http", "accept: " + ec.message());
                                   else
                                       std::make_shared<Session>(std::move(socket), state_)->run();
                                   do_accept();
                               });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        using response = http::response<http::string_body>;

        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        std::optional<http::request_parser<http::string_body>> parser;
        RelayState &state;

        Session(boost::asio::ip::tcp::socket &&s, RelayState &st)
            : socket(std::move(s)), state(st) {}

        void run()
        {
            parser.emplace();
            parser->body_limit(std::max(state.config.max_media_bytes, state.config.max_sound_bytes));
            auto self = shared_from_this();
            http::async_read(socket, buffer, *parser, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (ec == http::error::body_limit)
                    return self->respond(self->error(http::status::payload_too_large, 11, "body too large"));
                if (ec)
                {
                    if (ec != http::error::end_of_stream)
                        Log::debug("http", "read: " + ec.message());
                    return;
                }
                self->handle(self->parser->get()); });
        }

        // keep the response alive through async_write
        void respond(response &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<response>(std::move(res));
            sp->set(http::field::server, "display-relay");
            sp->keep_alive(false);

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code ec, std::size_t)
                              {
                if (ec)
                    Log::debug("http", "write: " + ec.message());
                boost::system::error_code sd;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, sd); });
        }

        static response json_response(http::status status, unsigned version, const nlohmann::json &body)
        {
            response res{status, version};
            res.set(http::field::content_type, "application/json");
            res.body() = body.dump();
            res.prepare_payload();
            return res;
        }

        static response empty(http::status status, unsigned version)
        {
            response res{status, version};
            res.prepare_payload();
            return res;
        }

        static response error(http::status status, unsigned version, const std::string &what)
        {
            return json_response(status, version, nlohmann::json{{"error", what}});
        }

        std::string viewer_address()
        {
            boost::system::error_code ec;
            auto ep = socket.remote_endpoint(ec);
            return ec ? std::string() : ep.address().to_string();
        }

        void handle(const http::request<http::string_body> &req)
        {
            using nlohmann::json;
            const std::string target(req.target());
            const std::string path = target_path(target);
            const unsigned v = req.version();

            // GET /health
            if (req.method() == http::verb::get && path == "/health")
            {
                auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
                return respond(json_response(http::status::ok, v, json{{"status", "ok"}, {"uptime_s", up}}));
            }

            // GET /v1/config
            if (req.method() == http::verb::get && path == "/v1/config")
                return respond(json_response(http::status::ok, v, config_to_json(state.config)));

            // GET /v1/state  (raw slots, quarantined items included)
            if (req.method() == http::verb::get && path == "/v1/state")
            {
                json body{{"media", nullptr}, {"sound", nullptr}, {"subscribers", state.hub.subscriber_count()}};
                if (auto m = state.store.current_media())
                    body["media"] = media_to_json(*m);
                if (auto s = state.store.current_sound())
                    body["sound"] = sound_to_json(*s);
                return respond(json_response(http::status::ok, v, body));
            }

            // GET /v1/media/last  (claims the current item for this client, once)
            if (req.method() == http::verb::get && path == "/v1/media/last")
            {
                const std::string viewer = viewer_address();
                if (viewer.empty())
                {
                    Log::warn("http", "no client address available");
                    return respond(empty(http::status::no_content, v));
                }
                auto item = state.views.claim(viewer);
                if (!item)
                    return respond(empty(http::status::no_content, v));
                json body{{"media", media_to_json(*item)},
                          {"url", "/uploads/" + encode_url_fragment(item->filename)}};
                return respond(json_response(http::status::ok, v, body));
            }

            // POST /v1/media?name=cat.jpg&duration=5&caption=hi   body: file bytes
            if (req.method() == http::verb::post && path == "/v1/media")
                return respond(upload_media(req, target));

            // POST /v1/sound?name=tune.mp3   body: file bytes
            if (req.method() == http::verb::post && path == "/v1/sound")
                return respond(upload_sound(req, target));

            // POST /v1/raw-url   body: {"url": "https://..."}
            if (req.method() == http::verb::post && path == "/v1/raw-url")
            {
                try
                {
                    auto body = json::parse(req.body());
                    if (!body.contains("url") || !body["url"].is_string() || body["url"].get<std::string>().empty())
                        return respond(error(http::status::bad_request, v, "missing url"));
                    auto n = state.hub.publish(raw_url_event(body["url"].get<std::string>()));
                    Log::info("http", "raw url pushed to " + std::to_string(n) + " viewers");
                    return respond(json_response(http::status::accepted, v, json{{"status", "ok"}, {"delivered", n}}));
                }
                catch (const std::exception &e)
                {
                    return respond(json_response(http::status::bad_request, v, json{{"error", "bad json"}, {"what", e.what()}}));
                }
            }

            // 404 fallback
            return respond(error(http::status::not_found, v, "not found"));
        }

        response upload_media(const http::request<http::string_body> &req, const std::string &target)
        {
            using nlohmann::json;
            const unsigned v = req.version();
            const std::string name = query_param(target, "name").value_or("");
            if (!is_plain_filename(name))
                return error(http::status::bad_request, v, "invalid filename");
            if (!is_media_filename(name))
            {
                Log::warn("http", "invalid file type uploaded: " + name);
                return error(http::status::bad_request, v, "only images and videos are allowed");
            }
            const std::string &data = req.body();
            if (data.empty())
                return error(http::status::bad_request, v, "empty body");
            if (data.size() > state.config.max_media_bytes)
                return error(http::status::payload_too_large, v, "body too large");
            if (!media_content_matches(name, data))
                return error(http::status::bad_request, v, "file content does not match file extension");

            uint64_t duration = 5;
            if (auto d = query_param(target, "duration"))
            {
                if (auto parsed = parse_duration_seconds(trim(*d)))
                    duration = *parsed;
                else
                    Log::warn("http", "bad duration '" + *d + "', using " + std::to_string(duration));
            }
            std::string caption = trim(query_param(target, "caption").value_or(""));

            try
            {
                fs::path dir(state.config.uploads_dir);
                write_atomic(dir / name, data);
            }
            catch (const std::exception &e)
            {
                Log::error("http", std::string("saving upload failed: ") + e.what());
                return json_response(http::status::internal_server_error, v, json{{"error", "write failed"}, {"what", e.what()}});
            }

            auto item = publish_media(state.store, state.hub, make_media_item(name, duration, std::move(caption)));
            return json_response(http::status::created, v, json{{"status", "ok"}, {"media", media_to_json(item)}});
        }

        response upload_sound(const http::request<http::string_body> &req, const std::string &target)
        {
            using nlohmann::json;
            const unsigned v = req.version();
            const std::string name = query_param(target, "name").value_or("");
            if (!is_plain_filename(name))
                return error(http::status::bad_request, v, "invalid filename");
            if (!is_sound_filename(name))
            {
                Log::warn("http", "invalid sound type uploaded: " + name);
                return error(http::status::bad_request, v, "only mp3, wav, ogg, flac and m4a are allowed");
            }
            const std::string &data = req.body();
            if (data.empty())
                return error(http::status::bad_request, v, "empty body");
            if (data.size() > state.config.max_sound_bytes)
                return error(http::status::payload_too_large, v, "body too large");
            if (!sound_content_matches(name, data))
                return error(http::status::bad_request, v, "sound file content does not match file extension");

            try
            {
                fs::path dir(state.config.sounds_dir);
                write_atomic(dir / name, data);
            }
            catch (const std::exception &e)
            {
                Log::error("http", std::string("saving sound failed: ") + e.what());
                return json_response(http::status::internal_server_error, v, json{{"error", "write failed"}, {"what", e.what()}});
            }

            auto item = publish_sound(state.store, state.hub, name);
            return json_response(http::status::created, v, json{{"status", "ok"}, {"sound", sound_to_json(item)}});
        }
    };
};
