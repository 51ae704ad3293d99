/*
 * File: src/relay_ws.hpp
 * Project: Display Relay
 * Purpose: WebSocket endpoint relaying hub events to connected viewers
 * Notes:
 *  - One Session per viewer: inbound pump (close/control only), outbound pump
 *  - Both pumps run on the session strand; the hub only posts a drain request
 *  - Events queued during the handshake are drained once it completes
 *  - When either pump ends the other is cancelled
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <memory>
#include <string>
#include "notification_hub.hpp"
#include "relay_log.hpp"
#include "relay_state.hpp"

namespace websocket = boost::beast::websocket;

class WsServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    RelayState &state_;

public:
    WsServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, RelayState &s)
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
            Log::warn("ws", "acceptor close: " + ec.message());
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
                                       Log::warn("ws", "accept: " + ec.message());
                                   else
                                       std::make_shared<Session>(std::move(socket), state_)->run();
                                   do_accept();
                               });
    }

    class Session : public std::enable_shared_from_this<Session>
    {
        websocket::stream<boost::beast::tcp_stream> ws_;
        boost::beast::flat_buffer buffer_;
        RelayState &state_;
        std::shared_ptr<Subscription> sub_;
        std::string viewer_;
        std::string out_; // frame in flight; must outlive async_write
        bool writing_ = false;
        bool open_ = false; // handshake done; no frame may precede the 101 response
        bool done_ = false;

    public:
        Session(boost::asio::ip::tcp::socket &&s, RelayState &st)
            : ws_(std::move(s)), state_(st) {}

        ~Session()
        {
            if (sub_)
                sub_->close();
        }

        void run()
        {
            boost::asio::dispatch(ws_.get_executor(),
                                  boost::beast::bind_front_handler(&Session::on_run, shared_from_this()));
        }

    private:
        void on_run()
        {
            boost::system::error_code ec;
            auto ep = boost::beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
            viewer_ = ec ? std::string("unknown") : ep.address().to_string();

            // Subscribe before the handshake so nothing published after it is missed.
            sub_ = state_.hub.subscribe();
            std::weak_ptr<Session> weak = weak_from_this();
            sub_->set_notify([weak]
                             {
                if (auto self = weak.lock())
                    boost::asio::post(self->ws_.get_executor(), [self] { self->pump_out(); }); });

            ws_.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
            ws_.set_option(websocket::stream_base::decorator([](websocket::response_type &res)
                                                             { res.set(boost::beast::http::field::server, "display-relay"); }));
            ws_.async_accept(boost::beast::bind_front_handler(&Session::on_accept, shared_from_this()));
        }

        void on_accept(boost::beast::error_code ec)
        {
            if (ec)
            {
                Log::warn("ws", "handshake with " + viewer_ + " failed: " + ec.message());
                return finish();
            }
            Log::info("ws", "viewer connected " + viewer_);
            open_ = true;
            do_read();
            pump_out();
        }

        // Inbound pump: viewers send nothing we act on; it only notices close and errors.
        void do_read()
        {
            ws_.async_read(buffer_, boost::beast::bind_front_handler(&Session::on_read, shared_from_this()));
        }

        void on_read(boost::beast::error_code ec, std::size_t)
        {
            if (ec)
            {
                if (ec == websocket::error::closed)
                    Log::info("ws", "viewer closed " + viewer_);
                else if (ec != boost::asio::error::operation_aborted)
                    Log::info("ws", "viewer " + viewer_ + " gone: " + ec.message());
                return finish();
            }
            buffer_.consume(buffer_.size());
            do_read();
        }

        // Outbound pump: one frame in flight at a time.
        void pump_out()
        {
            if (!open_ || writing_ || done_ || !sub_)
                return;
            auto e = sub_->try_pop();
            if (!e)
                return;
            out_ = event_to_json(*e).dump();
            writing_ = true;
            ws_.text(true);
            ws_.async_write(boost::asio::buffer(out_),
                            boost::beast::bind_front_handler(&Session::on_write, shared_from_this()));
        }

        void on_write(boost::beast::error_code ec, std::size_t)
        {
            writing_ = false;
            if (ec)
            {
                if (ec != boost::asio::error::operation_aborted)
                    Log::warn("ws", "send to " + viewer_ + " failed: " + ec.message());
                return finish();
            }
            pump_out();
        }

        void finish()
        {
            if (done_)
                return;
            done_ = true;
            if (sub_)
            {
                if (auto n = sub_->dropped())
                    Log::info("ws", "viewer " + viewer_ + " missed " + std::to_string(n) + " events");
                sub_->close();
            }
            boost::beast::get_lowest_layer(ws_).cancel();
        }
    };
};
