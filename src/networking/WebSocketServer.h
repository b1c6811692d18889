#pragma once

#include "networking/Transport.h"

#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace coedit::networking {

class WebSocketServer : public Transport {
public:
    // `target` is the HTTP upgrade request target, e.g. "/?userId=u1&workspaceId=w1".
    using OnConnect    = std::function<void(ClientId, const std::string& target)>;
    using OnDisconnect = std::function<void(ClientId)>;
    using OnMessage    = std::function<void(ClientId, const std::string&)>;

    WebSocketServer(boost::asio::io_context& ioc, const std::string& address, unsigned short port);
    ~WebSocketServer() override;

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active connections

    unsigned short port() const;

    void send(ClientId client, const std::string& frame) override;
    void close(ClientId client, std::uint16_t code, const std::string& reason) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace coedit::networking
