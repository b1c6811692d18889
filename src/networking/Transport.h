#pragma once

#include <cstdint>
#include <string>

namespace coedit::networking {

using ClientId = std::uint64_t;

// Close codes sent to clients that fail the connection handshake.
constexpr std::uint16_t kCloseMissingIdentity = 4001;
constexpr std::uint16_t kCloseSessionNotFound = 4004;
// Sent when a frame could not be handed to the connection.
constexpr std::uint16_t kCloseSendFailed = 1011;

// What the connection layer needs from a socket server. Both calls only
// enqueue. send throws collab::TransportError when the client is gone;
// close ignores unknown clients.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void send(ClientId client, const std::string& frame) = 0;
    virtual void close(ClientId client, std::uint16_t code, const std::string& reason) = 0;
};

} // namespace coedit::networking
