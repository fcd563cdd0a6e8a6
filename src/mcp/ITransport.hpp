#pragma once

#include <nlohmann/json.hpp>

namespace companion_mcp {

using json = nlohmann::json;

/**
 * @brief Channel carrying whole JSON-RPC messages to and from the server
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Blocks for the next message; null JSON once the peer is gone.
    virtual json read_message() = 0;

    virtual void write_message(const json& message) = 0;

    virtual bool is_open() const = 0;
};

} // namespace companion_mcp
