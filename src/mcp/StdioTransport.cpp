#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace companion_mcp {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

json StdioTransport::read_message() {
    std::string line;

    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        try {
            json message = json::parse(line);
            spdlog::debug("Read message: {}", line);
            return message;
        } catch (const json::parse_error& e) {
            spdlog::error("Skipping malformed message: {}", e.what());
        }
    }

    if (in_.eof()) {
        spdlog::debug("Reached end of input stream");
    } else {
        spdlog::error("Error reading from input stream");
    }
    return json();
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump();
    out_ << serialized << std::endl;
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace companion_mcp
