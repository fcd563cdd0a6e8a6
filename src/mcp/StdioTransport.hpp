#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace companion_mcp {

/**
 * @brief Newline-delimited JSON over standard input/output
 *
 * Blank lines and lines that are not valid JSON are skipped; only end of
 * input ends the stream.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    json read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace companion_mcp
