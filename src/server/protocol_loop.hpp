#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "server/dispatcher.hpp"

namespace toolgate::server {

enum class LoopState {
    Reading,
    Parsing,
    Dispatching,
    Responding,
    Terminated
};

enum class LoopExit {
    EndOfStream,
    ReadFault
};

std::string to_string(LoopState state);

// Line-delimited JSON-RPC over a pair of streams. One line is answered (or
// skipped) before the next is read, so responses keep input order.
class ProtocolLoop {
public:
    ProtocolLoop(std::istream& in, std::ostream& out, const Dispatcher& dispatcher);

    LoopExit run();

    LoopState state() const { return state_; }
    std::size_t lines_read() const { return lines_read_; }

private:
    void transition(LoopState next);
    void respond(const nlohmann::json& message);

    std::istream& in_;
    std::ostream& out_;
    const Dispatcher& dispatcher_;
    LoopState state_ = LoopState::Reading;
    std::size_t lines_read_ = 0;
};

// Strips surrounding whitespace, including a trailing '\r'.
std::string trim_line(const std::string& line);

}  // namespace toolgate::server
