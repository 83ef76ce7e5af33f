#include "server/protocol_loop.hpp"

#include <optional>
#include "core/logging/logger.hpp"
#include "protocol/json_rpc.hpp"

namespace toolgate::server {

using nlohmann::json;

std::string to_string(const LoopState state) {
    switch (state) {
        case LoopState::Reading:
            return "reading";
        case LoopState::Parsing:
            return "parsing";
        case LoopState::Dispatching:
            return "dispatching";
        case LoopState::Responding:
            return "responding";
        case LoopState::Terminated:
            return "terminated";
        default:
            return "unknown";
    }
}

std::string trim_line(const std::string& line) {
    constexpr const char* kWhitespace = " \t\r\n\f\v";
    const auto first = line.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = line.find_last_not_of(kWhitespace);
    return line.substr(first, last - first + 1);
}

ProtocolLoop::ProtocolLoop(std::istream& in, std::ostream& out, const Dispatcher& dispatcher)
    : in_(in), out_(out), dispatcher_(dispatcher) {}

void ProtocolLoop::transition(const LoopState next) {
    LOG_DEBUG("ProtocolLoop: " + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

void ProtocolLoop::respond(const json& message) {
    out_ << protocol::encode(message) << "\n";
    out_.flush();
}

LoopExit ProtocolLoop::run() {
    state_ = LoopState::Reading;
    std::string raw;
    while (true) {
        if (!std::getline(in_, raw)) {
            transition(LoopState::Terminated);
            if (in_.bad()) {
                LOG_ERROR("ProtocolLoop: input stream read fault after " +
                          std::to_string(lines_read_) + " lines");
                return LoopExit::ReadFault;
            }
            LOG_INFO("ProtocolLoop: end of input after " + std::to_string(lines_read_) + " lines");
            return LoopExit::EndOfStream;
        }
        ++lines_read_;

        const std::string line = trim_line(raw);
        if (line.empty()) {
            continue;
        }

        transition(LoopState::Parsing);
        std::optional<json> response;
        const auto decoded = protocol::decode_line(line);
        if (core::errors::is_error(decoded)) {
            LOG_DEBUG("ProtocolLoop: " + core::errors::get_error(decoded).message);
            response = protocol::make_error(nullptr, protocol::error_code::kParseError,
                                            "Parse error");
        } else {
            transition(LoopState::Dispatching);
            response = dispatcher_.dispatch(protocol::classify(core::errors::get_value(decoded)));
        }

        transition(LoopState::Responding);
        if (response.has_value()) {
            respond(response.value());
        }
        transition(LoopState::Reading);
    }
}

}  // namespace toolgate::server
