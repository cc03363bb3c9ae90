#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pipecdn::core {

// One notification from the transfer engine. A bare number on the wire
// becomes an event with only `percent` set.
struct ProgressEvent {
    std::optional<std::string> id;
    std::optional<double> percent;
    std::optional<std::uint64_t> uploaded;
    std::optional<std::uint64_t> total;
    std::optional<bool> completed;
    std::optional<std::string> status;
    std::optional<std::string> message;
    std::optional<std::string> error;
};

} // namespace pipecdn::core
