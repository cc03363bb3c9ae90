#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>

namespace pipecdn::core {

// Raw progress payloads in arrival order. Producers may post from any
// thread; a single consumer polls.
class ProgressEventStream {
public:
    void Post(nlohmann::json&& payload);
    void Post(const nlohmann::json& payload);

    std::optional<nlohmann::json> Poll();

    // Drops everything not yet polled, returns how many payloads were dropped
    std::size_t Clear();

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::deque<nlohmann::json> payloads_;
};

} // namespace pipecdn::core
