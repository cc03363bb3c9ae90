#include <core/upload/progress_event_stream.h>

namespace pipecdn::core {

void ProgressEventStream::Post(nlohmann::json&& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    payloads_.emplace_back(std::move(payload));
}

void ProgressEventStream::Post(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    payloads_.emplace_back(payload);
}

std::optional<nlohmann::json> ProgressEventStream::Poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (payloads_.empty()) {
        return std::nullopt;
    }
    nlohmann::json payload = std::move(payloads_.front());
    payloads_.pop_front();
    return payload;
}

std::size_t ProgressEventStream::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dropped = payloads_.size();
    payloads_.clear();
    return dropped;
}

std::size_t ProgressEventStream::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return payloads_.size();
}

} // namespace pipecdn::core
