#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace pipecdn::core::feedback {

struct UploadCompleted {
    std::string id;
    std::string file_path;
    std::string remote_file_name;
    std::uint64_t total_bytes = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(UploadCompleted, id, file_path, remote_file_name, total_bytes);
};

} // namespace pipecdn::core::feedback
