#pragma once

#include <core/model/std_optional.h>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pipecdn::ipc::operation {

struct StartUpload {
    std::string file_path;
    std::string remote_file_name; // empty: use the local file name
    std::optional<std::string> tier;
    std::optional<std::uint32_t> epochs;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(StartUpload, file_path, remote_file_name, tier, epochs);
};

} // namespace pipecdn::ipc::operation
