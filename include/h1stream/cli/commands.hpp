#pragma once

#include "h1stream/http/request_output.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace h1stream::cli {

struct DumpOptions {
  std::string config_file;
  std::string input_file;  // empty or "-" reads stdin
  std::size_t fragment_size{0};  // 0 feeds the whole capture at once
  std::string log_level;  // overrides the config file when set
};

[[nodiscard]] auto cmd_dump(const DumpOptions& opts) -> int;

/// One JSON object per parser event
[[nodiscard]] auto event_to_json(const http::RequestOutput& output)
    -> nlohmann::json;

}  // namespace h1stream::cli
