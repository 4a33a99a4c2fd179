#pragma once

#include "h1stream/config/parser_settings.hpp"
#include "h1stream/core/error.hpp"

#include <string>
#include <string_view>

namespace h1stream {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<Config>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<Config>;

  /// Checks limits and custom method names
  [[nodiscard]] static auto validate(const Config& config) -> Result<void>;

  [[nodiscard]] static auto to_string(const Config& config) -> std::string;
};

}  // namespace h1stream
