#include "h1stream/config/config.hpp"

#include "h1stream/config/yaml_utils.hpp"
#include "h1stream/http/method.hpp"
#include "h1stream/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <string_view>
#include <vector>

namespace YAML {

template <>
struct convert<h1stream::http::HttpMethod> {
  static bool decode(const Node& node, h1stream::http::HttpMethod& m) {
    if (!node.IsMap() || !node["name"] || !node["name"].IsScalar()) {
      return false;
    }
    auto name = node["name"].as<std::string>();
    auto entity = h1stream::yaml_get_or<std::string>(node, "entity", "expected");
    auto acceptance = h1stream::http::parse_entity_acceptance(entity);
    if (!acceptance) {
      return false;
    }
    m = h1stream::http::HttpMethod(std::move(name), *acceptance);
    return true;
  }
};

template <>
struct convert<h1stream::ParserSettings> {
  static bool decode(const Node& node, h1stream::ParserSettings& p) {
    if (!node.IsMap()) {
      return false;
    }
    const h1stream::ParserSettings defaults;
    p.max_method_length =
        h1stream::yaml_get_or(node, "max_method_length", defaults.max_method_length);
    p.max_uri_length =
        h1stream::yaml_get_or(node, "max_uri_length", defaults.max_uri_length);
    p.max_header_name_length = h1stream::yaml_get_or(
        node, "max_header_name_length", defaults.max_header_name_length);
    p.max_header_value_length = h1stream::yaml_get_or(
        node, "max_header_value_length", defaults.max_header_value_length);
    p.max_header_count =
        h1stream::yaml_get_or(node, "max_header_count", defaults.max_header_count);
    p.max_content_length = h1stream::yaml_get_or(
        node, "max_content_length", defaults.max_content_length);
    p.max_chunk_ext_length = h1stream::yaml_get_or(
        node, "max_chunk_ext_length", defaults.max_chunk_ext_length);
    p.max_chunk_size =
        h1stream::yaml_get_or(node, "max_chunk_size", defaults.max_chunk_size);
    p.raw_request_uri_header = h1stream::yaml_get_or(
        node, "raw_request_uri_header", defaults.raw_request_uri_header);

    auto mode_str = h1stream::yaml_get_or<std::string>(
        node, "uri_parsing_mode",
        std::string(h1stream::uri_parsing_mode_to_string(defaults.uri_parsing_mode)));
    auto mode = h1stream::string_to_uri_parsing_mode(mode_str);
    if (!mode) {
      return false;
    }
    p.uri_parsing_mode = *mode;

    if (auto methods = node["custom_methods"]) {
      if (!methods.IsSequence()) {
        return false;
      }
      for (const auto& entry : methods) {
        p.add_custom_method(entry.as<h1stream::http::HttpMethod>());
      }
    }
    return true;
  }
};

template <>
struct convert<h1stream::WebSocketSettings> {
  static bool decode(const Node& node, h1stream::WebSocketSettings& w) {
    if (!node.IsMap()) {
      return false;
    }
    w.enabled = h1stream::yaml_get_or(node, "enabled", true);
    return true;
  }
};

template <>
struct convert<h1stream::LogConfig> {
  static bool decode(const Node& node, h1stream::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = h1stream::yaml_get_or<std::string>(node, "level", "info");
    return true;
  }
};

template <>
struct convert<h1stream::Config> {
  static bool decode(const Node& node, h1stream::Config& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto parsing = node["parsing"]) {
      c.parsing = parsing.as<h1stream::ParserSettings>();
    }
    if (auto websocket = node["websocket"]) {
      c.parsing.websocket = websocket.as<h1stream::WebSocketSettings>();
    }
    if (auto log = node["log"]) {
      c.log = log.as<h1stream::LogConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace h1stream {

namespace {

// Scan limits are added to buffer offsets, so they must stay far from
// SIZE_MAX.
constexpr std::size_t kMaxScanLimit = std::size_t{1} << 30;

constexpr std::string_view kLogLevels[] = {"trace", "debug", "info",
                                           "warn",  "error", "off"};

void to_yaml(YAML::Emitter& out, const ParserSettings& p) {
  out << YAML::BeginMap;
  yaml_emit(out, "max_method_length", p.max_method_length);
  yaml_emit(out, "max_uri_length", p.max_uri_length);
  yaml_emit(out, "max_header_name_length", p.max_header_name_length);
  yaml_emit(out, "max_header_value_length", p.max_header_value_length);
  yaml_emit(out, "max_header_count", p.max_header_count);
  yaml_emit(out, "max_content_length", p.max_content_length);
  yaml_emit(out, "max_chunk_ext_length", p.max_chunk_ext_length);
  yaml_emit(out, "max_chunk_size", p.max_chunk_size);
  yaml_emit(out, "uri_parsing_mode",
            std::string(uri_parsing_mode_to_string(p.uri_parsing_mode)));
  yaml_emit(out, "raw_request_uri_header", p.raw_request_uri_header);

  if (!p.custom_methods.empty()) {
    // sorted so the output is stable
    std::vector<const http::HttpMethod*> methods;
    for (const auto& [name, method] : p.custom_methods) {
      methods.push_back(&method);
    }
    std::ranges::sort(methods, {}, &http::HttpMethod::name);

    out << YAML::Key << "custom_methods" << YAML::Value << YAML::BeginSeq;
    for (const auto* method : methods) {
      std::string_view entity = "expected";
      if (method->acceptance() == http::EntityAcceptance::Tolerated) {
        entity = "tolerated";
      } else if (method->acceptance() == http::EntityAcceptance::Disallowed) {
        entity = "disallowed";
      }
      out << YAML::Flow << YAML::BeginMap;
      yaml_emit(out, "name", std::string(method->name()));
      yaml_emit(out, "entity", std::string(entity));
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;
  }
  out << YAML::EndMap;
}

auto invalid(std::string_view what) -> std::unexpected<std::error_code> {
  log::error("Invalid configuration: {}", what);
  return fail(Error::InvalidArgument);
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path) -> Result<Config> {
  std::filesystem::path file_path{path};
  std::error_code ec;
  if (!std::filesystem::exists(file_path, ec)) {
    log::error("Config file not found: {}", path);
    return fail(Error::FileNotFound);
  }
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    log::error("Config path is not a regular file: {}", path);
    return fail(Error::FileOpenFailed);
  }

  std::ifstream file(file_path);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileOpenFailed);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<Config> {
  Config config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<Config>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (auto valid = validate(config); !valid) {
    return std::unexpected{valid.error()};
  }
  return ok(std::move(config));
}

auto ConfigLoader::validate(const Config& config) -> Result<void> {
  const auto& p = config.parsing;
  if (p.max_method_length == 0 || p.max_uri_length == 0 ||
      p.max_header_name_length == 0 || p.max_header_value_length == 0 ||
      p.max_header_count == 0 || p.max_content_length == 0 ||
      p.max_chunk_ext_length == 0 || p.max_chunk_size == 0) {
    return invalid("parsing limits must be greater than zero");
  }
  if (p.max_method_length > kMaxScanLimit || p.max_uri_length > kMaxScanLimit ||
      p.max_header_name_length > kMaxScanLimit ||
      p.max_header_value_length > kMaxScanLimit ||
      p.max_header_count > kMaxScanLimit ||
      p.max_chunk_ext_length > kMaxScanLimit) {
    return invalid(std::format(
        "method, URI, header and chunk extension limits must not exceed {}",
        kMaxScanLimit));
  }

  for (const auto& [name, method] : p.custom_methods) {
    if (name.empty() ||
        !std::ranges::all_of(name, [](char c) {
          return http::is_token_char(static_cast<std::uint8_t>(c));
        })) {
      return invalid(std::format("custom method '{}' is not a token", name));
    }
    if (name.size() > p.max_method_length) {
      return invalid(std::format(
          "custom method '{}' is longer than max_method_length ({})", name,
          p.max_method_length));
    }
    if (http::find_well_known_method(name) != nullptr) {
      return invalid(
          std::format("custom method '{}' shadows a standard method", name));
    }
  }

  if (std::ranges::find(kLogLevels, std::string_view{config.log.level}) ==
      std::end(kLogLevels)) {
    return invalid(std::format("unknown log level '{}'", config.log.level));
  }
  return ok();
}

auto ConfigLoader::to_string(const Config& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "parsing" << YAML::Value;
  to_yaml(out, config.parsing);
  out << YAML::Key << "websocket" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "enabled", config.parsing.websocket.enabled);
  out << YAML::EndMap;
  out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "level", config.log.level);
  out << YAML::EndMap;
  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace h1stream
