/* @file ConfigLoader.cpp
 * @brief JSON file -> ControllerConfig, with key-by-key validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// bangbang headers
#include "core/ConfigLoader.hpp"

using namespace bangbang::core;

namespace {

  std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  State parseState(const nlohmann::json& value) {
    if (!value.is_string())
      throw std::invalid_argument("[ConfigLoader] initial_state must be a string");

    const std::string name = lowercase(value.get<std::string>());
    if (name == "on" || name == "b")
      return State::On;
    if (name == "off" || name == "a")
      return State::Off;
    throw std::invalid_argument("[ConfigLoader] unknown initial_state: " + value.get<std::string>());
  }

  std::chrono::milliseconds parseMinimum(const nlohmann::json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end())
      return std::chrono::milliseconds{ 0 };

    if (!it->is_number_integer())
      throw std::invalid_argument(std::string("[ConfigLoader] ") + key + " must be an integer");
    if (it->is_number_unsigned()) {
      const auto ms = it->get<std::uint64_t>();
      if (ms > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        throw std::invalid_argument(std::string("[ConfigLoader] ") + key + " out of range");
      return std::chrono::milliseconds{ static_cast<std::int64_t>(ms) };
    }

    const auto ms = it->get<std::int64_t>();
    if (ms < 0)
      throw std::invalid_argument(std::string("[ConfigLoader] ") + key + " must not be negative");
    return std::chrono::milliseconds{ ms };
  }

} // namespace

ControllerConfig bangbang::core::parseControllerConfig(const nlohmann::json& doc) {
  if (!doc.is_object())
    throw std::invalid_argument("[ConfigLoader] controller config must be a JSON object");

  ControllerConfig cfg;
  if (auto it = doc.find("initial_state"); it != doc.end())
    cfg.initial = parseState(*it);
  cfg.minimumOn = parseMinimum(doc, "minimum_on_ms");
  cfg.minimumOff = parseMinimum(doc, "minimum_off_ms");
  return cfg;
}

ConfigLoader::ConfigLoader(std::string configPath) : path_{ std::move(configPath) } {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] parse error in " + path_ + ": " + e.what());
  }
}

ControllerConfig ConfigLoader::loadControllerConfig() const { return parseControllerConfig(load()); }
