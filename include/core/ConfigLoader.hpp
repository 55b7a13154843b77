#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads controller configuration (JSON) from SD-card or host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/DwellPolicy.hpp"
#include "core/State.hpp"

namespace bangbang::core {

  /**
 * @struct ControllerConfig
 * @brief Everything a TimedOnOff needs at construction, apart from its clock.
 */
  struct ControllerConfig {
    State initial{ State::Off };
    std::chrono::milliseconds minimumOn{ 0 };
    std::chrono::milliseconds minimumOff{ 0 };

    DwellPolicy policy() const { return DwellPolicy{ minimumOn, minimumOff }; }
  };

  /**
 * Validate \p doc and build a ControllerConfig.
 *
 *  Keys (all optional): `initial_state` ("on" | "off" | "A" | "B", any case),
 *  `minimum_on_ms`, `minimum_off_ms` (non-negative integers).
 *  Throws `std::invalid_argument` naming the offending key.
 */
  ControllerConfig parseControllerConfig(const nlohmann::json& doc);

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching — every call to `load()` re-reads the file (cheap, tiny file).
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on SD/host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// load() + parseControllerConfig().
    ControllerConfig loadControllerConfig() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace bangbang::core
