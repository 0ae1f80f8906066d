#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager keys. Options are "--key value", "--key=value"
// or a short alias "-v"; boolean options take an optional true/false literal.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string program = "tarpull",
                             nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                             std::vector<std::string> positional_keys = {"source_id", "item_id"});

  // Throws std::invalid_argument after reporting the problem on stderr.
  void parse(int argc, char* argv[], SettingsManager& settings) const;

  // Value of --config / -c only; used before the settings file is loaded.
  static std::string find_config_path(int argc, char* argv[]);

  void usage() const;

private:
  class Cursor;

  bool apply_option(Cursor& cursor, const std::string& name,
                    std::optional<std::string> inline_value, bool long_form,
                    SettingsManager& settings) const;
  void apply_positional(std::size_t slot, const std::string& token, SettingsManager& settings) const;
  std::string describe_option(const nlohmann::json& entry) const;

  std::string program_;
  nlohmann::json settings_spec_;
  std::vector<std::string> positional_keys_;
};
