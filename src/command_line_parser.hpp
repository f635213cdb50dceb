#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Maps `packmesh [nickname] [discovery_port] --key value -alias value` onto
// SettingsManager entries. Bool options may omit their value.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "packmesh",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","nickname"}},
                      {{"index",1},{"key","discovery_port"}}
                    }));

  // Throws CommandLineError on unknown options, missing values or bad values.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  struct PositionalSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<PositionalSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<PositionalSpec> positional_specs_;
};
