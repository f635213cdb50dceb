#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::PositionalSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<PositionalSpec> result;
  for(const auto& entry : spec) {
    PositionalSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const PositionalSpec& a, const PositionalSpec& b){ return a.index < b.index; });

  SettingsManager lookup(settings_spec_);
  for(const auto& positional : result) {
    if(!lookup.resolve_key(positional.key)) {
      throw std::runtime_error("Positional argument refers to unknown setting '" + positional.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  auto lowered = SettingsManager::to_lower(trim(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    // Returns false when a short token is not a known alias so it can be
    // treated as a positional value (negative numbers, "-" etc.).
    auto apply_option = [&](const std::string& name, bool long_form) {
      auto resolved = settings.resolve_key(name);
      if(!resolved) {
        if(long_form) throw CommandLineError("Unknown option --" + name);
        return false;
      }
      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          throw CommandLineError("Missing value for option '" + name + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw CommandLineError("Invalid value for option '" + name + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0) {
      auto name = token.substr(2);
      auto eq = name.find('=');
      if(eq != std::string::npos) {
        auto resolved = settings.resolve_key(name.substr(0, eq));
        if(!resolved) throw CommandLineError("Unknown option --" + name.substr(0, eq));
        std::string error;
        if(!settings.set_from_string(*resolved, name.substr(eq + 1), error)) {
          throw CommandLineError("Invalid value for option '" + name.substr(0, eq) + "': " + error);
        }
        continue;
      }
      apply_option(name, true);
      continue;
    }

    if(token.size() > 1 && token[0] == '-' && apply_option(token.substr(1), false)) {
      continue;
    }

    if(positional_index >= positional_specs_.size()) {
      throw CommandLineError("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      throw CommandLineError("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - LAN modpack sync node", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) cmd += " [" + pos.key + "]";
  print_out(nullptr, "  {} [options]", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");

  SettingsManager lookup(settings_spec_);
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    auto alias_list = entry.value("aliases", std::vector<std::string>{});
    if(!alias_list.empty()) {
      aliases << " (alias: ";
      for(std::size_t i = 0; i < alias_list.size(); ++i) {
        if(i > 0) aliases << ", ";
        aliases << "-" << alias_list[i];
      }
      aliases << ")";
    }
    print_out(nullptr, "  --{} {:<14} {}{} (default: {})",
              key, hint, lookup.describe(key), aliases.str(), lookup.value_as_string(key));
  }
  print_out(nullptr, "");
}
