#include "command_line_parser.hpp"

#include <cctype>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

namespace {

[[noreturn]] void reject(const std::string& message) {
  print_err("{}", message);
  throw std::invalid_argument(message);
}

bool looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() >= 2 && token[0] == '-' && std::isalpha(static_cast<unsigned char>(token[1]));
}

bool is_bool_word(const std::string& token) {
  static const char* const kWords[] = {"true", "false", "on", "off", "yes", "no", "1", "0"};
  const auto lowered = to_lower(trim_copy(token));
  for(const char* word : kWords) {
    if(lowered == word) return true;
  }
  return false;
}

std::string default_text(const nlohmann::json& entry) {
  const auto& value = entry.at("default");
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

} // namespace

class CommandLineParser::Cursor {
public:
  Cursor(int argc, char* argv[]) {
    for(int i = 1; argv && i < argc; ++i) {
      tokens_.emplace_back(argv[i] ? argv[i] : "");
    }
  }

  bool done() const { return pos_ >= tokens_.size(); }
  const std::string& take() { return tokens_[pos_++]; }
  const std::string* peek() const { return done() ? nullptr : &tokens_[pos_]; }

private:
  std::vector<std::string> tokens_;
  std::size_t pos_ = 0;
};

CommandLineParser::CommandLineParser(std::string program,
                                     nlohmann::json settings_spec,
                                     std::vector<std::string> positional_keys)
  : program_(std::move(program)),
    settings_spec_(std::move(settings_spec)),
    positional_keys_(std::move(positional_keys)) {
  SettingsManager known(settings_spec_);
  for(const auto& key : positional_keys_) {
    if(!known.resolve_key(key)) {
      throw std::runtime_error("positional argument maps to unknown setting '" + key + "'");
    }
  }
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  Cursor cursor(argc, argv);
  std::size_t slot = 0;
  while(!cursor.done()) {
    const std::string token = cursor.take();

    if(token.rfind("--", 0) == 0 && token.size() > 2) {
      std::string name = token.substr(2);
      std::optional<std::string> inline_value;
      const auto eq = name.find('=');
      if(eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name.erase(eq);
      }
      apply_option(cursor, name, std::move(inline_value), true, settings);
      continue;
    }

    // an unrecognised short token is taken as a positional value
    if(looks_like_option(token) && apply_option(cursor, token.substr(1), std::nullopt, false, settings)) {
      continue;
    }

    apply_positional(slot++, token, settings);
  }
}

bool CommandLineParser::apply_option(Cursor& cursor, const std::string& name,
                                     std::optional<std::string> inline_value, bool long_form,
                                     SettingsManager& settings) const {
  const auto key = settings.resolve_key(name);
  if(!key) {
    if(long_form) reject("Unknown option --" + name);
    return false;
  }

  std::string value;
  if(inline_value) {
    value = *inline_value;
  } else if(settings.is_bool_setting(*key)) {
    const std::string* next = cursor.peek();
    value = (next && !looks_like_option(*next) && is_bool_word(*next)) ? cursor.take() : "true";
  } else if(cursor.done()) {
    reject("Missing value for option '" + name + "'");
  } else {
    value = cursor.take();
  }

  std::string error;
  if(!settings.set_from_string(*key, value, error)) {
    reject("Invalid value for option '" + name + "': " + error);
  }
  return true;
}

void CommandLineParser::apply_positional(std::size_t slot, const std::string& token,
                                         SettingsManager& settings) const {
  if(slot >= positional_keys_.size()) {
    reject("Unexpected positional argument '" + token + "'");
  }
  const auto& key = positional_keys_[slot];
  std::string error;
  if(!settings.set_from_string(key, token, error)) {
    reject("Invalid value for " + key + " '" + token + "': " + error);
  }
}

std::string CommandLineParser::find_config_path(int argc, char* argv[]) {
  Cursor cursor(argc, argv);
  while(!cursor.done()) {
    const std::string token = cursor.take();
    if(token.rfind("--config=", 0) == 0) return token.substr(9);
    if((token == "--config" || token == "-c") && cursor.peek()) return cursor.take();
  }
  return std::string();
}

std::string CommandLineParser::describe_option(const nlohmann::json& entry) const {
  const auto key = entry.at("key").get<std::string>();
  const auto type = entry.at("type").get<std::string>();
  const std::string hint = type == "bool" ? "[true|false]" : "<" + type + ">";

  std::string aliases;
  for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
    aliases += aliases.empty() ? " (alias: -" : ", -";
    aliases += alias;
  }
  if(!aliases.empty()) aliases += ")";

  return fmt::format("  --{} {:<12} {}{} (default: {})",
                     key, hint, entry.value("description", ""), aliases, default_text(entry));
}

void CommandLineParser::usage() const {
  std::string synopsis = program_;
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";

  print_out(nullptr, "{} - pull a remote directory through an exec-only shell channel", program_);
  print_out(nullptr, "Usage:\n  {}\n\nOptions:", synopsis);
  for(const auto& entry : settings_spec_) {
    print_out(nullptr, "{}", describe_option(entry));
  }
  print_out(nullptr, "");
}
