#include "cli/cli.hpp"
#include "core/errors.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace {

bool is_help_token(const std::string& token) {
    return token == "--help" || token == "-h";
}

const vg::ArgDef* find_option(const vg::Command& command, const std::string& token) {
    for (const auto& def : command.args) {
        if (token == "--" + def.name) return &def;
        if (!def.short_name.empty() && token == "-" + def.short_name) return &def;
    }
    return nullptr;
}

}  // namespace

namespace vg {

// ============================================================================
// ArgValue / Args
// ============================================================================

int ArgValue::as_int(int default_val) const {
    if (!is_set) return default_val;

    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        std::throw_with_nested(std::invalid_argument("Expected an integer, got '" + value + "'"));
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Expected an integer, got '" + value + "'");
    }
    return parsed;
}

ArgValue Args::get(const std::string& name, const std::string& default_val) const {
    auto it = values_.find(name);
    if (it != values_.end()) return it->second;
    return ArgValue{default_val, !default_val.empty()};
}

bool Args::has(const std::string& name) const {
    return values_.count(name) > 0;
}

std::string Args::require(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::invalid_argument("Missing required argument: --" + name);
    }
    return it->second.value;
}

void Args::set(const std::string& name, const std::string& value) {
    values_[name] = ArgValue{value, true};
}

Args parse_command_args(const Command& command, const std::vector<std::string>& tokens) {
    Args result;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];

        std::string option = token;
        std::string inline_value;
        bool has_inline_value = false;
        if (token.rfind("--", 0) == 0) {
            auto eq_pos = token.find('=');
            if (eq_pos != std::string::npos) {
                option = token.substr(0, eq_pos);
                inline_value = token.substr(eq_pos + 1);
                has_inline_value = true;
            }
        }

        const ArgDef* def = token.rfind("-", 0) == 0 ? find_option(command, option) : nullptr;
        if (!def) {
            throw std::invalid_argument("Unknown argument: " + token);
        }

        if (def->is_flag) {
            if (has_inline_value) {
                throw std::invalid_argument("Flag --" + def->name + " takes no value");
            }
            result.set(def->name, "true");
        } else if (has_inline_value) {
            result.set(def->name, inline_value);
        } else {
            if (i + 1 >= tokens.size()) {
                throw std::invalid_argument("Argument " + token + " requires a value");
            }
            result.set(def->name, tokens[++i]);
        }
    }

    for (const auto& def : command.args) {
        if (result.has(def.name)) continue;
        if (def.required) {
            throw std::invalid_argument("Missing required argument: --" + def.name);
        }
        if (!def.default_value.empty()) {
            result.set(def.name, def.default_value);
        }
    }

    return result;
}

// ============================================================================
// Command
// ============================================================================

void Command::print_help(const std::string& program_name) const {
    std::cout << "\nUsage: " << program_name << " " << name;
    for (const auto& def : args) {
        if (def.required) std::cout << " --" << def.name << " <value>";
    }
    std::cout << " [options]\n\n" << description << "\n\nOptions:\n";

    for (const auto& def : args) {
        std::string label = "--" + def.name;
        if (!def.short_name.empty()) label += ", -" + def.short_name;
        if (!def.is_flag) label += " <value>";

        std::cout << "  " << std::left << std::setw(28) << label << def.description;
        if (!def.default_value.empty()) std::cout << " (default: " << def.default_value << ")";
        if (def.required) std::cout << " [required]";
        std::cout << "\n";
    }
    std::cout << "\n";
}

// ============================================================================
// CLI
// ============================================================================

CLI::CLI(std::string program_name, std::string version)
    : program_name_(std::move(program_name)), version_(std::move(version)) {}

void CLI::register_command(Command command) {
    std::string key = command.name;
    commands_[key] = std::move(command);
}

int CLI::run(int argc, char** argv) const {
    std::vector<std::string> tokens(argv + 1, argv + argc);
    if (tokens.empty()) {
        print_help();
        return 1;
    }

    const std::string& command_name = tokens.front();
    if (is_help_token(command_name)) {
        print_help();
        return 0;
    }
    if (command_name == "--version" || command_name == "-v") {
        std::cout << program_name_ << " version " << version_ << "\n";
        return 0;
    }

    auto it = commands_.find(command_name);
    if (it == commands_.end()) {
        std::cerr << "Unknown command: " << command_name << "\n"
                  << "Run '" << program_name_ << " --help' for available commands.\n";
        return 1;
    }
    const Command& command = it->second;

    tokens.erase(tokens.begin());
    for (const auto& token : tokens) {
        if (is_help_token(token)) {
            command.print_help(program_name_);
            return 0;
        }
    }

    Args args;
    try {
        args = parse_command_args(command, tokens);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        command.print_help(program_name_);
        return 1;
    }

    try {
        return command.handler(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << describe_exception(e) << "\n";
        return 1;
    }
}

void CLI::print_help() const {
    std::cout << program_name_ << " - verse corpus and word graph toolkit\n\n"
              << "Usage: " << program_name_ << " <command> [options]\n\n"
              << "Commands:\n";
    for (const auto& [name, command] : commands_) {
        std::cout << "  " << std::left << std::setw(16) << name << command.description << "\n";
    }
    std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n"
              << "\nVersion: " << version_ << "\n";
}

} // namespace vg
