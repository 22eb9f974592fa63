#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace vg {

// ============================================================================
// Command-line arguments
// ============================================================================

/// Raw option value as typed on the command line
struct ArgValue {
    std::string value;
    bool is_set = false;

    /**
     * @brief Parse as an integer, or default_val when unset
     * @throws std::invalid_argument if the value is set but not an integer
     */
    int as_int(int default_val = 0) const;
};

/// Options collected for one command, keyed by long name
class Args {
public:
    ArgValue get(const std::string& name, const std::string& default_val = "") const;
    bool has(const std::string& name) const;

    /// @throws std::invalid_argument when the option was not given
    std::string require(const std::string& name) const;

    void set(const std::string& name, const std::string& value);

private:
    std::map<std::string, ArgValue> values_;
};

struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;  // presence means true
};

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program_name) const;
};

/**
 * @brief Parse the tokens following a command name
 *
 * Accepts "--name value", "--name=value" and "-s value"; flags take no value.
 * Bare tokens are rejected, as are unknown options and missing required ones.
 * Unset options with a default are filled in.
 *
 * @throws std::invalid_argument on any usage error
 */
Args parse_command_args(const Command& command, const std::vector<std::string>& tokens);

// ============================================================================
// Dispatcher
// ============================================================================

class CLI {
public:
    CLI(std::string program_name, std::string version);

    void register_command(Command command);

    /// @return process exit status
    int run(int argc, char** argv) const;

    void print_help() const;

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace vg
