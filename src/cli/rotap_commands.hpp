#ifndef ROTAP_COMMANDS_HPP
#define ROTAP_COMMANDS_HPP

#include <ostream>
#include <string>
#include <vector>

namespace rotap {
namespace cli {

constexpr int EXIT_USAGE = 2;

extern const char* const DEFAULT_CONFIG_PATH;

std::string get_option(const std::vector<std::string>& args, const std::string& option,
                       const std::string& default_val = "");

/// First argument that is neither an option nor an option's value
std::string get_positional(const std::vector<std::string>& args);

/// --config, then $ROTAP_CONFIG, then DEFAULT_CONFIG_PATH
std::string config_path(const std::vector<std::string>& args);

// Operator commands. Exit code: 0 ok, 1 failure, EXIT_USAGE bad arguments.
int handle_rotate(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
int handle_status(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
int handle_check_config(const std::vector<std::string>& args, std::ostream& out,
                        std::ostream& err);

} // namespace cli
} // namespace rotap

#endif // ROTAP_COMMANDS_HPP
