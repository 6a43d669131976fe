#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>

// Command-line arguments of one subcommand.
//   --key value, --key=value, -k value  for options listed as taking a value
//   --flag, -f                          for everything else
// Options given more than once keep every value (see all()).
struct ParsedArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::vector<std::string>> options;
    std::set<std::string> flags;
    std::vector<std::string> errors;    // e.g. "--target needs a value"

    bool has_flag(const std::string& long_name, const std::string& short_name = "") const;

    // Last value given for the option, or `fallback`.
    std::string get(const std::string& long_name, const std::string& short_name = "",
                    const std::string& fallback = "") const;
    bool has(const std::string& long_name, const std::string& short_name = "") const;

    // Every value, in command-line order (long name first, then short).
    std::vector<std::string> all(const std::string& long_name, const std::string& short_name = "") const;
};

// `value_options` names (without dashes) the options that consume a value.
ParsedArgs parse_args(const std::vector<std::string>& args,
                      const std::set<std::string>& value_options);
