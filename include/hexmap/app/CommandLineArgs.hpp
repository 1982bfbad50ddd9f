#pragma once
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>

namespace hexmap::app {

// Parsed hexmapgen arguments (everything after the command word).
//
// Notes:
//   - "--opt=value" and "--opt value" are both accepted.
//   - Names in `switches` never take a value; "--opt" followed by another "--" option
//     is also treated as a switch.
//   - The first bare argument is the positional one (e.g. "3,4" for `tile`).
struct CommandLineArgs
{
    std::map<std::string, std::string> options;   // "--seed" -> "7", switches -> ""
    std::optional<std::string> positional;

    [[nodiscard]] bool has(const std::string& name) const { return options.count(name) != 0; }
    [[nodiscard]] const std::string& get(const std::string& name) const { return options.at(name); }
};

[[nodiscard]] CommandLineArgs ParseCommandLineArgs(std::span<const std::string_view> args,
                                                   const std::set<std::string_view>& switches);

} // namespace hexmap::app
