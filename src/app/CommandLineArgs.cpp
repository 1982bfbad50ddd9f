#include "hexmap/app/CommandLineArgs.hpp"

namespace hexmap::app {
namespace {

bool IsOption(std::string_view a) noexcept { return a.rfind("--", 0) == 0; }

} // namespace

CommandLineArgs ParseCommandLineArgs(std::span<const std::string_view> args,
                                     const std::set<std::string_view>& switches)
{
    CommandLineArgs out;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string_view a = args[i];
        if (!IsOption(a))
        {
            if (!out.positional)
                out.positional = std::string(a);
            continue;
        }

        if (const auto eq = a.find('='); eq != std::string_view::npos)
        {
            out.options[std::string(a.substr(0, eq))] = std::string(a.substr(eq + 1));
            continue;
        }

        const std::string name(a);
        if (!switches.count(a) && i + 1 < args.size() && !IsOption(args[i + 1]))
            out.options[name] = std::string(args[++i]);
        else
            out.options[name] = "";
    }
    return out;
}

} // namespace hexmap::app
