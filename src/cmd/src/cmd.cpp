#include "cmd.hpp"

#include <charconv>
#include <format>

#include <spdlog/spdlog.h>

namespace txgate::cmd
{
    void ArgParser::addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string description)
    {
        if(_def_index.contains(name))
        {
            spdlog::warn("Argument {} registered twice", name);
            return;
        }

        _def_index.emplace(name, _defs.size());
        _defs.push_back(CommandLineArgDef{
            .name = std::move(name),
            .nargs = nargs,
            .type = type,
            .description = std::move(description)
        });
    }

    void ArgParser::parse(int argc, char* argv[])
    {
        _values.clear();
        _unknown.clear();

        for(int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];

            auto it = _def_index.find(arg);
            if(it == _def_index.end())
            {
                spdlog::warn("Unknown argument: {}", arg);
                _unknown.push_back(arg);
                continue;
            }

            const CommandLineArgDef & def = _defs.at(it->second);
            std::vector<std::string> & values = _values[def.name];

            switch(def.nargs)
            {
                case CommandLineArgDef::NArgs::Zero:
                    break;

                case CommandLineArgDef::NArgs::One:
                    if(i + 1 >= argc)
                    {
                        spdlog::warn("Argument {} expects a value", arg);
                        _values.erase(def.name);
                        break;
                    }
                    values.assign({argv[++i]});
                    break;

                case CommandLineArgDef::NArgs::Many:
                    while(i + 1 < argc && !_def_index.contains(argv[i + 1]))
                    {
                        values.emplace_back(argv[++i]);
                    }
                    break;
            }
        }
    }

    const std::vector<std::string> & ArgParser::unknownArgs() const noexcept
    {
        return _unknown;
    }

    template<>
    std::optional<bool> ArgParser::getArg<bool>(const std::string & name) const
    {
        if(!_def_index.contains(name))
        {
            return std::nullopt;
        }
        return _values.contains(name);
    }

    template<>
    std::optional<std::vector<int>> ArgParser::getArg<std::vector<int>>(const std::string & name) const
    {
        auto it = _values.find(name);
        if(it == _values.end())
        {
            return std::nullopt;
        }

        std::vector<int> out;
        out.reserve(it->second.size());
        for(const std::string & value : it->second)
        {
            int parsed = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if(ec != std::errc{} || ptr != value.data() + value.size())
            {
                spdlog::error("Argument {} expects an integer, got `{}`", name, value);
                return std::nullopt;
            }
            out.push_back(parsed);
        }
        return out;
    }

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg<std::vector<std::string>>(const std::string & name) const
    {
        auto it = _values.find(name);
        if(it == _values.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string ArgParser::constructHelpMessage() const
    {
        std::string message = "Usage: txgated [options]\n\nOptions:\n";
        for(const CommandLineArgDef & def : _defs)
        {
            std::string placeholder;
            switch(def.nargs)
            {
                case CommandLineArgDef::NArgs::Zero: break;
                case CommandLineArgDef::NArgs::One: placeholder = (def.type == CommandLineArgDef::Type::Int) ? " <int>" : " <value>"; break;
                case CommandLineArgDef::NArgs::Many: placeholder = " <values...>"; break;
            }
            message += std::format("  {:<28}{}\n", def.name + placeholder, def.description);
        }
        return message;
    }
}
