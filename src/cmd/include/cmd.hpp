#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

namespace txgate::cmd
{
    struct CommandLineArgDef
    {
        enum class NArgs : std::uint8_t
        {
            Zero = 0,
            One,
            Many
        };

        enum class Type : std::uint8_t
        {
            Bool = 0,
            Int,
            String
        };

        std::string name;
        NArgs nargs = NArgs::Zero;
        Type type = Type::Bool;
        std::string description;
    };

    class ArgParser
    {
        public:
            ArgParser() = default;

            void addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string description);

            /**
             * @brief Collects values of the registered arguments. Unknown arguments are logged and kept aside.
             */
            void parse(int argc, char* argv[]);

            template<class T>
            std::optional<T> getArg(const std::string & name) const;

            const std::vector<std::string> & unknownArgs() const noexcept;

            std::string constructHelpMessage() const;

        private:
            std::vector<CommandLineArgDef> _defs;
            absl::flat_hash_map<std::string, std::size_t> _def_index;
            absl::flat_hash_map<std::string, std::vector<std::string>> _values;
            std::vector<std::string> _unknown;
    };

    template<>
    std::optional<bool> ArgParser::getArg<bool>(const std::string & name) const;

    template<>
    std::optional<std::vector<int>> ArgParser::getArg<std::vector<int>>(const std::string & name) const;

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg<std::vector<std::string>>(const std::string & name) const;
}
