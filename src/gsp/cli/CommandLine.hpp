#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace GSP::Cli {

/**
 * Small option parser for the gsp tools. Options are registered with a
 * handler and a help line; `--name=value` and `--name value` are both
 * accepted. Tokens that do not start with '-' are handed to the
 * positional handler.
 */
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    CommandLine();

    void set_program_name(std::string_view name);
    void set_error_logger(std::function<void(std::string const&)> logger);
    void set_positional_handler(std::function<ParseError(std::string_view)> handler);

    struct FlagOption {
        std::function<void()> on_set;
        std::string           help;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
        std::string                                 value_name = "value";
        std::string                                 help;
    };

    struct SizeOption {
        std::function<void(std::size_t)> on_value;
        std::string                      help;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_size(std::string_view name, SizeOption option);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char** argv);
    [[nodiscard]] bool had_errors() const;
    [[nodiscard]] auto usage() const -> std::string;

private:
    struct OptionEntry {
        std::string                                 name;
        std::vector<std::string>                    aliases;
        bool                                        expects_value = false;
        std::string                                 value_name;
        std::string                                 help;
        std::function<void()>                       flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    OptionEntry* find_option(std::string_view name);
    void         register_option(OptionEntry entry);
    void         log_error(std::string_view message);
    void         mark_error();

    std::vector<OptionEntry>                     options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::string                                  program_name_;
    std::function<ParseError(std::string_view)>  positional_handler_;
    std::function<void(std::string const&)>      error_logger_;
    bool                                         had_error_ = false;
};

} // namespace GSP::Cli
