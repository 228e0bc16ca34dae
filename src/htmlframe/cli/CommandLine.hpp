#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace HF::Cli {

// Small long-option parser: `--name value`, `--name=value` and bare flags.
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    explicit CommandLine(std::string_view program_name);

    void set_unknown_argument_handler(std::function<bool(std::string_view)> handler);
    void set_error_logger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::function<void()> on_set;
        std::string           help;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
        std::string                                 metavar = "VALUE";
        std::string                                 help;
    };

    struct IntOption {
        std::function<ParseError(int)> on_value;
        std::string                    metavar = "N";
        std::string                    help;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    // Stores the raw value into `target`.
    void add_string(std::string_view name, std::string& target, std::string help, std::string metavar = "VALUE");
    void add_int(std::string_view name, IntOption option);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char** argv);
    [[nodiscard]] bool had_errors() const { return had_error_; }

    void print_usage(std::ostream& out) const;

private:
    struct OptionEntry {
        std::string                                 name;
        std::vector<std::string>                    aliases;
        bool                                        expects_value = false;
        std::string                                 metavar;
        std::string                                 help;
        std::function<void()>                       flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    OptionEntry* find_option(std::string_view name);
    void         register_option(OptionEntry entry);
    void         log_error(std::string_view message);

    std::vector<OptionEntry>                     options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::string                                  program_name_;
    std::function<bool(std::string_view)>        unknown_handler_;
    std::function<void(std::string const&)>      error_logger_;
    bool                                         had_error_ = false;
};

} // namespace HF::Cli
