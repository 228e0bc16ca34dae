#include "cli/CommandLine.hpp"

#include <charconv>
#include <iostream>

namespace HF::Cli {

CommandLine::CommandLine(std::string_view program_name)
    : program_name_(program_name) {}

void CommandLine::set_unknown_argument_handler(std::function<bool(std::string_view)> handler) {
    unknown_handler_ = std::move(handler);
}

void CommandLine::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void CommandLine::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help         = std::move(option.help);
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void CommandLine::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.metavar       = std::move(option.metavar);
    entry.help          = std::move(option.help);
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void CommandLine::add_string(std::string_view name, std::string& target, std::string help, std::string metavar) {
    add_value(name, ValueOption{.on_value = [&target](std::string_view value) -> ParseError {
                                    target.assign(value.begin(), value.end());
                                    return std::nullopt;
                                },
                                .metavar = std::move(metavar),
                                .help    = std::move(help)});
}

void CommandLine::add_int(std::string_view name, IntOption option) {
    ValueOption value_opt{};
    value_opt.metavar  = std::move(option.metavar);
    value_opt.help     = std::move(option.help);
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires an integer value";
        }
        int  value  = 0;
        auto result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
            return stored + " expects an integer value";
        }
        return handler(value);
    };
    add_value(name, std::move(value_opt));
}

void CommandLine::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        log_error("missing option for alias '" + std::string(target) + "'");
        had_error_ = true;
        return;
    }
    options_[target_it->second].aliases.emplace_back(alias);
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool CommandLine::parse(int argc, char** argv) {
    had_error_ = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view                raw_token{argv[i]};
        std::optional<std::string_view> attached_value;
        std::string_view                name = raw_token;
        if (raw_token.starts_with("--")) {
            auto equals_pos = raw_token.find('=');
            if (equals_pos != std::string_view::npos) {
                name           = raw_token.substr(0, equals_pos);
                attached_value = raw_token.substr(equals_pos + 1);
            }
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            if (!unknown_handler_) {
                log_error("unknown argument '" + std::string(raw_token) + "'");
                had_error_ = true;
            } else if (!unknown_handler_(raw_token)) {
                had_error_ = true;
            }
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                had_error_ = true;
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::string_view value;
        if (attached_value) {
            value = *attached_value;
        } else {
            if ((i + 1) >= argc) {
                log_error(entry->name + " requires a value");
                had_error_ = true;
                continue;
            }
            value = std::string_view{argv[++i]};
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                log_error(*error);
                had_error_ = true;
            }
        }
    }
    return !had_error_;
}

void CommandLine::print_usage(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options]\n\nOptions:\n";
    for (auto const& option : options_) {
        std::string left = "  ";
        for (auto const& alias : option.aliases) {
            left += alias + ", ";
        }
        left += option.name;
        if (option.expects_value) {
            left += " <" + option.metavar + ">";
        }
        out << left;
        if (!option.help.empty()) {
            if (left.size() < 32) {
                out << std::string(32 - left.size(), ' ');
            } else {
                out << "\n" << std::string(32, ' ');
            }
            out << option.help;
        }
        out << '\n';
    }
}

CommandLine::OptionEntry* CommandLine::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void CommandLine::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    option_lookup_.emplace(options_.back().name, options_.size() - 1);
}

void CommandLine::log_error(std::string_view message) {
    std::string text = program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

} // namespace HF::Cli
