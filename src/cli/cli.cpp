#include "cli/cli.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace tg {

namespace {

std::runtime_error bad_value(const OptionValue& v, const std::string& expected) {
    return std::runtime_error("Option --" + v.name + " expects " + expected + ", got '" + v.text + "'");
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

// ==========================================
// OptionValue
// ==========================================

int OptionValue::as_int() const {
    size_t pos = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(text, &pos);
    } catch (const std::logic_error&) {
        throw bad_value(*this, "an integer");
    }
    if (pos != text.size()) throw bad_value(*this, "an integer");
    return parsed;
}

size_t OptionValue::as_size() const {
    int parsed = as_int();
    if (parsed < 0) throw bad_value(*this, "a non-negative integer");
    return static_cast<size_t>(parsed);
}

double OptionValue::as_double() const {
    size_t pos = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(text, &pos);
    } catch (const std::logic_error&) {
        throw bad_value(*this, "a number");
    }
    if (pos != text.size()) throw bad_value(*this, "a number");
    return parsed;
}

std::vector<std::string> OptionValue::as_list(char delim) const {
    std::vector<std::string> items;
    if (!present) return items;

    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, delim)) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

// ==========================================
// ParsedOptions
// ==========================================

void ParsedOptions::set(const std::string& name, const std::string& text) {
    values_[name] = OptionValue{name, text, true};
}

bool ParsedOptions::has(const std::string& name) const {
    return values_.count(name) > 0;
}

OptionValue ParsedOptions::get(const std::string& name, const std::string& fallback) const {
    auto it = values_.find(name);
    if (it != values_.end()) return it->second;
    return OptionValue{name, fallback, !fallback.empty()};
}

std::string ParsedOptions::require(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::runtime_error("Missing required option: --" + name);
    }
    return it->second.text;
}

// ==========================================
// Subcommand
// ==========================================

void Subcommand::print_usage(std::ostream& out, const std::string& program) const {
    out << "\nUsage: " << program << " " << name;
    for (const auto& opt : options) {
        if (opt.required) out << " --" << opt.name << " <value>";
    }
    out << " [options]\n\n" << summary << "\n\nOptions:\n";

    for (const auto& opt : options) {
        out << "  --" << opt.name;
        if (!opt.short_name.empty()) out << ", -" << opt.short_name;
        if (!opt.flag) out << " <value>";
        out << "\n      " << opt.help;
        if (!opt.choices.empty()) out << " {" << join(opt.choices, "|") << "}";
        if (!opt.default_value.empty()) out << " (default: " << opt.default_value << ")";
        if (opt.required) out << " [required]";
        out << "\n";
    }
    out << "\n";
}

// ==========================================
// CommandLine
// ==========================================

CommandLine::CommandLine(std::string program, std::string version, std::string summary)
    : program_(std::move(program)), version_(std::move(version)), summary_(std::move(summary)) {}

void CommandLine::add(Subcommand command) {
    std::string name = command.name;
    commands_[name] = std::move(command);
}

ParsedOptions CommandLine::parse(const Subcommand& command, const std::vector<std::string>& tokens) {
    std::map<std::string, const OptionSpec*> lookup;
    for (const auto& opt : command.options) {
        lookup["--" + opt.name] = &opt;
        if (!opt.short_name.empty()) lookup["-" + opt.short_name] = &opt;
    }

    ParsedOptions parsed;
    for (size_t i = 0; i < tokens.size(); ++i) {
        std::string token = tokens[i];
        std::string inline_value;
        bool has_inline = false;

        if (token.rfind("--", 0) == 0) {
            auto eq = token.find('=');
            if (eq != std::string::npos) {
                inline_value = token.substr(eq + 1);
                token = token.substr(0, eq);
                has_inline = true;
            }
        }

        auto it = lookup.find(token);
        if (it == lookup.end()) {
            throw std::runtime_error("Unknown option: " + tokens[i]);
        }
        const OptionSpec& spec = *it->second;

        if (spec.flag) {
            if (has_inline) throw std::runtime_error("Flag --" + spec.name + " takes no value");
            parsed.set(spec.name, "true");
            continue;
        }

        std::string value;
        if (has_inline) {
            value = inline_value;
        } else if (i + 1 < tokens.size()) {
            value = tokens[++i];
        } else {
            throw std::runtime_error("Option --" + spec.name + " requires a value");
        }

        if (!spec.choices.empty() &&
            std::find(spec.choices.begin(), spec.choices.end(), value) == spec.choices.end()) {
            throw std::runtime_error("Option --" + spec.name + " must be one of " +
                                     join(spec.choices, ", ") + ", got '" + value + "'");
        }
        parsed.set(spec.name, value);
    }

    for (const auto& opt : command.options) {
        if (parsed.has(opt.name)) continue;
        if (opt.required) {
            throw std::runtime_error("Missing required option: --" + opt.name);
        }
        if (!opt.default_value.empty()) {
            parsed.set(opt.name, opt.default_value);
        }
    }

    return parsed;
}

int CommandLine::run(int argc, char** argv) const {
    if (argc < 2) {
        print_usage(std::cerr);
        return 1;
    }

    const std::string name = argv[1];
    if (name == "--help" || name == "-h") {
        print_usage(std::cout);
        return 0;
    }
    if (name == "--version") {
        std::cout << program_ << " " << version_ << "\n";
        return 0;
    }

    auto it = commands_.find(name);
    if (it == commands_.end()) {
        std::cerr << "Unknown command: " << name << "\n"
                  << "Run '" << program_ << " --help' for available commands.\n";
        return 1;
    }
    const Subcommand& command = it->second;

    std::vector<std::string> tokens(argv + 2, argv + argc);
    if (std::find(tokens.begin(), tokens.end(), "--help") != tokens.end()) {
        command.print_usage(std::cout, program_);
        return 0;
    }

    ParsedOptions options;
    try {
        options = parse(command, tokens);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        command.print_usage(std::cerr, program_);
        return 1;
    }

    try {
        return command.handler(options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

void CommandLine::print_usage(std::ostream& out) const {
    out << program_ << " - " << summary_ << "\n\n"
        << "Usage: " << program_ << " <command> [options]\n\n"
        << "Commands:\n";
    for (const auto& [name, command] : commands_) {
        out << "  " << std::left << std::setw(16) << name << std::right << command.summary << "\n";
    }
    out << "\nRun '" << program_ << " <command> --help' for command options.\n";
}

} // namespace tg
