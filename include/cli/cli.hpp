#pragma once

#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace tg {

/**
 * @brief Raw text of one option plus typed accessors
 *
 * Accessors throw std::runtime_error naming the option when the text does
 * not parse, so handlers can report bad input without extra checks.
 */
struct OptionValue {
    std::string name;
    std::string text;
    bool present = false;

    int as_int() const;
    size_t as_size() const;
    double as_double() const;

    /**
     * @brief Split on `delim`, dropping empty items
     */
    std::vector<std::string> as_list(char delim = ',') const;
};

/**
 * @brief Options of one invocation after defaults were applied
 */
class ParsedOptions {
public:
    void set(const std::string& name, const std::string& text);

    bool has(const std::string& name) const;

    /**
     * @brief Value of `name`, or `fallback` (absent if empty) when not given
     */
    OptionValue get(const std::string& name, const std::string& fallback = "") const;

    /**
     * @throws std::runtime_error when the option was not given
     */
    std::string require(const std::string& name) const;

private:
    std::map<std::string, OptionValue> values_;
};

struct OptionSpec {
    std::string name;
    std::string short_name;
    std::string help;
    std::string default_value;
    bool required = false;
    bool flag = false;                     // Presence only, takes no value
    std::vector<std::string> choices;      // Accepted values; empty accepts anything
};

struct Subcommand {
    std::string name;
    std::string summary;
    std::vector<OptionSpec> options;
    std::function<int(const ParsedOptions&)> handler;

    void print_usage(std::ostream& out, const std::string& program) const;
};

/**
 * @brief Subcommand dispatcher: `program <command> [--option value ...]`
 */
class CommandLine {
public:
    CommandLine(std::string program, std::string version, std::string summary);

    void add(Subcommand command);

    /**
     * @return process exit code; errors are printed to stderr
     */
    int run(int argc, char** argv) const;

    /**
     * @brief Match `tokens` against the options of `command`
     *
     * Accepts `--name value`, `--name=value` and `-s value`.
     * @throws std::runtime_error on unknown, missing or invalid options
     */
    static ParsedOptions parse(const Subcommand& command, const std::vector<std::string>& tokens);

    void print_usage(std::ostream& out) const;

private:
    std::string program_;
    std::string version_;
    std::string summary_;
    std::map<std::string, Subcommand> commands_;
};

} // namespace tg
