#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Simple command line argument parser.
 *
 * The parser recognizes long style options (e.g. `--flag` or `--opt value`).
 * A list of known flags can be provided so that unknown flags are collected
 * and reported separately. Options may also be specified using the form
 * `--opt=value`. A mapping of short options (like `-v`) to their long
 * counterparts can optionally be supplied, as can long aliases such as
 * `--fetch-all-remotes` for `--fetch-all`; aliases are recorded under their
 * canonical name.
 *
 * When @a value_flags is non-empty only the listed flags consume the
 * following argument, so `--no-pull /srv/repos` keeps `/srv/repos` as a
 * positional argument. With an empty set every long flag may take a value.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::map<std::string, std::vector<std::string>>
        multi_options_;                      ///< Store all values for repeatable options
    std::vector<std::string> positional_;    ///< Positional arguments in order
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::set<std::string> known_flags_;      ///< List of accepted flags
    std::map<char, std::string> short_map_;  ///< Mapping of short to long flags
    std::set<std::string> value_flags_;      ///< Flags that take a value
    std::map<std::string, std::string> aliases_; ///< Long alias to canonical flag

    std::string canonical(const std::string& key) const {
        auto it = aliases_.find(key);
        return it != aliases_.end() ? it->second : key;
    }

    bool is_known(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    bool takes_value(const std::string& key) const {
        return value_flags_.empty() || value_flags_.count(key) > 0;
    }

    void record(const std::string& raw_key, const std::string* val) {
        std::string key = canonical(raw_key);
        if (!is_known(key)) {
            unknown_flags_.push_back(raw_key);
            return;
        }
        flags_.insert(key);
        if (val) {
            options_[key] = *val;
            multi_options_[key].push_back(*val);
        }
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Optional set of flags that are considered valid. If
     *        empty, all flags are treated as known.
     * @param short_map Mapping from single character options (e.g. '-v') to
     *        their long form (e.g. '--verbose').
     * @param value_flags Flags that require a value.
     * @param aliases Long aliases mapped to their canonical long flag.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {},
              const std::map<std::string, std::string>& aliases = {})
        : known_flags_(known_flags), short_map_(short_map), value_flags_(value_flags),
          aliases_(aliases) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--") {
                for (++i; i < argc; ++i)
                    positional_.emplace_back(argv[i]);
                break;
            }
            if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string val = arg.substr(eq + 1);
                    record(arg.substr(0, eq), &val);
                } else if (takes_value(canonical(arg)) && i + 1 < argc &&
                           std::string(argv[i + 1]).rfind("-", 0) != 0) {
                    std::string val = argv[++i];
                    record(arg, &val);
                } else {
                    record(arg, nullptr);
                }
            } else if (arg.size() >= 2 && arg[0] == '-') {
                size_t eq = arg.find('=');
                std::string before =
                    arg.substr(1, eq != std::string::npos ? eq - 1 : std::string::npos);
                std::string after = eq != std::string::npos ? arg.substr(eq + 1) : "";

                // Stacked short flags: "-nv" expands to "--no-pull --verbose"; a value
                // flag ends the stack and takes the rest of the token or the next arg.
                for (size_t j = 0; j < before.size(); ++j) {
                    char c = before[j];
                    auto it = short_map_.find(c);
                    if (it == short_map_.end()) {
                        unknown_flags_.push_back(std::string("-") + c);
                        continue;
                    }
                    const std::string& key = it->second;
                    if (!value_flags_.empty() && !value_flags_.count(key)) {
                        record(key, nullptr);
                        continue;
                    }
                    std::string val;
                    if (j + 1 < before.size())
                        val = before.substr(j + 1);
                    else if (!after.empty())
                        val = after;
                    else if (i + 1 < argc && std::string(argv[i + 1]).rfind('-', 0) != 0)
                        val = argv[++i];
                    if (val.empty())
                        record(key, nullptr);
                    else
                        record(key, &val);
                    break;
                }
            } else {
                positional_.push_back(arg);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Canonical flag name including the leading `--`.
     * @return `true` if the flag was present, otherwise `false`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * If the option was not provided, an empty string is returned.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /**
     * @brief Retrieve all values associated with a repeatable option.
     */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Map of option names to their parsed values. */
    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags, as typed. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
