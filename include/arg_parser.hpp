#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

namespace svckit {

/**
 * @brief Small command line parser for `verb --flag --opt value` style input.
 *
 * Options listed in @a value_options take a value, either as `--opt value`
 * or `--opt=value`. Every other known flag is a switch and never consumes
 * the following word, so `--verbose start` keeps `start` as a positional
 * argument. A switch may still be written `--flag=false`. Short aliases map
 * a single character (e.g. `-c`) to its long form. Anything starting with a
 * dash that is not known ends up in unknown_flags().
 */
class ArgParser {
    std::map<std::string, std::string> options_; ///< Flag or option to value
    std::vector<std::string> positional_;
    std::vector<std::string> unknown_flags_;
    std::vector<std::string> missing_values_;     ///< Options given without a value
    std::set<std::string> value_options_;
    std::set<std::string> switches_;
    std::map<char, std::string> short_map_;

    bool known(const std::string& key) const {
        return value_options_.count(key) > 0 || switches_.count(key) > 0;
    }

    void take(const std::string& key, int& i, int argc, char* argv[]) {
        if (!known(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        if (value_options_.count(key) == 0) {
            options_[key] = "";
            return;
        }
        if (i + 1 < argc) {
            options_[key] = argv[++i];
            return;
        }
        missing_values_.push_back(key);
    }

  public:
    /**
     * @param argc          Argument count from `main`.
     * @param argv          Argument vector from `main`.
     * @param value_options Options that take a value, including the `--`.
     * @param switches      Boolean flags, including the `--`.
     * @param short_map     Single character aliases of long names.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& value_options,
              const std::set<std::string>& switches,
              const std::map<char, std::string>& short_map = {})
        : value_options_(value_options), switches_(switches), short_map_(short_map) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional || arg == "-" || arg.empty() || arg[0] != '-') {
                positional_.push_back(arg);
            } else if (arg == "--") {
                only_positional = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq == std::string::npos) {
                    take(arg, i, argc, argv);
                    continue;
                }
                std::string key = arg.substr(0, eq);
                if (known(key))
                    options_[key] = arg.substr(eq + 1);
                else
                    unknown_flags_.push_back(key);
            } else if (arg.size() == 2 && short_map_.count(arg[1])) {
                take(short_map_.at(arg[1]), i, argc, argv);
            } else {
                unknown_flags_.push_back(arg);
            }
        }
    }

    /** @return true if the flag or option appeared, with or without a value. */
    bool has_flag(const std::string& flag) const { return options_.count(flag) > 0; }

    /** @return Stored value, empty for switches and absent options. */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        return it != options_.end() ? it->second : std::string();
    }

    /** @return Every flag and option found, keyed by long name. */
    const std::map<std::string, std::string>& options() const { return options_; }

    const std::vector<std::string>& positional() const { return positional_; }

    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value options that ended the command line without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

} // namespace svckit

#endif // ARG_PARSER_HPP
