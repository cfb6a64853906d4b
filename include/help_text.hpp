#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP
#include <map>
#include <string>
#include <vector>

/**
 * @brief One command line option as shown in the help output.
 *
 * An empty @c arg marks a boolean flag; anything else means the option
 * consumes a value.
 */
struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

/** @return Every supported option, in help order. */
const std::vector<OptionInfo>& option_table();

/** @return Long aliases mapped to their canonical flag. */
const std::map<std::string, std::string>& option_aliases();

/** @return Full help message for program name @p prog. */
std::string help_text(const char* prog);

/** @brief Write help_text() to standard output. */
void print_help(const char* prog);

#endif // HELP_TEXT_HPP
