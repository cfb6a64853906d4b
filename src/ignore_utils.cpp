#include "ignore_utils.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <fnmatch.h>

namespace {

void trim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

} // namespace

namespace ignore {

std::vector<std::string> read_ignore_file(const std::filesystem::path& file) {
    std::vector<std::string> entries;
    std::ifstream ifs(file);
    if (!ifs)
        return entries;
    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        entries.push_back(line);
    }
    return entries;
}

bool matches(const std::string& name, const std::vector<std::string>& patterns) {
    for (const auto& pat : patterns) {
        if (pat.empty())
            continue;
        const bool has_glob = pat.find_first_of("*?[") != std::string::npos;
        if (!has_glob) {
            if (name == pat)
                return true;
            continue;
        }
        if (fnmatch(pat.c_str(), name.c_str(), 0) == 0)
            return true;
    }
    return false;
}

} // namespace ignore
