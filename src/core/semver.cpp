#include "scfw/semver.hpp"
#include "scfw/text_utils.hpp"

#include <cctype>

namespace scfw {

std::optional<Version> parse_version(const std::string& str) {
    std::string s = text::trim(str);
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

std::optional<Version> parse_manager_version(const std::string& str) {
    std::string s = text::trim(str);
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) {
        s = s.substr(1);
    }

    // Collect up to three dot-separated numeric components
    std::string components[3] = {"0", "0", "0"};
    size_t pos = 0;
    int count = 0;
    while (count < 3 && pos < s.size()) {
        size_t start = pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        if (pos == start) break;

        std::string digits = s.substr(start, pos - start);
        // Leading zeros are not valid SemVer numbers
        size_t nz = digits.find_first_not_of('0');
        components[count++] = (nz == std::string::npos) ? "0" : digits.substr(nz);

        if (pos < s.size() && s[pos] == '.') {
            ++pos;
        } else {
            break;
        }
    }

    if (count == 0) return std::nullopt;
    return parse_version(components[0] + "." + components[1] + "." + components[2]);
}

bool meets_minimum(const Version& version, const Version& minimum) {
    return version >= minimum;
}

} // namespace scfw
