#include "toolchain/semver.hpp"

#include <limits>
#include <sstream>

namespace kmake::toolchain {

/// Reads a run of digits at `pos`. Returns nullopt if there are none or the
/// value does not fit in an unsigned long.
static std::optional<unsigned long> read_number(std::string_view text, size_t& pos) {
    constexpr unsigned long max = std::numeric_limits<unsigned long>::max();

    size_t start = pos;
    unsigned long value = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        auto digit = static_cast<unsigned long>(text[pos] - '0');
        if (value > (max - digit) / 10)
            return std::nullopt;
        value = value * 10 + digit;
        ++pos;
    }
    if (pos == start)
        return std::nullopt;
    return value;
}

std::optional<SemVer> SemVer::parse(std::string_view text) {
    size_t pos = 0;
    if (pos < text.size() && (text[pos] == 'v' || text[pos] == 'V'))
        ++pos;

    SemVer v;
    auto major = read_number(text, pos);
    if (!major)
        return std::nullopt;
    v.major = *major;

    unsigned long* rest[] = {&v.minor, &v.patch};
    for (unsigned long* slot : rest) {
        if (pos >= text.size() || text[pos] != '.')
            break;
        size_t save = pos;
        ++pos;
        auto n = read_number(text, pos);
        if (!n) {
            pos = save;
            break;
        }
        *slot = *n;
    }

    // Anything after the numeric core must be a suffix, not more garbage digits.
    if (pos < text.size() && text[pos] != '-' && text[pos] != '+')
        return std::nullopt;

    return v;
}

std::string SemVer::to_string() const {
    std::ostringstream oss;
    oss << major << '.' << minor << '.' << patch;
    return oss.str();
}

std::optional<SemVer> parse_tool_version(std::string_view output) {
    std::istringstream words{std::string(output)};
    std::string word;
    while (words >> word) {
        if (!word.empty() && word[0] >= '0' && word[0] <= '9') {
            return SemVer::parse(word);
        }
    }
    return std::nullopt;
}

} // namespace kmake::toolchain
