#ifndef NEURODECODE_COMPAT_UTILS_H
#define NEURODECODE_COMPAT_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>

namespace neurodecode {
namespace io {
namespace compat {

// C++17 compatible string ends_with function
inline bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.length() > str.length()) {
        return false;
    }
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

inline std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

// Extension test that ignores case and a trailing ".gz"
inline bool has_extension(const std::string& filename, const std::string& extension) {
    std::string lower_name = to_lower(filename);
    if (ends_with(lower_name, ".gz")) {
        lower_name = lower_name.substr(0, lower_name.length() - 3);
    }
    return ends_with(lower_name, extension);
}

} // namespace compat
} // namespace io
} // namespace neurodecode

#endif // NEURODECODE_COMPAT_UTILS_H
