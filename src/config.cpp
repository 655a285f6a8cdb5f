#include "lbridge/config.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace lbridge {

std::vector<string> default_sandbox_policy() {
    return {
        "os.execute",
        "os.exit",
        "os.remove",
        "os.rename",
        "os.tmpname",
        "os.getenv",
        "os.setlocale",
        "io",
        "debug",
        "loadfile",
        "dofile",
        "load",
        "loadstring",
        "package.loadlib",
        "package.loaded.io",
        "package.loaded.debug"
    };
}

engine_config default_config() {
    return engine_config{};
}

engine_config unrestricted_config() {
    engine_config res;
    res.sandboxed = false;
    res.sandbox_policy.clear();
    return res;
}

std::vector<string> split_dotted(const string& path) {
    std::vector<string> res;
    size_t start = 0;
    while (true) {
        auto dot = path.find('.', start);
        if (dot == string::npos) {
            res.push_back(path.substr(start));
            break;
        }
        res.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return res;
}

optional<size_t> parse_count(const string& s) {
    // stoull would accept leading spaces and a sign
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) {
        return std::nullopt;
    }
    size_t pos = 0;
    unsigned long long n;
    try {
        n = std::stoull(s, &pos);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (pos != s.size() || n > std::numeric_limits<size_t>::max()) {
        return std::nullopt;
    }
    return static_cast<size_t>(n);
}

}
