#ifndef __LBRIDGE_CONFIG_HPP
#define __LBRIDGE_CONFIG_HPP

#include "lbridge/base.hpp"

#include <vector>

namespace lbridge {

// the entry points removed by default
std::vector<string> default_sandbox_policy();

// Settings applied once, when an engine is constructed.
struct engine_config {
    // whether to apply sandbox_policy and lock down the package library
    bool sandboxed = true;
    // Entry points removed from the interpreter, in order. Each one is a
    // dotted path from the global table, e.g. "os.execute" or
    // "package.loaded.io". Missing entries are skipped.
    std::vector<string> sandbox_policy = default_sandbox_policy();
    // directory searched by require(). When sandboxed and unset, require() can
    // only load preloaded modules.
    optional<string> package_path;
    // limit of the memory accounting hook in bytes, 0 for no limit
    size_t memory_limit = 0;
    // limit of the interpreter heap in bytes, 0 for no limit. Only enforced
    // while script code runs.
    size_t interpreter_memory_limit = 0;
};

// sandboxed, with the default policy and no limits
engine_config default_config();
// no sandbox and no limits
engine_config unrestricted_config();

// split a dotted path like "package.loaded.io" into its segments
std::vector<string> split_dotted(const string& path);

// Parse a non-negative decimal count, e.g. a byte limit or a 1-based index.
// Signs, spaces, trailing characters and values that do not fit in size_t are
// rejected.
optional<size_t> parse_count(const string& s);

}

#endif
