#include "lbridge/base.hpp"

namespace lbridge {

const char* error_kind_name(error_kind kind) {
    switch (kind) {
    case ek_syntax:
        return "syntax";
    case ek_runtime:
        return "runtime";
    case ek_memory:
        return "memory";
    case ek_read_only:
        return "read-only";
    case ek_path_resolution:
        return "path-resolution";
    case ek_callback:
        return "callback";
    case ek_coroutine:
        return "coroutine";
    case ek_init_failed:
        return "init";
    case ek_type:
        return "type";
    case ek_unknown:
        break;
    }
    return "unknown";
}

error::error(error_kind kind,
        const string& message,
        const string& path,
        int code)
    : kind{kind}
    , message{message}
    , path{path}
    , code{code} {
    formatted = "[" + string{error_kind_name(kind)} + "] ";
    if (kind == ek_unknown) {
        formatted += "(status " + std::to_string(code) + ") ";
    }
    formatted += message;
}

error read_only_access(const string& path) {
    return error{ek_read_only, "cannot write to read-only path " + path, path};
}

error path_resolution(const string& path) {
    return error{ek_path_resolution,
        "no data server is registered for path " + path, path};
}

}
