#include "lbridge/data_server.hpp"

namespace lbridge {

string format_path(const string& name_space, const data_path& path) {
    string res = name_space;
    for (auto& seg : path) {
        res += "." + seg;
    }
    return res;
}

data_server::data_server(const string& name_space)
    : name_space{name_space} {
}

const string& data_server::get_namespace() const {
    return name_space;
}

resolution data_server::lookup(const data_path& path) {
    auto v = resolve(path);
    if (v.is_nil()) {
        return resolution::make_intermediate();
    }
    return resolution::make_leaf(std::move(v));
}

bool data_server::can_write(const data_path&) {
    return false;
}

void data_server::write(const data_path& path, const value&) {
    throw read_only_access(format_path(name_space, path));
}

}
