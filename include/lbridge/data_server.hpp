// data_server.hpp -- host objects that expose hierarchical data to scripts

#ifndef __LBRIDGE_DATA_SERVER_HPP
#define __LBRIDGE_DATA_SERVER_HPP

#include "lbridge/base.hpp"
#include "lbridge/value.hpp"

#include <vector>

namespace lbridge {

// path segments below a namespace, e.g. {"User", "name"} for Test.User.name
using data_path = std::vector<string>;

// human-readable form of a path, e.g. "Test.User.name"
string format_path(const string& name_space, const data_path& path);

enum resolution_kind {
    rk_leaf,          // the path names a value; traversal stops here
    rk_intermediate   // the path may have children; scripts get a proxy
};

struct resolution {
    resolution_kind kind;
    value leaf;

    static resolution make_leaf(value v) {
        return resolution{rk_leaf, std::move(v)};
    }
    static resolution make_intermediate() {
        return resolution{rk_intermediate, value{}};
    }
};

// A data server answers reads and writes under one global name (its
// namespace). Scripts read Namespace.a.b.c one segment at a time; every
// segment that is not a leaf gives back a proxy whose next access extends the
// path.
//
// Servers are called with the engine lock held. A server shared between
// engines on different threads must do its own locking.
class data_server {
private:
    string name_space;

public:
    explicit data_server(const string& name_space);
    virtual ~data_server() = default;

    const string& get_namespace() const;

    // Value at path, or nil for unknown paths and intermediate segments. A
    // non-nil value for an intermediate segment hides everything below it.
    virtual value resolve(const data_path& path) = 0;

    // Classifies path for the proxy system. The default treats nil from
    // resolve() as an intermediate segment and anything else as a leaf.
    virtual resolution lookup(const data_path& path);

    // default: nothing is writable
    virtual bool can_write(const data_path& path);

    // Only called when can_write(path) is true. Errors are reported by
    // throwing; an lbridge::error keeps its kind when it reaches the host. The
    // default throws read_only_access. Functions inside v are anchored like
    // host function arguments and stay anchored until released.
    virtual void write(const data_path& path, const value& v);
};

}

#endif
