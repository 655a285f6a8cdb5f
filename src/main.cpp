#include "config.h"
#include "lbridge/engine.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

using namespace lbridge;

void show_usage() {
    std::cout <<
        "Usage: lbridge [options] [FILE | -] [ARGS...]\n"
        "Description:\n"
        "  Run a Lua script inside a sandboxed lbridge engine and print its\n"
        "  result.\n"
        "Options/Arguments:\n"
        "  -h            Show this help message and exit.\n"
        "  -v            Show the version and exit.\n"
        "  -u            Run without the sandbox.\n"
        "  -I dir        Let require() load Lua modules from dir.\n"
        "  -m bytes      Limit the interpreter heap to this many bytes.\n"
        "  -             Take the script from STDIN.\n"
        "  FILE          Script to run. Arguments after it are passed on.\n"
        "Scripts can read Host.version, Host.args.count and Host.args.1 to\n"
        "Host.args.N.\n"
        ;
}

struct runner_options {
    // script to run. An empty filename is treated as stdin.
    string src = "";
    bool help = false;
    bool version = false;
    bool unrestricted = false;
    optional<string> include;
    size_t heap_limit = 0;
    // arguments after the script name
    std::vector<string> args;

    // if true, the argument list was malformed and the other fields are not
    // guaranteed to be properly initialized
    bool err = false;
    string message = "";
};

// fill in a runner_options object based on CLI options
void process_args(int argc, char** argv, runner_options* opt) {
    int i;
    bool stdin_flag = false;
    for (i = 1; i < argc; ++i) {
        string s{argv[i]};
        if (s[0] == '-') {
            switch(s[1]) {
            case 'h':
                opt->help = true;
                if (s[2] != '\0') {
                    opt->err = true;
                    opt->message = "Unrecognized option: " + s;
                }
                // no sense doing further processing at this point
                return;
            case 'v':
                opt->version = true;
                return;
            case 'u':
                opt->unrestricted = true;
                if (s[2] != '\0') {
                    opt->err = true;
                    opt->message = "Unrecognized option: " + s;
                    return;
                }
                break;
            case 'I':
                if (opt->include.has_value()) {
                    opt->err = true;
                    opt->message = "Multiple -I options.";
                    return;
                }
                // can have -I my/dir or -Imy/dir syntax
                if (s[2] == '\0') {
                    if (i == argc - 1) {
                        opt->err = true;
                        opt->message = "Option -I requires an argument.";
                        return;
                    }
                    opt->include = string{argv[++i]};
                } else {
                    opt->include = s.substr(2);
                }
                break;
            case 'm': {
                if (i == argc - 1) {
                    opt->err = true;
                    opt->message = "Option -m requires an argument.";
                    return;
                }
                auto n = parse_count(argv[++i]);
                if (!n.has_value()) {
                    opt->err = true;
                    opt->message = "Option -m requires a byte count.";
                    return;
                }
                opt->heap_limit = *n;
                break;
            }
            case '\0':
                stdin_flag = true;
                // everything after - belongs to the script
                for (++i; i < argc; ++i) {
                    opt->args.push_back(argv[i]);
                }
                return;
            default:
                opt->err = true;
                opt->message = "Unrecognized option: " + s;
                return;
            }
        } else {
            opt->src = s;
            for (++i; i < argc; ++i) {
                opt->args.push_back(argv[i]);
            }
            return;
        }
    }
    if (opt->src == "" && !stdin_flag) {
        opt->err = true;
        opt->message = "No script provided.";
    }
}

// exposes the runner's arguments and version to the script
class host_server : public data_server {
private:
    std::vector<string> args;

public:
    explicit host_server(const std::vector<string>& args)
        : data_server{"Host"}
        , args{args} {
    }

    value resolve(const data_path& path) override {
        if (path.size() == 1 && path[0] == "version") {
            return value{LBRIDGE_VERSION};
        }
        if (path.size() == 2 && path[0] == "args") {
            if (path[1] == "count") {
                return value{static_cast<i64>(args.size())};
            }
            auto n = parse_count(path[1]);
            if (n.has_value() && *n >= 1 && *n <= args.size()) {
                return value{args[*n - 1]};
            }
        }
        return value{};
    }
};

int main(int argc, char** argv) {
    runner_options opt;
    process_args(argc, argv, &opt);
    if (opt.help) {
        show_usage();
        return 0;
    } else if (opt.version) {
        std::cout << "lbridge " << LBRIDGE_VERSION
                  << " (Lua " << LBRIDGE_LUA_VERSION << ")\n";
        return 0;
    } else if (opt.err) {
        std::cout << "Error processing command line arguments:\n  "
                  << opt.message << '\n';
        return -1;
    }

    string code;
    {
        std::ostringstream buf;
        if (opt.src == "") {
            buf << std::cin.rdbuf();
        } else {
            std::ifstream in{opt.src, std::ios::binary};
            if (!in) {
                std::cout << "Error: could not open " << opt.src << '\n';
                return -1;
            }
            buf << in.rdbuf();
        }
        code = buf.str();
    }

    auto config = opt.unrestricted ? unrestricted_config() : default_config();
    config.package_path = opt.include;
    config.interpreter_memory_limit = opt.heap_limit;

    logger log{&std::cerr, nullptr};
    try {
        engine eng{config, &log};
        eng.register_server(std::make_shared<host_server>(opt.args));
        auto chunk = opt.src == "" ? string{"=stdin"} : "@" + opt.src;
        auto res = eng.evaluate(code, chunk);
        if (!res.is_nil()) {
            std::cout << v_to_string(res) << '\n';
        }
    } catch (const error& e) {
        std::cout << "Error: " << e.what() << '\n';
        return -1;
    }

    return 0;
}
