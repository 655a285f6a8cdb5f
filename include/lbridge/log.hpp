#ifndef __LBRIDGE_LOG_HPP
#define __LBRIDGE_LOG_HPP

#include "lbridge/base.hpp"

#include <ostream>

namespace lbridge {

class logger {
private:
    std::ostream* err_out;
    std::ostream* info_out;

public:
    // info_out and err_out must be externally managed and ensured to outlive
    // the logger. They may be null, in which case messages are simply ignored.
    logger(std::ostream* err_out, std::ostream* info_out);

    // this logs a fault (as an error)
    void log_fault(const fault& err);
    // this logs a caught error under the given subsystem
    void log_exception(const string& subsystem, const error& e);

    // an error goes to err_out and indicates a stoppage of control flow
    void log_error(const string& subsystem, const string& message);
    // a warning goes to err_out but is not considered fatal
    void log_warning(const string& subsystem, const string& message);
    // info messages are logged to info_out
    void log_info(const string& subsystem, const string& message);
};

}

#endif
