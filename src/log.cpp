#include "lbridge/log.hpp"

namespace lbridge {

logger::logger(std::ostream* err_out, std::ostream* info_out)
    : err_out{err_out}
    , info_out{info_out} {
}

static void emit(std::ostream* out,
        const char* level,
        const string& subsystem,
        const string& message) {
    if (out == nullptr) {
        return;
    }
    (*out) << "[" << level << "] " << subsystem << ":\n\t"
           << message << '\n';
}

void logger::log_fault(const fault& err) {
    log_error(err.subsystem, err.message);
}

void logger::log_exception(const string& subsystem, const error& e) {
    log_error(subsystem, e.what());
}

void logger::log_error(const string& subsystem, const string& message) {
    emit(err_out, "ERROR", subsystem, message);
}

void logger::log_warning(const string& subsystem, const string& message) {
    emit(err_out, "WARNING", subsystem, message);
}

void logger::log_info(const string& subsystem, const string& message) {
    emit(info_out, "INFO", subsystem, message);
}

}
