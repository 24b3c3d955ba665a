#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codebench {
using namespace std;

bench_exception::bench_exception()
    : bench_exception("") {}

bench_exception::bench_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *bench_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const bench_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : bench_exception() {}

internal_error::internal_error(const string &message)
    : bench_exception(message) {}

extraction_error::extraction_error()
    : extraction_error("no code extracted") {}

extraction_error::extraction_error(const string &message)
    : bench_exception(message) {}

adapter_error::adapter_error(error_kind kind, const string &message)
    : bench_exception(message), kind(kind) {}

sandbox_error::sandbox_error(const string &message)
    : internal_error(message) {}

report_io_error::report_io_error(const string &message)
    : bench_exception(message) {}

config_error::config_error(const string &message)
    : bench_exception(message) {}

interrupted_error::interrupted_error()
    : bench_exception("evaluation interrupted") {}

}  // namespace codebench
