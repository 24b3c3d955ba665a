#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace codebench {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PASS, "Pass")
    (status::FAIL, "Fail")
    (status::ERROR, "Error")
    (status::TIMEOUT, "Timeout");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::PASS, "pass")
    (status::FAIL, "fail")
    (status::ERROR, "error")
    (status::TIMEOUT, "timeout");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *to_string(status stat) {
    return status_name.at(stat);
}

status status_from_string(const string &name) {
    for (auto &[stat, str] : status_name)
        if (name == str) return stat;
    throw invalid_argument("unknown status " + name);
}

}  // namespace codebench
