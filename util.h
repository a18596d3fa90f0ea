#pragma once

#include <cassert>
#include <cerrno>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <z3++.h>

#include "config.h"

#define report(msg, ...) \
fprintf(stderr, "report: " msg "\n", ##__VA_ARGS__)

#define trace(msg, ...)                                         \
do {                                                            \
    if (conf::verbose) {                                        \
        fprintf(stderr, "trace: " msg "\n", ##__VA_ARGS__);     \
    }                                                           \
} while (false)

namespace z3 {

struct eval {
    z3::model model;
    eval(const z3::model& model): model(model) {}
    z3::expr operator()(const z3::expr& e) const { return model.eval(e, true); }
};

inline z3::expr reduce_and(const z3::expr_vector& v) {
    return z3::mk_and(v);
}

inline z3::expr reduce_or(const z3::expr_vector& v) {
    return z3::mk_or(v);
}

inline expr iff(const z3::expr& a, const z3::expr& b) {
    assert(a.is_bool());
    assert(b.is_bool());
    return a == b;
}

}

namespace util {

inline std::system_error syserr(const std::string& what = "") {
    return std::system_error(std::error_code(errno, std::generic_category()), what);
}

inline std::string format(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    char *s;
    const int res = vasprintf(&s, fmt, ap);
    va_end(ap);
    if (res < 0) {
        throw syserr("vasprintf");
    }
    const std::string str {s};
    std::free(s);
    return str;
}

inline std::string hex(uint64_t x) {
    return format("0x%llx", (unsigned long long) x);
}

template <typename... Ts>
std::string to_string(Ts&&... args) {
    std::stringstream ss;
    (ss << ... << args);
    return ss.str();
}

}
