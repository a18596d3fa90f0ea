#pragma once

#include <ostream>
#include <string>

namespace wxv {

struct exception {
    std::string msg;

    exception(const std::string& msg): msg(msg) {}
    virtual ~exception() = default;

    virtual const char *kind() const = 0;

    const char *what() const {
        return msg.c_str();
    }

    void print(std::ostream& os) const {
        os << kind() << ": " << what();
    }
};

inline std::ostream& operator<<(std::ostream& os, const exception& e) {
    e.print(os);
    return os;
}

/// Bad geometry, scenario or goal identifier, or a mis-kinded address. Raised before
/// the offending constraint is built.
struct configuration_error: exception {
    using exception::exception;

    virtual const char *kind() const override {
        return "configuration error";
    }
};

/// The solver session could not be created or failed mid-call.
struct oracle_unavailable: exception {
    using exception::exception;

    virtual const char *kind() const override {
        return "oracle unavailable";
    }
};

}
