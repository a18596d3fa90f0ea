#pragma once

#include <cstddef>
#include <cstring>
#include <optional>

/* An X-macro table is written as
 *   #define X_FOO(XB, XE) XB(a) XB(b) XE(c)
 * where XE marks the last entry.
 */

#define XM_LIST_ENT(name, ...) name,
#define XM_LIST_END(name, ...) name
#define XM_LIST(XM) XM(XM_LIST_ENT, XM_LIST_END)

#define XM_ENUM_CLASS(name, XM) enum class name { XM_LIST(XM) }

#define XM_STR_ENT(name, ...) #name,
#define XM_STR_END(name, ...) #name
#define XM_STR_LIST(XM) XM(XM_STR_ENT, XM_STR_END)

#define XM_SIZE_ENT(name, ...) 1 +
#define XM_SIZE_END(name, ...) 1
#define XM_SIZE(XM) (XM(XM_SIZE_ENT, XM_SIZE_END))

namespace xm {

/// Finds the enumerator whose name is s in a name table generated by XM_STR_LIST.
template <typename Enum, std::size_t N>
std::optional<Enum> lookup(const char *const (&names)[N], const char *s) {
    for (std::size_t i = 0; i < N; ++i) {
        if (std::strcmp(names[i], s) == 0) {
            return static_cast<Enum>(i);
        }
    }
    return std::nullopt;
}

template <typename Enum, std::size_t N>
const char *name(const char *const (&names)[N], Enum e) {
    const auto i = static_cast<std::size_t>(e);
    return i < N ? names[i] : "?";
}

}
