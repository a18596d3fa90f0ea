#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace conf {

extern bool verbose;
extern bool dump;

extern unsigned addr_bits;
extern unsigned page_bits;
extern unsigned nested_stages;

/* solver resource limit; 0 means none */
extern unsigned timeout_ms;
extern unsigned jobs;

/* pinned by -a; otherwise default_va is pinned when it fits the address width */
extern std::optional<uint64_t> va;
constexpr uint64_t default_va = 0x12345000;
extern std::vector<uint64_t> aliases;

extern std::optional<std::string> profile;

}
