#include "config.h"

namespace conf {

bool verbose = false;
bool dump = false;

unsigned addr_bits = 32;
unsigned page_bits = 12;
unsigned nested_stages = 2;

unsigned timeout_ms = 0;
unsigned jobs = 1;

std::optional<uint64_t> va;
std::vector<uint64_t> aliases;

std::optional<std::string> profile;

}
