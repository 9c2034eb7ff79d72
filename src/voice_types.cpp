#include "internal/voice_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace voice {

bool isAllocationFailure(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const char* const kSignatures[] = {
        "out of memory",
        "allocat",          // allocate / allocation / allocator
        "bad_alloc",
        "bad allocation",
    };
    for (const char* sig : kSignatures) {
        if (lower.find(sig) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace voice
