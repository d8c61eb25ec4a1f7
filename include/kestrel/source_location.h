#pragma once

#include <cstdint>
#include <string>

namespace kestrel {

struct SourceLocation {
    uint32_t line = 0;
    uint32_t column = 0;
    uint32_t offset = 0;

    bool isNone() const { return line == 0; }
    std::string toString() const;
};

} // namespace kestrel
