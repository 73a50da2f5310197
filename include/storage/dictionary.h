#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "types.h"

namespace eqjoin {

// Dictionary for encoding strings to IDs and vice versa
class Dictionary {
public:
    StrId get_or_add(const std::string& s);
    const std::string& get(StrId id) const;
    size_t size() const { return strings.size(); }

private:
    std::vector<std::string> strings;
    std::unordered_map<std::string, StrId> ids;
};

} // namespace eqjoin
