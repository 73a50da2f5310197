#include "storage/dictionary.h"
#include <stdexcept>
#include <fmt/core.h>

namespace eqjoin {

StrId Dictionary::get_or_add(const std::string& s) {
    auto it = ids.find(s);
    if (it != ids.end()) return it->second;
    StrId id = static_cast<StrId>(strings.size());
    strings.push_back(s);
    ids.emplace(s, id);
    return id;
}

const std::string& Dictionary::get(StrId id) const {
    if (id >= strings.size()) {
        throw std::out_of_range(fmt::format("Dictionary has no string {}", id));
    }
    return strings[id];
}

} // namespace eqjoin
