#include "dawn/link_api.h"

#include <stdexcept>

namespace dawn {

void LinkTable::add(const std::string& link_id, LinkFn fn, bool allow_override) {
    if (link_id.empty()) throw std::runtime_error("link table: empty link id");
    if (!fn) throw std::runtime_error("link table: null implementation for " + link_id);
    if (fns_.count(link_id) && !allow_override) {
        throw std::runtime_error("duplicate link implementation: " + link_id);
    }
    fns_[link_id] = std::move(fn);
}

const LinkFn* LinkTable::find(const std::string& link_id) const {
    auto it = fns_.find(link_id);
    if (it == fns_.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> LinkTable::ids() const {
    std::vector<std::string> out;
    out.reserve(fns_.size());
    for (const auto& kv : fns_) out.push_back(kv.first);
    return out;
}

} // namespace dawn
