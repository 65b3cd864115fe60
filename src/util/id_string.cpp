#include "rnm/util/id_string.hpp"

namespace rnm {
IdString::Pool& IdString::pool() {
    static Pool p;
    return p;
}

uint32_t IdString::internGlobal(std::string_view sv) {
    auto& p = pool();
    std::lock_guard<std::mutex> lock(p.mMu);
    if (auto it = p.mMap.find(sv); it != p.mMap.end()) { return it->second; }

    uint32_t id = static_cast<uint32_t>(p.mPool.size());
    p.mPool.emplace_back(sv);
    p.mMap.emplace(std::string(sv), id);
    return id;
}

uint32_t IdString::lookupGlobal(std::string_view sv) {
    auto& p = pool();
    std::lock_guard<std::mutex> lock(p.mMu);
    if (auto it = p.mMap.find(sv); it != p.mMap.end()) { return it->second; }
    return kInvalid;
}

const std::string& IdString::resolveGlobal(uint32_t id) {
    static const std::string kInvalidStr = "<invalid>";
    auto& p = pool();
    std::lock_guard<std::mutex> lock(p.mMu);
    if (id == kInvalid || id >= p.mPool.size()) { return kInvalidStr; }
    return p.mPool[id];
}

std::ostream& operator<<(std::ostream& os, const IdString& s) {
    return os << s.str();
}
} // namespace rnm
