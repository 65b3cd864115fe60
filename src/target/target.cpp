#include <sstream>

#include "rnm/target/target.hpp"

namespace rnm {

ReferenceAddr ModuleAddr::ref(IdString name) const {
    return ReferenceAddr{mCircuit, mModule, {}, name, {}};
}

InstanceAddr ModuleAddr::instOf(IdString inst, IdString ofModule) const {
    return InstanceAddr{mCircuit, mModule, {}, inst, ofModule};
}

ReferenceAddr ReferenceAddr::field(IdString f) const {
    ReferenceAddr out = *this;
    out.mFields.push_back(f);
    return out;
}

ReferenceAddr ReferenceAddr::base() const {
    ReferenceAddr out = *this;
    out.mFields.clear();
    return out;
}

bool Target::isLocal() const {
    return visit([](const auto& a) -> bool {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, InstanceAddr> ||
                      std::is_same_v<T, ReferenceAddr>) {
            return a.isLocal();
        } else {
            return true;
        }
    });
}

IdString Target::circuitName() const {
    return visit([](const auto& a) { return a.mCircuit; });
}

std::optional<ModuleAddr> Target::moduleAddr() const {
    return visit([](const auto& a) -> std::optional<ModuleAddr> {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, CircuitAddr>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, ModuleAddr>) {
            return a;
        } else {
            return a.moduleAddr();
        }
    });
}

IdString Target::leafName() const {
    return visit([this](const auto& a) -> IdString {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, CircuitAddr>) {
            return a.mCircuit;
        } else if constexpr (std::is_same_v<T, ModuleAddr>) {
            return a.mModule;
        } else if constexpr (std::is_same_v<T, InstanceAddr>) {
            return a.mInstance;
        } else {
            if (a.mFields.empty()) return a.mRef;
            if (a.mFields.size() == 1) return a.mFields.front();
            throw InternalError("reference target must end in a reference or "
                                "a single field: " +
                                toString());
        }
    });
}

Target Target::withLeafName(IdString name) const {
    // Validates the shape first
    (void)leafName();
    return visit([name](auto a) -> Target {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, CircuitAddr>) {
            a.mCircuit = name;
        } else if constexpr (std::is_same_v<T, ModuleAddr>) {
            a.mModule = name;
        } else if constexpr (std::is_same_v<T, InstanceAddr>) {
            a.mInstance = name;
        } else {
            if (a.mFields.empty()) a.mRef = name;
            else a.mFields.back() = name;
        }
        return a;
    });
}

static void writePath(std::ostream& os, const InstancePath& path) {
    for (const auto& h : path)
        os << "/" << h.mInstance.str() << ":" << h.mOfModule.str();
}

std::string Target::toString() const {
    std::ostringstream os;
    visit([&](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        os << "~" << a.mCircuit.str();
        if constexpr (std::is_same_v<T, ModuleAddr>) {
            os << "|" << a.mModule.str();
        } else if constexpr (std::is_same_v<T, InstanceAddr>) {
            os << "|" << a.mModule.str();
            writePath(os, a.mPath);
            os << "/" << a.mInstance.str() << ":" << a.mOfModule.str();
        } else if constexpr (std::is_same_v<T, ReferenceAddr>) {
            os << "|" << a.mModule.str();
            writePath(os, a.mPath);
            os << ">" << a.mRef.str();
            for (const auto& f : a.mFields)
                os << "." << f.str();
        }
    });
    return os.str();
}

static inline void hashCombine(size_t& seed, size_t v) {
    seed ^= v + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
}

size_t Target::Hash::operator()(const Target& t) const noexcept {
    size_t seed = t.mNode.index();
    IdString::Hash h;
    t.visit([&](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        hashCombine(seed, h(a.mCircuit));
        if constexpr (!std::is_same_v<T, CircuitAddr>) {
            hashCombine(seed, h(a.mModule));
        }
        if constexpr (std::is_same_v<T, InstanceAddr> ||
                      std::is_same_v<T, ReferenceAddr>) {
            for (const auto& hop : a.mPath) {
                hashCombine(seed, h(hop.mInstance));
                hashCombine(seed, h(hop.mOfModule));
            }
        }
        if constexpr (std::is_same_v<T, InstanceAddr>) {
            hashCombine(seed, h(a.mInstance));
            hashCombine(seed, h(a.mOfModule));
        } else if constexpr (std::is_same_v<T, ReferenceAddr>) {
            hashCombine(seed, h(a.mRef));
            for (const auto& f : a.mFields)
                hashCombine(seed, h(f));
        }
    });
    return seed;
}

static std::vector<std::string_view> splitOn(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

static bool isValidIdent(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c == '~' || c == '|' || c == '/' || c == ':' || c == '>' ||
            c == '.' || c == ' ' || c == '\t' || c == '\n')
            return false;
    }
    return true;
}

Target parseTarget(std::string_view text) {
    std::string original(text);
    auto fail = [&](const std::string& why) -> ConfigError {
        return ConfigError("malformed target '" + original + "': " + why);
    };
    auto ident = [&](std::string_view s, const char* what) {
        if (!isValidIdent(s)) throw fail(std::string("bad ") + what);
        return IdString(s);
    };

    if (text.empty() || text.front() != '~') throw fail("expected '~'");
    text.remove_prefix(1);

    size_t bar = text.find('|');
    IdString circuit = ident(text.substr(0, bar), "circuit name");
    if (bar == std::string_view::npos) return CircuitAddr{circuit};

    std::string_view rest = text.substr(bar + 1);
    std::string_view refPart;
    bool hasRef = false;
    if (size_t gt = rest.find('>'); gt != std::string_view::npos) {
        refPart = rest.substr(gt + 1);
        rest = rest.substr(0, gt);
        hasRef = true;
    }

    auto segments = splitOn(rest, '/');
    IdString module = ident(segments.front(), "module name");
    InstancePath path;
    for (size_t i = 1; i < segments.size(); ++i) {
        auto pair = splitOn(segments[i], ':');
        if (pair.size() != 2) throw fail("expected 'instance:Module'");
        path.push_back(InstanceHop{ident(pair[0], "instance name"),
                                   ident(pair[1], "module name")});
    }

    if (hasRef) {
        auto comps = splitOn(refPart, '.');
        ReferenceAddr r{circuit, module, std::move(path),
                        ident(comps.front(), "reference name"), {}};
        for (size_t i = 1; i < comps.size(); ++i)
            r.mFields.push_back(ident(comps[i], "field name"));
        return r;
    }
    if (path.empty()) return ModuleAddr{circuit, module};

    InstanceHop last = path.back();
    path.pop_back();
    return InstanceAddr{circuit, module, std::move(path), last.mInstance,
                        last.mOfModule};
}

std::ostream& operator<<(std::ostream& os, const Target& t) {
    return os << t.toString();
}
} // namespace rnm
