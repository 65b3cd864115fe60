#include "rnm/vis/json.hpp"

#include <utility>

namespace rnm {
namespace vis {

using nlohmann::json;

//******************************************************************************
// Export
//******************************************************************************

static json typeToJson(const ast::Type& t) {
    switch (t.mKind) {
    case ast::Type::Kind::UInt: return {{"kind", "UInt"}, {"width", t.mWidth}};
    case ast::Type::Kind::SInt: return {{"kind", "SInt"}, {"width", t.mWidth}};
    case ast::Type::Kind::Clock: return {{"kind", "Clock"}};
    case ast::Type::Kind::Reset: return {{"kind", "Reset"}};
    }
    return json::object();
}

static json namesToJson(const std::vector<IdString>& names) {
    json arr = json::array();
    for (const auto& n : names)
        arr.push_back(n.str());
    return arr;
}

static json exprToJson(const ast::Expr& e) {
    return e.visit([](const auto& node) -> json {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ast::RefExpr>) {
            return {{"ref", node.mName.str()}};
        } else if constexpr (std::is_same_v<T, ast::SubFieldExpr>) {
            return {{"field", node.mField.str()},
                    {"of", exprToJson(*node.mBase)}};
        } else if constexpr (std::is_same_v<T, ast::LiteralExpr>) {
            return {{"lit", node.mValue},
                    {"width", node.mWidth},
                    {"signed", node.mSigned}};
        } else if constexpr (std::is_same_v<T, ast::PrimOpExpr>) {
            json args = json::array();
            for (const auto& a : node.mArgs)
                args.push_back(exprToJson(a));
            json j = {{"prim", ast::to_string(node.mOp)}, {"args", args}};
            if (!node.mConsts.empty()) j["consts"] = node.mConsts;
            return j;
        } else if constexpr (std::is_same_v<T, ast::MuxExpr>) {
            return {{"mux", json::array({exprToJson(*node.mCond),
                                         exprToJson(*node.mTval),
                                         exprToJson(*node.mFval)})}};
        } else {
            static_assert(ast::kAlwaysFalse<T>, "unhandled expression kind");
        }
    });
}

static json bodyToJson(const std::vector<ast::Stmt>& body);

static json stmtToJson(const ast::Stmt& s) {
    return s.visit([](const auto& node) -> json {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ast::WireDecl>) {
            return {{"op", "wire"},
                    {"name", node.mName.str()},
                    {"type", typeToJson(node.mType)}};
        } else if constexpr (std::is_same_v<T, ast::RegDecl>) {
            json j = {{"op", "reg"},
                      {"name", node.mName.str()},
                      {"type", typeToJson(node.mType)},
                      {"clock", exprToJson(node.mClock)}};
            if (node.mReset) j["reset"] = exprToJson(*node.mReset);
            if (node.mInit) j["init"] = exprToJson(*node.mInit);
            return j;
        } else if constexpr (std::is_same_v<T, ast::NodeDecl>) {
            return {{"op", "node"},
                    {"name", node.mName.str()},
                    {"value", exprToJson(node.mValue)}};
        } else if constexpr (std::is_same_v<T, ast::InstanceDecl>) {
            return {{"op", "inst"},
                    {"name", node.mName.str()},
                    {"module", node.mModule.str()}};
        } else if constexpr (std::is_same_v<T, ast::MemDecl>) {
            return {{"op", "mem"},
                    {"name", node.mName.str()},
                    {"type", typeToJson(node.mDataType)},
                    {"depth", node.mDepth},
                    {"read-latency", node.mReadLatency},
                    {"write-latency", node.mWriteLatency},
                    {"readers", namesToJson(node.mReaders)},
                    {"writers", namesToJson(node.mWriters)},
                    {"readwriters", namesToJson(node.mReadWriters)}};
        } else if constexpr (std::is_same_v<T, ast::ConnectStmt>) {
            return {{"op", "connect"},
                    {"loc", exprToJson(node.mLoc)},
                    {"expr", exprToJson(node.mExpr)}};
        } else if constexpr (std::is_same_v<T, ast::InvalidateStmt>) {
            return {{"op", "invalid"}, {"expr", exprToJson(node.mExpr)}};
        } else if constexpr (std::is_same_v<T, ast::WhenStmt>) {
            return {{"op", "when"},
                    {"cond", exprToJson(node.mCond)},
                    {"then", bodyToJson(node.mThen)},
                    {"else", bodyToJson(node.mElse)}};
        } else if constexpr (std::is_same_v<T, ast::BlockStmt>) {
            return {{"op", "block"}, {"stmts", bodyToJson(node.mStmts)}};
        } else {
            static_assert(ast::kAlwaysFalse<T>, "unhandled statement kind");
        }
    });
}

static json bodyToJson(const std::vector<ast::Stmt>& body) {
    json arr = json::array();
    for (const auto& s : body)
        arr.push_back(stmtToJson(s));
    return arr;
}

static json portsToJson(const std::vector<ast::Port>& ports) {
    json arr = json::array();
    for (const auto& p : ports) {
        arr.push_back({{"name", p.mName.str()},
                       {"dir", to_string(p.mDir)},
                       {"type", typeToJson(p.mType)}});
    }
    return arr;
}

json circuitToJson(const ast::Circuit& c) {
    json mods = json::array();
    for (const auto& m : c.mModules) {
        json jm = {{"kind", m.isExternal() ? "extmodule" : "module"},
                   {"name", m.name().str()},
                   {"ports", portsToJson(m.ports())}};
        if (m.isExternal()) {
            jm["defname"] = m.as<ast::ExtModule>().mDefName;
        } else {
            jm["body"] = bodyToJson(m.as<ast::Module>().mBody);
        }
        mods.push_back(std::move(jm));
    }
    return {{"name", c.mName.str()}, {"top", c.mTop.str()}, {"modules", mods}};
}

json ledgerToJson(const RenameLedger& ledger) {
    json arr = json::array();
    for (const auto& [from, images] : ledger.entries()) {
        json to = json::array();
        for (const auto& t : images)
            to.push_back(t.toString());
        arr.push_back({{"from", from.toString()}, {"to", to}});
    }
    return arr;
}

//******************************************************************************
// Import
//******************************************************************************

static const json& field(const json& j, const char* key, const char* what) {
    if (!j.is_object() || !j.contains(key))
        throw ConfigError(std::string(what) + " is missing \"" + key + "\"");
    return j.at(key);
}

static IdString nameField(const json& j, const char* key, const char* what) {
    const json& v = field(j, key, what);
    if (!v.is_string() || v.get_ref<const std::string&>().empty())
        throw ConfigError(std::string(what) + " has a bad \"" + key + "\"");
    return IdString(v.get_ref<const std::string&>());
}

static ast::Type typeFromJson(const json& j) {
    std::string kind = field(j, "kind", "type").get<std::string>();
    int width = j.value("width", 1);
    if (kind == "UInt") return ast::Type::uintOf(width);
    if (kind == "SInt") return ast::Type::sintOf(width);
    if (kind == "Clock") return ast::Type::clock();
    if (kind == "Reset") return ast::Type::reset();
    throw ConfigError("unknown type kind '" + kind + "'");
}

static std::vector<IdString> namesFromJson(const json& j, const char* key) {
    std::vector<IdString> out;
    if (!j.contains(key)) return out;
    for (const auto& n : j.at(key))
        out.emplace_back(n.get<std::string>());
    return out;
}

static ast::Expr exprFromJson(const json& j) {
    using ast::Expr;
    if (!j.is_object()) throw ConfigError("expression must be an object");
    if (j.contains("ref")) return Expr::ref(nameField(j, "ref", "reference"));
    if (j.contains("field")) {
        return Expr::subField(exprFromJson(field(j, "of", "subfield")),
                              nameField(j, "field", "subfield"));
    }
    if (j.contains("lit")) {
        return Expr::literal(j.at("lit").get<uint64_t>(), j.value("width", 0),
                             j.value("signed", false));
    }
    if (j.contains("prim")) {
        std::string name = j.at("prim").get<std::string>();
        auto op = ast::parsePrimOp(name);
        if (!op) throw ConfigError("unknown primitive operation '" + name + "'");
        std::vector<Expr> args;
        for (const auto& a : field(j, "args", "primitive operation"))
            args.push_back(exprFromJson(a));
        std::vector<int64_t> consts;
        if (j.contains("consts"))
            consts = j.at("consts").get<std::vector<int64_t>>();
        return Expr::prim(*op, std::move(args), std::move(consts));
    }
    if (j.contains("mux")) {
        const json& ops = j.at("mux");
        if (!ops.is_array() || ops.size() != 3)
            throw ConfigError("mux needs exactly three operands");
        return Expr::mux(exprFromJson(ops[0]), exprFromJson(ops[1]),
                         exprFromJson(ops[2]));
    }
    throw ConfigError("unknown expression: " + j.dump());
}

static std::vector<ast::Stmt> bodyFromJson(const json& j);

static ast::Stmt stmtFromJson(const json& j) {
    using ast::Stmt;
    std::string op = field(j, "op", "statement").get<std::string>();
    if (op == "wire") {
        return Stmt(ast::WireDecl{nameField(j, "name", "wire"),
                                  typeFromJson(field(j, "type", "wire"))});
    }
    if (op == "reg") {
        ast::RegDecl r{nameField(j, "name", "reg"),
                       typeFromJson(field(j, "type", "reg")),
                       exprFromJson(field(j, "clock", "reg")),
                       std::nullopt,
                       std::nullopt};
        if (j.contains("reset") != j.contains("init"))
            throw ConfigError("reg " + r.mName.str() +
                              ": reset and init go together");
        if (j.contains("reset")) {
            r.mReset = exprFromJson(j.at("reset"));
            r.mInit = exprFromJson(j.at("init"));
        }
        return Stmt(std::move(r));
    }
    if (op == "node") {
        return Stmt(ast::NodeDecl{nameField(j, "name", "node"),
                                  exprFromJson(field(j, "value", "node"))});
    }
    if (op == "inst") {
        return Stmt(ast::InstanceDecl{nameField(j, "name", "instance"),
                                      nameField(j, "module", "instance")});
    }
    if (op == "mem") {
        ast::MemDecl m;
        m.mName = nameField(j, "name", "memory");
        m.mDataType = typeFromJson(field(j, "type", "memory"));
        m.mDepth = j.value("depth", uint64_t{1});
        m.mReadLatency = j.value("read-latency", 0);
        m.mWriteLatency = j.value("write-latency", 1);
        m.mReaders = namesFromJson(j, "readers");
        m.mWriters = namesFromJson(j, "writers");
        m.mReadWriters = namesFromJson(j, "readwriters");
        return Stmt(std::move(m));
    }
    if (op == "connect") {
        return Stmt(ast::ConnectStmt{exprFromJson(field(j, "loc", "connect")),
                                     exprFromJson(field(j, "expr", "connect"))});
    }
    if (op == "invalid") {
        return Stmt(
          ast::InvalidateStmt{exprFromJson(field(j, "expr", "invalidate"))});
    }
    if (op == "when") {
        ast::WhenStmt w{exprFromJson(field(j, "cond", "when")), {}, {}};
        if (j.contains("then")) w.mThen = bodyFromJson(j.at("then"));
        if (j.contains("else")) w.mElse = bodyFromJson(j.at("else"));
        return Stmt(std::move(w));
    }
    if (op == "block") {
        return Stmt(ast::BlockStmt{bodyFromJson(field(j, "stmts", "block"))});
    }
    throw ConfigError("unknown statement op '" + op + "'");
}

static std::vector<ast::Stmt> bodyFromJson(const json& j) {
    if (!j.is_array()) throw ConfigError("statement list must be an array");
    std::vector<ast::Stmt> out;
    out.reserve(j.size());
    for (const auto& s : j)
        out.push_back(stmtFromJson(s));
    return out;
}

static std::vector<ast::Port> portsFromJson(const json& j) {
    std::vector<ast::Port> out;
    if (!j.contains("ports")) return out;
    for (const auto& p : j.at("ports")) {
        ast::Port port;
        port.mName = nameField(p, "name", "port");
        std::string dir = field(p, "dir", "port").get<std::string>();
        if (dir == "input") port.mDir = PortDirection::In;
        else if (dir == "output") port.mDir = PortDirection::Out;
        else throw ConfigError("port " + port.mName.str() +
                               ": unknown direction '" + dir + "'");
        port.mType = typeFromJson(field(p, "type", "port"));
        out.push_back(std::move(port));
    }
    return out;
}

ast::Circuit circuitFromJson(const json& j) {
    try {
        ast::Circuit c;
        c.mName = nameField(j, "name", "circuit");
        c.mTop = j.contains("top") ? nameField(j, "top", "circuit") : c.mName;
        for (const auto& jm : field(j, "modules", "circuit")) {
            std::string kind = jm.value("kind", std::string("module"));
            if (kind == "module") {
                ast::Module m{nameField(jm, "name", "module"),
                              portsFromJson(jm), {}};
                if (jm.contains("body")) m.mBody = bodyFromJson(jm.at("body"));
                c.mModules.emplace_back(std::move(m));
            } else if (kind == "extmodule") {
                c.mModules.emplace_back(
                  ast::ExtModule{nameField(jm, "name", "extmodule"),
                                 portsFromJson(jm),
                                 jm.value("defname", std::string())});
            } else {
                throw ConfigError("unknown module kind '" + kind + "'");
            }
        }
        return c;
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed circuit JSON: ") + e.what());
    }
}

RenameLedger ledgerFromJson(const json& j) {
    try {
        if (!j.is_array()) throw ConfigError("ledger must be an array");
        RenameLedger ledger;
        for (const auto& e : j) {
            Target from = parseTarget(field(e, "from", "ledger entry")
                                        .get<std::string>());
            for (const auto& to : field(e, "to", "ledger entry"))
                ledger.record(from, parseTarget(to.get<std::string>()));
        }
        return ledger;
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed ledger JSON: ") + e.what());
    }
}

} // namespace vis
} // namespace rnm
