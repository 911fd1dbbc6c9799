#include "../include/predicate.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <unordered_map>
#include <utility>

using json = nlohmann::json;

static const std::unordered_map<std::string, Predicate::Op> kOperatorMap = {
    {"==", Predicate::Op::Eq},
    {"=", Predicate::Op::Eq},
    {"!=", Predicate::Op::Ne},
    {"<>", Predicate::Op::Ne},
    {"<", Predicate::Op::Lt},
    {"<=", Predicate::Op::Le},
    {">", Predicate::Op::Gt},
    {">=", Predicate::Op::Ge},
    {"@>", Predicate::Op::Contains},
};

static const char* op_text(Predicate::Op op) {
    switch (op) {
        case Predicate::Op::Eq: return "==";
        case Predicate::Op::Ne: return "!=";
        case Predicate::Op::Lt: return "<";
        case Predicate::Op::Le: return "<=";
        case Predicate::Op::Gt: return ">";
        case Predicate::Op::Ge: return ">=";
        case Predicate::Op::Contains: return "@>";
        case Predicate::Op::And: return "AND";
        case Predicate::Op::Or: return "OR";
        case Predicate::Op::Not: return "NOT";
    }
    return "?";
}

static bool is_logical(Predicate::Op op) {
    return op == Predicate::Op::And || op == Predicate::Op::Or || op == Predicate::Op::Not;
}

Predicate::Predicate(std::string field, Op op, json value)
    : op_(op), field_(std::move(field)), value_(std::move(value)) {
    if (is_logical(op_)) throw InvalidArgument("logical operator used as a comparison");
    if (field_.empty()) throw InvalidArgument("predicate field must not be empty");
}

Predicate::Predicate(std::string field, const std::string& op, json value)
    : Predicate(std::move(field), [&]{
          auto it = kOperatorMap.find(op);
          if (it == kOperatorMap.end()) throw InvalidArgument("unknown predicate operator: '" + op + "'");
          return it->second;
      }(), std::move(value)) {}

Predicate::Predicate(Op op, std::vector<Predicate> children)
    : op_(op), children_(std::move(children)) {}

Predicate Predicate::all_of(std::vector<Predicate> children) {
    if (children.empty()) throw InvalidArgument("AND needs at least one operand");
    if (children.size() == 1) return std::move(children.front());
    return Predicate(Op::And, std::move(children));
}

Predicate Predicate::any_of(std::vector<Predicate> children) {
    if (children.empty()) throw InvalidArgument("OR needs at least one operand");
    if (children.size() == 1) return std::move(children.front());
    return Predicate(Op::Or, std::move(children));
}

Predicate operator&&(Predicate a, Predicate b) {
    std::vector<Predicate> children;
    // Flatten nested ANDs so a && b && c is a single node.
    for (auto* p : {&a, &b}) {
        if (p->op() == Predicate::Op::And) {
            for (const auto& c : p->children()) children.push_back(c);
        } else {
            children.push_back(std::move(*p));
        }
    }
    return Predicate::all_of(std::move(children));
}

Predicate operator||(Predicate a, Predicate b) {
    std::vector<Predicate> children;
    for (auto* p : {&a, &b}) {
        if (p->op() == Predicate::Op::Or) {
            for (const auto& c : p->children()) children.push_back(c);
        } else {
            children.push_back(std::move(*p));
        }
    }
    return Predicate::any_of(std::move(children));
}

Predicate operator!(Predicate p) {
    std::vector<Predicate> children;
    children.push_back(std::move(p));
    return Predicate(Predicate::Op::Not, std::move(children));
}

Predicate Predicate::parse(const std::string& expr) {
    // Two-character operators first so "<=" is not read as "<".
    static const char* ops[] = {"@>", "==", "!=", "<>", "<=", ">=", "=", "<", ">"};
    size_t best_pos = std::string::npos;
    std::string best_op;
    for (const char* op : ops) {
        auto pos = expr.find(op);
        if (pos == std::string::npos) continue;
        if (pos < best_pos || (pos == best_pos && std::string(op).size() > best_op.size())) {
            best_pos = pos;
            best_op = op;
        }
    }
    if (best_pos == std::string::npos) throw InvalidArgument("no operator in predicate: '" + expr + "'");
    auto field = trim(expr.substr(0, best_pos));
    auto raw = trim(expr.substr(best_pos + best_op.size()));
    json value = json::parse(raw, nullptr, false);
    if (value.is_discarded()) value = raw;
    return Predicate(field, best_op, std::move(value));
}

static const json* lookup(const json& metadata, const std::string& field) {
    if (!metadata.is_object()) return nullptr;
    auto it = metadata.find(field);
    if (it != metadata.end()) return &*it;
    // Dotted paths address nested objects.
    const json* cur = &metadata;
    size_t start = 0;
    while (start <= field.size()) {
        auto dot = field.find('.', start);
        auto part = field.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!cur->is_object()) return nullptr;
        auto jt = cur->find(part);
        if (jt == cur->end()) return nullptr;
        cur = &*jt;
        if (dot == std::string::npos) return cur;
        start = dot + 1;
    }
    return nullptr;
}

static bool contains(const json& haystack, const json& needle) {
    if (haystack.is_array()) {
        if (needle.is_array()) {
            return std::all_of(needle.begin(), needle.end(), [&](const json& n){ return contains(haystack, n); });
        }
        return std::any_of(haystack.begin(), haystack.end(), [&](const json& h){ return h == needle; });
    }
    if (haystack.is_object() && needle.is_object()) {
        for (auto it = needle.begin(); it != needle.end(); ++it) {
            auto h = haystack.find(it.key());
            if (h == haystack.end()) return false;
            if (!(*h == it.value()) && !contains(*h, it.value())) return false;
        }
        return true;
    }
    return haystack == needle;
}

bool Predicate::compare(const json& actual) const {
    if (op_ == Op::Contains) return contains(actual, value_);
    if (op_ == Op::Eq) return actual == value_;
    if (op_ == Op::Ne) return actual != value_;

    int cmp = 0;
    if (actual.is_number() && value_.is_number()) {
        double a = actual.get<double>(), b = value_.get<double>();
        cmp = a < b ? -1 : (a > b ? 1 : 0);
    } else if (actual.is_string() && value_.is_string()) {
        cmp = actual.get_ref<const std::string&>().compare(value_.get_ref<const std::string&>());
    } else {
        return false;
    }
    switch (op_) {
        case Op::Lt: return cmp < 0;
        case Op::Le: return cmp <= 0;
        case Op::Gt: return cmp > 0;
        case Op::Ge: return cmp >= 0;
        default: return false;
    }
}

bool Predicate::matches(const json& metadata) const {
    switch (op_) {
        case Op::And:
            return std::all_of(children_.begin(), children_.end(), [&](const Predicate& c){ return c.matches(metadata); });
        case Op::Or:
            return std::any_of(children_.begin(), children_.end(), [&](const Predicate& c){ return c.matches(metadata); });
        case Op::Not:
            return !children_.front().matches(metadata);
        default: {
            const json* actual = lookup(metadata, field_);
            if (!actual) return false;
            return compare(*actual);
        }
    }
}

std::string Predicate::to_string() const {
    if (op_ == Op::Not) return "NOT (" + children_.front().to_string() + ")";
    if (is_logical(op_)) {
        std::string out = "(";
        for (size_t i = 0; i < children_.size(); ++i) {
            if (i) out += std::string(" ") + op_text(op_) + " ";
            out += children_[i].to_string();
        }
        return out + ")";
    }
    return field_ + " " + op_text(op_) + " " + value_.dump();
}
