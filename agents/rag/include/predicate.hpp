#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Boolean/range expression over record metadata. Leaves compare one field
// with a constant; inner nodes combine children with AND, OR or NOT.
class Predicate {
public:
    enum class Op { Eq, Ne, Lt, Le, Gt, Ge, Contains, And, Or, Not };

    // `op` is one of == != < <= > >= @> (also = and <>). Throws InvalidArgument.
    Predicate(std::string field, const std::string& op, nlohmann::json value);
    Predicate(std::string field, Op op, nlohmann::json value);

    static Predicate all_of(std::vector<Predicate> children);
    static Predicate any_of(std::vector<Predicate> children);

    // "field<op>value"; value is JSON when it parses as JSON, else a string.
    static Predicate parse(const std::string& expr);

    bool matches(const nlohmann::json& metadata) const;

    Op op() const { return op_; }
    const std::string& field() const { return field_; }
    const nlohmann::json& value() const { return value_; }
    const std::vector<Predicate>& children() const { return children_; }

    std::string to_string() const;

private:
    Predicate(Op op, std::vector<Predicate> children);

    bool compare(const nlohmann::json& actual) const;

    Op op_;
    std::string field_;
    nlohmann::json value_;
    std::vector<Predicate> children_;

    friend Predicate operator!(Predicate p);
};

Predicate operator&&(Predicate a, Predicate b);
Predicate operator||(Predicate a, Predicate b);
Predicate operator!(Predicate p);
