#include "dbal/restriction.hpp"
#include <utility>
#include "dbal/lib.hpp"

namespace dbal {

namespace {

    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        auto b = s.find_first_not_of(ws);
        if (b == std::string::npos) return "";
        auto e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }

    // complement of a list restriction, taken on the operator it renders as
    std::optional<std::string> list_complement(const std::string& op) {
        if (op == "=" || op == Restriction::IN_OPERATOR) return std::string(Restriction::NOT_IN_OPERATOR);
        if (op == "<>" || op == Restriction::NOT_IN_OPERATOR) return std::string(Restriction::IN_OPERATOR);
        return std::nullopt;
    }

    std::optional<std::string> group_complement(const Restriction& r) {
        return r.isList() ? list_complement(r.rawOperator()) : Restriction::complement(r.rawOperator());
    }

}

/* ---------- Restriction ---------- */

Restriction::Restriction(RestrictionTarget field, const std::string& op, RestrictionValue value)
    : field_(std::move(field)), operator_(trim(op)), value_(std::move(value)) {}

const FieldRef& Restriction::field() const {
    if (isSubQuery()) DBAL_NOT_FOUND("Restriction targets a sub-query, not a field");
    return std::get<FieldRef>(field_);
}

const SubQuery& Restriction::subQuery() const {
    if (!isSubQuery()) DBAL_NOT_FOUND("Restriction targets a field, not a sub-query");
    return std::get<SubQuery>(field_);
}

std::string Restriction::getOperator() const {
    if (isList() && operator_ != IN_OPERATOR && operator_ != NOT_IN_OPERATOR) {
        return IN_OPERATOR;
    }
    return operator_;
}

bool Restriction::isNullValue() const {
    return std::holds_alternative<Value>(value_) && is_null(std::get<Value>(value_));
}

std::optional<std::string> Restriction::complement(const std::string& op) {
    if (op == "=")        return std::string("<>");
    if (op == "<>")       return std::string("=");
    if (op == ">")        return std::string("<");
    if (op == "<")        return std::string(">");
    if (op == "IS")       return std::string("IS NOT");
    if (op == "IS NOT")   return std::string("IS");
    if (op == "LIKE")     return std::string("NOT LIKE");
    if (op == "NOT LIKE") return std::string("LIKE");
    return std::nullopt;
}

std::string Restriction::negate() {
    auto negated = complement(operator_);
    if (!negated) DBAL_INVALID_OPERATOR("Invalid operator detected: '%s'", operator_.c_str());
    operator_ = *negated;
    return operator_;
}

/* ---------- RestrictionGroup ---------- */

RestrictionGroup::RestrictionGroup(TableRef scope, Type type)
    : scope_(std::move(scope)), type_(type) {}

RestrictionGroup::RestrictionGroup(const RestrictionGroup& other)
    : scope_(other.scope_), type_(other.type_) {
    children_.reserve(other.children_.size());
    for (const auto& child : other.children_) {
        if (std::holds_alternative<Restriction>(child)) {
            children_.emplace_back(std::get<Restriction>(child));
        } else {
            children_.emplace_back(std::make_unique<RestrictionGroup>(*std::get<std::unique_ptr<RestrictionGroup>>(child)));
        }
    }
}

RestrictionGroup& RestrictionGroup::operator=(const RestrictionGroup& other) {
    if (this != &other) {
        RestrictionGroup copy(other);
        *this = std::move(copy);
    }
    return *this;
}

RestrictionGroup& RestrictionGroup::push(Restriction restriction) {
    children_.emplace_back(std::move(restriction));
    return *this;
}

RestrictionGroup& RestrictionGroup::where(const std::string& field, const std::string& op, RestrictionValue value) {
    return push(Restriction(scope_.output(field), op, std::move(value)));
}

RestrictionGroup& RestrictionGroup::where(const std::string& field, RestrictionValue value) {
    return where(field, Restriction::EQUAL_OPERATOR, std::move(value));
}

RestrictionGroup& RestrictionGroup::where(const FieldRef& field, const std::string& op, RestrictionValue value) {
    return push(Restriction(field, op, std::move(value)));
}

RestrictionGroup& RestrictionGroup::whereQuery(SubQuery query, const std::string& op, RestrictionValue value) {
    if (!query) DBAL_THROW("whereQuery: null sub-query");
    return push(Restriction(std::move(query), op, std::move(value)));
}

RestrictionGroup& RestrictionGroup::group(Type type) {
    children_.emplace_back(std::make_unique<RestrictionGroup>(scope_, type));
    return *std::get<std::unique_ptr<RestrictionGroup>>(children_.back());
}

RestrictionGroup& RestrictionGroup::add(RestrictionGroup nested) {
    children_.emplace_back(std::make_unique<RestrictionGroup>(std::move(nested)));
    return *this;
}

std::vector<const Restriction*> RestrictionGroup::restrictions() const {
    std::vector<const Restriction*> out;
    for (const auto& child : children_) {
        if (std::holds_alternative<Restriction>(child)) out.push_back(&std::get<Restriction>(child));
    }
    return out;
}

bool RestrictionGroup::negatable() const {
    for (const auto& child : children_) {
        if (std::holds_alternative<Restriction>(child)) {
            if (!group_complement(std::get<Restriction>(child))) return false;
        } else if (!std::get<std::unique_ptr<RestrictionGroup>>(child)->negatable()) {
            return false;
        }
    }
    return true;
}

void RestrictionGroup::negate_unchecked() {
    type_ = type_ == Type::And ? Type::Or : Type::And;
    for (auto& child : children_) {
        if (std::holds_alternative<Restriction>(child)) {
            auto& leaf = std::get<Restriction>(child);
            leaf.operator_ = *group_complement(leaf);
        } else {
            std::get<std::unique_ptr<RestrictionGroup>>(child)->negate_unchecked();
        }
    }
}

void RestrictionGroup::negate() {
    if (!negatable()) DBAL_INVALID_OPERATOR("Restriction group contains an operator without complement");
    negate_unchecked();
}

std::string to_string(RestrictionGroup::Type type) {
    return type == RestrictionGroup::Type::And ? "AND" : "OR";
}

} // namespace dbal
