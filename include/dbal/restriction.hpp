#pragma once
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "dbal/identifiers.hpp"
#include "dbal/value.hpp"

namespace dbal {

class Query; // fw decl

using SubQuery = std::shared_ptr<const Query>;

// What a restriction compares: a column, or the output of a sub-query.
using RestrictionTarget = std::variant<FieldRef, SubQuery>;

// What it is compared against: a scalar (null included), a list of scalars, or another column.
using RestrictionValue = std::variant<Value, std::vector<Value>, FieldRef>;

/**
 * A restriction indicates a condition a record must satisfy to be returned by
 * a query. The operator is kept as text, grammars decide what it means.
 *
 * Target / value combinations:
 *  - (field, op, value)        WHERE a = 'b'
 *  - (field, op, field)        WHERE a = b
 *  - (query, "<>", null)       WHERE EXISTS(SELECT ...)
 *  - (query, "=", null)        WHERE NOT EXISTS(SELECT ...)
 *  - (query, op, value)        WHERE (SELECT COUNT(*) ...) > 3
 */
class Restriction {
public:
    static constexpr const char* EQUAL_OPERATOR = "=";
    static constexpr const char* NOT_EQUAL_OPERATOR = "<>";
    static constexpr const char* LIKE_OPERATOR = "LIKE";
    static constexpr const char* IN_OPERATOR = "IN";
    static constexpr const char* NOT_IN_OPERATOR = "NOT IN";

    Restriction(RestrictionTarget field, const std::string& op, RestrictionValue value);

    const RestrictionTarget& getField() const { return field_; }
    bool isSubQuery() const { return std::holds_alternative<SubQuery>(field_); }
    // Both throw NotFoundError when the target is of the other kind.
    const FieldRef& field() const;
    const SubQuery& subQuery() const;

    /**
     * @brief the operator the grammar must render
     *
     * A list value turns any operator other than IN / NOT IN into IN. The stored
     * operator is left as it was.
     */
    std::string getOperator() const;
    const std::string& rawOperator() const { return operator_; }

    const RestrictionValue& getValue() const { return value_; }
    bool isList() const { return std::holds_alternative<std::vector<Value>>(value_); }
    bool isNullValue() const;

    /**
     * @brief replace the operator with its logical complement and return it
     * @throws InvalidOperator when the operator has none; the restriction is
     *         left untouched in that case
     */
    std::string negate();

    static std::optional<std::string> complement(const std::string& op);

private:
    friend class RestrictionGroup;

    RestrictionTarget field_;
    std::string operator_;
    RestrictionValue value_;
};

/**
 * Boolean tree of restrictions. Every group has a connective (AND / OR) and is
 * scoped to the table whose fields it may refer to by name. An empty group is a
 * valid predicate that matches everything.
 */
class RestrictionGroup {
public:
    enum class Type { And, Or };
    using Child = std::variant<Restriction, std::unique_ptr<RestrictionGroup>>;

    explicit RestrictionGroup(TableRef scope, Type type = Type::And);
    RestrictionGroup(const RestrictionGroup& other);
    RestrictionGroup& operator=(const RestrictionGroup& other);
    RestrictionGroup(RestrictionGroup&&) = default;
    RestrictionGroup& operator=(RestrictionGroup&&) = default;
    ~RestrictionGroup() = default;

    Type type() const { return type_; }
    void setType(Type type) { type_ = type; }
    const TableRef& scope() const { return scope_; }

    RestrictionGroup& push(Restriction restriction);

    // Resolves @p field against the group's table, NotFoundError if unknown.
    RestrictionGroup& where(const std::string& field, const std::string& op, RestrictionValue value);
    RestrictionGroup& where(const std::string& field, RestrictionValue value);
    RestrictionGroup& where(const FieldRef& field, const std::string& op, RestrictionValue value);
    RestrictionGroup& whereQuery(SubQuery query, const std::string& op, RestrictionValue value);

    // Append a nested group and return it so the caller can fill it.
    RestrictionGroup& group(Type type);
    RestrictionGroup& andGroup() { return group(Type::And); }
    RestrictionGroup& orGroup() { return group(Type::Or); }
    RestrictionGroup& add(RestrictionGroup nested);

    /**
     * @brief De Morgan negation of the whole tree
     *
     * Flips the connective of every group and negates every restriction. List
     * restrictions are negated by their effective operator (IN <-> NOT IN). Either
     * every node is negated or, when one operator has no complement, none is.
     */
    void negate();

    const std::vector<Child>& children() const { return children_; }
    std::vector<const Restriction*> restrictions() const; // direct leaves only
    std::size_t size() const { return children_.size(); }
    bool empty() const { return children_.empty(); }

private:
    bool negatable() const;
    void negate_unchecked();

    TableRef scope_;
    Type type_;
    std::vector<Child> children_;
};

std::string to_string(RestrictionGroup::Type type);

} // namespace dbal
