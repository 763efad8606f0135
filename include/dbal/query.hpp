#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "dbal/identifiers.hpp"
#include "dbal/restriction.hpp"

namespace dbal {

/**
 * An aggregation applied to an output, e.g. COUNT(t_1._id). The alias is
 * derived from the operation and the input so two aggregates in the same
 * query never produce the same output name.
 */
class Aggregate {
public:
    enum class Operation { Count, Sum, Min, Max, Avg };

    Aggregate(FieldRef input, Operation operation);

    const FieldRef& input() const { return input_; }
    Operation operation() const { return operation_; }
    const std::string& alias() const { return alias_; }

    Aggregate& setAlias(std::string alias) { alias_ = std::move(alias); return *this; }

    static std::string name(Operation operation); // count, sum, ...

private:
    FieldRef input_;
    Operation operation_;
    std::string alias_;
};

// One projection of the query: a column, optionally renamed / aggregated.
class SelectExpression {
public:
    explicit SelectExpression(FieldRef input,
                              std::optional<std::string> alias = std::nullopt,
                              std::optional<Aggregate::Operation> aggregate = std::nullopt)
        : input_(std::move(input)), alias_(std::move(alias)), aggregate_(aggregate) {}

    const FieldRef& input() const { return input_; }
    const std::optional<std::string>& alias() const { return alias_; }
    const std::optional<Aggregate::Operation>& aggregate() const { return aggregate_; }

    // The name the output is addressed by: the alias if any, else the column name.
    std::string getName() const { return alias_ ? *alias_ : input_.name(); }

private:
    FieldRef input_;
    std::optional<std::string> alias_;
    std::optional<Aggregate::Operation> aggregate_;
};

class OrderBy {
public:
    enum class Direction { Asc, Desc };

    explicit OrderBy(FieldRef field, Direction direction = Direction::Asc)
        : field_(std::move(field)), direction_(direction) {}

    const FieldRef& field() const { return field_; }
    Direction direction() const { return direction_; }

private:
    FieldRef field_;
    Direction direction_;
};

// A table or sub-query, together with the aliased reference the rest of the query uses.
class Alias {
public:
    using Input = std::variant<TableRef, SubQuery>;

    Alias(Input input, TableRef output)
        : input_(std::move(input)), output_(std::move(output)) {}

    const Input& input() const { return input_; }
    const TableRef& output() const { return output_; }
    bool isQuery() const { return std::holds_alternative<SubQuery>(input_); }

private:
    Input input_;
    TableRef output_;
};

/**
 * A table joined into a query. Linking it to the rest of the query is up to
 * the caller, through the on() restriction group.
 */
class Join {
public:
    enum class Type { Inner, Left, Right };

    explicit Join(Alias source, Type type = Type::Left);

    const Alias& source() const { return source_; }
    const TableRef& table() const { return source_.output(); }
    FieldRef output(const std::string& name) const { return source_.output().output(name); }

    Type type() const { return type_; }
    Join& setType(Type type) { type_ = type; return *this; }

    RestrictionGroup& on() { return on_; }
    const RestrictionGroup& on() const { return on_; }

private:
    Alias source_;
    Type type_;
    RestrictionGroup on_;
};

/**
 * The query assembles everything a grammar needs to build a SELECT: source,
 * joins, restrictions, projections, grouping, ordering and pagination. It is
 * data only, rendering and execution happen in the driver's grammar.
 */
class Query {
public:
    using JoinConfigurator = std::function<void(Join&, Query&)>;

    explicit Query(const TableRef& table);
    explicit Query(SubQuery query);

    Query(const Query& other);
    Query& operator=(const Query& other);
    Query(Query&&) = default;
    Query& operator=(Query&&) = default;
    ~Query() = default;

    const Alias& getFrom() const { return from_; }
    // The aliased table this query reads from.
    const TableRef& getTable() const { return from_.output(); }

    /**
     * @brief join a table into the query
     *
     * When @p fn is given it is called right away with the new join and this
     * query, before joinTable returns, so the caller can link the two.
     */
    Join& joinTable(const TableRef& table, const JoinConfigurator& fn = nullptr);
    const std::vector<std::unique_ptr<Join>>& getJoined() const { return joins_; }

    RestrictionGroup& restrictions() { return where_; }
    const RestrictionGroup& restrictions() const { return where_; }

    // Find a column by name in the source, then in each join ("alias.name" is accepted).
    FieldRef resolve(const std::string& name) const;

    std::vector<SelectExpression> selectAll();
    std::vector<SelectExpression> selectAll(const TableRef& table);
    SelectExpression& select(const std::string& name, std::optional<std::string> alias = std::nullopt);
    SelectExpression& selectField(const FieldRef& field, std::optional<std::string> alias = std::nullopt);
    Query& aggregate(const FieldRef& field, Aggregate::Operation fn, const std::string& alias);
    Query& aggregate(const Aggregate& fn);

    const SelectExpression& getOutput(const std::string& name) const;
    const std::vector<SelectExpression>& getOutputs() const { return select_; }

    Query& groupBy(const std::vector<std::string>& names);
    Query& groupBy(std::vector<FieldRef> fields);
    const std::vector<FieldRef>& getGroupBy() const { return group_by_; }

    Query& putOrder(OrderBy order);
    Query& orderBy(const std::string& name, OrderBy::Direction direction = OrderBy::Direction::Asc);
    const std::vector<OrderBy>& getOrder() const { return order_; }

    Query& range(std::optional<int64_t> skip, std::optional<int64_t> amount);
    std::optional<int64_t> getOffset() const { return offset_; }
    std::optional<int64_t> getLimit() const { return limit_; }

    // Copy with projections and ordering cleared, for metadata queries like count.
    Query withoutSelect() const;

    std::string toString() const;

private:
    bool owns(const FieldRef& field) const;

    Alias from_;
    std::vector<std::unique_ptr<Join>> joins_;
    RestrictionGroup where_;
    std::vector<SelectExpression> select_;
    std::vector<FieldRef> group_by_;
    std::vector<OrderBy> order_;
    std::optional<int64_t> offset_;
    std::optional<int64_t> limit_;
};

} // namespace dbal
