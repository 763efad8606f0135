#include "dbal/query.hpp"
#include <sstream>
#include "dbal/lib.hpp"

namespace dbal {

namespace {

    TableRef subquery_output(const SubQuery& query) {
        if (!query) DBAL_THROW("Query: null sub-query");
        std::vector<std::string> names;
        for (const auto& e : query->getOutputs()) names.push_back(e.getName());
        return TableRef({}, TableRef::nextAlias(), names);
    }

}

/* ---------- Aggregate ---------- */

Aggregate::Aggregate(FieldRef input, Operation operation)
    : input_(std::move(input)), operation_(operation) {
    alias_ = name(operation_) + "_" + input_.table() + "_" + input_.name();
}

std::string Aggregate::name(Operation operation) {
    switch (operation) {
        case Operation::Count: return "count";
        case Operation::Sum:   return "sum";
        case Operation::Min:   return "min";
        case Operation::Max:   return "max";
        case Operation::Avg:   return "avg";
    }
    return "count";
}

/* ---------- Join ---------- */

Join::Join(Alias source, Type type)
    : source_(std::move(source)), type_(type), on_(source_.output()) {}

/* ---------- Query ---------- */

Query::Query(const TableRef& table)
    : from_(table, table.withAlias())
    , where_(from_.output()) {}

Query::Query(SubQuery query)
    : from_(query, subquery_output(query))
    , where_(from_.output()) {}

Query::Query(const Query& other)
    : from_(other.from_)
    , where_(other.where_)
    , select_(other.select_)
    , group_by_(other.group_by_)
    , order_(other.order_)
    , offset_(other.offset_)
    , limit_(other.limit_) {
    joins_.reserve(other.joins_.size());
    for (const auto& join : other.joins_) joins_.push_back(std::make_unique<Join>(*join));
}

Query& Query::operator=(const Query& other) {
    if (this != &other) {
        Query copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Join& Query::joinTable(const TableRef& table, const JoinConfigurator& fn) {
    joins_.push_back(std::make_unique<Join>(Alias(table, table.withAlias())));
    Join& join = *joins_.back();
    if (fn) fn(join, *this);
    return join;
}

bool Query::owns(const FieldRef& field) const {
    const TableRef& from = from_.output();
    if (field.table() == from.alias()) return from.has(field.name());
    for (const auto& join : joins_) {
        if (field.table() == join->table().alias()) return join->table().has(field.name());
    }
    return false;
}

FieldRef Query::resolve(const std::string& name) const {
    auto dot = name.find('.');
    if (dot != std::string::npos) {
        FieldRef field(name.substr(0, dot), name.substr(dot + 1));
        if (!owns(field)) DBAL_NOT_FOUND("Query: cannot resolve '%s'", name.c_str());
        return field;
    }

    if (from_.output().has(name)) return from_.output().output(name);
    for (const auto& join : joins_) {
        if (join->table().has(name)) return join->output(name);
    }
    DBAL_NOT_FOUND("Query: cannot resolve '%s'", name.c_str());
}

std::vector<SelectExpression> Query::selectAll() {
    return selectAll(from_.output());
}

std::vector<SelectExpression> Query::selectAll(const TableRef& table) {
    std::vector<SelectExpression> added;
    for (const auto& field : table.outputs()) {
        if (!owns(field)) DBAL_NOT_FOUND("Query: table %s is not part of the query", table.alias().c_str());
        added.emplace_back(field);
    }
    select_.insert(select_.end(), added.begin(), added.end());
    return added;
}

SelectExpression& Query::select(const std::string& name, std::optional<std::string> alias) {
    FieldRef field = from_.output().output(name);
    select_.emplace_back(field, std::move(alias));
    return select_.back();
}

SelectExpression& Query::selectField(const FieldRef& field, std::optional<std::string> alias) {
    if (!owns(field)) DBAL_NOT_FOUND("Query: cannot select '%s'", field.raw().c_str());
    select_.emplace_back(field, std::move(alias));
    return select_.back();
}

Query& Query::aggregate(const FieldRef& field, Aggregate::Operation fn, const std::string& alias) {
    if (!owns(field)) DBAL_NOT_FOUND("Query: cannot aggregate '%s'", field.raw().c_str());
    select_.emplace_back(field, alias, fn);
    return *this;
}

Query& Query::aggregate(const Aggregate& fn) {
    return aggregate(fn.input(), fn.operation(), fn.alias());
}

const SelectExpression& Query::getOutput(const std::string& name) const {
    for (const auto& e : select_) {
        if (e.getName() == name) return e;
    }
    DBAL_NOT_FOUND("Query: no output named '%s'", name.c_str());
}

Query& Query::groupBy(const std::vector<std::string>& names) {
    std::vector<FieldRef> fields;
    fields.reserve(names.size());
    for (const auto& n : names) fields.push_back(resolve(n));
    group_by_ = std::move(fields);
    return *this;
}

Query& Query::groupBy(std::vector<FieldRef> fields) {
    for (const auto& f : fields) {
        if (!owns(f)) DBAL_NOT_FOUND("Query: cannot group by '%s'", f.raw().c_str());
    }
    group_by_ = std::move(fields);
    return *this;
}

Query& Query::putOrder(OrderBy order) {
    if (!owns(order.field())) DBAL_NOT_FOUND("Query: cannot order by '%s'", order.field().raw().c_str());
    order_.push_back(std::move(order));
    return *this;
}

Query& Query::orderBy(const std::string& name, OrderBy::Direction direction) {
    return putOrder(OrderBy(resolve(name), direction));
}

Query& Query::range(std::optional<int64_t> skip, std::optional<int64_t> amount) {
    offset_ = skip;
    limit_ = amount;
    return *this;
}

Query Query::withoutSelect() const {
    Query copy(*this);
    copy.select_.clear();
    copy.order_.clear();
    return copy;
}

std::string Query::toString() const {
    std::ostringstream os;
    os << (from_.isQuery() ? "Query" : "Table") << "(";
    const auto& raw = from_.output().raw();
    if (raw.empty()) {
        os << from_.output().alias();
    } else {
        for (size_t i = 0; i < raw.size(); ++i) {
            if (i) os << ".";
            os << raw[i];
        }
    }
    os << ") {" << where_.size() << "}";
    return os.str();
}

} // namespace dbal
