#include "dbal/grammar.hpp"
#include <cctype>
#include <sstream>
#include "dbal/lib.hpp"

namespace dbal {

/* ---------- Dialect ---------- */

std::string Dialect::identifier(const std::string& name) const {
    std::string out = "\"";
    for (char c : name) out += (c == '"') ? "\"\"" : std::string(1, c);
    return out + "\"";
}

std::string Dialect::literal(const Value& value) const {
    if (is_null(value)) return "NULL";
    if (std::holds_alternative<int64_t>(value)) return std::to_string(std::get<int64_t>(value));
    if (std::holds_alternative<double>(value)) {
        std::ostringstream os;
        os.precision(17);
        os << std::get<double>(value);
        return os.str();
    }
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value) ? "TRUE" : "FALSE";

    const auto& s = std::get<std::string>(value);
    std::string out = "'";
    for (char c : s) out += (c == '\'') ? "''" : std::string(1, c);
    return out + "'";
}

std::string Dialect::limit(std::optional<int64_t> offset, std::optional<int64_t> limit) const {
    std::string out;
    if (limit) out += " LIMIT " + std::to_string(*limit);
    if (offset) out += " OFFSET " + std::to_string(*offset);
    return out;
}

/* ---------- QueryGrammar ---------- */

std::string QueryGrammar::field(const FieldRef& f) const {
    return dialect_->identifier(f.table()) + "." + dialect_->identifier(f.name());
}

std::string QueryGrammar::source(const Alias& alias) const {
    std::string out;
    if (alias.isQuery()) {
        out = "(" + query(*std::get<SubQuery>(alias.input())) + ")";
    } else {
        const auto& raw = std::get<TableRef>(alias.input()).raw();
        for (std::size_t i = 0; i < raw.size(); ++i) {
            if (i) out += ".";
            out += dialect_->identifier(raw[i]);
        }
    }
    return out + " AS " + dialect_->identifier(alias.output().alias());
}

std::string QueryGrammar::select(const Query& q) const {
    const auto& outputs = q.getOutputs();
    if (outputs.empty()) return dialect_->identifier(q.getTable().alias()) + ".*";

    std::string out;
    for (std::size_t i = 0; i < outputs.size(); ++i) {
        const auto& o = outputs[i];
        if (i) out += ", ";
        if (o.aggregate()) {
            std::string fn = Aggregate::name(*o.aggregate());
            for (auto& c : fn) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            out += fn + "(" + field(o.input()) + ")";
        } else {
            out += field(o.input());
        }
        if (o.alias()) out += " AS " + dialect_->identifier(*o.alias());
    }
    return out;
}

std::string QueryGrammar::restriction(const Restriction& r) const {
    std::string op = r.getOperator();
    std::string lhs;

    if (r.isSubQuery()) {
        std::string sub = query(*r.subQuery());
        if (r.isNullValue()) {
            if (op == "<>" || op == "!=" || op == "IS NOT") return "EXISTS (" + sub + ")";
            if (op == "=" || op == "IS") return "NOT EXISTS (" + sub + ")";
        }
        lhs = "(" + sub + ")";
    } else {
        lhs = field(r.field());
    }

    const auto& value = r.getValue();
    if (std::holds_alternative<FieldRef>(value)) {
        return lhs + " " + op + " " + field(std::get<FieldRef>(value));
    }
    if (std::holds_alternative<std::vector<Value>>(value)) {
        const auto& list = std::get<std::vector<Value>>(value);
        // IN () is not valid SQL; an empty list matches nothing, its negation everything
        if (list.empty()) return op == Restriction::NOT_IN_OPERATOR ? "1 = 1" : "1 = 0";
        std::string out = lhs + " " + op + " (";
        for (std::size_t i = 0; i < list.size(); ++i) {
            if (i) out += ", ";
            out += dialect_->literal(list[i]);
        }
        return out + ")";
    }

    const auto& scalar = std::get<Value>(value);
    if (is_null(scalar)) {
        if (op == "=" || op == "IS") return lhs + " IS NULL";
        if (op == "<>" || op == "!=" || op == "IS NOT") return lhs + " IS NOT NULL";
    }
    return lhs + " " + op + " " + dialect_->literal(scalar);
}

std::string QueryGrammar::group(const RestrictionGroup& g, bool nested) const {
    if (g.empty()) return "1 = 1";

    std::string glue = " " + to_string(g.type()) + " ";
    std::string out;
    bool first = true;
    for (const auto& child : g.children()) {
        if (!first) out += glue;
        first = false;
        if (std::holds_alternative<Restriction>(child)) {
            out += restriction(std::get<Restriction>(child));
        } else {
            out += group(*std::get<std::unique_ptr<RestrictionGroup>>(child), true);
        }
    }
    return nested ? "(" + out + ")" : out;
}

std::string QueryGrammar::query(const Query& q) const {
    std::string sql = "SELECT " + select(q) + " FROM " + source(q.getFrom());

    for (const auto& join : q.getJoined()) {
        switch (join->type()) {
            case Join::Type::Inner: sql += " INNER JOIN "; break;
            case Join::Type::Left:  sql += " LEFT JOIN ";  break;
            case Join::Type::Right: sql += " RIGHT JOIN "; break;
        }
        sql += source(join->source()) + " ON " + group(join->on(), true);
    }

    if (!q.restrictions().empty()) sql += " WHERE " + group(q.restrictions());

    if (!q.getGroupBy().empty()) {
        sql += " GROUP BY ";
        for (std::size_t i = 0; i < q.getGroupBy().size(); ++i) {
            if (i) sql += ", ";
            sql += field(q.getGroupBy()[i]);
        }
    }

    if (!q.getOrder().empty()) {
        sql += " ORDER BY ";
        for (std::size_t i = 0; i < q.getOrder().size(); ++i) {
            const auto& o = q.getOrder()[i];
            if (i) sql += ", ";
            sql += field(o.field()) + (o.direction() == OrderBy::Direction::Desc ? " DESC" : " ASC");
        }
    }

    return sql + dialect_->limit(q.getOffset(), q.getLimit());
}

/* ---------- RecordGrammar ---------- */

std::string RecordGrammar::where(const Layout& layout, const Record& record) const {
    Row match;
    if (const Index* pk = layout.getPrimaryKey()) {
        for (const auto& f : pk->getFields()) {
            auto it = record.committed().find(f.getName());
            match[f.getName()] = it != record.committed().end() ? it->second : record.get(f.getName());
        }
    } else {
        match = record.committed();
    }
    if (match.empty()) DBAL_INVARIANT("record of '%s' has no values to identify it", layout.getTableName().c_str());

    std::string out;
    for (const auto& [name, value] : match) {
        if (!out.empty()) out += " AND ";
        out += dialect_->identifier(name) + (is_null(value) ? " IS NULL" : " = " + dialect_->literal(value));
    }
    return out;
}

std::string RecordGrammar::insertRecord(const Layout& layout, const Record& record) const {
    std::string table = dialect_->identifier(layout.getTableName());
    Row data = record.raw();
    if (data.empty()) return "INSERT INTO " + table + " DEFAULT VALUES";

    std::string names, values;
    for (const auto& f : layout.getFields()) {
        auto it = data.find(f.getName());
        if (it == data.end()) continue;
        if (!names.empty()) { names += ", "; values += ", "; }
        names += dialect_->identifier(f.getName());
        values += dialect_->literal(it->second);
    }
    return "INSERT INTO " + table + " (" + names + ") VALUES (" + values + ")";
}

std::string RecordGrammar::updateRecord(const Layout& layout, const Record& record) const {
    Row diff = record.diff();
    if (diff.empty()) return "";

    std::string set;
    for (const auto& f : layout.getFields()) {
        auto it = diff.find(f.getName());
        if (it == diff.end()) continue;
        if (!set.empty()) set += ", ";
        set += dialect_->identifier(f.getName()) + " = " + dialect_->literal(it->second);
    }
    return "UPDATE " + dialect_->identifier(layout.getTableName()) + " SET " + set + " WHERE " + where(layout, record);
}

std::string RecordGrammar::deleteRecord(const Layout& layout, const Record& record) const {
    std::string table = dialect_->identifier(layout.getTableName());
    if (!layout.getPrimaryKey()) return dialect_->delete_one(table, where(layout, record));
    return "DELETE FROM " + table + " WHERE " + where(layout, record);
}

} // namespace dbal
