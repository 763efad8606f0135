#include "dbal/grammar.hpp"
#include "dbal/lib.hpp"

namespace dbal {

namespace {

std::string check_options(const Dialect& d, const Field& f) {
    std::string out = " CHECK (" + d.identifier(f.getName()) + " IN (";
    const auto& options = f.getType().options();
    for (std::size_t i = 0; i < options.size(); ++i) {
        if (i) out += ", ";
        out += d.literal(options[i]);
    }
    return out + "))";
}

}

/* ---------- SQLite ---------- */

std::string SqliteDialect::literal(const Value& value) const {
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value) ? "1" : "0";
    return Dialect::literal(value);
}

std::string SqliteDialect::sql_type(const Field& f) const {
    const auto& t = f.getType();
    switch (t.kind()) {
        case FieldType::Kind::Int:
        case FieldType::Kind::Long:   return "INTEGER";
        case FieldType::Kind::String: return "VARCHAR(" + std::to_string(t.length()) + ")";
        case FieldType::Kind::Text:   return "TEXT";
        case FieldType::Kind::Enum:   return "TEXT" + check_options(*this, f);
    }
    return "TEXT";
}

std::string SqliteDialect::auto_increment(const Field& f) const {
    if (!f.getType().isInteger())
        DBAL_UNSUPPORTED("sqlite: auto increment field '%s' must be an integer", f.getName().c_str());
    return "INTEGER PRIMARY KEY AUTOINCREMENT";
}

std::string SqliteDialect::limit(std::optional<int64_t> offset, std::optional<int64_t> limit) const {
    // SQLite only accepts OFFSET after a LIMIT
    if (offset && !limit) return " LIMIT -1 OFFSET " + std::to_string(*offset);
    return Dialect::limit(offset, limit);
}

std::string SqliteDialect::has_table(const std::string&, const std::string& table) const {
    return "SELECT COUNT(*) AS " + identifier("count") +
           " FROM sqlite_master WHERE type = 'table' AND name = " + literal(table);
}

std::string SqliteDialect::delete_one(const std::string& table, const std::string& where) const {
    return "DELETE FROM " + table + " WHERE rowid IN (SELECT rowid FROM " + table + " WHERE " + where + " LIMIT 1)";
}

/* ---------- PostgreSQL ---------- */

std::string PgDialect::sql_type(const Field& f) const {
    const auto& t = f.getType();
    switch (t.kind()) {
        // unsigned 32 bit values do not fit INTEGER
        case FieldType::Kind::Int:    return t.isUnsigned() ? "BIGINT" : "INTEGER";
        case FieldType::Kind::Long:   return "BIGINT";
        case FieldType::Kind::String: return "VARCHAR(" + std::to_string(t.length()) + ")";
        case FieldType::Kind::Text:   return "TEXT";
        case FieldType::Kind::Enum:   return "TEXT" + check_options(*this, f);
    }
    return "TEXT";
}

std::string PgDialect::auto_increment(const Field& f) const {
    const auto& t = f.getType();
    if (!t.isInteger())
        DBAL_UNSUPPORTED("postgres: auto increment field '%s' must be an integer", f.getName().c_str());
    return (t.kind() == FieldType::Kind::Long || t.isUnsigned()) ? "BIGSERIAL NOT NULL" : "SERIAL NOT NULL";
}

std::string PgDialect::has_table(const std::string& schema, const std::string& table) const {
    std::string catalog = schema.empty() ? "current_database()" : literal(schema);
    return "SELECT COUNT(*) AS " + identifier("count") + " FROM information_schema.tables WHERE table_catalog = " +
           catalog + " AND table_schema = current_schema() AND table_name = " + literal(table);
}

std::string PgDialect::delete_one(const std::string& table, const std::string& where) const {
    return "DELETE FROM " + table + " WHERE ctid IN (SELECT ctid FROM " + table + " WHERE " + where + " LIMIT 1)";
}

PDialect make_sqlite_dialect() {
    return std::make_shared<SqliteDialect>();
}

PDialect make_pg_dialect() {
    return std::make_shared<PgDialect>();
}

} // namespace dbal
