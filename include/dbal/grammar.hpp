#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "dbal/layout.hpp"
#include "dbal/query.hpp"
#include "dbal/record.hpp"

namespace dbal {

/**
 * Dialect specific SQL fragments. The grammars below build statements out of
 * these, so adding a backend mostly means adding a dialect.
 */
class Dialect {
public:
    virtual ~Dialect() = default;

    virtual std::string name() const = 0;

    // "name", embedded quotes doubled
    virtual std::string identifier(const std::string& name) const;
    // 'text', 42, NULL ... ready to embed in a statement
    virtual std::string literal(const Value& value) const;

    virtual std::string sql_type(const Field& f) const = 0;
    // Column type clause of an auto increment field.
    virtual std::string auto_increment(const Field& f) const = 0;
    // The auto increment clause already declares the primary key (SQLite).
    virtual bool auto_increment_is_key() const { return false; }

    virtual std::string limit(std::optional<int64_t> offset, std::optional<int64_t> limit) const;

    // SELECT returning a single count column, > 0 if the table exists.
    virtual std::string has_table(const std::string& schema, const std::string& table) const = 0;
    // Delete a single row matching @p where (rows with no primary key).
    virtual std::string delete_one(const std::string& table, const std::string& where) const = 0;

    // Primary / foreign keys can be added to and removed from existing tables.
    virtual bool alter_constraints() const = 0;
    // Existing columns can change type or nullability.
    virtual bool alter_columns() const = 0;
};

class SqliteDialect final : public Dialect {
public:
    std::string name() const override { return "sqlite"; }
    std::string literal(const Value& value) const override;
    std::string sql_type(const Field& f) const override;
    std::string auto_increment(const Field& f) const override;
    bool auto_increment_is_key() const override { return true; }
    std::string limit(std::optional<int64_t> offset, std::optional<int64_t> limit) const override;
    std::string has_table(const std::string& schema, const std::string& table) const override;
    std::string delete_one(const std::string& table, const std::string& where) const override;
    bool alter_constraints() const override { return false; }
    bool alter_columns() const override { return false; }
};

class PgDialect final : public Dialect {
public:
    std::string name() const override { return "postgres"; }
    std::string sql_type(const Field& f) const override;
    std::string auto_increment(const Field& f) const override;
    std::string has_table(const std::string& schema, const std::string& table) const override;
    std::string delete_one(const std::string& table, const std::string& where) const override;
    bool alter_constraints() const override { return true; }
    bool alter_columns() const override { return true; }
};

using PDialect = std::shared_ptr<const Dialect>;

// Renders a Query into a SELECT statement.
class QueryGrammar {
public:
    explicit QueryGrammar(PDialect dialect) : dialect_(std::move(dialect)) {}
    virtual ~QueryGrammar() = default;

    virtual std::string query(const Query& q) const;

    std::string field(const FieldRef& f) const;
    std::string group(const RestrictionGroup& g, bool nested = false) const;
    std::string restriction(const Restriction& r) const;

protected:
    std::string source(const Alias& alias) const;
    std::string select(const Query& q) const;

    PDialect dialect_;
};

// INSERT / UPDATE / DELETE for a single record.
class RecordGrammar {
public:
    explicit RecordGrammar(PDialect dialect) : dialect_(std::move(dialect)) {}
    virtual ~RecordGrammar() = default;

    virtual std::string insertRecord(const Layout& layout, const Record& record) const;
    // Empty when the record has no changes.
    virtual std::string updateRecord(const Layout& layout, const Record& record) const;
    virtual std::string deleteRecord(const Layout& layout, const Record& record) const;

protected:
    // Identify the stored row: primary key when there is one, every committed value otherwise.
    std::string where(const Layout& layout, const Record& record) const;

    PDialect dialect_;
};

// DDL.
class SchemaGrammar {
public:
    explicit SchemaGrammar(PDialect dialect) : dialect_(std::move(dialect)) {}
    virtual ~SchemaGrammar() = default;

    virtual std::string hasTable(const std::string& schema, const std::string& table) const;
    // CREATE TABLE followed by one CREATE INDEX per plain index.
    virtual std::vector<std::string> createTable(const Layout& layout) const;
    virtual std::string dropTable(const std::string& table) const;

    virtual std::string addColumn(const std::string& table, const Field& f) const;
    // @throws UnsupportedError when the dialect cannot alter columns
    virtual std::vector<std::string> modifyColumn(const std::string& table, const Field& f) const;
    virtual std::string dropColumn(const std::string& table, const std::string& name) const;

    // Handles plain, primary and foreign indexes. Primary and foreign keys on
    // existing tables raise UnsupportedError where the dialect lacks them.
    virtual std::string createIndex(const std::string& table, const Index& index) const;
    virtual std::string dropIndex(const std::string& table, const Index& index) const;

    std::string columnDefinition(const Field& f) const;

protected:
    std::string columns(const std::vector<Field>& fields) const;

    PDialect dialect_;
};

PDialect make_sqlite_dialect();
PDialect make_pg_dialect();

} // namespace dbal
