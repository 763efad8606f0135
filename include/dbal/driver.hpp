#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "dbal/grammar.hpp"
#include "dbal/settings.hpp"
#include "dbal/value.hpp"

namespace dbal {

class Schema;
class SchemaMigrationExecutor;

// Rows of a SELECT, fetched one at a time.
class ResultSet {
public:
    virtual ~ResultSet() = default;
    // std::nullopt once exhausted
    virtual std::optional<Row> fetch() = 0;

    std::vector<Row> fetchAll() {
        std::vector<Row> rows;
        while (auto row = fetch()) rows.push_back(std::move(*row));
        return rows;
    }
};

/**
 * A backend. Executes SQL text, hands out the grammars that produce it and the
 * live migration executor. Errors reported by the database surface as BackendError.
 */
class Driver {
public:
    explicit Driver(Settings settings) : settings_(std::move(settings)) {}
    virtual ~Driver() = default;

    const Settings& settings() const { return settings_; }

    // Safe to call multiple times.
    virtual void connect() = 0;
    virtual void disconnect() = 0;

    // Statement without result rows, returns the number of rows affected.
    virtual int64_t write(const std::string& sql) = 0;
    virtual std::unique_ptr<ResultSet> read(const std::string& sql) = 0;
    // Key generated by the last INSERT on this connection.
    virtual int64_t lastInsertId() = 0;

    virtual PDialect dialect() const = 0;

    virtual std::unique_ptr<QueryGrammar> queryGrammar() const { return std::make_unique<QueryGrammar>(dialect()); }
    virtual std::unique_ptr<RecordGrammar> recordGrammar() const { return std::make_unique<RecordGrammar>(dialect()); }
    virtual std::unique_ptr<SchemaGrammar> schemaGrammar() const { return std::make_unique<SchemaGrammar>(dialect()); }

    // DDL executor bound to this driver; keeps its ledger in the _tags table.
    virtual std::unique_ptr<SchemaMigrationExecutor> migrationExecutor(Schema& schema);

    bool hasTable(const std::string& name);

protected:
    Settings settings_;
};

using PDriver = std::shared_ptr<Driver>;

PDriver make_sqlite_driver(const Settings& settings);
#if HAVE_POSTGRESQL
PDriver make_postgres_driver(const Settings& settings);
#endif
// Picks the driver named by settings.getDriver(). UnsupportedError for drivers not built in.
PDriver make_driver(const Settings& settings);

} // namespace dbal
