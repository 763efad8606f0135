#pragma once
#include <memory>
#include <string>
#include "dbal/driver.hpp"
#include "dbal/migration.hpp"
#include "dbal/query.hpp"
#include "dbal/record.hpp"
#include "dbal/schema.hpp"

namespace dbal {

/**
 * A driver paired with the schema the application believes the database has.
 * Migrations go through here so that both stay in step.
 */
class Connection {
public:
    Connection(std::shared_ptr<Schema> schema, PDriver driver);

    Schema& getSchema() { return *schema_; }
    void setSchema(std::shared_ptr<Schema> schema);
    Driver& getDriver() { return *driver_; }

    // Whether the ledger records @p migration as applied. False when the driver keeps no ledger.
    bool contains(const Migration& migration);

    /**
     * @brief run the migration's up against the database, then against the schema
     *
     * Each executor that keeps a ledger is tagged after its run. On failure the
     * executors already processed are not rolled back.
     */
    void apply(const Migration& migration);
    // down, same order, untagging instead.
    void rollback(const Migration& migration);

    std::unique_ptr<ResultSet> query(const Query& query);
    // Query on a layout, after its query listeners ran (e.g. soft delete filtering).
    Query newQuery(const std::string& layout);

    // Each returns false when a listener prevented the write.
    bool insert(const Layout& layout, Record& record);
    bool update(const Layout& layout, Record& record);
    bool remove(const Layout& layout, Record& record);

    bool has(const std::string& table);

private:
    using Step = void (Migration::*)(SchemaMigrationExecutor&) const;
    void run(const Migration& migration, Step step, bool tag);

    std::shared_ptr<Schema> schema_;
    PDriver driver_;
};

} // namespace dbal
