#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "dbal/schema.hpp"
#include "dbal/table_migration.hpp"

namespace dbal {

class TagManager;

/**
 * Schema level half of the migration DSL. Connection::apply hands the same
 * migration to a live executor (DDL against the database) and to a schema
 * state executor (the in-memory model), one after the other.
 */
class SchemaMigrationExecutor {
public:
    using TableFn = std::function<void(TableMigrator&)>;

    virtual ~SchemaMigrationExecutor() = default;

    // Create a table, shaped by @p fn. InvariantError if it already exists.
    virtual TableMigrator& add(const std::string& name, const TableFn& fn = nullptr) = 0;
    // Alter an existing table. NotFoundError if unknown.
    virtual TableMigrator& table(const std::string& name) = 0;
    virtual void drop(const std::string& name) = 0;
    virtual bool has(const std::string& name) = 0;

    // Ledger of applied migrations, nullptr when this executor keeps none.
    virtual TagManager* tags() = 0;
};

// Applies migrations to a Schema only.
class SchemaStateMigrationExecutor : public SchemaMigrationExecutor {
public:
    explicit SchemaStateMigrationExecutor(Schema& schema) : schema_(schema) {}

    TableMigrator& add(const std::string& name, const TableFn& fn = nullptr) override;
    TableMigrator& table(const std::string& name) override;
    void drop(const std::string& name) override;
    bool has(const std::string& name) override { return schema_.hasLayout(name); }
    TagManager* tags() override { return nullptr; }

private:
    Schema& schema_;
    std::map<std::string, std::unique_ptr<TableMigrationExecutor>> tables_;
};

class Migration {
public:
    virtual ~Migration() = default;

    // Stable across releases, the ledger stores it.
    virtual std::string identifier() const = 0;
    virtual void up(SchemaMigrationExecutor& schema) const = 0;
    virtual void down(SchemaMigrationExecutor& schema) const = 0;
};

using PMigration = std::shared_ptr<const Migration>;
// Ordered list of migrations; applied front to back, rolled back back to front.
using MigrationManifest = std::vector<PMigration>;

class LambdaMigration : public Migration {
public:
    using Step = std::function<void(SchemaMigrationExecutor&)>;

    LambdaMigration(std::string identifier, Step up, Step down)
        : identifier_(std::move(identifier)), up_(std::move(up)), down_(std::move(down)) {}

    std::string identifier() const override { return identifier_; }
    void up(SchemaMigrationExecutor& schema) const override { if (up_) up_(schema); }
    void down(SchemaMigrationExecutor& schema) const override { if (down_) down_(schema); }

private:
    std::string identifier_;
    Step up_;
    Step down_;
};

inline PMigration make_migration(std::string identifier, LambdaMigration::Step up, LambdaMigration::Step down) {
    return std::make_shared<LambdaMigration>(std::move(identifier), std::move(up), std::move(down));
}

// The tag a migration leaves in the ledger once applied.
inline std::string migration_tag(const Migration& migration) {
    return "migration:" + migration.identifier();
}

} // namespace dbal
