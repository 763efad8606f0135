#pragma once
#include <map>
#include <memory>
#include <string>
#include "dbal/driver.hpp"
#include "dbal/migration.hpp"
#include "dbal/tag_manager.hpp"

namespace dbal {

/**
 * Live TableMigrator. Shapes a working copy of the layout with the in-memory
 * executor and turns every change into DDL.
 *
 * A table being created buffers everything until create() emits CREATE TABLE;
 * afterwards each call is diffed against the previous layout and executed
 * right away as ALTER / CREATE INDEX / DROP INDEX statements.
 */
class SqlTableMigrationExecutor : public TableMigrator {
public:
    SqlTableMigrationExecutor(Driver& driver, Layout layout, bool creating);
    SqlTableMigrationExecutor(const SqlTableMigrationExecutor&) = delete;
    SqlTableMigrationExecutor& operator=(const SqlTableMigrationExecutor&) = delete;

    TableMigrator& increments(const std::string& name) override;
    TableMigrator& integer(const std::string& name, bool is_unsigned = false, bool nullable = true) override;
    TableMigrator& longint(const std::string& name, bool is_unsigned = false, bool nullable = true) override;
    TableMigrator& string(const std::string& name, int length = 255, bool nullable = true) override;
    TableMigrator& text(const std::string& name, bool nullable = true) override;
    TableMigrator& enumeration(const std::string& name, std::vector<std::string> options, bool nullable = true) override;
    TableMigrator& index(const std::string& name, const std::vector<std::string>& fields) override;
    TableMigrator& unique(const std::string& name, const std::vector<std::string>& fields) override;
    TableMigrator& primary(const std::vector<std::string>& fields) override;
    TableMigrator& foreign(const std::string& name, TableMigrator& remote) override;
    TableMigrator& timestamps() override;
    TableMigrator& softDelete() override;
    TableMigrator& drop(const std::string& field) override;
    TableMigrator& dropIndex(const std::string& name) override;

    const Layout& layout() const override { return layout_; }

    // Emit CREATE TABLE for the buffered layout and switch to altering.
    void create();

private:
    template <typename Op>
    TableMigrator& track(Op op);
    void apply(const Layout& before);
    void run(const std::string& sql);

    Driver& driver_;
    Layout layout_;
    TableMigrationExecutor inner_;
    bool creating_;
};

class SqlSchemaMigrationExecutor : public SchemaMigrationExecutor {
public:
    SqlSchemaMigrationExecutor(Driver& driver, Schema& schema) : driver_(driver), schema_(schema) {}

    TableMigrator& add(const std::string& name, const TableFn& fn = nullptr) override;
    TableMigrator& table(const std::string& name) override;
    void drop(const std::string& name) override;
    bool has(const std::string& name) override { return driver_.hasTable(name); }
    // Created on first use; creates the _tags table if needed.
    TagManager* tags() override;

private:
    Driver& driver_;
    Schema& schema_;
    std::map<std::string, std::unique_ptr<SqlTableMigrationExecutor>> tables_;
    std::unique_ptr<TagManager> tags_;
};

} // namespace dbal
