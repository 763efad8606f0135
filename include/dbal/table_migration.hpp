#pragma once
#include <string>
#include <vector>
#include "dbal/layout.hpp"

namespace dbal {

/**
 * Fluent DSL a migration uses to shape one table. Implemented once over an
 * in-memory layout and once per live backend; both must accept the same
 * sequence of calls.
 */
class TableMigrator {
public:
    virtual ~TableMigrator() = default;

    // Unsigned, non null, auto increment long made primary key.
    virtual TableMigrator& increments(const std::string& name) = 0;
    TableMigrator& id() { return increments("_id"); }

    virtual TableMigrator& integer(const std::string& name, bool is_unsigned = false, bool nullable = true) = 0;
    virtual TableMigrator& longint(const std::string& name, bool is_unsigned = false, bool nullable = true) = 0;
    virtual TableMigrator& string(const std::string& name, int length = 255, bool nullable = true) = 0;
    virtual TableMigrator& text(const std::string& name, bool nullable = true) = 0;
    virtual TableMigrator& enumeration(const std::string& name, std::vector<std::string> options, bool nullable = true) = 0;

    virtual TableMigrator& index(const std::string& name, const std::vector<std::string>& fields) = 0;
    virtual TableMigrator& unique(const std::string& name, const std::vector<std::string>& fields) = 0;
    virtual TableMigrator& primary(const std::vector<std::string>& fields) = 0;
    // Adds <name><remote pk> referencing @p remote's primary key, indexed as fk_<table>_<name>.
    virtual TableMigrator& foreign(const std::string& name, TableMigrator& remote) = 0;

    // created / updated stamps maintained on insert and update.
    virtual TableMigrator& timestamps() = 0;
    // removed stamp; deletes become updates and queries skip removed rows.
    virtual TableMigrator& softDelete() = 0;

    virtual TableMigrator& drop(const std::string& field) = 0;
    virtual TableMigrator& dropIndex(const std::string& name) = 0;

    // The layout as shaped so far.
    virtual const Layout& layout() const = 0;
};

// TableMigrator over a layout held elsewhere (usually in a Schema).
class TableMigrationExecutor : public TableMigrator {
public:
    explicit TableMigrationExecutor(Layout& layout) : layout_(layout) {}

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

    static constexpr const char* CREATED = "created";
    static constexpr const char* UPDATED = "updated";
    static constexpr const char* REMOVED = "removed";

private:
    std::vector<Field> fields(const std::vector<std::string>& names) const;

    Layout& layout_;
};

} // namespace dbal
