#include "dbal/sql_migration.hpp"
#include <algorithm>
#include "dbal/lib.hpp"
#include "dbal/log.hpp"

namespace dbal {

SqlTableMigrationExecutor::SqlTableMigrationExecutor(Driver& driver, Layout layout, bool creating)
    : driver_(driver), layout_(std::move(layout)), inner_(layout_), creating_(creating) {}

void SqlTableMigrationExecutor::run(const std::string& sql) {
    DBAL_LOG_DEBUG("migration", "%s", sql.c_str());
    driver_.write(sql);
}

template <typename Op>
TableMigrator& SqlTableMigrationExecutor::track(Op op) {
    if (creating_) {
        op();
        return *this;
    }
    Layout before = layout_;
    op();
    apply(before);
    return *this;
}

void SqlTableMigrationExecutor::apply(const Layout& before) {
    auto grammar = driver_.schemaGrammar();
    const std::string& table = layout_.getTableName();

    auto same_index = [](const std::vector<PIndex>& list, const PIndex& index) {
        return std::find(list.begin(), list.end(), index) != list.end();
    };

    // indexes that went away or were replaced
    for (const auto& index : before.getIndexes()) {
        if (!same_index(layout_.getIndexes(), index)) run(grammar->dropIndex(table, *index));
    }

    for (const auto& field : before.getFields()) {
        if (!layout_.hasField(field.getName())) run(grammar->dropColumn(table, field.getName()));
    }

    for (const auto& field : layout_.getFields()) {
        if (!before.hasField(field.getName())) {
            run(grammar->addColumn(table, field));
        } else if (!(before.getField(field.getName()) == field)) {
            for (const auto& sql : grammar->modifyColumn(table, field)) run(sql);
        }
    }

    for (const auto& index : layout_.getIndexes()) {
        if (!same_index(before.getIndexes(), index)) run(grammar->createIndex(table, *index));
    }
}

void SqlTableMigrationExecutor::create() {
    if (!creating_) return;
    for (const auto& sql : driver_.schemaGrammar()->createTable(layout_)) run(sql);
    creating_ = false;
}

TableMigrator& SqlTableMigrationExecutor::increments(const std::string& name) {
    return track([&] { inner_.increments(name); });
}

TableMigrator& SqlTableMigrationExecutor::integer(const std::string& name, bool is_unsigned, bool nullable) {
    return track([&] { inner_.integer(name, is_unsigned, nullable); });
}

TableMigrator& SqlTableMigrationExecutor::longint(const std::string& name, bool is_unsigned, bool nullable) {
    return track([&] { inner_.longint(name, is_unsigned, nullable); });
}

TableMigrator& SqlTableMigrationExecutor::string(const std::string& name, int length, bool nullable) {
    return track([&] { inner_.string(name, length, nullable); });
}

TableMigrator& SqlTableMigrationExecutor::text(const std::string& name, bool nullable) {
    return track([&] { inner_.text(name, nullable); });
}

TableMigrator& SqlTableMigrationExecutor::enumeration(const std::string& name, std::vector<std::string> options,
                                                      bool nullable) {
    return track([&] { inner_.enumeration(name, std::move(options), nullable); });
}

TableMigrator& SqlTableMigrationExecutor::index(const std::string& name, const std::vector<std::string>& fields) {
    return track([&] { inner_.index(name, fields); });
}

TableMigrator& SqlTableMigrationExecutor::unique(const std::string& name, const std::vector<std::string>& fields) {
    return track([&] { inner_.unique(name, fields); });
}

TableMigrator& SqlTableMigrationExecutor::primary(const std::vector<std::string>& fields) {
    return track([&] { inner_.primary(fields); });
}

TableMigrator& SqlTableMigrationExecutor::foreign(const std::string& name, TableMigrator& remote) {
    return track([&] { inner_.foreign(name, remote); });
}

TableMigrator& SqlTableMigrationExecutor::timestamps() {
    return track([&] { inner_.timestamps(); });
}

TableMigrator& SqlTableMigrationExecutor::softDelete() {
    return track([&] { inner_.softDelete(); });
}

TableMigrator& SqlTableMigrationExecutor::drop(const std::string& field) {
    return track([&] { inner_.drop(field); });
}

TableMigrator& SqlTableMigrationExecutor::dropIndex(const std::string& name) {
    return track([&] { inner_.dropIndex(name); });
}

/* ---------- SqlSchemaMigrationExecutor ---------- */

TableMigrator& SqlSchemaMigrationExecutor::add(const std::string& name, const TableFn& fn) {
    auto& exec = tables_[name] = std::make_unique<SqlTableMigrationExecutor>(driver_, Layout(name), true);
    if (fn) fn(*exec);
    exec->create();
    return *exec;
}

TableMigrator& SqlSchemaMigrationExecutor::table(const std::string& name) {
    auto it = tables_.find(name);
    if (it != tables_.end()) return *it->second;
    auto& exec = tables_[name] =
        std::make_unique<SqlTableMigrationExecutor>(driver_, schema_.getLayoutByName(name), false);
    return *exec;
}

void SqlSchemaMigrationExecutor::drop(const std::string& name) {
    driver_.write(driver_.schemaGrammar()->dropTable(name));
    tables_.erase(name);
}

TagManager* SqlSchemaMigrationExecutor::tags() {
    if (!tags_) tags_ = std::make_unique<TagManager>(driver_, schema_);
    return tags_.get();
}

} // namespace dbal
