#include "dbal/migration.hpp"
#include "dbal/lib.hpp"

namespace dbal {

TableMigrator& SchemaStateMigrationExecutor::add(const std::string& name, const TableFn& fn) {
    if (schema_.hasLayout(name)) DBAL_INVARIANT("table '%s' already exists", name.c_str());
    Layout& layout = schema_.putLayout(Layout(name));
    auto& exec = tables_[name] = std::make_unique<TableMigrationExecutor>(layout);
    if (fn) fn(*exec);
    return *exec;
}

TableMigrator& SchemaStateMigrationExecutor::table(const std::string& name) {
    auto it = tables_.find(name);
    if (it != tables_.end()) return *it->second;
    Layout& layout = schema_.getLayoutByName(name);
    auto& exec = tables_[name] = std::make_unique<TableMigrationExecutor>(layout);
    return *exec;
}

void SchemaStateMigrationExecutor::drop(const std::string& name) {
    schema_.removeLayout(name);
    tables_.erase(name);
}

} // namespace dbal
