#include "dbal/table_migration.hpp"
#include <memory>
#include "dbal/lib.hpp"

namespace dbal {

std::vector<Field> TableMigrationExecutor::fields(const std::vector<std::string>& names) const {
    if (names.empty()) DBAL_INVARIANT("index on '%s' needs at least one field", layout_.getTableName().c_str());
    std::vector<Field> out;
    for (const auto& n : names) out.push_back(layout_.getField(n));
    return out;
}

TableMigrator& TableMigrationExecutor::increments(const std::string& name) {
    layout_.putField(name, FieldType::longint(true), false, true);
    return primary({name});
}

TableMigrator& TableMigrationExecutor::integer(const std::string& name, bool is_unsigned, bool nullable) {
    layout_.putField(name, FieldType::integer(is_unsigned), nullable, false);
    return *this;
}

TableMigrator& TableMigrationExecutor::longint(const std::string& name, bool is_unsigned, bool nullable) {
    layout_.putField(name, FieldType::longint(is_unsigned), nullable, false);
    return *this;
}

TableMigrator& TableMigrationExecutor::string(const std::string& name, int length, bool nullable) {
    layout_.putField(name, FieldType::string(length), nullable, false);
    return *this;
}

TableMigrator& TableMigrationExecutor::text(const std::string& name, bool nullable) {
    layout_.putField(name, FieldType::text(), nullable, false);
    return *this;
}

TableMigrator& TableMigrationExecutor::enumeration(const std::string& name, std::vector<std::string> options,
                                                   bool nullable) {
    layout_.putField(name, FieldType::enumeration(std::move(options)), nullable, false);
    return *this;
}

TableMigrator& TableMigrationExecutor::index(const std::string& name, const std::vector<std::string>& names) {
    layout_.putIndex(std::make_shared<Index>(name, fields(names)));
    return *this;
}

TableMigrator& TableMigrationExecutor::unique(const std::string& name, const std::vector<std::string>& names) {
    layout_.putIndex(std::make_shared<Index>(name, fields(names), true));
    return *this;
}

TableMigrator& TableMigrationExecutor::primary(const std::vector<std::string>& names) {
    layout_.putIndex(std::make_shared<Index>(Layout::PRIMARY_KEY, fields(names), false, true));
    return *this;
}

TableMigrator& TableMigrationExecutor::foreign(const std::string& name, TableMigrator& remote) {
    const Layout& other = remote.layout();
    const Index* pk = other.getPrimaryKey();
    if (!pk) DBAL_INVARIANT("foreign key '%s': table '%s' has no primary key", name.c_str(), other.getTableName().c_str());
    if (pk->getFields().size() != 1)
        DBAL_INVARIANT("foreign key '%s': primary key of '%s' spans several fields", name.c_str(),
                       other.getTableName().c_str());

    Field remote_field = pk->getFields().front();
    std::string remote_table = other.getTableName();
    const Field& local = layout_.putField(name + remote_field.getName(), remote_field.getType(), true, false);
    layout_.putIndex(std::make_shared<ForeignKey>("fk_" + layout_.getTableName() + "_" + name, local,
                                                  remote_table, remote_field));
    return *this;
}

TableMigrator& TableMigrationExecutor::timestamps() {
    layout_.putField(CREATED, FieldType::integer(true), false, false);
    layout_.putField(UPDATED, FieldType::integer(true), true, false);
    layout_.events().hook(EventType::RecordBeforeInsert, std::make_shared<UpdateTimestampListener>(CREATED));
    layout_.events().hook(EventType::RecordBeforeUpdate, std::make_shared<UpdateTimestampListener>(UPDATED));
    return *this;
}

TableMigrator& TableMigrationExecutor::softDelete() {
    layout_.putField(REMOVED, FieldType::integer(true), true, false);
    layout_.events().hook(EventType::RecordBeforeDelete, std::make_shared<SoftDeleteListener>(REMOVED));
    layout_.events().hook(EventType::QueryBeforeCreate, std::make_shared<SoftDeleteQueryListener>(REMOVED));
    return *this;
}

TableMigrator& TableMigrationExecutor::drop(const std::string& field) {
    layout_.unsetField(field);
    return *this;
}

TableMigrator& TableMigrationExecutor::dropIndex(const std::string& name) {
    layout_.unsetIndex(name);
    return *this;
}

} // namespace dbal
