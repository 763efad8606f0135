#include "dbal/grammar.hpp"
#include "dbal/lib.hpp"

namespace dbal {

namespace {

// Value given to rows that already exist when a NOT NULL column is added.
Value fill_value(const FieldType& type) {
    switch (type.kind()) {
        case FieldType::Kind::Int:
        case FieldType::Kind::Long: return int64_t{0};
        case FieldType::Kind::Enum: return type.options().front();
        default: return std::string();
    }
}

std::string constraint_name(const std::string& table, const Index& index) {
    return index.isPrimary() ? table + index.getName() : index.getName();
}

}

std::string SchemaGrammar::hasTable(const std::string& schema, const std::string& table) const {
    return dialect_->has_table(schema, table);
}

std::string SchemaGrammar::columns(const std::vector<Field>& fields) const {
    std::string out;
    for (const auto& f : fields) {
        if (!out.empty()) out += ", ";
        out += dialect_->identifier(f.getName());
    }
    return out;
}

std::string SchemaGrammar::columnDefinition(const Field& f) const {
    std::string def = dialect_->identifier(f.getName()) + " ";
    if (f.isAutoIncrement()) return def + dialect_->auto_increment(f);
    def += dialect_->sql_type(f);
    if (!f.isNullable()) def += " NOT NULL";
    return def;
}

std::vector<std::string> SchemaGrammar::createTable(const Layout& layout) const {
    const std::string& table = layout.getTableName();
    const Field* serial = layout.getAutoIncrement();
    const Index* pk = layout.getPrimaryKey();

    bool inline_key = false;
    if (serial && dialect_->auto_increment_is_key()) {
        if (!pk || pk->getFields().size() != 1 || pk->getFields().front().getName() != serial->getName())
            DBAL_UNSUPPORTED("%s: auto increment field '%s' of '%s' must be the primary key",
                             dialect_->name().c_str(), serial->getName().c_str(), table.c_str());
        inline_key = true;
    }

    std::string ddl = "CREATE TABLE IF NOT EXISTS " + dialect_->identifier(table) + " (";
    bool first = true;
    for (const auto& f : layout.getFields()) {
        if (!first) ddl += ", ";
        first = false;
        ddl += columnDefinition(f);
    }
    if (pk && !inline_key) {
        ddl += ", CONSTRAINT " + dialect_->identifier(constraint_name(table, *pk)) +
               " PRIMARY KEY (" + columns(pk->getFields()) + ")";
    }
    for (const auto& i : layout.getIndexes()) {
        auto* fk = dynamic_cast<const ForeignKey*>(i.get());
        if (!fk) continue;
        ddl += ", CONSTRAINT " + dialect_->identifier(fk->getName()) + " FOREIGN KEY (" + columns(fk->getFields()) +
               ") REFERENCES " + dialect_->identifier(fk->getReferencedTable()) + " (" +
               dialect_->identifier(fk->getReferencedField().getName()) + ")";
    }
    ddl += ")";

    std::vector<std::string> out{ddl};
    for (const auto& i : layout.getIndexes()) {
        if (i->isPrimary() || i->isForeign()) continue;
        out.push_back(createIndex(table, *i));
    }
    return out;
}

std::string SchemaGrammar::dropTable(const std::string& table) const {
    return "DROP TABLE IF EXISTS " + dialect_->identifier(table);
}

std::string SchemaGrammar::addColumn(const std::string& table, const Field& f) const {
    if (f.isAutoIncrement() && dialect_->auto_increment_is_key())
        DBAL_UNSUPPORTED("%s: cannot add auto increment column '%s' to existing table '%s'",
                         dialect_->name().c_str(), f.getName().c_str(), table.c_str());

    std::string sql = "ALTER TABLE " + dialect_->identifier(table) + " ADD COLUMN " + columnDefinition(f);
    if (!f.isNullable() && !f.isAutoIncrement()) sql += " DEFAULT " + dialect_->literal(fill_value(f.getType()));
    return sql;
}

std::vector<std::string> SchemaGrammar::modifyColumn(const std::string& table, const Field& f) const {
    if (!dialect_->alter_columns())
        DBAL_UNSUPPORTED("%s: cannot change column '%s' of '%s'", dialect_->name().c_str(), f.getName().c_str(),
                         table.c_str());
    std::string prefix = "ALTER TABLE " + dialect_->identifier(table) + " ALTER COLUMN " +
                         dialect_->identifier(f.getName());
    return {prefix + " TYPE " + dialect_->sql_type(f),
            prefix + (f.isNullable() ? " DROP NOT NULL" : " SET NOT NULL")};
}

std::string SchemaGrammar::dropColumn(const std::string& table, const std::string& name) const {
    return "ALTER TABLE " + dialect_->identifier(table) + " DROP COLUMN " + dialect_->identifier(name);
}

std::string SchemaGrammar::createIndex(const std::string& table, const Index& index) const {
    if (index.isPrimary() || index.isForeign()) {
        if (!dialect_->alter_constraints())
            DBAL_UNSUPPORTED("%s: cannot add key '%s' to existing table '%s'", dialect_->name().c_str(),
                             index.getName().c_str(), table.c_str());
        std::string sql = "ALTER TABLE " + dialect_->identifier(table) + " ADD CONSTRAINT " +
                          dialect_->identifier(constraint_name(table, index));
        if (index.isPrimary()) return sql + " PRIMARY KEY (" + columns(index.getFields()) + ")";
        const auto& fk = dynamic_cast<const ForeignKey&>(index);
        return sql + " FOREIGN KEY (" + columns(fk.getFields()) + ") REFERENCES " +
               dialect_->identifier(fk.getReferencedTable()) + " (" +
               dialect_->identifier(fk.getReferencedField().getName()) + ")";
    }
    return std::string("CREATE ") + (index.isUnique() ? "UNIQUE " : "") + "INDEX " +
           dialect_->identifier(index.getName()) + " ON " + dialect_->identifier(table) + " (" +
           columns(index.getFields()) + ")";
}

std::string SchemaGrammar::dropIndex(const std::string& table, const Index& index) const {
    if (index.isPrimary() || index.isForeign()) {
        if (!dialect_->alter_constraints())
            DBAL_UNSUPPORTED("%s: cannot drop key '%s' from table '%s'", dialect_->name().c_str(),
                             index.getName().c_str(), table.c_str());
        return "ALTER TABLE " + dialect_->identifier(table) + " DROP CONSTRAINT " +
               dialect_->identifier(constraint_name(table, index));
    }
    return "DROP INDEX " + dialect_->identifier(index.getName());
}

} // namespace dbal
