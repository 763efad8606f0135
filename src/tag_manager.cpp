#include "dbal/tag_manager.hpp"
#include "dbal/lib.hpp"
#include "dbal/log.hpp"
#include "dbal/record.hpp"

namespace dbal {

void TagLayoutMigration::up(SchemaMigrationExecutor& schema) const {
    if (schema.has(TagManager::TABLE)) return;
    schema.add(TagManager::TABLE, [](TableMigrator& t) { t.string("tag", 255, false); });
}

void TagLayoutMigration::down(SchemaMigrationExecutor& schema) const {
    if (schema.has(TagManager::TABLE)) schema.drop(TagManager::TABLE);
}

TagManager::TagManager(Driver& driver, Schema& schema)
    : driver_(driver), schema_(schema) {
    TagLayoutMigration bootstrap;
    auto live = driver_.migrationExecutor(schema_);
    bootstrap.up(*live);
    SchemaStateMigrationExecutor state(schema_);
    bootstrap.up(state);
}

void TagManager::tag(const std::string& tag) {
    const Layout& layout = schema_.getLayoutByName(TABLE);
    Record record(layout, Row{{"tag", Value(tag)}});
    driver_.write(driver_.recordGrammar()->insertRecord(layout, record));
    DBAL_LOG_DEBUG("tags", "+ %s", tag.c_str());
}

void TagManager::untag(const std::string& tag) {
    const Layout& layout = schema_.getLayoutByName(TABLE);
    Record record(layout, Row{{"tag", Value(tag)}});
    driver_.write(driver_.recordGrammar()->deleteRecord(layout, record));
    DBAL_LOG_DEBUG("tags", "- %s", tag.c_str());
}

std::vector<std::string> TagManager::listTags() {
    const Layout& layout = schema_.getLayoutByName(TABLE);
    Query query(layout.getTableReference());
    auto result = driver_.read(driver_.queryGrammar()->query(query));

    std::vector<std::string> tags;
    while (auto row = result->fetch()) {
        auto it = row->find("tag");
        if (it == row->end() || !std::holds_alternative<std::string>(it->second))
            DBAL_BACKEND("malformed row in %s", TABLE);
        tags.push_back(std::get<std::string>(it->second));
    }
    return tags;
}

} // namespace dbal
