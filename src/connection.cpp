#include "dbal/connection.hpp"
#include <algorithm>
#include "dbal/lib.hpp"
#include "dbal/log.hpp"
#include "dbal/tag_manager.hpp"

namespace dbal {

Connection::Connection(std::shared_ptr<Schema> schema, PDriver driver)
    : schema_(std::move(schema)), driver_(std::move(driver)) {
    if (!schema_ || !driver_) DBAL_THROW("Connection needs a schema and a driver");
}

void Connection::setSchema(std::shared_ptr<Schema> schema) {
    if (!schema) DBAL_THROW("Connection::setSchema: null schema");
    schema_ = std::move(schema);
}

bool Connection::contains(const Migration& migration) {
    auto executor = driver_->migrationExecutor(*schema_);
    TagManager* tags = executor->tags();
    if (!tags) return false;
    auto list = tags->listTags();
    return std::find(list.begin(), list.end(), migration_tag(migration)) != list.end();
}

void Connection::run(const Migration& migration, Step step, bool tag) {
    std::unique_ptr<SchemaMigrationExecutor> migrators[] = {
        driver_->migrationExecutor(*schema_),
        std::make_unique<SchemaStateMigrationExecutor>(*schema_),
    };
    const char* names[] = {"database", "schema state"};

    for (std::size_t i = 0; i < 2; ++i) {
        try {
            (migration.*step)(*migrators[i]);
            if (TagManager* tags = migrators[i]->tags()) {
                tag ? tags->tag(migration_tag(migration)) : tags->untag(migration_tag(migration));
            }
        } catch (const std::exception& e) {
            DBAL_LOG_ERROR("migration", "%s of '%s' failed on the %s after %zu executor(s): %s",
                           tag ? "apply" : "rollback", migration.identifier().c_str(), names[i], i, e.what());
            throw;
        }
    }
    DBAL_LOG_INFO("migration", "%s %s", tag ? "applied" : "rolled back", migration.identifier().c_str());
}

void Connection::apply(const Migration& migration) {
    run(migration, &Migration::up, true);
}

void Connection::rollback(const Migration& migration) {
    run(migration, &Migration::down, false);
}

std::unique_ptr<ResultSet> Connection::query(const Query& query) {
    return driver_->read(driver_->queryGrammar()->query(query));
}

Query Connection::newQuery(const std::string& name) {
    const Layout& layout = schema_->getLayoutByName(name);
    Query query(layout.getTableReference());
    QueryEvent event(layout, query);
    layout.events().dispatch(event);
    return query;
}

bool Connection::insert(const Layout& layout, Record& record) {
    RecordEvent event(EventType::RecordBeforeInsert, layout, record);
    layout.events().dispatch(event);
    if (event.isPrevented()) return false;

    driver_->write(driver_->recordGrammar()->insertRecord(layout, record));

    // the database picked the key, read it back
    const Field* serial = layout.getAutoIncrement();
    if (serial && is_null(record.get(serial->getName()))) {
        record.set(serial->getName(), driver_->lastInsertId());
    }
    record.commit();
    return true;
}

bool Connection::update(const Layout& layout, Record& record) {
    RecordEvent event(EventType::RecordBeforeUpdate, layout, record);
    layout.events().dispatch(event);
    if (event.isPrevented()) return false;

    std::string sql = driver_->recordGrammar()->updateRecord(layout, record);
    if (!sql.empty()) driver_->write(sql);
    record.commit();
    return true;
}

bool Connection::remove(const Layout& layout, Record& record) {
    RecordEvent event(EventType::RecordBeforeDelete, layout, record);
    layout.events().dispatch(event);

    if (event.isPrevented()) {
        // a listener turned the delete into changes on the record (soft delete)
        if (!record.isDirty()) return false;
        driver_->write(driver_->recordGrammar()->updateRecord(layout, record));
        record.commit();
        return true;
    }

    driver_->write(driver_->recordGrammar()->deleteRecord(layout, record));
    return true;
}

bool Connection::has(const std::string& table) {
    return driver_->hasTable(table);
}

} // namespace dbal
