#pragma once
#include <string>
#include <vector>
#include "dbal/driver.hpp"
#include "dbal/migration.hpp"

namespace dbal {

/**
 * Ledger of tags stored inside the database itself (table _tags). Connection
 * uses it to remember which migrations were applied.
 */
class TagManager {
public:
    static constexpr const char* TABLE = "_tags";

    // Creates the _tags table on the database and in @p schema when missing.
    TagManager(Driver& driver, Schema& schema);

    void tag(const std::string& tag);
    // Removes one row carrying @p tag.
    void untag(const std::string& tag);
    std::vector<std::string> listTags();

private:
    Driver& driver_;
    Schema& schema_;
};

// Creates / drops the ledger table. Safe to run on executors that already have it.
class TagLayoutMigration : public Migration {
public:
    std::string identifier() const override { return "_tags"; }
    void up(SchemaMigrationExecutor& schema) const override;
    void down(SchemaMigrationExecutor& schema) const override;
};

} // namespace dbal
