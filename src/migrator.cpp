#include "dbal/migrator.hpp"
#include <filesystem>
#include "dbal/lib.hpp"
#include "dbal/log.hpp"

namespace dbal {

void Migrator::prepare(const MigrationManifest& manifest) {
    if (!snapshot_.empty() && std::filesystem::exists(snapshot_)) {
        connection_.setSchema(std::make_shared<Schema>(Schema::load(snapshot_)));
        return;
    }

    connection_.setSchema(std::make_shared<Schema>(connection_.getSchema().getName()));
    for (const auto& migration : manifest) {
        if (!connection_.contains(*migration)) continue;
        DBAL_LOG_DEBUG("migrator", "replaying %s", migration->identifier().c_str());
        SchemaStateMigrationExecutor state(connection_.getSchema());
        migration->up(state);
    }
}

void Migrator::save() {
    if (!snapshot_.empty()) connection_.getSchema().save(snapshot_);
}

std::vector<std::string> Migrator::pending(const MigrationManifest& manifest) {
    std::vector<std::string> out;
    for (const auto& migration : manifest) {
        if (!connection_.contains(*migration)) out.push_back(migration->identifier());
    }
    return out;
}

std::vector<std::string> Migrator::run(const MigrationManifest& manifest) {
    prepare(manifest);

    std::vector<std::string> applied;
    for (const auto& migration : manifest) {
        if (connection_.contains(*migration)) {
            DBAL_LOG_DEBUG("migrator", "skipping %s", migration->identifier().c_str());
            continue;
        }
        DBAL_LOG_INFO("migrator", "applying %s", migration->identifier().c_str());
        connection_.apply(*migration);
        applied.push_back(migration->identifier());
        save();
    }
    save();
    return applied;
}

std::vector<std::string> Migrator::rollbackLast(const MigrationManifest& manifest, std::size_t steps) {
    prepare(manifest);

    std::vector<std::string> rolled;
    for (auto it = manifest.rbegin(); it != manifest.rend() && rolled.size() < steps; ++it) {
        if (!connection_.contains(**it)) continue;
        DBAL_LOG_INFO("migrator", "rolling back %s", (*it)->identifier().c_str());
        connection_.rollback(**it);
        rolled.push_back((*it)->identifier());
        save();
    }
    save();
    return rolled;
}

} // namespace dbal
