#pragma once
#include <string>
#include <vector>
#include "dbal/connection.hpp"
#include "dbal/migration.hpp"

namespace dbal {

/**
 * Brings a database up to date with a manifest.
 *
 * The schema state is taken from the snapshot file when there is one.
 * Otherwise it is rebuilt by replaying, in memory only, every migration the
 * ledger already lists. The snapshot is written back after each run.
 */
class Migrator {
public:
    explicit Migrator(Connection& connection, std::string snapshot = "")
        : connection_(connection), snapshot_(std::move(snapshot)) {}

    // Applies pending migrations in manifest order; returns their identifiers.
    std::vector<std::string> run(const MigrationManifest& manifest);
    // Rolls back the last @p steps applied migrations, newest first.
    std::vector<std::string> rollbackLast(const MigrationManifest& manifest, std::size_t steps = 1);
    std::vector<std::string> pending(const MigrationManifest& manifest);

private:
    void prepare(const MigrationManifest& manifest);
    void save();

    Connection& connection_;
    std::string snapshot_;
};

} // namespace dbal
