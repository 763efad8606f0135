#pragma once
#include <memory>
#include <string>
#include <vector>
#include "dbal/driver.hpp"
#include "dbal/migration.hpp"

// ---- Test fakes ----

// Serves a fixed list of rows.
class FakeResultSet final : public dbal::ResultSet {
public:
    explicit FakeResultSet(std::vector<dbal::Row> rows) : rows_(std::move(rows)) {}

    std::optional<dbal::Row> fetch() override {
        if (next_ >= rows_.size()) return std::nullopt;
        return rows_[next_++];
    }

private:
    std::vector<dbal::Row> rows_;
    std::size_t next_ = 0;
};

/**
 * Records every statement instead of running it. Reads answer with the rows
 * queued in `results` (front first); with none queued, table lookups count 0
 * and other reads come back empty. With `ledger` off the driver
 * hands out an executor without tag manager, like a backend that keeps no ledger.
 */
class FakeDriver final : public dbal::Driver {
public:
    std::vector<std::string> writes;
    std::vector<std::string> reads;
    std::vector<std::vector<dbal::Row>> results;
    int64_t next_id = 1;
    int connects = 0;
    bool ledger = true;

    explicit FakeDriver(dbal::PDialect dialect = dbal::make_sqlite_dialect())
        : dbal::Driver(dbal::Settings().setDriver("fake")), dialect_(std::move(dialect)) {}

    void connect() override { connects++; }
    void disconnect() override {}

    int64_t write(const std::string& sql) override {
        writes.push_back(sql);
        return 1;
    }

    std::unique_ptr<dbal::ResultSet> read(const std::string& sql) override {
        reads.push_back(sql);
        if (results.empty()) {
            // table lookups find nothing
            std::vector<dbal::Row> rows;
            if (sql.rfind("SELECT COUNT(*)", 0) == 0) rows.push_back({{"count", dbal::Value(int64_t{0})}});
            return std::make_unique<FakeResultSet>(std::move(rows));
        }
        auto rows = std::move(results.front());
        results.erase(results.begin());
        return std::make_unique<FakeResultSet>(std::move(rows));
    }

    int64_t lastInsertId() override { return next_id++; }

    dbal::PDialect dialect() const override { return dialect_; }

    std::unique_ptr<dbal::SchemaMigrationExecutor> migrationExecutor(dbal::Schema& schema) override;

    bool wrote(const std::string& needle) const {
        for (const auto& w : writes) {
            if (w.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    dbal::PDialect dialect_;
};

// Live executor minus the ledger: statements still reach FakeDriver::writes.
class LedgerlessExecutor final : public dbal::SchemaMigrationExecutor {
public:
    explicit LedgerlessExecutor(std::unique_ptr<dbal::SchemaMigrationExecutor> inner) : inner_(std::move(inner)) {}

    dbal::TableMigrator& add(const std::string& name, const TableFn& fn = nullptr) override { return inner_->add(name, fn); }
    dbal::TableMigrator& table(const std::string& name) override { return inner_->table(name); }
    void drop(const std::string& name) override { inner_->drop(name); }
    bool has(const std::string& name) override { return inner_->has(name); }
    dbal::TagManager* tags() override { return nullptr; }

private:
    std::unique_ptr<dbal::SchemaMigrationExecutor> inner_;
};

inline std::unique_ptr<dbal::SchemaMigrationExecutor> FakeDriver::migrationExecutor(dbal::Schema& schema) {
    auto live = dbal::Driver::migrationExecutor(schema);
    if (ledger) return live;
    return std::make_unique<LedgerlessExecutor>(std::move(live));
}
