#include "dbal/driver.hpp"
#include "dbal/lib.hpp"
#include "dbal/sql_migration.hpp"

namespace dbal {

std::unique_ptr<SchemaMigrationExecutor> Driver::migrationExecutor(Schema& schema) {
    return std::make_unique<SqlSchemaMigrationExecutor>(*this, schema);
}

bool Driver::hasTable(const std::string& name) {
    auto rs = read(schemaGrammar()->hasTable(settings_.getSchema(), name));
    auto row = rs->fetch();
    if (!row || row->empty()) DBAL_BACKEND("table lookup for '%s' returned no rows", name.c_str());
    const Value& count = row->begin()->second;
    if (std::holds_alternative<int64_t>(count)) return std::get<int64_t>(count) > 0;
    if (std::holds_alternative<std::string>(count)) return std::get<std::string>(count) != "0";
    DBAL_BACKEND("table lookup for '%s' returned a non numeric count", name.c_str());
}

PDriver make_driver(const Settings& settings) {
    if (settings.getDriver() == "sqlite") return make_sqlite_driver(settings);
#if HAVE_POSTGRESQL
    if (settings.getDriver() == "postgres") return make_postgres_driver(settings);
#endif
    DBAL_UNSUPPORTED("driver '%s' is not available in this build", settings.getDriver().c_str());
}

} // namespace dbal
