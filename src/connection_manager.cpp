#include "dbal/connection_manager.hpp"
#include <filesystem>
#include "dbal/lib.hpp"
#include "dbal/log.hpp"

namespace dbal {

ConnectionManager::ConnectionManager(const jval& definitions) {
    if (!definitions.IsObject() || !definitions.HasMember("connections") || !definitions["connections"].IsObject())
        DBAL_INVARIANT("connection definitions need a \"connections\" object");

    for (jit it = definitions["connections"].MemberBegin(); it != definitions["connections"].MemberEnd(); ++it) {
        std::string name = it->name.GetString();
        const jval& def = it->value;
        if (!def.IsObject() || !def.HasMember("settings"))
            DBAL_INVARIANT("connection '%s' has no settings", name.c_str());

        const jval& settings = def["settings"];
        define(name, settings.IsString() ? Settings::fromURL(settings.GetString()) : Settings::fromJson(settings),
               jhlp::get<std::string>(def, "schema"));
    }

    default_ = jhlp::get<std::string>(definitions, "default");
    if (default_.empty() && definitions_.size() == 1) default_ = definitions_.begin()->first;
}

ConnectionManager ConnectionManager::fromFile(const std::string& path) {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) DBAL_THROW("cannot read connection definitions from %s", path.c_str());
    return ConnectionManager(doc);
}

ConnectionManager& ConnectionManager::define(const std::string& name, Settings settings, std::string schemaFile) {
    definitions_[name] = Definition{std::move(settings), std::move(schemaFile)};
    connections_.erase(name);
    if (default_.empty()) default_ = name;
    return *this;
}

const std::string& ConnectionManager::getSchemaFile(const std::string& name) const {
    auto it = definitions_.find(name);
    if (it == definitions_.end()) DBAL_NOT_FOUND("no connection named '%s'", name.c_str());
    return it->second.schema_file;
}

Connection& ConnectionManager::get(const std::string& name) {
    auto it = connections_.find(name);
    if (it != connections_.end()) return *it->second;
    auto connection = make(name);
    connections_[name] = connection;
    return *connection;
}

std::shared_ptr<Connection> ConnectionManager::make(const std::string& name) const {
    auto it = definitions_.find(name);
    if (it == definitions_.end()) DBAL_NOT_FOUND("no connection named '%s'", name.c_str());
    const Definition& def = it->second;

    std::shared_ptr<Schema> schema;
    if (!def.schema_file.empty() && std::filesystem::exists(def.schema_file)) {
        schema = std::make_shared<Schema>(Schema::load(def.schema_file));
    } else {
        schema = std::make_shared<Schema>(def.settings.getSchema());
    }

    PDriver driver = make_driver(def.settings);
    driver->connect();
    DBAL_LOG_INFO("connections", "opened '%s' (%s)", name.c_str(), def.settings.getDriver().c_str());
    return std::make_shared<Connection>(std::move(schema), std::move(driver));
}

} // namespace dbal
