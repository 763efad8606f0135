#pragma once
#include <map>
#include <memory>
#include <string>
#include "dbal/connection.hpp"
#include "dbal/jsonhlp.hpp"
#include "dbal/settings.hpp"

namespace dbal {

/**
 * Named connection definitions. Connections are opened on first get() and
 * cached by name.
 *
 * {"default": "main",
 *  "connections": {"main": {"settings": "sqlite:///var/app.db", "schema": "schema.json"}}}
 *
 * "settings" is either a URL or an object understood by Settings::fromJson.
 * "schema" names the snapshot file; a fresh schema is used when it does not exist.
 */
class ConnectionManager {
public:
    ConnectionManager() = default;
    // @throws InvariantError on malformed definitions
    explicit ConnectionManager(const jval& definitions);
    static ConnectionManager fromFile(const std::string& path);

    ConnectionManager& define(const std::string& name, Settings settings, std::string schemaFile = "");
    bool has(const std::string& name) const { return definitions_.count(name) > 0; }

    // @throws NotFoundError for undefined names
    Connection& get(const std::string& name);
    Connection& get() { return get(default_); }
    // A new, uncached connection.
    std::shared_ptr<Connection> make(const std::string& name) const;

    const std::string& getDefault() const { return default_; }
    const std::string& getSchemaFile(const std::string& name) const;

private:
    struct Definition {
        Settings settings;
        std::string schema_file;
    };

    std::map<std::string, Definition> definitions_;
    std::map<std::string, std::shared_ptr<Connection>> connections_;
    std::string default_;
};

} // namespace dbal
