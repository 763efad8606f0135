#pragma once
#include <string>
#include <vector>

namespace dbal {

/**
 * A column as seen from inside a query: the alias of the table (or sub-query)
 * it is read from plus its name within that table.
 */
class FieldRef {
public:
    FieldRef() = default;
    FieldRef(std::string table, std::string name)
        : table_(std::move(table)), name_(std::move(name)) {}

    const std::string& table() const { return table_; }
    const std::string& name() const { return name_; }

    // alias.name, the way grammars address the column
    std::string raw() const { return table_ + "." + name_; }

    bool operator==(const FieldRef& other) const = default;

private:
    std::string table_;
    std::string name_;
};

/**
 * A table (or the output of a sub-query) that can be referenced by a query.
 * The alias is unique within the process so that two references to the same
 * table never collide inside one statement.
 */
class TableRef {
public:
    TableRef() = default;
    TableRef(std::vector<std::string> raw, std::vector<std::string> fields);
    TableRef(std::vector<std::string> raw, std::string alias, std::vector<std::string> fields);

    const std::vector<std::string>& raw() const { return raw_; }
    const std::string& name() const;
    const std::string& alias() const { return alias_; }
    const std::vector<std::string>& fields() const { return fields_; }

    bool has(const std::string& field) const;

    /**
     * @brief resolve a column of this table
     * @throws NotFoundError when the table has no such output
     */
    FieldRef output(const std::string& field) const;
    std::vector<FieldRef> outputs() const;

    // Same table, fresh alias.
    TableRef withAlias() const;

    static std::string nextAlias();

private:
    std::vector<std::string> raw_;
    std::string alias_;
    std::vector<std::string> fields_;
};

} // namespace dbal
