#pragma once
#include <memory>
#include <string>
#include <vector>
#include "dbal/events.hpp"
#include "dbal/identifiers.hpp"

namespace dbal {

/**
 * Column type. Encoded as text in the schema snapshot:
 *   int | int:unsigned | long | long:unsigned | string:<length> | text | enum:<a>,<b>,...
 */
class FieldType {
public:
    enum class Kind { Int, Long, String, Text, Enum };

    static constexpr char SEPARATOR = ',';

    static FieldType integer(bool is_unsigned = false);
    static FieldType longint(bool is_unsigned = false);
    static FieldType string(int length);
    static FieldType text();
    // @throws InvariantError when an option contains the separator
    static FieldType enumeration(std::vector<std::string> options);

    static FieldType parse(const std::string& encoded);
    std::string str() const;

    Kind kind() const { return kind_; }
    bool isUnsigned() const { return unsigned_; }
    int length() const { return length_; }
    const std::vector<std::string>& options() const { return options_; }
    bool isInteger() const { return kind_ == Kind::Int || kind_ == Kind::Long; }

    bool operator==(const FieldType& other) const = default;

private:
    FieldType(Kind kind) : kind_(kind) {}

    Kind kind_;
    bool unsigned_ = false;
    int length_ = 0;
    std::vector<std::string> options_;
};

class Field {
public:
    Field(std::string name, FieldType type, bool nullable = true, bool autoIncrement = false)
        : name_(std::move(name)), type_(std::move(type)), nullable_(nullable), auto_increment_(autoIncrement) {}

    const std::string& getName() const { return name_; }
    const FieldType& getType() const { return type_; }
    bool isNullable() const { return nullable_; }
    bool isAutoIncrement() const { return auto_increment_; }

    bool operator==(const Field& other) const = default;

private:
    std::string name_;
    FieldType type_;
    bool nullable_;
    bool auto_increment_;
};

/**
 * An index over one or more fields of a layout. Drivers asking whether an
 * index is unique must use isUnique(), which accounts for primary keys too.
 */
class Index {
public:
    Index(std::string name, std::vector<Field> fields, bool unique = false, bool primary = false)
        : name_(std::move(name)), fields_(std::move(fields)), unique_(unique), primary_(primary) {}
    virtual ~Index() = default;

    const std::string& getName() const { return name_; }
    const std::vector<Field>& getFields() const { return fields_; }
    bool isUnique() const { return unique_ || primary_; }
    bool isPrimary() const { return primary_; }
    virtual bool isForeign() const { return false; }

private:
    std::string name_;
    std::vector<Field> fields_;
    bool unique_;
    bool primary_;
};

// Index on a local field that references the primary key of another table.
class ForeignKey final : public Index {
public:
    ForeignKey(std::string name, Field field, std::string remoteTable, Field remoteField)
        : Index(std::move(name), {std::move(field)})
        , remote_table_(std::move(remoteTable))
        , remote_field_(std::move(remoteField)) {}

    bool isForeign() const override { return true; }
    const std::string& getReferencedTable() const { return remote_table_; }
    const Field& getReferencedField() const { return remote_field_; }

private:
    std::string remote_table_;
    Field remote_field_;
};

using PIndex = std::shared_ptr<const Index>;

/**
 * The layout is the list of columns and indexes that make up a table. Fields
 * keep insertion order, which is the column order of the table.
 */
class Layout {
public:
    static constexpr const char* PRIMARY_KEY = "_primary";

    explicit Layout(std::string tableName) : table_name_(std::move(tableName)) {}

    const std::string& getTableName() const { return table_name_; }

    // @throws NotFoundError
    const Field& getField(const std::string& name) const;
    bool hasField(const std::string& name) const;
    const std::vector<Field>& getFields() const { return fields_; }

    // Replaces a field of the same name in place, appends otherwise.
    Layout& setField(Field field);
    const Field& putField(const std::string& name, FieldType type, bool nullable, bool autoIncrement);
    // @throws NotFoundError
    Layout& unsetField(const std::string& name);

    /**
     * @brief add or replace an index
     * @throws InvariantError when @p index is primary and the layout already has a primary key
     */
    Layout& putIndex(PIndex index);
    // @throws NotFoundError
    Layout& unsetIndex(const std::string& name);
    const Index& getIndex(const std::string& name) const;
    bool hasIndex(const std::string& name) const;
    const std::vector<PIndex>& getIndexes() const { return indexes_; }

    const Index* getPrimaryKey() const;
    const Field* getAutoIncrement() const;

    // A fresh aliased reference for use in queries.
    TableRef getTableReference() const;

    EventDispatcher& events() { return events_; }
    const EventDispatcher& events() const { return events_; }

private:
    std::string table_name_;
    std::vector<Field> fields_;
    std::vector<PIndex> indexes_;
    EventDispatcher events_;
};

} // namespace dbal
