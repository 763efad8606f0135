#pragma once
#include <string>
#include "dbal/layout.hpp"
#include "dbal/value.hpp"

namespace dbal {

/**
 * A row of a layout with change tracking. Values passed at construction are
 * considered in sync with the database; set() stages changes until commit().
 */
class Record {
public:
    // @throws NotFoundError when @p data names a field the layout lacks
    explicit Record(const Layout& layout, Row data = {});

    const Layout& layout() const { return *layout_; }

    // null when the field was never set; NotFoundError for unknown fields
    Value get(const std::string& field) const;
    Record& set(const std::string& field, Value value);
    bool has(const std::string& field) const;

    // Committed values overlaid with staged ones.
    Row raw() const;
    const Row& committed() const { return committed_; }

    // Staged values that differ from the committed ones.
    Row diff() const;
    bool isDirty() const { return !diff().empty(); }
    void commit();

    // Primary key columns and their values, empty when the layout has no primary key.
    Row getPrimary() const;

private:
    void check(const std::string& field) const;

    const Layout* layout_;
    Row committed_;
    Row pending_;
};

} // namespace dbal
