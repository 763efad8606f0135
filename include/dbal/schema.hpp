#pragma once
#include <memory>
#include <string>
#include <vector>
#include "dbal/jsonhlp.hpp"
#include "dbal/layout.hpp"

namespace dbal {

/**
 * The set of layouts a connection knows about, in creation order. Layouts are
 * heap allocated so references handed out stay valid while others are added.
 */
class Schema {
public:
    explicit Schema(std::string name = "") : name_(std::move(name)) {}
    Schema(const Schema&) = delete;
    Schema& operator=(const Schema&) = delete;
    Schema(Schema&&) = default;
    Schema& operator=(Schema&&) = default;

    const std::string& getName() const { return name_; }

    // Replaces a layout of the same name.
    Layout& putLayout(Layout layout);
    // @throws NotFoundError
    Layout& getLayoutByName(const std::string& name);
    const Layout& getLayoutByName(const std::string& name) const;
    bool hasLayout(const std::string& name) const;
    // @throws NotFoundError
    void removeLayout(const std::string& name);

    std::vector<const Layout*> getLayouts() const;

    void toJson(jval& out, jalloc& a) const;
    // @throws InvariantError on malformed documents
    static Schema fromJson(const jval& in);

    // Snapshot file persistence.
    void save(const std::string& path) const;
    static Schema load(const std::string& path);

private:
    std::string name_;
    std::vector<std::unique_ptr<Layout>> layouts_;
};

} // namespace dbal
