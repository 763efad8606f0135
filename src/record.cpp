#include "dbal/record.hpp"
#include "dbal/lib.hpp"

namespace dbal {

Record::Record(const Layout& layout, Row data)
    : layout_(&layout), committed_(std::move(data)) {
    for (const auto& [name, value] : committed_) check(name);
}

void Record::check(const std::string& field) const {
    if (!layout_->hasField(field))
        DBAL_NOT_FOUND("table '%s' has no field '%s'", layout_->getTableName().c_str(), field.c_str());
}

Value Record::get(const std::string& field) const {
    check(field);
    if (auto it = pending_.find(field); it != pending_.end()) return it->second;
    if (auto it = committed_.find(field); it != committed_.end()) return it->second;
    return nullptr;
}

Record& Record::set(const std::string& field, Value value) {
    check(field);
    pending_[field] = std::move(value);
    return *this;
}

bool Record::has(const std::string& field) const {
    return pending_.count(field) || committed_.count(field);
}

Row Record::raw() const {
    Row out = committed_;
    for (const auto& [name, value] : pending_) out[name] = value;
    return out;
}

Row Record::diff() const {
    Row out;
    for (const auto& [name, value] : pending_) {
        auto it = committed_.find(name);
        if (it == committed_.end() || it->second != value) out[name] = value;
    }
    return out;
}

void Record::commit() {
    for (auto& [name, value] : pending_) committed_[name] = std::move(value);
    pending_.clear();
}

Row Record::getPrimary() const {
    Row out;
    const Index* pk = layout_->getPrimaryKey();
    if (!pk) return out;
    for (const auto& f : pk->getFields()) out[f.getName()] = get(f.getName());
    return out;
}

} // namespace dbal
