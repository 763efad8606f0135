#include "dbal/identifiers.hpp"
#include <algorithm>
#include <atomic>
#include "dbal/lib.hpp"

namespace dbal {

TableRef::TableRef(std::vector<std::string> raw, std::vector<std::string> fields)
    : raw_(std::move(raw)), alias_(nextAlias()), fields_(std::move(fields)) {}

TableRef::TableRef(std::vector<std::string> raw, std::string alias, std::vector<std::string> fields)
    : raw_(std::move(raw)), alias_(std::move(alias)), fields_(std::move(fields)) {}

const std::string& TableRef::name() const {
    if (raw_.empty()) DBAL_NOT_FOUND("Table reference %s has no name", alias_.c_str());
    return raw_.back();
}

bool TableRef::has(const std::string& field) const {
    return std::find(fields_.begin(), fields_.end(), field) != fields_.end();
}

FieldRef TableRef::output(const std::string& field) const {
    if (!has(field)) {
        DBAL_NOT_FOUND("No field '%s' in %s", field.c_str(), raw_.empty() ? alias_.c_str() : raw_.back().c_str());
    }
    return FieldRef(alias_, field);
}

std::vector<FieldRef> TableRef::outputs() const {
    std::vector<FieldRef> out;
    out.reserve(fields_.size());
    for (const auto& f : fields_) out.emplace_back(alias_, f);
    return out;
}

TableRef TableRef::withAlias() const {
    return TableRef(raw_, nextAlias(), fields_);
}

std::string TableRef::nextAlias() {
    static std::atomic<unsigned long> counter{0};
    return "t_" + std::to_string(++counter);
}

} // namespace dbal
