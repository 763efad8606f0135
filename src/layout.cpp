#include "dbal/layout.hpp"
#include <algorithm>
#include "dbal/lib.hpp"

namespace dbal {

FieldType FieldType::integer(bool is_unsigned) {
    FieldType t(Kind::Int);
    t.unsigned_ = is_unsigned;
    return t;
}

FieldType FieldType::longint(bool is_unsigned) {
    FieldType t(Kind::Long);
    t.unsigned_ = is_unsigned;
    return t;
}

FieldType FieldType::string(int length) {
    if (length <= 0) DBAL_INVARIANT("string length must be positive, got %d", length);
    FieldType t(Kind::String);
    t.length_ = length;
    return t;
}

FieldType FieldType::text() {
    return FieldType(Kind::Text);
}

FieldType FieldType::enumeration(std::vector<std::string> options) {
    if (options.empty()) DBAL_INVARIANT("enum needs at least one option");
    for (const auto& o : options) {
        if (o.find(SEPARATOR) != std::string::npos)
            DBAL_INVARIANT("enum option '%s' contains '%c'", o.c_str(), SEPARATOR);
    }
    FieldType t(Kind::Enum);
    t.options_ = std::move(options);
    return t;
}

FieldType FieldType::parse(const std::string& encoded) {
    auto colon = encoded.find(':');
    std::string head = encoded.substr(0, colon);
    std::string tail = colon == std::string::npos ? "" : encoded.substr(colon + 1);

    if (head == "int" || head == "long") {
        if (!tail.empty() && tail != "unsigned") DBAL_INVARIANT("bad type modifier in '%s'", encoded.c_str());
        return head == "int" ? integer(!tail.empty()) : longint(!tail.empty());
    }
    if (head == "string") {
        try {
            return string(std::stoi(tail));
        } catch (const std::logic_error&) {
            DBAL_INVARIANT("bad string length in '%s'", encoded.c_str());
        }
    }
    if (head == "text") return text();
    if (head == "enum") {
        std::vector<std::string> options;
        std::size_t start = 0;
        while (true) {
            auto pos = tail.find(SEPARATOR, start);
            options.push_back(tail.substr(start, pos - start));
            if (pos == std::string::npos) break;
            start = pos + 1;
        }
        return enumeration(std::move(options));
    }
    DBAL_NOT_FOUND("unknown field type '%s'", encoded.c_str());
}

std::string FieldType::str() const {
    switch (kind_) {
        case Kind::Int: return unsigned_ ? "int:unsigned" : "int";
        case Kind::Long: return unsigned_ ? "long:unsigned" : "long";
        case Kind::String: return "string:" + std::to_string(length_);
        case Kind::Text: return "text";
        case Kind::Enum: {
            std::string out = "enum:";
            for (std::size_t i = 0; i < options_.size(); ++i) {
                if (i) out += SEPARATOR;
                out += options_[i];
            }
            return out;
        }
    }
    return "";
}

const Field& Layout::getField(const std::string& name) const {
    for (const auto& f : fields_) {
        if (f.getName() == name) return f;
    }
    DBAL_NOT_FOUND("table '%s' has no field '%s'", table_name_.c_str(), name.c_str());
}

bool Layout::hasField(const std::string& name) const {
    return std::any_of(fields_.begin(), fields_.end(), [&](const Field& f) { return f.getName() == name; });
}

Layout& Layout::setField(Field field) {
    for (auto& f : fields_) {
        if (f.getName() == field.getName()) {
            f = std::move(field);
            return *this;
        }
    }
    fields_.push_back(std::move(field));
    return *this;
}

const Field& Layout::putField(const std::string& name, FieldType type, bool nullable, bool autoIncrement) {
    setField(Field(name, std::move(type), nullable, autoIncrement));
    return getField(name);
}

Layout& Layout::unsetField(const std::string& name) {
    auto it = std::find_if(fields_.begin(), fields_.end(), [&](const Field& f) { return f.getName() == name; });
    if (it == fields_.end()) DBAL_NOT_FOUND("table '%s' has no field '%s'", table_name_.c_str(), name.c_str());
    fields_.erase(it);
    events_.unhook(name);
    return *this;
}

Layout& Layout::putIndex(PIndex index) {
    if (index->isPrimary() && getPrimaryKey())
        DBAL_INVARIANT("table '%s' already has a primary key", table_name_.c_str());
    for (auto& i : indexes_) {
        if (i->getName() == index->getName()) {
            i = std::move(index);
            return *this;
        }
    }
    indexes_.push_back(std::move(index));
    return *this;
}

Layout& Layout::unsetIndex(const std::string& name) {
    auto it = std::find_if(indexes_.begin(), indexes_.end(), [&](const PIndex& i) { return i->getName() == name; });
    if (it == indexes_.end()) DBAL_NOT_FOUND("table '%s' has no index '%s'", table_name_.c_str(), name.c_str());
    indexes_.erase(it);
    return *this;
}

const Index& Layout::getIndex(const std::string& name) const {
    for (const auto& i : indexes_) {
        if (i->getName() == name) return *i;
    }
    DBAL_NOT_FOUND("table '%s' has no index '%s'", table_name_.c_str(), name.c_str());
}

bool Layout::hasIndex(const std::string& name) const {
    return std::any_of(indexes_.begin(), indexes_.end(), [&](const PIndex& i) { return i->getName() == name; });
}

const Index* Layout::getPrimaryKey() const {
    for (const auto& i : indexes_) {
        if (i->isPrimary()) return i.get();
    }
    return nullptr;
}

const Field* Layout::getAutoIncrement() const {
    for (const auto& f : fields_) {
        if (f.isAutoIncrement()) return &f;
    }
    return nullptr;
}

TableRef Layout::getTableReference() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& f : fields_) names.push_back(f.getName());
    return TableRef({table_name_}, std::move(names));
}

} // namespace dbal
