#include "dbal/schema.hpp"
#include <algorithm>
#include <fstream>
#include "dbal/lib.hpp"

namespace dbal {

Layout& Schema::putLayout(Layout layout) {
    for (auto& l : layouts_) {
        if (l->getTableName() == layout.getTableName()) {
            *l = std::move(layout);
            return *l;
        }
    }
    layouts_.push_back(std::make_unique<Layout>(std::move(layout)));
    return *layouts_.back();
}

Layout& Schema::getLayoutByName(const std::string& name) {
    for (auto& l : layouts_) {
        if (l->getTableName() == name) return *l;
    }
    DBAL_NOT_FOUND("schema has no layout '%s'", name.c_str());
}

const Layout& Schema::getLayoutByName(const std::string& name) const {
    return const_cast<Schema*>(this)->getLayoutByName(name);
}

bool Schema::hasLayout(const std::string& name) const {
    return std::any_of(layouts_.begin(), layouts_.end(),
                       [&](const std::unique_ptr<Layout>& l) { return l->getTableName() == name; });
}

void Schema::removeLayout(const std::string& name) {
    auto it = std::find_if(layouts_.begin(), layouts_.end(),
                           [&](const std::unique_ptr<Layout>& l) { return l->getTableName() == name; });
    if (it == layouts_.end()) DBAL_NOT_FOUND("schema has no layout '%s'", name.c_str());
    layouts_.erase(it);
}

std::vector<const Layout*> Schema::getLayouts() const {
    std::vector<const Layout*> out;
    for (const auto& l : layouts_) out.push_back(l.get());
    return out;
}

/*
 * {"name": "app", "layouts": [{"name": "users",
 *               "fields": [{"name": "_id", "type": "long:unsigned", "nullable": false, "autoIncrement": true}],
 *               "indexes": [{"name": "_primary", "fields": [{"name": "_id", ...}], "unique": false, "primary": true,
 *                            "foreign": {"table": "groups", "field": {...}}}],
 *               "hooks": [{"event": "record.beforeInsert", "kind": "timestamp", "field": "created"}]}]}
 */

namespace {

jval field_to_json(const Field& f, jalloc& a) {
    jval out(json::kObjectType);
    out.AddMember("name", jhlp::str(f.getName(), a), a);
    out.AddMember("type", jhlp::str(f.getType().str(), a), a);
    out.AddMember("nullable", f.isNullable(), a);
    out.AddMember("autoIncrement", f.isAutoIncrement(), a);
    return out;
}

Field field_from_json(const jval& in) {
    auto name = jhlp::get<std::string>(in, "name");
    auto type = jhlp::get<std::string>(in, "type");
    if (name.empty() || type.empty()) DBAL_INVARIANT("snapshot field without name or type");
    return Field(name, FieldType::parse(type), jhlp::get<bool>(in, "nullable", true),
                 jhlp::get<bool>(in, "autoIncrement", false));
}

const jval& member(const jval& in, const char* key, json::Type type) {
    if (!in.IsObject() || !in.HasMember(key) || in[key].GetType() != type)
        DBAL_INVARIANT("snapshot: missing or malformed '%s'", key);
    return in[key];
}

}

void Schema::toJson(jval& out, jalloc& a) const {
    out.SetObject();
    out.AddMember("name", jhlp::str(name_, a), a);
    jval layouts(json::kArrayType);
    for (const auto& l : layouts_) {
        jval jl(json::kObjectType);
        jl.AddMember("name", jhlp::str(l->getTableName(), a), a);

        jval fields(json::kArrayType);
        for (const auto& f : l->getFields()) fields.PushBack(field_to_json(f, a), a);
        jl.AddMember("fields", fields, a);

        jval indexes(json::kArrayType);
        for (const auto& i : l->getIndexes()) {
            jval ji(json::kObjectType);
            ji.AddMember("name", jhlp::str(i->getName(), a), a);
            // full definitions, an index may outlive a dropped field
            jval fields(json::kArrayType);
            for (const auto& f : i->getFields()) fields.PushBack(field_to_json(f, a), a);
            ji.AddMember("fields", fields, a);
            ji.AddMember("unique", i->isUnique() && !i->isPrimary(), a);
            ji.AddMember("primary", i->isPrimary(), a);
            if (auto* fk = dynamic_cast<const ForeignKey*>(i.get())) {
                jval jf(json::kObjectType);
                jf.AddMember("table", jhlp::str(fk->getReferencedTable(), a), a);
                jf.AddMember("field", field_to_json(fk->getReferencedField(), a), a);
                ji.AddMember("foreign", jf, a);
            }
            indexes.PushBack(ji, a);
        }
        jl.AddMember("indexes", indexes, a);

        jval hooks(json::kArrayType);
        for (const auto& [type, listener] : l->events().hooks()) {
            jval jh(json::kObjectType);
            jh.AddMember("event", jhlp::str(to_string(type), a), a);
            jh.AddMember("kind", jhlp::str(listener->kind(), a), a);
            jh.AddMember("field", jhlp::str(listener->field(), a), a);
            hooks.PushBack(jh, a);
        }
        jl.AddMember("hooks", hooks, a);

        layouts.PushBack(jl, a);
    }
    out.AddMember("layouts", layouts, a);
}

Schema Schema::fromJson(const jval& in) {
    Schema schema(jhlp::get<std::string>(in, "name"));
    for (const auto& jl : member(in, "layouts", json::kArrayType).GetArray()) {
        Layout layout(member(jl, "name", json::kStringType).GetString());

        for (const auto& jf : member(jl, "fields", json::kArrayType).GetArray())
            layout.setField(field_from_json(jf));

        for (const auto& ji : member(jl, "indexes", json::kArrayType).GetArray()) {
            std::string name = member(ji, "name", json::kStringType).GetString();
            std::vector<Field> fields;
            for (const auto& jn : member(ji, "fields", json::kArrayType).GetArray()) {
                if (jn.IsObject()) {
                    fields.push_back(field_from_json(jn));
                } else if (jn.IsString()) {
                    fields.push_back(layout.getField(jn.GetString()));
                } else {
                    DBAL_INVARIANT("snapshot: index '%s' has a malformed field", name.c_str());
                }
            }
            if (ji.HasMember("foreign")) {
                const jval& jf = ji["foreign"];
                if (fields.size() != 1) DBAL_INVARIANT("snapshot: foreign key '%s' must have one field", name.c_str());
                layout.putIndex(std::make_shared<ForeignKey>(name, fields.front(),
                                                             member(jf, "table", json::kStringType).GetString(),
                                                             field_from_json(member(jf, "field", json::kObjectType))));
            } else {
                layout.putIndex(std::make_shared<Index>(name, std::move(fields), jhlp::get<bool>(ji, "unique", false),
                                                        jhlp::get<bool>(ji, "primary", false)));
            }
        }

        if (jl.HasMember("hooks")) {
            for (const auto& jh : member(jl, "hooks", json::kArrayType).GetArray()) {
                layout.events().hook(event_type(jhlp::get<std::string>(jh, "event")),
                                     make_listener(jhlp::get<std::string>(jh, "kind"),
                                                   jhlp::get<std::string>(jh, "field")));
            }
        }
        schema.putLayout(std::move(layout));
    }
    return schema;
}

void Schema::save(const std::string& path) const {
    jdoc doc;
    toJson(doc, doc.GetAllocator());
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.is_open()) DBAL_THROW("cannot write schema snapshot %s", path.c_str());
    ofs << jhlp::stringify(doc, true);
    if (!ofs) DBAL_THROW("failed writing schema snapshot %s", path.c_str());
    DBAL_LOG_DEBUG("schema", "saved %zu layouts to %s", layouts_.size(), path.c_str());
}

Schema Schema::load(const std::string& path) {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) DBAL_THROW("cannot read schema snapshot %s", path.c_str());
    return fromJson(doc);
}

} // namespace dbal
