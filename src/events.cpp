#include "dbal/events.hpp"
#include <algorithm>
#include <chrono>
#include "dbal/layout.hpp"
#include "dbal/lib.hpp"
#include "dbal/log.hpp"
#include "dbal/query.hpp"
#include "dbal/record.hpp"

namespace dbal {

namespace {

int64_t now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

}

std::string to_string(EventType type) {
    switch (type) {
        case EventType::RecordBeforeInsert: return "record.beforeInsert";
        case EventType::RecordBeforeUpdate: return "record.beforeUpdate";
        case EventType::RecordBeforeDelete: return "record.beforeDelete";
        case EventType::QueryBeforeCreate:  return "query.beforeCreate";
    }
    return "";
}

EventType event_type(const std::string& name) {
    for (auto type : {EventType::RecordBeforeInsert, EventType::RecordBeforeUpdate,
                      EventType::RecordBeforeDelete, EventType::QueryBeforeCreate}) {
        if (to_string(type) == name) return type;
    }
    DBAL_NOT_FOUND("unknown event '%s'", name.c_str());
}

void UpdateTimestampListener::handle(Event& event) {
    auto* e = dynamic_cast<RecordEvent*>(&event);
    if (!e) return;
    e->record().set(field_, now());
}

void SoftDeleteListener::handle(Event& event) {
    auto* e = dynamic_cast<RecordEvent*>(&event);
    if (!e || e->type() != EventType::RecordBeforeDelete) return;
    e->record().set(field_, now());
    e->preventDefault();
}

void SoftDeleteQueryListener::handle(Event& event) {
    auto* e = dynamic_cast<QueryEvent*>(&event);
    if (!e) return;
    Query& q = e->query();
    q.restrictions().where(q.getTable().output(field_), "IS", Value(nullptr));
}

std::shared_ptr<Listener> make_listener(const std::string& kind, const std::string& field) {
    if (kind == "timestamp") return std::make_shared<UpdateTimestampListener>(field);
    if (kind == "soft-delete") return std::make_shared<SoftDeleteListener>(field);
    if (kind == "soft-delete-query") return std::make_shared<SoftDeleteQueryListener>(field);
    DBAL_NOT_FOUND("unknown listener kind '%s'", kind.c_str());
}

void EventDispatcher::hook(EventType type, std::shared_ptr<Listener> listener) {
    for (const auto& [t, l] : hooks_) {
        if (t == type && l->kind() == listener->kind() && l->field() == listener->field()) return;
    }
    hooks_.emplace_back(type, std::move(listener));
}

void EventDispatcher::unhook(const std::string& field) {
    hooks_.erase(std::remove_if(hooks_.begin(), hooks_.end(),
                                [&](const Hook& h) { return h.second->field() == field; }),
                 hooks_.end());
}

void EventDispatcher::dispatch(Event& event) const {
    for (const auto& [type, listener] : hooks_) {
        if (type != event.type()) continue;
        DBAL_LOG_DEBUG("events", "%s -> %s(%s)", to_string(type).c_str(),
                       listener->kind().c_str(), listener->field().c_str());
        listener->handle(event);
    }
}

} // namespace dbal
