#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dbal {

class Layout;
class Record;
class Query;

enum class EventType { RecordBeforeInsert, RecordBeforeUpdate, RecordBeforeDelete, QueryBeforeCreate };

std::string to_string(EventType type);
EventType event_type(const std::string& name); // NotFoundError on unknown names

class Event {
public:
    explicit Event(EventType type) : type_(type) {}
    virtual ~Event() = default;

    EventType type() const { return type_; }

    // Ask the emitter to skip its default action (e.g. the DELETE statement).
    void preventDefault() { prevented_ = true; }
    bool isPrevented() const { return prevented_; }

private:
    EventType type_;
    bool prevented_ = false;
};

class RecordEvent : public Event {
public:
    RecordEvent(EventType type, const Layout& layout, Record& record)
        : Event(type), layout_(layout), record_(record) {}

    const Layout& layout() const { return layout_; }
    Record& record() const { return record_; }

private:
    const Layout& layout_;
    Record& record_;
};

class QueryEvent : public Event {
public:
    QueryEvent(const Layout& layout, Query& query)
        : Event(EventType::QueryBeforeCreate), layout_(layout), query_(query) {}

    const Layout& layout() const { return layout_; }
    Query& query() const { return query_; }

private:
    const Layout& layout_;
    Query& query_;
};

/**
 * Hooks registered on a layout by migrations. A listener is identified by its
 * kind and the field it maintains, which is all the schema snapshot stores.
 */
class Listener {
public:
    virtual ~Listener() = default;
    virtual void handle(Event& event) = 0;
    virtual std::string kind() const = 0;
    virtual const std::string& field() const = 0;
};

// Writes the current UNIX time into the field.
class UpdateTimestampListener final : public Listener {
public:
    explicit UpdateTimestampListener(std::string field) : field_(std::move(field)) {}
    void handle(Event& event) override;
    std::string kind() const override { return "timestamp"; }
    const std::string& field() const override { return field_; }
private:
    std::string field_;
};

// Turns a delete into an update that stamps the field with the deletion time.
class SoftDeleteListener final : public Listener {
public:
    explicit SoftDeleteListener(std::string field) : field_(std::move(field)) {}
    void handle(Event& event) override;
    std::string kind() const override { return "soft-delete"; }
    const std::string& field() const override { return field_; }
private:
    std::string field_;
};

// Restricts freshly created queries to records whose field IS NULL.
class SoftDeleteQueryListener final : public Listener {
public:
    explicit SoftDeleteQueryListener(std::string field) : field_(std::move(field)) {}
    void handle(Event& event) override;
    std::string kind() const override { return "soft-delete-query"; }
    const std::string& field() const override { return field_; }
private:
    std::string field_;
};

std::shared_ptr<Listener> make_listener(const std::string& kind, const std::string& field);

class EventDispatcher {
public:
    using Hook = std::pair<EventType, std::shared_ptr<Listener>>;

    // Registering the same kind/field twice for one event is a no-op.
    void hook(EventType type, std::shared_ptr<Listener> listener);
    // Drop every hook that maintains @p field.
    void unhook(const std::string& field);
    void dispatch(Event& event) const;

    const std::vector<Hook>& hooks() const { return hooks_; }

private:
    std::vector<Hook> hooks_;
};

} // namespace dbal
