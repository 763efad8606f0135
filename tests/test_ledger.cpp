#include <catch2/catch.hpp>
#include <algorithm>
#include <cstdio>
#include "dbal/connection.hpp"
#include "dbal/lib.hpp"
#include "dbal/migrator.hpp"
#include "dbal/tag_manager.hpp"
#include "fake_driver.hpp"

using namespace dbal;

static PMigration create_users() {
    return make_migration("create-users",
        [](SchemaMigrationExecutor& s) {
            s.add("users", [](TableMigrator& t) {
                t.id();
                t.string("name", 100, false);
                t.timestamps();
            });
        },
        [](SchemaMigrationExecutor& s) { s.drop("users"); });
}

static PMigration create_posts() {
    return make_migration("create-posts",
        [](SchemaMigrationExecutor& s) {
            s.add("posts", [&](TableMigrator& t) {
                t.id();
                t.text("body");
                t.foreign("author", s.table("users"));
            });
        },
        [](SchemaMigrationExecutor& s) { s.drop("posts"); });
}

static Connection sqlite_connection() {
    return Connection(std::make_shared<Schema>(), make_sqlite_driver(Settings::fromURL("sqlite::memory:")));
}

TEST_CASE("the tag manager creates its table and tracks tags", "[ledger]") {
    auto driver = make_sqlite_driver(Settings::fromURL("sqlite::memory:"));
    Schema schema;
    TagManager tags(*driver, schema);

    REQUIRE(driver->hasTable("_tags"));
    REQUIRE(schema.hasLayout("_tags"));
    REQUIRE(tags.listTags().empty());

    tags.tag("a");
    tags.tag("b");
    tags.tag("b");
    auto list = tags.listTags();
    std::sort(list.begin(), list.end());
    REQUIRE(list == std::vector<std::string>{"a", "b", "b"});

    // one untag removes one row
    tags.untag("b");
    list = tags.listTags();
    std::sort(list.begin(), list.end());
    REQUIRE(list == std::vector<std::string>{"a", "b"});

    // a second manager finds the table already there
    TagManager again(*driver, schema);
    REQUIRE(again.listTags().size() == 2);
}

TEST_CASE("apply then contains, rollback then not", "[ledger]") {
    Connection connection = sqlite_connection();
    auto users = create_users();

    REQUIRE_FALSE(connection.contains(*users));
    connection.apply(*users);
    REQUIRE(connection.contains(*users));
    REQUIRE(connection.has("users"));
    REQUIRE(connection.getSchema().getLayoutByName("users").getFields().size() == 4);

    connection.rollback(*users);
    REQUIRE_FALSE(connection.contains(*users));
    REQUIRE_FALSE(connection.has("users"));
    REQUIRE_FALSE(connection.getSchema().hasLayout("users"));
}

TEST_CASE("records round trip through SQLite", "[ledger][record]") {
    Connection connection = sqlite_connection();
    connection.apply(*create_users());
    connection.apply(*create_posts());

    Layout& users = connection.getSchema().getLayoutByName("users");
    Record ann(users);
    ann.set("name", std::string("ann"));
    REQUIRE(connection.insert(users, ann));
    REQUIRE(std::get<int64_t>(ann.get("_id")) == 1);

    Layout& posts = connection.getSchema().getLayoutByName("posts");
    Record post(posts);
    post.set("body", std::string("hello")).set("author_id", ann.get("_id"));
    REQUIRE(connection.insert(posts, post));

    Query q = connection.newQuery("posts");
    q.joinTable(users.getTableReference(), [](Join& j, Query& parent) {
        j.on().where(j.output("_id"), "=", parent.getTable().output("author_id"));
        j.setType(Join::Type::Inner);
    });
    q.select("body");
    q.selectField(q.resolve("name"), std::string("author"));
    auto rows = connection.query(q)->fetchAll();

    REQUIRE(rows.size() == 1);
    REQUIRE(std::get<std::string>(rows[0]["body"]) == "hello");
    REQUIRE(std::get<std::string>(rows[0]["author"]) == "ann");

    connection.remove(posts, post);
    REQUIRE(connection.query(connection.newQuery("posts"))->fetchAll().empty());
}

TEST_CASE("a backend without ledger never reports a migration as applied", "[ledger]") {
    auto driver = std::make_shared<FakeDriver>();
    driver->ledger = false;
    Connection connection(std::make_shared<Schema>(), driver);

    auto users = create_users();
    connection.apply(*users);
    REQUIRE_FALSE(connection.contains(*users));
    REQUIRE(driver->wrote("CREATE TABLE IF NOT EXISTS \"users\""));
    REQUIRE_FALSE(driver->wrote("_tags"));
    REQUIRE(connection.getSchema().hasLayout("users"));
}

TEST_CASE("the fake backend tags after the live run", "[ledger]") {
    auto driver = std::make_shared<FakeDriver>();
    Connection connection(std::make_shared<Schema>(), driver);

    connection.apply(*create_users());
    REQUIRE(driver->writes.front().find("\"users\"") != std::string::npos);
    REQUIRE(driver->wrote("CREATE TABLE IF NOT EXISTS \"_tags\""));
    REQUIRE(driver->writes.back() == "INSERT INTO \"_tags\" (\"tag\") VALUES ('migration:create-users')");
}

TEST_CASE("a failing migration propagates and is not tagged", "[ledger][error]") {
    Connection connection = sqlite_connection();
    auto broken = make_migration("broken",
        [](SchemaMigrationExecutor& s) {
            s.add("t", [](TableMigrator& t) { t.integer("a").primary({"a"}).primary({"a"}); });
        },
        nullptr);

    REQUIRE_THROWS_AS(connection.apply(*broken), InvariantError);
    REQUIRE_FALSE(connection.contains(*broken));
}

TEST_CASE("the migrator applies pending migrations once", "[ledger]") {
    Connection connection = sqlite_connection();
    MigrationManifest manifest{create_users(), create_posts()};
    std::string snapshot = "dbal_test_migrator.json";
    std::remove(snapshot.c_str());

    Migrator migrator(connection, snapshot);
    REQUIRE(migrator.pending(manifest).size() == 2);
    REQUIRE(migrator.run(manifest) == std::vector<std::string>{"create-users", "create-posts"});
    REQUIRE(migrator.run(manifest).empty());
    REQUIRE(migrator.pending(manifest).empty());

    // a fresh schema is fast-forwarded from the snapshot
    connection.setSchema(std::make_shared<Schema>());
    REQUIRE(migrator.rollbackLast(manifest) == std::vector<std::string>{"create-posts"});
    REQUIRE(connection.getSchema().hasLayout("users"));
    REQUIRE_FALSE(connection.getSchema().hasLayout("posts"));
    REQUIRE(migrator.pending(manifest) == std::vector<std::string>{"create-posts"});

    std::remove(snapshot.c_str());
}

TEST_CASE("without a snapshot the migrator replays applied migrations", "[ledger]") {
    Connection connection = sqlite_connection();
    MigrationManifest manifest{create_users(), create_posts()};
    Migrator migrator(connection);

    connection.apply(*manifest[0]);
    connection.setSchema(std::make_shared<Schema>());

    REQUIRE(migrator.run(manifest) == std::vector<std::string>{"create-posts"});
    REQUIRE(connection.getSchema().hasLayout("users"));
    REQUIRE(connection.getSchema().getLayoutByName("posts").hasField("author_id"));
}
