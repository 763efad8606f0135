#include <catch2/catch.hpp>
#include <cstdio>
#include "dbal/lib.hpp"
#include "dbal/migration.hpp"
#include "dbal/schema.hpp"
#include "dbal/table_migration.hpp"

using namespace dbal;

TEST_CASE("field types encode and parse", "[layout]") {
    REQUIRE(FieldType::parse("int:unsigned") == FieldType::integer(true));
    REQUIRE(FieldType::parse("long") == FieldType::longint());
    REQUIRE(FieldType::parse("string:64").length() == 64);
    REQUIRE(FieldType::parse("enum:a,b,c").options() == std::vector<std::string>{"a", "b", "c"});

    for (const std::string encoded : {"int", "int:unsigned", "long:unsigned", "string:255", "text", "enum:x,y"}) {
        REQUIRE(FieldType::parse(encoded).str() == encoded);
    }

    REQUIRE_THROWS_AS(FieldType::parse("blob"), NotFoundError);
    REQUIRE_THROWS_AS(FieldType::parse("string:abc"), InvariantError);
    REQUIRE_THROWS_AS(FieldType::parse("int:signed"), InvariantError);
}

TEST_CASE("enum options may not contain the separator", "[layout][error]") {
    REQUIRE_THROWS_AS(FieldType::enumeration({"a,b"}), InvariantError);
    REQUIRE_THROWS_AS(FieldType::enumeration({}), InvariantError);
    REQUIRE_NOTHROW(FieldType::enumeration({"a", "b"}));
}

TEST_CASE("layout fields keep insertion order and fail on unknown names", "[layout]") {
    Layout l("users");
    l.putField("b", FieldType::text(), true, false);
    l.putField("a", FieldType::integer(), false, false);
    l.putField("b", FieldType::string(10), true, false);

    REQUIRE(l.getFields().size() == 2);
    REQUIRE(l.getFields()[0].getName() == "b");
    REQUIRE(l.getFields()[0].getType() == FieldType::string(10));
    REQUIRE_FALSE(l.getField("a").isNullable());

    REQUIRE_THROWS_AS(l.getField("c"), NotFoundError);
    REQUIRE_THROWS_AS(l.unsetField("c"), NotFoundError);
    l.unsetField("b");
    REQUIRE_FALSE(l.hasField("b"));
}

TEST_CASE("a layout holds at most one primary index", "[layout][error]") {
    Layout l("users");
    const Field& id = l.putField("_id", FieldType::longint(true), false, true);
    l.putIndex(std::make_shared<Index>(Layout::PRIMARY_KEY, std::vector<Field>{id}, false, true));
    REQUIRE(l.getPrimaryKey() != nullptr);
    REQUIRE(l.getPrimaryKey()->isUnique());
    REQUIRE(l.getAutoIncrement()->getName() == "_id");

    auto other = std::make_shared<Index>("other", std::vector<Field>{l.getField("_id")}, false, true);
    REQUIRE_THROWS_AS(l.putIndex(other), InvariantError);
    REQUIRE(l.getIndexes().size() == 1);

    l.unsetIndex(Layout::PRIMARY_KEY);
    REQUIRE(l.getPrimaryKey() == nullptr);
    REQUIRE_THROWS_AS(l.getIndex(Layout::PRIMARY_KEY), NotFoundError);
}

TEST_CASE("unique and primary both make an index unique", "[layout]") {
    Field f("email", FieldType::string(255));
    REQUIRE_FALSE(Index("i", {f}).isUnique());
    REQUIRE(Index("u", {f}, true).isUnique());
    REQUIRE(Index("p", {f}, false, true).isUnique());
}

TEST_CASE("table references list the layout's fields", "[layout]") {
    Layout l("users");
    l.putField("_id", FieldType::longint(true), false, true);
    l.putField("name", FieldType::string(50), true, false);

    TableRef a = l.getTableReference();
    TableRef b = l.getTableReference();
    REQUIRE(a.name() == "users");
    REQUIRE(a.fields() == std::vector<std::string>{"_id", "name"});
    REQUIRE(a.alias() != b.alias());
}

TEST_CASE("schema snapshots survive a save / load cycle", "[layout]") {
    Schema schema("app");
    {
        Layout& groups = schema.putLayout(Layout("groups"));
        TableMigrationExecutor g(groups);
        g.id();
        g.string("title", 80, false);

        Layout& users = schema.putLayout(Layout("users"));
        TableMigrationExecutor u(users);
        u.id();
        u.enumeration("role", {"admin", "user"});
        u.unique("role_idx", {"role"});
        u.foreign("group", g);
        u.timestamps();
        u.softDelete();
    }

    std::string path = "dbal_test_snapshot.json";
    schema.save(path);
    Schema loaded = Schema::load(path);
    std::remove(path.c_str());

    REQUIRE(loaded.getName() == "app");
    REQUIRE(loaded.getLayouts().size() == 2);
    REQUIRE(loaded.getLayouts()[0]->getTableName() == "groups");

    const Layout& users = loaded.getLayoutByName("users");
    REQUIRE(users.getFields().size() == schema.getLayoutByName("users").getFields().size());
    REQUIRE(users.getField("role").getType().options() == std::vector<std::string>{"admin", "user"});
    REQUIRE(users.getIndex("role_idx").isUnique());
    REQUIRE(users.getPrimaryKey()->getFields()[0].getName() == "_id");

    const auto& fk = dynamic_cast<const ForeignKey&>(users.getIndex("fk_users_group"));
    REQUIRE(fk.getReferencedTable() == "groups");
    REQUIRE(fk.getReferencedField().getName() == "_id");

    REQUIRE(users.events().hooks().size() == schema.getLayoutByName("users").events().hooks().size());
    REQUIRE(users.events().hooks().size() == 4);
}

TEST_CASE("a snapshot reloads after an indexed field was dropped", "[layout][migration]") {
    Schema schema("app");
    SchemaStateMigrationExecutor state(schema);
    state.add("users", [](TableMigrator& t) {
        t.id();
        t.string("email");
        t.index("email_idx", {"email"});
    });
    state.table("users").drop("email");
    REQUIRE_FALSE(schema.getLayoutByName("users").hasField("email"));

    std::string path = "dbal_test_dropped_field.json";
    schema.save(path);
    Schema loaded = Schema::load(path);
    std::remove(path.c_str());

    const Layout& users = loaded.getLayoutByName("users");
    REQUIRE_FALSE(users.hasField("email"));
    REQUIRE(users.getIndex("email_idx").getFields()[0].getName() == "email");
    REQUIRE(users.getIndex("email_idx").getFields()[0].getType() == FieldType::string(255));
}

TEST_CASE("malformed snapshots are rejected", "[layout][error]") {
    jdoc doc;
    REQUIRE(jhlp::parse_str(R"({"layouts": [{"name": "t"}]})", doc));
    REQUIRE_THROWS_AS(Schema::fromJson(doc), InvariantError);

    REQUIRE(jhlp::parse_str(R"({"layouts": [{"name": "t", "fields": [], "indexes": [{"name": "i", "fields": ["x"]}]}]})", doc));
    REQUIRE_THROWS_AS(Schema::fromJson(doc), NotFoundError);
}

TEST_CASE("schema lookups fail on unknown layouts", "[layout][error]") {
    Schema schema;
    REQUIRE_THROWS_AS(schema.getLayoutByName("nope"), NotFoundError);
    REQUIRE_THROWS_AS(schema.removeLayout("nope"), NotFoundError);
    schema.putLayout(Layout("t"));
    REQUIRE(schema.hasLayout("t"));
    schema.removeLayout("t");
    REQUIRE_FALSE(schema.hasLayout("t"));
}
