#include <catch2/catch.hpp>
#include "dbal/grammar.hpp"
#include "dbal/lib.hpp"
#include "dbal/table_migration.hpp"

using namespace dbal;

static TableRef users() {
    return TableRef({"users"}, "u", {"_id", "name", "age"});
}

static TableRef posts() {
    return TableRef({"posts"}, {"_id", "author", "title"});
}

TEST_CASE("a bare query selects every column of its source", "[grammar]") {
    QueryGrammar g(make_sqlite_dialect());
    Query q(users());
    std::string a = q.getTable().alias();
    REQUIRE(g.query(q) == "SELECT \"" + a + "\".* FROM \"users\" AS \"" + a + "\"");
}

TEST_CASE("restrictions render with nested groups and null handling", "[grammar]") {
    QueryGrammar g(make_sqlite_dialect());
    Query q(users());
    std::string a = "\"" + q.getTable().alias() + "\"";

    q.restrictions().where("age", ">", Value(int64_t{18}));
    auto& any = q.restrictions().orGroup();
    any.where("name", "LIKE", Value(std::string("a%")));
    any.where("name", "=", Value(nullptr));

    REQUIRE(g.group(q.restrictions()) ==
            a + ".\"age\" > 18 AND (" + a + ".\"name\" LIKE 'a%' OR " + a + ".\"name\" IS NULL)");

    q.restrictions().negate();
    REQUIRE(g.group(q.restrictions()) ==
            a + ".\"age\" < 18 OR (" + a + ".\"name\" NOT LIKE 'a%' AND " + a + ".\"name\" IS NOT NULL)");
}

TEST_CASE("list values render as IN and empty lists stay valid SQL", "[grammar]") {
    QueryGrammar g(make_sqlite_dialect());
    auto t = users().withAlias();
    std::string f = "\"" + t.alias() + "\".\"_id\"";

    REQUIRE(g.restriction(Restriction(t.output("_id"), "=", std::vector<Value>{Value(int64_t{1}), Value(int64_t{2})})) ==
            f + " IN (1, 2)");
    REQUIRE(g.restriction(Restriction(t.output("_id"), "NOT IN", std::vector<Value>{Value(std::string("x"))})) ==
            f + " NOT IN ('x')");
    REQUIRE(g.restriction(Restriction(t.output("_id"), "IN", std::vector<Value>{})) == "1 = 0");
    REQUIRE(g.restriction(Restriction(t.output("_id"), "NOT IN", std::vector<Value>{})) == "1 = 1");
}

TEST_CASE("sub-query restrictions render as EXISTS", "[grammar]") {
    QueryGrammar g(make_sqlite_dialect());
    auto sub = std::make_shared<Query>(posts());
    std::string inner = g.query(*sub);

    Restriction exists(SubQuery(sub), "<>", Value(nullptr));
    REQUIRE(g.restriction(exists) == "EXISTS (" + inner + ")");

    exists.negate();
    REQUIRE(g.restriction(exists) == "NOT EXISTS (" + inner + ")");

    Restriction compare(SubQuery(sub), ">", Value(int64_t{3}));
    REQUIRE(g.restriction(compare) == "(" + inner + ") > 3");
}

TEST_CASE("joins, projections, grouping, order and pagination", "[grammar]") {
    QueryGrammar g(make_sqlite_dialect());
    Query q(users());
    Join& join = q.joinTable(posts(), [](Join& j, Query& parent) {
        j.on().where(j.output("author"), "=", parent.getTable().output("_id"));
    });
    q.select("name");
    q.aggregate(join.output("_id"), Aggregate::Operation::Count, "posts");
    q.groupBy(std::vector<std::string>{"name"});
    q.orderBy("name", OrderBy::Direction::Desc);
    q.range(20, 10);

    std::string u = "\"" + q.getTable().alias() + "\"";
    std::string p = "\"" + join.table().alias() + "\"";
    REQUIRE(g.query(q) ==
            "SELECT " + u + ".\"name\", COUNT(" + p + ".\"_id\") AS \"posts\" FROM \"users\" AS " + u +
            " LEFT JOIN \"posts\" AS " + p + " ON (" + p + ".\"author\" = " + u + ".\"_id\")" +
            " GROUP BY " + u + ".\"name\" ORDER BY " + u + ".\"name\" DESC LIMIT 10 OFFSET 20");
}

TEST_CASE("SQLite needs a LIMIT before OFFSET", "[grammar]") {
    Query q(users());
    q.range(5, std::nullopt);
    REQUIRE(QueryGrammar(make_sqlite_dialect()).query(q).find(" LIMIT -1 OFFSET 5") != std::string::npos);
    REQUIRE(QueryGrammar(make_pg_dialect()).query(q).find(" OFFSET 5") != std::string::npos);
    REQUIRE(QueryGrammar(make_pg_dialect()).query(q).find("LIMIT") == std::string::npos);
}

TEST_CASE("sub-queries can be a query source", "[grammar]") {
    QueryGrammar g(make_pg_dialect());
    auto inner = std::make_shared<Query>(posts());
    inner->select("author");
    Query outer{SubQuery(inner)};
    outer.restrictions().where("author", "=", Value(int64_t{1}));

    std::string o = "\"" + outer.getTable().alias() + "\"";
    REQUIRE(g.query(outer) == "SELECT " + o + ".* FROM (" + g.query(*inner) + ") AS " + o + " WHERE " + o +
                                  ".\"author\" = 1");
}

TEST_CASE("literals are escaped per dialect", "[grammar]") {
    auto sqlite = make_sqlite_dialect();
    auto pg = make_pg_dialect();
    REQUIRE(sqlite->literal(Value(std::string("it's"))) == "'it''s'");
    REQUIRE(sqlite->literal(Value(true)) == "1");
    REQUIRE(pg->literal(Value(true)) == "TRUE");
    REQUIRE(pg->literal(Value(nullptr)) == "NULL");
    REQUIRE(pg->identifier("we\"ird") == "\"we\"\"ird\"");
}

TEST_CASE("record statements", "[grammar]") {
    RecordGrammar g(make_sqlite_dialect());

    Layout tags("_tags");
    TableMigrationExecutor(tags).string("tag", 255, false);
    Record tag(tags, Row{{"tag", Value(std::string("migration:a"))}});
    REQUIRE(g.insertRecord(tags, tag) == "INSERT INTO \"_tags\" (\"tag\") VALUES ('migration:a')");
    REQUIRE(g.deleteRecord(tags, tag) ==
            "DELETE FROM \"_tags\" WHERE rowid IN (SELECT rowid FROM \"_tags\" WHERE \"tag\" = 'migration:a' LIMIT 1)");
    REQUIRE(RecordGrammar(make_pg_dialect()).deleteRecord(tags, tag) ==
            "DELETE FROM \"_tags\" WHERE ctid IN (SELECT ctid FROM \"_tags\" WHERE \"tag\" = 'migration:a' LIMIT 1)");

    Layout empty("t");
    TableMigrationExecutor(empty).id();
    REQUIRE(g.insertRecord(empty, Record(empty)) == "INSERT INTO \"t\" DEFAULT VALUES");
    REQUIRE(g.updateRecord(empty, Record(empty)).empty());
}

TEST_CASE("create table per dialect", "[grammar]") {
    Layout users("users"), groups("groups");
    TableMigrationExecutor g(groups), u(users);
    g.id();
    u.id().string("name", 80, false).enumeration("role", {"a", "b"}).foreign("group", g).unique("by_name", {"name"});

    auto sqlite = SchemaGrammar(make_sqlite_dialect()).createTable(users);
    REQUIRE(sqlite.size() == 2);
    REQUIRE(sqlite[0] ==
            "CREATE TABLE IF NOT EXISTS \"users\" (\"_id\" INTEGER PRIMARY KEY AUTOINCREMENT, "
            "\"name\" VARCHAR(80) NOT NULL, \"role\" TEXT CHECK (\"role\" IN ('a', 'b')), \"group_id\" INTEGER, "
            "CONSTRAINT \"fk_users_group\" FOREIGN KEY (\"group_id\") REFERENCES \"groups\" (\"_id\"))");
    REQUIRE(sqlite[1] == "CREATE UNIQUE INDEX \"by_name\" ON \"users\" (\"name\")");

    auto pg = SchemaGrammar(make_pg_dialect()).createTable(users);
    REQUIRE(pg[0] ==
            "CREATE TABLE IF NOT EXISTS \"users\" (\"_id\" BIGSERIAL NOT NULL, "
            "\"name\" VARCHAR(80) NOT NULL, \"role\" TEXT CHECK (\"role\" IN ('a', 'b')), \"group_id\" BIGINT, "
            "CONSTRAINT \"users_primary\" PRIMARY KEY (\"_id\"), "
            "CONSTRAINT \"fk_users_group\" FOREIGN KEY (\"group_id\") REFERENCES \"groups\" (\"_id\"))");
}

TEST_CASE("SQLite auto increment must be the whole primary key", "[grammar][error]") {
    Layout t("t");
    t.putField("a", FieldType::integer(), false, false);
    t.putField("n", FieldType::longint(true), false, true);
    t.putIndex(std::make_shared<Index>(Layout::PRIMARY_KEY, std::vector<Field>{t.getField("a")}, false, true));
    REQUIRE_THROWS_AS(SchemaGrammar(make_sqlite_dialect()).createTable(t), UnsupportedError);
}

TEST_CASE("has-table lookups", "[grammar]") {
    REQUIRE(SchemaGrammar(make_sqlite_dialect()).hasTable("", "_tags") ==
            "SELECT COUNT(*) AS \"count\" FROM sqlite_master WHERE type = 'table' AND name = '_tags'");
    REQUIRE(SchemaGrammar(make_pg_dialect()).hasTable("app", "_tags").find("table_catalog = 'app'") !=
            std::string::npos);
}
