#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "dbal/lib.hpp"
#include "dbal/query.hpp"
#include "dbal/restriction.hpp"

using namespace dbal;

static TableRef users() {
    return TableRef({"users"}, {"_id", "name", "age"});
}

TEST_CASE("negate is an involution on every operator with a complement", "[restriction]") {
    auto t = users();
    for (const std::string op : {"=", "<>", ">", "<", "IS", "IS NOT", "LIKE", "NOT LIKE"}) {
        Restriction r(t.output("name"), op, Value(std::string("x")));
        std::string once = r.negate();
        REQUIRE(once != op);
        REQUIRE(r.rawOperator() == once);
        REQUIRE(r.negate() == op);
        REQUIRE(r.rawOperator() == op);
    }
}

TEST_CASE("negate maps the documented pairs", "[restriction]") {
    auto t = users();
    Restriction eq(t.output("age"), "=", Value(int64_t{3}));
    REQUIRE(eq.negate() == "<>");

    Restriction gt(t.output("age"), ">", Value(int64_t{3}));
    REQUIRE(gt.negate() == "<");

    Restriction is(t.output("age"), "IS", Value(nullptr));
    REQUIRE(is.negate() == "IS NOT");

    Restriction like(t.output("name"), "LIKE", Value(std::string("a%")));
    REQUIRE(like.negate() == "NOT LIKE");
}

TEST_CASE("negate of an unknown operator throws and leaves the restriction alone", "[restriction][error]") {
    auto t = users();
    Restriction r(t.output("name"), "SOUNDS LIKE", Value(std::string("x")));
    REQUIRE_THROWS_AS(r.negate(), InvalidOperator);
    REQUIRE(r.rawOperator() == "SOUNDS LIKE");
}

TEST_CASE("operator is trimmed but not validated", "[restriction]") {
    auto t = users();
    Restriction r(t.output("name"), "  ~*  ", Value(std::string("x")));
    REQUIRE(r.rawOperator() == "~*");
    REQUIRE(r.getOperator() == "~*");
}

TEST_CASE("a list value reports IN without touching the stored operator", "[restriction]") {
    auto t = users();
    std::vector<Value> ids{Value(int64_t{1}), Value(int64_t{2})};

    Restriction r(t.output("_id"), "=", ids);
    REQUIRE(r.isList());
    REQUIRE(r.getOperator() == "IN");
    REQUIRE(r.rawOperator() == "=");

    Restriction not_in(t.output("_id"), "NOT IN", ids);
    REQUIRE(not_in.getOperator() == "NOT IN");

    Restriction scalar(t.output("_id"), ">", Value(int64_t{1}));
    REQUIRE(scalar.getOperator() == ">");
}

TEST_CASE("restriction target is either a field or a sub-query", "[restriction]") {
    auto t = users();
    Restriction on_field(t.output("age"), ">", Value(int64_t{18}));
    REQUIRE_FALSE(on_field.isSubQuery());
    REQUIRE(on_field.field().name() == "age");
    REQUIRE_THROWS_AS(on_field.subQuery(), NotFoundError);

    auto sub = std::make_shared<const Query>(t);
    Restriction on_query(sub, "<>", Value(nullptr));
    REQUIRE(on_query.isSubQuery());
    REQUIRE(on_query.isNullValue());
    REQUIRE_THROWS_AS(on_query.field(), NotFoundError);
}

TEST_CASE("groups resolve names against their table", "[restriction]") {
    RestrictionGroup g(users());
    g.where("name", "=", Value(std::string("bob"))).where("age", Value(int64_t{4}));
    REQUIRE(g.size() == 2);
    REQUIRE(g.restrictions()[1]->rawOperator() == "=");
    REQUIRE_THROWS_AS(g.where("missing", Value(int64_t{1})), NotFoundError);
    REQUIRE(g.size() == 2);
}

TEST_CASE("an empty group is valid", "[restriction]") {
    RestrictionGroup g(users(), RestrictionGroup::Type::Or);
    REQUIRE(g.empty());
    REQUIRE_NOTHROW(g.negate());
    REQUIRE(g.type() == RestrictionGroup::Type::And);
}

TEST_CASE("group negation applies De Morgan to the whole tree", "[restriction]") {
    RestrictionGroup g(users());
    g.where("age", ">", Value(int64_t{18}));
    auto& nested = g.orGroup();
    nested.where("name", "=", Value(std::string("a")));
    nested.where("name", "LIKE", Value(std::string("b%")));

    g.negate();

    REQUIRE(g.type() == RestrictionGroup::Type::Or);
    REQUIRE(g.restrictions()[0]->rawOperator() == "<");
    REQUIRE(nested.type() == RestrictionGroup::Type::And);
    REQUIRE(nested.restrictions()[0]->rawOperator() == "<>");
    REQUIRE(nested.restrictions()[1]->rawOperator() == "NOT LIKE");
}

TEST_CASE("group negation is all or nothing", "[restriction][error]") {
    RestrictionGroup g(users());
    g.where("age", ">", Value(int64_t{18}));
    g.andGroup().where("name", "REGEXP", Value(std::string("^a")));

    REQUIRE_THROWS_AS(g.negate(), InvalidOperator);
    REQUIRE(g.type() == RestrictionGroup::Type::And);
    REQUIRE(g.restrictions()[0]->rawOperator() == ">");
}

TEST_CASE("group negation complements list restrictions", "[restriction]") {
    RestrictionGroup g(users());
    g.where("_id", std::vector<Value>{int64_t{1}, int64_t{2}});
    g.where("age", "NOT IN", std::vector<Value>{int64_t{3}});
    REQUIRE(g.restrictions()[0]->getOperator() == "IN");

    g.negate();
    REQUIRE(g.restrictions()[0]->getOperator() == "NOT IN");
    REQUIRE(g.restrictions()[1]->getOperator() == "IN");

    g.negate();
    REQUIRE(g.restrictions()[0]->getOperator() == "IN");
    REQUIRE(g.restrictions()[1]->getOperator() == "NOT IN");
}

TEST_CASE("group negation rejects list restrictions it cannot complement", "[restriction][error]") {
    RestrictionGroup g(users());
    g.where("age", "=", Value(int64_t{18}));
    g.where("_id", ">", std::vector<Value>{int64_t{1}});

    REQUIRE_THROWS_AS(g.negate(), InvalidOperator);
    REQUIRE(g.restrictions()[0]->rawOperator() == "=");
    REQUIRE(g.restrictions()[1]->rawOperator() == ">");
}

TEST_CASE("copies of a group are independent", "[restriction]") {
    RestrictionGroup g(users());
    g.andGroup().where("age", "=", Value(int64_t{1}));

    RestrictionGroup copy = g;
    copy.negate();

    REQUIRE(g.type() == RestrictionGroup::Type::And);
    const auto& kept_nested = *std::get<std::unique_ptr<RestrictionGroup>>(g.children()[0]);
    REQUIRE(kept_nested.restrictions()[0]->rawOperator() == "=");
}
