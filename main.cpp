#include <iostream>
#include "dbal/connection.hpp"
#include "dbal/lib.hpp"
#include "dbal/migrator.hpp"
#include "dbal/settings.hpp"

using namespace dbal;

static MigrationManifest manifest()
{
    return {
        make_migration("create-authors",
            [](SchemaMigrationExecutor &s) {
                s.add("authors", [](TableMigrator &t) {
                    t.id();
                    t.string("name", 100, false);
                    t.enumeration("role", {"writer", "editor"});
                    t.unique("authors_name", {"name"});
                    t.timestamps();
                });
            },
            [](SchemaMigrationExecutor &s) { s.drop("authors"); }),
        make_migration("create-posts",
            [](SchemaMigrationExecutor &s) {
                s.add("posts", [&](TableMigrator &t) {
                    t.id();
                    t.string("title");
                    t.text("body");
                    t.foreign("author", s.table("authors"));
                    t.softDelete();
                });
            },
            [](SchemaMigrationExecutor &s) { s.drop("posts"); }),
    };
}

int main(int argc, char **argv)
{
    std::string url = argc > 1 ? argv[1] : "sqlite::memory:";
    std::string snapshot = argc > 2 ? argv[2] : "";

    try
    {
        Connection connection(std::make_shared<Schema>("demo"), make_driver(Settings::fromURL(url)));
        Migrator migrator(connection, snapshot);

        std::cout << "[*] Applying migrations:" << std::endl;
        for (const auto &id : migrator.run(manifest()))
            std::cout << "    " << id << std::endl;

        Layout &authors = connection.getSchema().getLayoutByName("authors");
        Layout &posts = connection.getSchema().getLayoutByName("posts");

        Record ann(authors);
        ann.set("name", std::string("ann")).set("role", std::string("writer"));
        connection.insert(authors, ann);

        for (const char *title : {"first", "second"})
        {
            Record post(posts);
            post.set("title", std::string(title)).set("author_id", ann.get("_id"));
            connection.insert(posts, post);
            if (std::string(title) == "first")
                connection.remove(posts, post);
        }

        std::cout << "\n[*] Live posts:" << std::endl;
        Query q = connection.newQuery("posts");
        q.joinTable(authors.getTableReference(), [](Join &j, Query &parent) {
            j.on().where(j.output("_id"), "=", parent.getTable().output("author_id"));
        });
        q.select("title");
        q.selectField(q.resolve("name"), std::string("author"));
        auto rows = connection.query(q);
        while (auto row = rows->fetch())
            std::cout << "    " << to_string((*row)["title"]) << " by " << to_string((*row)["author"]) << std::endl;
    }
    catch (const Error &e)
    {
        std::cerr << "[!] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
