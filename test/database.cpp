#include <Omnibus/database/SQLite.hpp>
#include <Omnibus/database/memory.hpp>
#include "mock_node.hpp"
#include "gtest/gtest.h"

namespace Omnibus {

    // both databases must behave the same way.
    void test_directory (database &db) {
        maybe<user> alice = db.make_user ("alice");
        maybe<user> bob = db.make_user ("bob");
        ASSERT_TRUE (bool (alice));
        ASSERT_TRUE (bool (bob));
        EXPECT_NE (alice->ID, bob->ID);
        EXPECT_EQ (alice->Name, "alice");

        // names are unique.
        EXPECT_FALSE (bool (db.make_user ("alice")));

        EXPECT_EQ (db.get_user (alice->ID), alice);
        EXPECT_EQ (db.find_user ("bob"), bob);
        EXPECT_FALSE (bool (db.find_user ("carol")));
        EXPECT_FALSE (bool (db.get_user (bob->ID + 100)));
        EXPECT_EQ (db.list_users (), (list<user> {*alice, *bob}));

        EXPECT_TRUE (db.add_address ("a1", alice->ID));
        EXPECT_TRUE (db.add_address ("a2", alice->ID));
        EXPECT_TRUE (db.add_address ("pool", {}));
        EXPECT_FALSE (db.add_address ("a1", bob->ID));
        EXPECT_THROW (db.add_address ("x", bob->ID + 100), exception);

        EXPECT_EQ (db.addresses (alice->ID), (list<std::string> {"a1", "a2"}));
        EXPECT_TRUE (db.addresses (bob->ID).empty ());
        EXPECT_EQ (db.owner ("a2"), maybe<user_id> {alice->ID});
        EXPECT_FALSE (bool (db.owner ("pool")));
        EXPECT_FALSE (bool (db.owner ("unknown")));
    }

    void test_store (database &db) {
        user_id a = db.make_user ("alice")->ID;
        user_id b = db.make_user ("bob")->ID;
        user_id c = db.make_user ("carol")->ID;

        ledger_record r1 = db.append (ledger_record::on_chain_receive (a, coins ("1"), "a1", test_txid (1)));
        ledger_record r2 = db.append (ledger_record::internal_transfer (a, b, coins ("0.25")));
        ledger_record r3 = db.append (ledger_record::on_chain_send (b, coins ("0.2"), coins ("0.0001"), "addrX", test_txid (2)));

        EXPECT_LT (r1.ID, r2.ID);
        EXPECT_LT (r2.ID, r3.ID);

        EXPECT_EQ (db.query (a), (list<ledger_record> {r1, r2}));
        EXPECT_EQ (db.query (b), (list<ledger_record> {r2, r3}));
        EXPECT_TRUE (db.query (c).empty ());

        list<ledger_record> bs = db.query (b);
        EXPECT_EQ (bs.first ().Counterparty, maybe<user_id> {b});
        EXPECT_EQ (bs.rest ().first ().Fee, coins ("0.0001"));
        EXPECT_EQ (bs.rest ().first ().TXID, maybe<Bitcoin::TXID> {test_txid (2)});
        EXPECT_EQ (bs.rest ().first ().Address, maybe<std::string> {"addrX"});
    }

    TEST (Database, MemoryDirectory) {
        memory_database db {};
        test_directory (db);
    }

    TEST (Database, MemoryStore) {
        memory_database db {};
        test_store (db);
    }

    TEST (Database, SQLiteDirectory) {
        auto db = SQLite::load ({});
        test_directory (*db);
    }

    TEST (Database, SQLiteStore) {
        auto db = SQLite::load ({});
        test_store (*db);
    }

    TEST (Database, SQLiteInvalidRecord) {
        auto db = SQLite::load ({});
        user_id a = db->make_user ("alice")->ID;
        EXPECT_THROW (db->append (ledger_record::internal_transfer (a, a, coins ("1"))), exception);
        EXPECT_THROW (db->append (ledger_record::on_chain_receive (a, coins ("0"), "a1", test_txid (1))), exception);
        EXPECT_TRUE (db->query (a).empty ());
    }

    TEST (Database, SQLitePersistence) {
        filepath path = std::filesystem::temp_directory_path () / "omnibus_test_persistence.db";
        std::filesystem::remove (path);

        ledger_record r;
        user_id a;
        {
            auto db = SQLite::load (path);
            a = db->make_user ("alice")->ID;
            db->add_address ("a1", a);
            r = db->append (ledger_record::on_chain_receive (a, coins ("1"), "a1", test_txid (1)));
        }

        {
            auto db = SQLite::load (path);
            EXPECT_EQ (db->find_user ("alice"), (maybe<user> {user {a, "alice"}}));
            EXPECT_EQ (db->owner ("a1"), maybe<user_id> {a});
            EXPECT_EQ (db->query (a), (list<ledger_record> {r}));
        }

        std::filesystem::remove (path);
    }

}
