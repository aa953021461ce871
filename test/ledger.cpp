#include <Omnibus/ledger/ledger.hpp>
#include <Omnibus/database/memory.hpp>
#include "mock_node.hpp"
#include "gtest/gtest.h"
#include <thread>
#include <atomic>

namespace Omnibus {

    struct LedgerTest : ::testing::Test {
        memory_database DB {};
        ledger Ledger {DB};

        user_id Alice;
        user_id Bob;
        user_id Carol;

        void SetUp () override {
            Alice = DB.make_user ("alice")->ID;
            Bob = DB.make_user ("bob")->ID;
            Carol = DB.make_user ("carol")->ID;
        }

        void fund (user_id u, const std::string &amount, uint32 n = 1) {
            Ledger.record_on_chain_receive (u, coins (amount), "deposit", test_txid (n));
        }

        Bitcoin::satoshi total () {
            return Ledger.balance (Alice) + Ledger.balance (Bob) + Ledger.balance (Carol);
        }
    };

    TEST_F (LedgerTest, EmptyBalance) {
        EXPECT_EQ (Ledger.balance (Alice), Bitcoin::satoshi {0});
        EXPECT_TRUE (Ledger.history (Alice).empty ());
    }

    TEST_F (LedgerTest, Receive) {
        fund (Alice, "1.5");
        EXPECT_EQ (Ledger.balance (Alice), coins ("1.5"));
        EXPECT_EQ (Ledger.balance (Bob), Bitcoin::satoshi {0});
        EXPECT_THROW (Ledger.record_on_chain_receive (Alice, coins ("0"), "deposit", test_txid (2)), exception);
    }

    TEST_F (LedgerTest, InternalTransfer) {
        fund (Alice, "1");

        ledger_record r = Ledger.record_internal_transfer (Alice, Bob, coins ("0.4"));
        EXPECT_EQ (r.Type, record_type::internal_transfer);
        EXPECT_EQ (r.User, Alice);
        EXPECT_EQ (r.Counterparty, maybe<user_id> {Bob});
        EXPECT_FALSE (bool (r.TXID));
        EXPECT_NE (r.ID, 0);

        EXPECT_EQ (Ledger.balance (Alice), coins ("0.6"));
        EXPECT_EQ (Ledger.balance (Bob), coins ("0.4"));

        // one record seen from both sides.
        EXPECT_EQ (data::size (Ledger.history (Alice)), 2);
        EXPECT_EQ (data::size (Ledger.history (Bob)), 1);
        EXPECT_EQ (Ledger.history (Bob).first (), r);
    }

    TEST_F (LedgerTest, TransferToUnknownUser) {
        fund (Alice, "1");
        user_id nobody = Alice + Bob + Carol + 1;

        EXPECT_THROW (Ledger.record_internal_transfer (Alice, nobody, coins ("0.5")), exception);
        EXPECT_THROW (Ledger.record_internal_transfer (nobody, Alice, coins ("0.5")), exception);
        EXPECT_EQ (Ledger.balance (Alice), coins ("1"));
        EXPECT_EQ (data::size (Ledger.history (Alice)), 1);
        EXPECT_TRUE (Ledger.history (nobody).empty ());
    }

    TEST_F (LedgerTest, InsufficientBalance) {
        fund (Alice, "1");

        EXPECT_THROW (Ledger.record_internal_transfer (Alice, Bob, coins ("1.00000001")), insufficient_balance);
        EXPECT_THROW (Ledger.record_internal_transfer (Bob, Alice, coins ("0.00000001")), insufficient_balance);

        // an exactly equal amount succeeds.
        EXPECT_NO_THROW (Ledger.record_internal_transfer (Alice, Bob, coins ("1")));
        EXPECT_EQ (Ledger.balance (Alice), Bitcoin::satoshi {0});
        EXPECT_EQ (Ledger.balance (Bob), coins ("1"));

        try {
            Ledger.record_internal_transfer (Alice, Carol, coins ("0.1"));
            FAIL () << "expected insufficient_balance";
        } catch (const insufficient_balance &x) {
            EXPECT_EQ (x.User, Alice);
            EXPECT_EQ (x.Balance, Bitcoin::satoshi {0});
            EXPECT_EQ (x.Required, coins ("0.1"));
        }
    }

    TEST_F (LedgerTest, InvalidTransfer) {
        fund (Alice, "1");
        EXPECT_THROW (Ledger.record_internal_transfer (Alice, Alice, coins ("0.1")), exception);
        EXPECT_THROW (Ledger.record_internal_transfer (Alice, Bob, coins ("0")), exception);
        EXPECT_THROW (Ledger.record_internal_transfer (Alice, Bob, coins ("-0.1")), exception);
        EXPECT_EQ (Ledger.balance (Alice), coins ("1"));
    }

    TEST_F (LedgerTest, OnChainSend) {
        fund (Alice, "1");

        // the fee is debited along with the amount.
        EXPECT_THROW (Ledger.record_on_chain_send (Alice, coins ("1"), coins ("0.0001"), "addrX", test_txid (10)),
            insufficient_balance);

        ledger_record r = Ledger.record_on_chain_send (Alice, coins ("0.5"), coins ("0.0001"), "addrX", test_txid (10));
        EXPECT_EQ (r.Type, record_type::on_chain_send);
        EXPECT_EQ (r.effect (Alice), Bitcoin::satoshi {0} - coins ("0.5001"));
        EXPECT_EQ (Ledger.balance (Alice), coins ("0.4999"));

        // amount + fee exactly equal to the balance.
        Ledger.record_on_chain_send (Alice, coins ("0.4998"), coins ("0.0001"), "addrX", test_txid (11));
        EXPECT_EQ (Ledger.balance (Alice), Bitcoin::satoshi {0});
    }

    TEST_F (LedgerTest, Conservation) {
        fund (Alice, "3", 1);
        fund (Bob, "2", 2);
        fund (Carol, "1", 3);

        Bitcoin::satoshi before = total ();
        user_id users[] {Alice, Bob, Carol};

        for (int i = 0; i < 60; i++) {
            user_id from = users[i % 3];
            user_id to = users[(i * 7 + 1) % 3];
            if (from == to) continue;
            try {
                Ledger.record_internal_transfer (from, to, Bitcoin::satoshi {int64 (12345678) * (i % 5 + 1)});
            } catch (const insufficient_balance &) {}
            EXPECT_EQ (total (), before);
        }

        for (user_id u : users) EXPECT_GE (int64 (Ledger.balance (u)), 0);
    }

    TEST_F (LedgerTest, ConcurrentDebits) {
        fund (Alice, "1");

        // ten threads try to take 0.3 each; only three can succeed.
        std::atomic<int> succeeded {0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 10; i++) threads.emplace_back ([this, i, &succeeded] () {
            try {
                if (i % 2 == 0) Ledger.record_internal_transfer (Alice, Bob, coins ("0.3"));
                else Ledger.record_on_chain_send (Alice, coins ("0.2"), coins ("0.1"), "addrX", test_txid (100 + i));
                succeeded++;
            } catch (const insufficient_balance &) {}
        });

        for (std::thread &t : threads) t.join ();

        EXPECT_EQ (succeeded, 3);
        EXPECT_EQ (Ledger.balance (Alice), coins ("0.1"));
    }

}
