#ifndef OMNIBUS_LEDGER_LEDGER
#define OMNIBUS_LEDGER_LEDGER

#include <Omnibus/ledger/record.hpp>
#include <Omnibus/ledger/store.hpp>
#include <Omnibus/database.hpp>
#include <mutex>

namespace Omnibus {

    struct insufficient_balance : std::runtime_error {
        user_id User;
        Bitcoin::satoshi Balance;
        Bitcoin::satoshi Required;

        insufficient_balance (user_id u, Bitcoin::satoshi balance, Bitcoin::satoshi required);
    };

    // The ledger is the only place where the balances of users come from.
    // A balance is the sum of the effects of all records that touch a user.
    // Debits are checked against the balance while the user is locked so
    // that two debits of the same user can never both pass the check.
    struct ledger {
        ledger_store &Store;

        // if present, users are checked to exist before they are credited by a transfer.
        // Otherwise this is left to the caller.
        directory *Directory {nullptr};

        ledger (ledger_store &store) : Store {store} {}
        ledger (database &db) : Store {db}, Directory {&db} {}

        // exclusive access to the balance of a user. Lock users
        // before the pool and never lock two users at once.
        struct hold {
            std::unique_lock<std::mutex> Lock;
            user_id User;
        };

        hold lock (user_id);

        Bitcoin::satoshi balance (user_id);
        Bitcoin::satoshi balance (const hold &);

        // all records touching the user in the order they were appended.
        list<ledger_record> history (user_id);

        // Only the sender is locked since a credit cannot make a balance negative.
        // throws insufficient_balance, or exception if either user is unknown.
        ledger_record record_internal_transfer (user_id from, user_id to, Bitcoin::satoshi amount);

        // throws insufficient_balance if the user cannot cover amount + fee.
        ledger_record record_on_chain_send (user_id, Bitcoin::satoshi amount, Bitcoin::satoshi fee,
            const std::string &destination, const Bitcoin::TXID &);

        ledger_record record_on_chain_send (const hold &, Bitcoin::satoshi amount, Bitcoin::satoshi fee,
            const std::string &destination, const Bitcoin::TXID &);

        ledger_record record_on_chain_receive (user_id, Bitcoin::satoshi amount,
            const std::string &address, const Bitcoin::TXID &);

    private:
        std::mutex Mutex;
        std::map<user_id, std::mutex> Locks;

        std::mutex &user_mutex (user_id);
    };

    Bitcoin::satoshi inline ledger::balance (user_id u) {
        return balance (lock (u));
    }

    ledger_record inline ledger::record_on_chain_send (user_id u, Bitcoin::satoshi amount, Bitcoin::satoshi fee,
        const std::string &destination, const Bitcoin::TXID &txid) {
        return record_on_chain_send (lock (u), amount, fee, destination, txid);
    }
}

#endif
