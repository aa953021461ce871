#include <Omnibus/ledger/ledger.hpp>

namespace Omnibus {

    insufficient_balance::insufficient_balance (user_id u, Bitcoin::satoshi balance, Bitcoin::satoshi required) :
        std::runtime_error {(std::stringstream {} << "user " << u << " has balance " << write_amount (balance) <<
            " but " << write_amount (required) << " is required").str ()},
        User {u}, Balance {balance}, Required {required} {}

    std::mutex &ledger::user_mutex (user_id u) {
        std::lock_guard<std::mutex> lock (Mutex);
        return Locks[u];
    }

    ledger::hold ledger::lock (user_id u) {
        return hold {std::unique_lock<std::mutex> {user_mutex (u)}, u};
    }

    Bitcoin::satoshi ledger::balance (const hold &h) {
        Bitcoin::satoshi total {0};
        for (const ledger_record &r : Store.query (h.User)) total = total + r.effect (h.User);
        return total;
    }

    list<ledger_record> ledger::history (user_id u) {
        return Store.query (u);
    }

    ledger_record ledger::record_internal_transfer (user_id from, user_id to, Bitcoin::satoshi amount) {
        if (int64 (amount) <= 0) throw exception {} << "transfer amount must be positive";
        if (from == to) throw exception {} << "user " << from << " cannot transfer to itself";

        if (Directory != nullptr) {
            if (!bool (Directory->get_user (from))) throw exception {} << "unknown user " << from;
            if (!bool (Directory->get_user (to))) throw exception {} << "unknown user " << to;
        }

        hold h = lock (from);
        Bitcoin::satoshi available = balance (h);
        if (available < amount) throw insufficient_balance {from, available, amount};

        return Store.append (ledger_record::internal_transfer (from, to, amount));
    }

    ledger_record ledger::record_on_chain_send (const hold &h, Bitcoin::satoshi amount, Bitcoin::satoshi fee,
        const std::string &destination, const Bitcoin::TXID &txid) {
        if (int64 (amount) <= 0) throw exception {} << "send amount must be positive";
        if (int64 (fee) < 0) throw exception {} << "fee cannot be negative";

        Bitcoin::satoshi required = amount + fee;
        Bitcoin::satoshi available = balance (h);
        if (available < required) throw insufficient_balance {h.User, available, required};

        return Store.append (ledger_record::on_chain_send (h.User, amount, fee, destination, txid));
    }

    ledger_record ledger::record_on_chain_receive (user_id u, Bitcoin::satoshi amount,
        const std::string &address, const Bitcoin::TXID &txid) {
        if (int64 (amount) <= 0) throw exception {} << "received amount must be positive";
        return Store.append (ledger_record::on_chain_receive (u, amount, address, txid));
    }

}
