#ifndef OMNIBUS_WALLET_PAYOUT
#define OMNIBUS_WALLET_PAYOUT

#include <Omnibus/ledger/ledger.hpp>
#include <Omnibus/directory.hpp>
#include <Omnibus/wallet/select.hpp>
#include <Omnibus/wallet/build.hpp>
#include <Omnibus/options.hpp>
#include <mutex>
#include <map>

namespace Omnibus {

    // a payout that is in progress.
    struct pending_transaction {
        user_id User;
        std::string Destination;
        Bitcoin::satoshi Amount;
        Bitcoin::satoshi Fee;

        maybe<std::string> ChangeAddress {};
        list<unspent_output> Inputs {};
        Bitcoin::satoshi Change {0};

        bytes Raw {};
        bytes Signed {};

        // known once the transaction is signed.
        maybe<Bitcoin::TXID> TXID {};
    };

    // the coins of all users sit in the node's wallet. Only one
    // transaction at a time may be built, signed and broadcast
    // so that two payouts never select the same outputs.
    struct pool {
        node &Node;
        std::mutex Mutex;

        // payouts that were broadcast without a reply from the node, by user.
        // Their inputs are not selected again until they are settled.
        std::map<user_id, pending_transaction> Unconfirmed {};

        pool (node &n) : Node {n} {}

        bool reserved (const Bitcoin::outpoint &) const;
    };

    struct payout_result {
        enum state {
            CREATED,
            BUILT,
            SIGNED,
            BROADCAST,
            RECORDED
        };

        enum failure {
            NONE,
            INSUFFICIENT_BALANCE,
            INSUFFICIENT_FUNDS,
            NO_CHANGE_ADDRESS,
            // the node could not be reached or could not build the transaction.
            NODE_ERROR,
            SIGNING_FAILED,
            BROADCAST_FAILED,
            // the node did not answer the broadcast and we could not find out
            // whether the transaction reached the network.
            BROADCAST_UNCONFIRMED,
            // the transaction was broadcast but could not be recorded.
            LEDGER_INCONSISTENCY,
            // nothing new was sent because an earlier payout of the user
            // was settled instead. Its record is returned.
            PREVIOUS_PAYOUT
        };

        // the last state that was reached.
        state Reached {CREATED};
        failure Failure {NONE};

        std::string Message {};

        // present once the transaction may have been broadcast.
        maybe<Bitcoin::TXID> TXID {};

        // present if the payout or an earlier payout was recorded.
        maybe<ledger_record> Record {};

        payout_result () {}
        payout_result (state s, failure f, const std::string &message, maybe<Bitcoin::TXID> txid = {}) :
            Reached {s}, Failure {f}, Message {message}, TXID {txid} {}
        payout_result (const ledger_record &r) : Reached {RECORDED}, Failure {NONE}, TXID {r.TXID}, Record {r} {}

        // payout_result is equivalent to true when the payout succeeded.
        operator bool () const {
            return Failure == NONE && Reached == RECORDED;
        }

        // coins may have left the pool but the ledger does not say so.
        bool reconciliation_required () const {
            return Failure == LEDGER_INCONSISTENCY || Failure == BROADCAST_UNCONFIRMED;
        }
    };

    std::ostream &operator << (std::ostream &, payout_result::state);
    std::ostream &operator << (std::ostream &, payout_result::failure);
    std::ostream &operator << (std::ostream &, const payout_result &);

    // send coins out of the pool on behalf of a user. The user's
    // balance is debited only after the transaction is broadcast.
    // If an earlier payout of the user is unconfirmed, it is settled
    // and nothing new is sent.
    struct payout {
        ledger &Ledger;
        directory &Directory;
        pool &Pool;

        payout_options Options {};

        select Select {largest_first {}};

        // if no fee is given, the fee in Options is used.
        payout_result operator () (user_id, const std::string &destination,
            Bitcoin::satoshi amount, maybe<Bitcoin::satoshi> fee = {});

    private:
        payout_result record (const ledger::hold &, const pending_transaction &);
    };

    // thrown by the program when a payout leaves the ledger out of step with the pool.
    struct ledger_inconsistency : std::runtime_error {
        payout_result Result;
        ledger_inconsistency (const payout_result &);
    };
}

#endif
