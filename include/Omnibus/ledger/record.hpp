#ifndef OMNIBUS_LEDGER_RECORD
#define OMNIBUS_LEDGER_RECORD

#include <Omnibus/write.hpp>

namespace Omnibus {

    enum class record_type : byte {
        invalid = 0,
        // a move between two users of the pool. Nothing happens on chain.
        internal_transfer = 1,
        // a payout from the pool to an external address.
        on_chain_send = 2,
        // a payment into the pool to an address owned by a user.
        on_chain_receive = 3
    };

    std::ostream &operator << (std::ostream &, record_type);

    // A record in the append-only ledger. Amount and Fee are
    // never negative; the sign of a record's effect on a balance
    // is determined by the type and by which side the user is on.
    struct ledger_record {
        // assigned by the store when the record is appended.
        uint64 ID {0};

        user_id User {0};
        record_type Type {record_type::invalid};

        Bitcoin::satoshi Amount {0};
        Bitcoin::satoshi Fee {0};

        // the receiving user of an internal transfer.
        maybe<user_id> Counterparty {};

        // destination of a send or receiving address of a receive.
        maybe<std::string> Address {};

        // empty for internal transfers.
        maybe<Bitcoin::TXID> TXID {};

        Bitcoin::timestamp Created {};

        ledger_record () {}

        static ledger_record internal_transfer (user_id from, user_id to, Bitcoin::satoshi amount);
        static ledger_record on_chain_send (user_id, Bitcoin::satoshi amount, Bitcoin::satoshi fee,
            const std::string &destination, const Bitcoin::TXID &);
        static ledger_record on_chain_receive (user_id, Bitcoin::satoshi amount,
            const std::string &address, const Bitcoin::TXID &);

        // the change in balance of the given user due to this record.
        Bitcoin::satoshi effect (user_id) const;

        bool valid () const;

        bool operator == (const ledger_record &) const;

        explicit operator JSON () const;
    };

    std::ostream &operator << (std::ostream &, const ledger_record &);

    Bitcoin::satoshi inline ledger_record::effect (user_id u) const {
        switch (Type) {
            case record_type::internal_transfer: {
                if (User == u) return Bitcoin::satoshi {0} - Amount;
                if (bool (Counterparty) && *Counterparty == u) return Amount;
                return Bitcoin::satoshi {0};
            }
            case record_type::on_chain_send:
                return User == u ? Bitcoin::satoshi {0} - (Amount + Fee) : Bitcoin::satoshi {0};
            case record_type::on_chain_receive:
                return User == u ? Amount : Bitcoin::satoshi {0};
            default: throw exception {} << "invalid ledger record type";
        }
    }
}

#endif
