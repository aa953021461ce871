#ifndef OMNIBUS_NODE
#define OMNIBUS_NODE

#include <Omnibus/write.hpp>

namespace Omnibus {

    // an output held by the node's wallet.
    struct unspent_output {
        Bitcoin::outpoint Outpoint {};
        Bitcoin::satoshi Amount {0};
        bool Spendable {false};
        maybe<std::string> Address {};
        uint32 Confirmations {0};

        unspent_output () {}
        unspent_output (const Bitcoin::outpoint &o, Bitcoin::satoshi amount, bool spendable = true,
            maybe<std::string> address = {}, uint32 confirmations = 1) :
            Outpoint {o}, Amount {amount}, Spendable {spendable}, Address {address}, Confirmations {confirmations} {}

        // from an entry of listunspent.
        explicit unspent_output (const JSON &);

        bool operator == (const unspent_output &u) const {
            return Outpoint == u.Outpoint && Amount == u.Amount && Spendable == u.Spendable;
        }

        explicit operator JSON () const;
    };

    std::ostream &operator << (std::ostream &, const unspent_output &);

    struct payee {
        std::string Address;
        Bitcoin::satoshi Amount;

        bool operator == (const payee &p) const {
            return Address == p.Address && Amount == p.Amount;
        }
    };

    std::ostream inline &operator << (std::ostream &o, const payee &p) {
        return o << "payee {" << p.Address << ", " << write_amount (p.Amount) << "}";
    }

    // what the node tells us is inside a raw transaction.
    struct decoded_transaction {
        Bitcoin::TXID TXID {};
        list<Bitcoin::outpoint> Inputs {};
        list<payee> Outputs {};

        decoded_transaction () {}
        decoded_transaction (const Bitcoin::TXID &id, list<Bitcoin::outpoint> inputs, list<payee> outputs) :
            TXID {id}, Inputs {inputs}, Outputs {outputs} {}

        // from the result of decoderawtransaction.
        explicit decoded_transaction (const JSON &);
    };

    // an entry in the node wallet's transaction history.
    struct wallet_transaction {
        Bitcoin::TXID TXID {};
        maybe<std::string> Address {};
        std::string Category {};
        Bitcoin::satoshi Amount {0};
        uint32 Confirmations {0};
        uint32 Vout {0};

        wallet_transaction () {}

        // from an entry of listtransactions.
        explicit wallet_transaction (const JSON &);
    };

    // The wallet-bearing node that holds the pool's coins. Addresses are
    // encoded and decoded by the node so we keep them as strings.
    struct node {

        struct error : std::runtime_error {
            using std::runtime_error::runtime_error;
        };

        // the node answered with an error.
        struct command_failed : error {
            std::string Method;
            int Code;
            command_failed (const std::string &method, int code, const std::string &message);
        };

        // we could not reach the node or could not read its reply.
        struct connection_failed : error {
            using error::error;
        };

        virtual list<unspent_output> list_unspent () = 0;

        virtual bytes create_raw_transaction (list<Bitcoin::outpoint> inputs, list<payee> outputs) = 0;

        virtual decoded_transaction decode_raw_transaction (const bytes &) = 0;

        // throws command_failed if the node cannot sign every input.
        virtual bytes sign_raw_transaction (const bytes &) = 0;

        virtual Bitcoin::TXID send_raw_transaction (const bytes &) = 0;

        virtual std::string get_new_address () = 0;

        // most recent entries last.
        virtual list<wallet_transaction> list_transactions (uint32 count, uint32 skip) = 0;

        virtual ~node () {}
    };

}

#endif
