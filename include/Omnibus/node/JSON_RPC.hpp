#ifndef OMNIBUS_NODE_JSON_RPC
#define OMNIBUS_NODE_JSON_RPC

#include <Omnibus/node.hpp>
#include <data/net/HTTP_client.hpp>

namespace Omnibus {

    // talks to a Bitcoin node over its JSON-RPC interface.
    struct JSON_RPC final : node, net::HTTP::client_blocking {
        struct options {
            std::string Host {"127.0.0.1"};
            uint16 Port {8332};

            maybe<std::string> User {};
            maybe<std::string> Password {};

            // older nodes only have signrawtransaction.
            std::string SignMethod {"signrawtransactionwithwallet"};
        };

        JSON_RPC (const options &);

        // call a method and return the result. Throws command_failed if
        // the node replies with an error and connection_failed if it
        // cannot be reached or the reply cannot be read.
        JSON operator () (const std::string &method, JSON params = JSON::array ());

        // interpret the node's reply to a method call and return its result.
        static JSON read_reply (const std::string &method, net::HTTP::status, const std::string &body);

        // the signed transaction in the result of a sign method. A transaction
        // that is not completely signed is a command_failed.
        static bytes read_signed (const std::string &method, const JSON &result);

        list<unspent_output> list_unspent () final override;

        bytes create_raw_transaction (list<Bitcoin::outpoint> inputs, list<payee> outputs) final override;

        decoded_transaction decode_raw_transaction (const bytes &) final override;

        bytes sign_raw_transaction (const bytes &) final override;

        Bitcoin::TXID send_raw_transaction (const bytes &) final override;

        std::string get_new_address () final override;

        list<wallet_transaction> list_transactions (uint32 count, uint32 skip) final override;

    private:
        options Options;
        uint64 Nonce {0};

        // value of the Authorization header if we have credentials.
        maybe<std::string> Authorization {};

        awaitable<net::HTTP::response> post (const JSON &body);
    };

}

#endif
