#ifndef OMNIBUS_WALLET_BUILD
#define OMNIBUS_WALLET_BUILD

#include <Omnibus/node.hpp>

namespace Omnibus {

    // the selected inputs do not cover the amount and the fee.
    // This means the selector was given the wrong target.
    struct negative_change : std::logic_error {
        Bitcoin::satoshi Total;
        Bitcoin::satoshi Spent;

        negative_change (Bitcoin::satoshi total, Bitcoin::satoshi spent);
    };

    struct raw_transaction_request {
        list<Bitcoin::outpoint> Inputs;

        // the payment comes first, followed by change if there is any.
        list<payee> Outputs;

        bytes Raw;

        Bitcoin::satoshi Total;
        Bitcoin::satoshi Change;
    };

    // construct an unsigned transaction with the node.
    struct build {
        node &Node;

        raw_transaction_request operator () (
            list<unspent_output> inputs,
            const std::string &destination,
            Bitcoin::satoshi amount,
            Bitcoin::satoshi fee,
            const std::string &change_address) const;
    };
}

#endif
