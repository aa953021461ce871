#ifndef OMNIBUS_WALLET_SELECT
#define OMNIBUS_WALLET_SELECT

#include <Omnibus/node.hpp>

namespace Omnibus {

    struct selected {
        list<unspent_output> Selected;
        Bitcoin::satoshi Total;
    };

    struct insufficient_funds : std::runtime_error {
        Bitcoin::satoshi Available;
        Bitcoin::satoshi Required;

        insufficient_funds (Bitcoin::satoshi available, Bitcoin::satoshi required);
    };

    // select outputs of the pool worth at least the target.
    using select = data::function<selected (list<unspent_output>, Bitcoin::satoshi target)>;

    // default select function. Spendable outputs are taken largest first
    // until the target is reached; ties are broken by outpoint so that
    // the result is the same for the same input. Throws insufficient_funds
    // if all spendable outputs together are not enough.
    struct largest_first {
        selected operator () (list<unspent_output>, Bitcoin::satoshi target) const;
    };
}

#endif
