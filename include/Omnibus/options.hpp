#ifndef OMNIBUS_OPTIONS
#define OMNIBUS_OPTIONS

#include <Omnibus/types.hpp>

namespace Omnibus {

    struct payout_options {
        // used when a payout does not say what fee to pay.
        constexpr static int64 DefaultTransactionFee {10000};

        // whether a new user is given a receiving address right away.
        constexpr static bool DefaultAutoCreateAddress {true};

        // receipts with fewer confirmations than this are not credited.
        constexpr static uint32 DefaultMinConfirmations {1};

        Bitcoin::satoshi TransactionFee {DefaultTransactionFee};

        bool AutoCreateAddress {DefaultAutoCreateAddress};

        uint32 MinConfirmations {DefaultMinConfirmations};
    };
}

#endif
