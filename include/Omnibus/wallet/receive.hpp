#ifndef OMNIBUS_WALLET_RECEIVE
#define OMNIBUS_WALLET_RECEIVE

#include <Omnibus/ledger/ledger.hpp>
#include <Omnibus/directory.hpp>
#include <Omnibus/node.hpp>

namespace Omnibus {

    // Look through the node's transaction history for payments to
    // addresses owned by users and record them in the ledger. Payments
    // with fewer than min_confirmations confirmations are left for later.
    // Nothing is credited twice so this can be run any number of times.
    // Return the records that were created.
    list<ledger_record> credit_receipts (ledger &, directory &, node &,
        uint32 min_confirmations, uint32 batch_size = 100);

}

#endif
