#ifndef OMNIBUS_LEDGER_STORE
#define OMNIBUS_LEDGER_STORE

#include <Omnibus/ledger/record.hpp>

namespace Omnibus {

    // Persistence for the ledger. Records are only ever appended.
    struct ledger_store {

        // store the record and return it with its ID set.
        virtual ledger_record append (const ledger_record &) = 0;

        // every record in which the user is either the owner or
        // the counterparty, in the order in which they were appended.
        virtual list<ledger_record> query (user_id) = 0;

        virtual ~ledger_store () {}
    };
}

#endif
