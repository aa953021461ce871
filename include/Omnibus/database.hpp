#ifndef OMNIBUS_DATABASE
#define OMNIBUS_DATABASE

#include <Omnibus/ledger/store.hpp>
#include <Omnibus/directory.hpp>

namespace Omnibus {

    struct database : ledger_store, directory {
        virtual ~database () {}
    };

}

#endif
