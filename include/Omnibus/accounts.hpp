#ifndef OMNIBUS_ACCOUNTS
#define OMNIBUS_ACCOUNTS

#include <Omnibus/directory.hpp>
#include <Omnibus/node.hpp>
#include <Omnibus/options.hpp>

namespace Omnibus {

    // creates users and gives them addresses from the node.
    struct accounts {
        directory &Directory;
        node &Node;
        payout_options Options {};

        // throws if the name is taken. If AutoCreateAddress is set,
        // the user is given an address that can also receive change.
        user make_user (const std::string &name);

        user get_or_make_user (const std::string &name);

        // a new receiving address owned by the user.
        std::string new_address (user_id);

        // a new address that belongs to no user.
        std::string new_pool_address ();
    };
}

#endif
