#ifndef OMNIBUS_DIRECTORY
#define OMNIBUS_DIRECTORY

#include <Omnibus/types.hpp>

namespace Omnibus {

    // users of the pool and the addresses they own.
    struct directory {

        // return nothing if the name is taken.
        virtual maybe<user> make_user (const std::string &name) = 0;

        virtual maybe<user> get_user (user_id) = 0;
        virtual maybe<user> find_user (const std::string &name) = 0;
        virtual list<user> list_users () = 0;

        // an address without an owner belongs to the pool only.
        // Return false if the address is already known.
        virtual bool add_address (const std::string &address, maybe<user_id> owner) = 0;

        // addresses owned by a user in the order they were added.
        virtual list<std::string> addresses (user_id) = 0;

        // nothing if the address is unknown or unowned.
        virtual maybe<user_id> owner (const std::string &address) = 0;

        virtual ~directory () {}
    };
}

#endif
