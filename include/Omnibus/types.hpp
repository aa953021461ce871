#ifndef OMNIBUS_TYPES
#define OMNIBUS_TYPES

#include <data/tools.hpp>
#include <data/numbers.hpp>
#include <data/net/JSON.hpp>
#include <Gigamonkey.hpp>

#include <data/io/exception.hpp>

#include <filesystem>

namespace Omnibus {
    using namespace data;
    namespace Bitcoin = Gigamonkey::Bitcoin;
    using filepath = std::filesystem::path;

    // users are identified by a number assigned when they are created.
    using user_id = uint64;

    // a user of the pool. The balance is not stored here; it is
    // always derived from the ledger.
    struct user {
        user_id ID {0};
        std::string Name {};

        user () {}
        user (user_id id, const std::string &name) : ID {id}, Name {name} {}

        bool operator == (const user &u) const {
            return ID == u.ID && Name == u.Name;
        }
    };

    std::ostream inline &operator << (std::ostream &o, const user &u) {
        return o << "user {" << u.ID << ", \"" << u.Name << "\"}";
    }
}

#endif
