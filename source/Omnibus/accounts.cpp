#include <Omnibus/accounts.hpp>

namespace Omnibus {

    user accounts::make_user (const std::string &name) {
        if (name == "") throw exception {} << "user name cannot be empty";

        maybe<user> u = Directory.make_user (name);
        if (!bool (u)) throw exception {} << "user name " << name << " is taken";

        if (Options.AutoCreateAddress) new_address (u->ID);

        return *u;
    }

    user accounts::get_or_make_user (const std::string &name) {
        maybe<user> u = Directory.find_user (name);
        if (bool (u)) return *u;
        return make_user (name);
    }

    std::string accounts::new_address (user_id id) {
        if (!bool (Directory.get_user (id))) throw exception {} << "unknown user " << id;
        std::string address = Node.get_new_address ();
        if (!Directory.add_address (address, id))
            throw exception {} << "node returned address " << address << " which is already in use";
        return address;
    }

    std::string accounts::new_pool_address () {
        std::string address = Node.get_new_address ();
        if (!Directory.add_address (address, {}))
            throw exception {} << "node returned address " << address << " which is already in use";
        return address;
    }

}
