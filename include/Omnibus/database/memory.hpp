#ifndef OMNIBUS_DATABASE_MEMORY
#define OMNIBUS_DATABASE_MEMORY

#include <Omnibus/database.hpp>
#include <mutex>
#include <map>
#include <vector>

namespace Omnibus {

    // In-memory implementation of the database. Everything
    // is lost when it is destroyed.
    struct memory_database : database {
        memory_database () {}

        ledger_record append (const ledger_record &) final override;
        list<ledger_record> query (user_id) final override;

        maybe<user> make_user (const std::string &name) final override;
        maybe<user> get_user (user_id) final override;
        maybe<user> find_user (const std::string &name) final override;
        list<user> list_users () final override;

        bool add_address (const std::string &address, maybe<user_id> owner) final override;
        list<std::string> addresses (user_id) final override;
        maybe<user_id> owner (const std::string &address) final override;

        virtual ~memory_database () {}

    private:
        std::mutex Mutex;

        std::vector<ledger_record> Records {};

        // records by the users they touch.
        std::map<user_id, std::vector<size_t>> RecordIndex {};

        std::map<user_id, user> Users {};
        std::map<std::string, user_id> UserNames {};

        std::map<std::string, maybe<user_id>> Owners {};
        std::map<user_id, list<std::string>> Addresses {};
    };
}

#endif
