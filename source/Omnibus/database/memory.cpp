#include <Omnibus/database/memory.hpp>

namespace Omnibus {

    ledger_record memory_database::append (const ledger_record &r) {
        if (!r.valid ()) throw exception {} << "attempt to append invalid record " << r;
        std::lock_guard<std::mutex> lock (Mutex);
        ledger_record n = r;
        n.ID = Records.size () + 1;
        Records.push_back (n);
        RecordIndex[n.User].push_back (Records.size () - 1);
        if (bool (n.Counterparty) && *n.Counterparty != n.User)
            RecordIndex[*n.Counterparty].push_back (Records.size () - 1);
        return n;
    }

    list<ledger_record> memory_database::query (user_id u) {
        std::lock_guard<std::mutex> lock (Mutex);
        auto v = RecordIndex.find (u);
        if (v == RecordIndex.end ()) return {};
        list<ledger_record> result;
        for (size_t i : v->second) result <<= Records[i];
        return result;
    }

    maybe<user> memory_database::make_user (const std::string &name) {
        std::lock_guard<std::mutex> lock (Mutex);
        if (UserNames.find (name) != UserNames.end ()) return {};
        user u {Users.size () + 1, name};
        Users[u.ID] = u;
        UserNames[name] = u.ID;
        return u;
    }

    maybe<user> memory_database::get_user (user_id id) {
        std::lock_guard<std::mutex> lock (Mutex);
        auto v = Users.find (id);
        if (v == Users.end ()) return {};
        return v->second;
    }

    maybe<user> memory_database::find_user (const std::string &name) {
        std::lock_guard<std::mutex> lock (Mutex);
        auto v = UserNames.find (name);
        if (v == UserNames.end ()) return {};
        return Users[v->second];
    }

    list<user> memory_database::list_users () {
        std::lock_guard<std::mutex> lock (Mutex);
        list<user> result;
        for (const auto &[_, u] : Users) result <<= u;
        return result;
    }

    bool memory_database::add_address (const std::string &address, maybe<user_id> owner) {
        std::lock_guard<std::mutex> lock (Mutex);
        if (Owners.find (address) != Owners.end ()) return false;
        if (bool (owner) && Users.find (*owner) == Users.end ())
            throw exception {} << "cannot add address " << address << " for unknown user " << *owner;
        Owners[address] = owner;
        if (bool (owner)) Addresses[*owner] <<= address;
        return true;
    }

    list<std::string> memory_database::addresses (user_id u) {
        std::lock_guard<std::mutex> lock (Mutex);
        auto v = Addresses.find (u);
        if (v == Addresses.end ()) return {};
        return v->second;
    }

    maybe<user_id> memory_database::owner (const std::string &address) {
        std::lock_guard<std::mutex> lock (Mutex);
        auto v = Owners.find (address);
        if (v == Owners.end ()) return {};
        return v->second;
    }

}
