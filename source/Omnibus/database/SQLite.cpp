#include <Omnibus/database/SQLite.hpp>

#include <sqlite_orm/sqlite_orm.h>
#include <sqlite3.h>

#include <mutex>

namespace sqlite_orm {

    template <> struct type_printer<Omnibus::record_type> {
        static std::string print () {
            return "INTEGER";
        }
    };

    template <> struct statement_binder<Omnibus::record_type> {
        int bind (sqlite3_stmt *stmt, int index, const Omnibus::record_type &value) const {
            return sqlite3_bind_int (stmt, index, static_cast<int> (value));
        }
    };

    template <> struct field_printer<Omnibus::record_type> {
        std::string operator () (const Omnibus::record_type &value) const {
            std::stringstream ss;
            ss << value;
            return ss.str ();
        }
    };

    template <> struct row_extractor<Omnibus::record_type> {
        Omnibus::record_type extract (sqlite3_stmt *stmt, int columnIndex) const {
            int v = sqlite3_column_int (stmt, columnIndex);
            if (v < 1 || v > 3) return Omnibus::record_type::invalid;
            return static_cast<Omnibus::record_type> (v);
        }
    };
}

namespace Omnibus::SQLite {
    using namespace sqlite_orm;

    // database version.
    struct Version {
        uint64_t version;
        std::string details;
    };

    struct User {
        int64_t id;
        std::string name;
    };

    // an address given out by the node. Pool addresses have no user.
    struct Address {
        std::string address;
        std::optional<int64_t> user;
    };

    struct Record {
        int64_t id;
        int64_t user;
        record_type type;
        int64_t amount;
        int64_t fee;
        std::optional<int64_t> counterparty;
        std::optional<std::string> address;
        // hex, as written by the node.
        std::optional<std::string> txid;
        uint32_t created;
    };

    inline auto init_storage (const std::string &path) {
        return make_storage (path,

            make_table ("versions",
                make_column ("version", &Version::version, primary_key ()),
                make_column ("details", &Version::details)
            ),

            make_table ("users",
                make_column ("id", &User::id, primary_key ().autoincrement ()),
                make_column ("name", &User::name),
                unique (&User::name)
            ),

            make_index ("idx_addresses_user", &Address::user),

            make_table ("addresses",
                make_column ("address", &Address::address, primary_key ()),
                make_column ("user", &Address::user)
            ),

            make_index ("idx_records_user", &Record::user),
            make_index ("idx_records_counterparty", &Record::counterparty),

            make_table ("records",
                make_column ("id", &Record::id, primary_key ().autoincrement ()),
                make_column ("user", &Record::user),
                make_column ("type", &Record::type),
                make_column ("amount", &Record::amount),
                make_column ("fee", &Record::fee),
                make_column ("counterparty", &Record::counterparty),
                make_column ("address", &Record::address),
                make_column ("txid", &Record::txid),
                make_column ("created", &Record::created)
            )
        );
    }

    ledger_record read_record (const Record &r) {
        ledger_record x;
        x.ID = uint64 (r.id);
        x.User = user_id (r.user);
        x.Type = r.type;
        x.Amount = Bitcoin::satoshi {r.amount};
        x.Fee = Bitcoin::satoshi {r.fee};
        if (bool (r.counterparty)) x.Counterparty = user_id (*r.counterparty);
        if (bool (r.address)) x.Address = *r.address;
        if (bool (r.txid)) x.TXID = read_TXID (string_view {*r.txid});
        x.Created = Bitcoin::timestamp {r.created};
        return x;
    }

    struct db final : database {

        decltype (init_storage ("")) storage;

        std::mutex Mutex;

        std::optional<uint64_t> get_latest_version () {
            auto rows = storage.select (
                &Version::version,
                order_by (&Version::version).desc (),
                limit (1));

            if (rows.empty ()) return {};

            return rows.front ();
        }

        db (const std::string &db_path): storage (init_storage (db_path)) {
            storage.sync_schema (true);
            auto opt_latest_version = get_latest_version ();
            if (!bool (opt_latest_version)) storage.insert (Version {1, "First Omnibus db"});
            else if (*opt_latest_version > 1) throw data::exception {} << "unrecognized database";
        }

        /*
            ledger
        */

        ledger_record append (const ledger_record &r) final override {
            if (!r.valid ()) throw data::exception {} << "attempt to append invalid record " << r;

            Record row {0, int64_t (r.User), r.Type, int64 (r.Amount), int64 (r.Fee),
                bool (r.Counterparty) ? std::optional<int64_t> {int64_t (*r.Counterparty)} : std::optional<int64_t> {},
                bool (r.Address) ? std::optional<std::string> {*r.Address} : std::optional<std::string> {},
                bool (r.TXID) ? std::optional<std::string> {write (*r.TXID)} : std::optional<std::string> {},
                uint32 (r.Created)};

            std::lock_guard<std::mutex> lock (Mutex);
            ledger_record n = r;
            n.ID = uint64 (storage.insert (row));
            return n;
        }

        list<ledger_record> query (user_id u) final override {
            std::lock_guard<std::mutex> lock (Mutex);
            auto rows = storage.get_all<Record> (
                where (is_equal (&Record::user, int64_t (u)) or is_equal (&Record::counterparty, int64_t (u))),
                order_by (&Record::id));

            list<ledger_record> records;
            for (const Record &r : rows) records <<= read_record (r);
            return records;
        }

        /*
            directory
        */

        maybe<user> make_user (const std::string &name) final override {
            std::lock_guard<std::mutex> lock (Mutex);
            try {
                int64_t id = storage.insert (User {0, name});
                return user {user_id (id), name};
            } catch (const std::system_error &e) {
                // means the name is taken.
                return {};
            }
        }

        maybe<user> get_user (user_id id) final override {
            std::lock_guard<std::mutex> lock (Mutex);
            return get_user_unlocked (id);
        }

        maybe<user> find_user (const std::string &name) final override {
            std::lock_guard<std::mutex> lock (Mutex);
            auto rows = storage.get_all<User> (where (is_equal (&User::name, name)), limit (1));
            if (rows.empty ()) return {};
            return user {user_id (rows.front ().id), rows.front ().name};
        }

        list<user> list_users () final override {
            std::lock_guard<std::mutex> lock (Mutex);
            list<user> users;
            for (const User &u : storage.get_all<User> (order_by (&User::id))) users <<= user {user_id (u.id), u.name};
            return users;
        }

        bool add_address (const std::string &address, maybe<user_id> owner) final override {
            std::lock_guard<std::mutex> lock (Mutex);
            if (bool (owner) && !bool (get_user_unlocked (*owner)))
                throw data::exception {} << "cannot add address " << address << " for unknown user " << *owner;

            if (!storage.select (&Address::address, where (is_equal (&Address::address, address)), limit (1)).empty ())
                return false;

            try {
                storage.replace (Address {address,
                    bool (owner) ? std::optional<int64_t> {int64_t (*owner)} : std::optional<int64_t> {}});
            } catch (const std::system_error &e) {
                throw data::exception {} << "could not save address " << address << ": " << e.what ();
            }

            return true;
        }

        list<std::string> addresses (user_id u) final override {
            std::lock_guard<std::mutex> lock (Mutex);
            list<std::string> result;
            for (const std::string &a : storage.select (&Address::address,
                where (is_equal (&Address::user, int64_t (u))), order_by (rowid ()))) result <<= a;
            return result;
        }

        maybe<user_id> owner (const std::string &address) final override {
            std::lock_guard<std::mutex> lock (Mutex);
            auto rows = storage.select (&Address::user, where (is_equal (&Address::address, address)), limit (1));
            if (rows.empty () || !bool (rows.front ())) return {};
            return user_id (*rows.front ());
        }

    private:
        maybe<user> get_user_unlocked (user_id id) {
            auto rows = storage.get_all<User> (where (is_equal (&User::id, int64_t (id))), limit (1));
            if (rows.empty ()) return {};
            return user {user_id (rows.front ().id), rows.front ().name};
        }
    };

    ptr<database> load (const maybe<filepath> &fzf) {
        std::string path;
        if (!bool (fzf)) path = ":memory:";
        else path = *fzf;
        return std::static_pointer_cast<database> (std::make_shared<db> (path));
    }

}
