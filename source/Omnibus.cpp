#include <cstdlib>
#include <laserpants/dotenv/dotenv.h>

#include <Omnibus/database/SQLite.hpp>
#include <Omnibus/node/JSON_RPC.hpp>
#include <Omnibus/accounts.hpp>
#include <Omnibus/wallet/payout.hpp>
#include <Omnibus/wallet/receive.hpp>

#include "method.hpp"
#include "catch_all.hpp"
#include "options.hpp"

using namespace data;
namespace Bitcoin = Omnibus::Bitcoin;

void run (const options &);

int main (int arg_count, char **arg_values) {

    error err = catch_all (run, options {io::arg_parser {arg_count, arg_values}});

    if (bool (err)) {
        if (err.Message) std::cout << "Fail code " << err.Code << ": " << *err.Message << std::endl;
        else std::cout << "Fail code " << err.Code << "." << std::endl;
    }

    return err.Code;

}

void load_env (const options &program_options) {
    // path to an env file containing program options.
    auto envpath = program_options.env ();

    // If the user provided a path, it is an error if it is not found.
    // Otherwise we look in the default location but don't throw an
    // error if we don't find it.
    if (bool (envpath)) {
        std::error_code ec;
        if (!std::filesystem::exists (*envpath, ec)) {
            throw exception {} << "file " << *envpath << " does not exist ";
        } else if (ec) {
            throw exception {} << "could not access file " << *envpath;
        }

        dotenv::init (envpath->c_str ());
    } else dotenv::init ();
}

Omnibus::user read_user (Omnibus::directory &d, const options &p, uint32 index, const std::string &param) {
    maybe<std::string> name;
    p.get (index, param, name);
    if (!bool (name)) throw exception {} << "no user name provided for parameter " << param;

    maybe<Omnibus::user> u = d.find_user (*name);
    if (!bool (u)) throw exception {} << "no user named " << *name;
    return *u;
}

Bitcoin::satoshi read_amount (const options &p, uint32 index, const std::string &param) {
    maybe<std::string> amount;
    p.get (index, param, amount);
    if (!bool (amount)) throw exception {} << "no amount provided for parameter " << param;
    return Omnibus::read_amount (std::string_view {*amount});
}

void command_make_user (const options &p) {
    auto db = Omnibus::SQLite::load (p.sqlite_path ());
    Omnibus::payout_options po = p.payout_options ();
    Omnibus::JSON_RPC node {p.rpc ()};

    maybe<std::string> name;
    p.get (2, "name", name);
    if (!bool (name)) throw exception {} << "no user name provided";

    Omnibus::user u = Omnibus::accounts {*db, node, po}.make_user (*name);
    std::cout << "created " << u << std::endl;
    for (const std::string &address : db->addresses (u.ID)) std::cout << "\taddress " << address << std::endl;
}

void command_new_address (const options &p) {
    auto db = Omnibus::SQLite::load (p.sqlite_path ());
    Omnibus::JSON_RPC node {p.rpc ()};
    Omnibus::accounts acc {*db, node, p.payout_options ()};

    if (p.has ("pool")) {
        std::cout << acc.new_pool_address () << std::endl;
        return;
    }

    std::cout << acc.new_address (read_user (*db, p, 2, "name").ID) << std::endl;
}

void command_balance (const options &p) {
    auto db = Omnibus::SQLite::load (p.sqlite_path ());
    Omnibus::user u = read_user (*db, p, 2, "name");
    std::cout << Omnibus::write_amount (Omnibus::ledger {*db}.balance (u.ID)) << std::endl;
}

void command_history (const options &p) {
    auto db = Omnibus::SQLite::load (p.sqlite_path ());
    Omnibus::user u = read_user (*db, p, 2, "name");

    JSON::array_t records;
    for (const Omnibus::ledger_record &r : Omnibus::ledger {*db}.history (u.ID)) records.push_back (JSON (r));
    std::cout << JSON (records).dump (2) << std::endl;
}

void command_transfer (const options &p) {
    auto db = Omnibus::SQLite::load (p.sqlite_path ());
    Omnibus::user from = read_user (*db, p, 2, "from");
    Omnibus::user to = read_user (*db, p, 3, "to");
    Bitcoin::satoshi amount = read_amount (p, 4, "amount");

    std::cout << "recorded " << Omnibus::ledger {*db}.record_internal_transfer (from.ID, to.ID, amount) << std::endl;
}

void command_payout (const options &p) {
    auto db = Omnibus::SQLite::load (p.sqlite_path ());
    Omnibus::user u = read_user (*db, p, 2, "name");

    maybe<std::string> address;
    p.get (3, "address", address);
    if (!bool (address)) throw exception {} << "no destination address provided";

    Bitcoin::satoshi amount = read_amount (p, 4, "amount");

    Omnibus::JSON_RPC node {p.rpc ()};
    Omnibus::ledger l {*db};
    Omnibus::pool pool {node};

    Omnibus::payout_result result = Omnibus::payout {l, *db, pool, p.payout_options ()} (u.ID, *address, amount);

    if (result.reconciliation_required ()) throw Omnibus::ledger_inconsistency {result};

    if (!bool (result) && result.Failure != Omnibus::payout_result::PREVIOUS_PAYOUT) throw exception {} << result;

    std::cout << result << std::endl;
}

void command_receive (const options &p) {
    auto db = Omnibus::SQLite::load (p.sqlite_path ());
    Omnibus::JSON_RPC node {p.rpc ()};
    Omnibus::ledger l {*db};

    auto credited = Omnibus::credit_receipts (l, *db, node, p.payout_options ().MinConfirmations);
    std::cout << data::size (credited) << " payments credited" << std::endl;
}

void run (const options &program_options) {

    if (program_options.has ("version")) {
        version (std::cout) << std::endl;
        return;
    }

    maybe<std::string> method_name;
    program_options.get (1, method_name);

    method m = bool (method_name) ? read_method (*method_name) : method::UNSET;

    if (m == method::UNSET || m == method::HELP || program_options.has ("help")) {
        maybe<std::string> help_method;
        if (m == method::HELP) program_options.get (2, help_method);
        help (std::cout, bool (help_method) ? read_method (*help_method) : m) << std::endl;
        return;
    }

    if (m == method::VERSION) {
        version (std::cout) << std::endl;
        return;
    }

    load_env (program_options);

    switch (m) {
        case method::MAKE_USER: return command_make_user (program_options);
        case method::NEW_ADDRESS: return command_new_address (program_options);
        case method::BALANCE: return command_balance (program_options);
        case method::HISTORY: return command_history (program_options);
        case method::TRANSFER: return command_transfer (program_options);
        case method::PAYOUT: return command_payout (program_options);
        case method::RECEIVE: return command_receive (program_options);
        default: throw exception {} << "unknown method " << m;
    }
}
