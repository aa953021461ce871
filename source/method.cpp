#include "method.hpp"
#include <Omnibus/options.hpp>
#include <Omnibus/write.hpp>
#include <regex>
#include <sstream>

std::string regex_replace (const std::string &x, const std::regex &r, const std::string &n) {
    std::stringstream ss;
    std::regex_replace (std::ostreambuf_iterator<char> (ss), x.begin (), x.end (), r, n);
    return ss.str ();
}

std::string sanitize (const std::string &in) {
    return regex_replace (data::to_lower (in), std::regex {"_|-"}, "");
}

method read_method (const UTF8 &p) {
    UTF8 sanitized = sanitize (p);

    if (sanitized == "help") return method::HELP;
    if (sanitized == "version") return method::VERSION;
    if (sanitized == "makeuser") return method::MAKE_USER;
    if (sanitized == "newaddress") return method::NEW_ADDRESS;
    if (sanitized == "balance") return method::BALANCE;
    if (sanitized == "history") return method::HISTORY;
    if (sanitized == "transfer") return method::TRANSFER;
    if (sanitized == "payout") return method::PAYOUT;
    if (sanitized == "receive") return method::RECEIVE;

    return method::UNSET;
}

std::ostream &operator << (std::ostream &o, method m) {
    switch (m) {
        case method::HELP: return o << "help";
        case method::VERSION: return o << "version";
        case method::MAKE_USER: return o << "make_user";
        case method::NEW_ADDRESS: return o << "new_address";
        case method::BALANCE: return o << "balance";
        case method::HISTORY: return o << "history";
        case method::TRANSFER: return o << "transfer";
        case method::PAYOUT: return o << "payout";
        case method::RECEIVE: return o << "receive";
        default: return o << "unset";
    }
}

std::ostream &version (std::ostream &o) {
    return o << "Omnibus version 0.0.1 alpha";
}

std::ostream &help (std::ostream &o, method meth) {
    switch (meth) {
        default :
            return version (o) << "\n" << "input should be <method> <args>... where method is "
                "\n\tmake_user    -- create a new user."
                "\n\tnew_address  -- get a new receiving address for a user or for the pool."
                "\n\tbalance      -- print the balance of a user."
                "\n\thistory      -- print the ledger records of a user."
                "\n\ttransfer     -- move funds from one user to another."
                "\n\tpayout       -- send funds from a user to an address outside the pool."
                "\n\treceive      -- credit confirmed payments to the users who own the addresses."
                "\noptions for every method that uses the node or the database are"
                "\n\t(--env=<path to env file>) (= .env)"
                "\n\t(--sqlite_path=<path>) or (--sqlite_in_memory)"
                "\n\t(--rpc_host=<host>) (= 127.0.0.1)"
                "\n\t(--rpc_port=<port>) (= 8332)"
                "\n\t(--rpc_user=<user>) (--rpc_password=<password>)"
                "\n\t(--sign_method=<node method>) (= signrawtransactionwithwallet)"
                "\nuse help \"method\" for information on a specific method";
        case method::MAKE_USER :
            return o << "Create a new user."
                "\narguments for method make_user:"
                "\n\t(--name=)<user name>"
                "\n\t(--auto_create_address=<bool>) (= " << std::boolalpha <<
                Omnibus::payout_options::DefaultAutoCreateAddress << ") (give the user a receiving address)";
        case method::NEW_ADDRESS :
            return o << "Get a new address from the node."
                "\narguments for method new_address:"
                "\n\t(--name=)<user name>"
                "\n\t(--pool) (the address belongs to no user)";
        case method::BALANCE :
            return o << "Print the balance of a user."
                "\narguments for method balance:"
                "\n\t(--name=)<user name>";
        case method::HISTORY :
            return o << "Print the ledger records of a user, oldest first."
                "\narguments for method history:"
                "\n\t(--name=)<user name>";
        case method::TRANSFER :
            return o << "Move funds from one user to another. Nothing happens on chain."
                "\narguments for method transfer:"
                "\n\t(--from=)<user name>"
                "\n\t(--to=)<user name>"
                "\n\t(--amount=)<decimal amount>";
        case method::PAYOUT :
            return o << "Send funds from a user's balance to an address."
                "\narguments for method payout:"
                "\n\t(--name=)<user name>"
                "\n\t(--address=)<destination address>"
                "\n\t(--amount=)<decimal amount>"
                "\n\t(--fee=<decimal amount>) (= " <<
                Omnibus::write_amount (Omnibus::Bitcoin::satoshi {Omnibus::payout_options::DefaultTransactionFee}) << ")";
        case method::RECEIVE :
            return o << "Credit payments to addresses owned by users."
                "\narguments for method receive:"
                "\n\t(--min_confirmations=<uint32>) (= " << Omnibus::payout_options::DefaultMinConfirmations << ")";
    }
}
