#ifndef OMNIBUS_METHOD
#define OMNIBUS_METHOD

#include <data/io/error.hpp>
#include <Omnibus/types.hpp>

using error = data::io::error;
using UTF8 = data::UTF8;

enum class method {
    UNSET,
    HELP,             // print help messages
    VERSION,          // print a version message
    MAKE_USER,        // create a user
    NEW_ADDRESS,      // get a receiving address from the node
    BALANCE,          // balance of a user
    HISTORY,          // ledger records of a user
    TRANSFER,         // move funds between users
    PAYOUT,           // send funds out of the pool
    RECEIVE           // credit confirmed payments to users
};

method read_method (const UTF8 &);

std::ostream &operator << (std::ostream &, method);

std::ostream &version (std::ostream &);

std::ostream &help (std::ostream &, method m = method::UNSET);

std::string sanitize (const std::string &in);

#endif
