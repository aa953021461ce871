#ifndef OMNIBUS_PROGRAM_OPTIONS
#define OMNIBUS_PROGRAM_OPTIONS

#include <Omnibus/options.hpp>
#include <Omnibus/node/JSON_RPC.hpp>
#include <data/io/arg_parser.hpp>

using arg_parser = data::io::arg_parser;
using uint16 = data::uint16;
using uint32 = data::uint32;
using filepath = Omnibus::filepath;

// options are read from the command line first and then
// from environment variables, which may be set in an env file.
struct options : arg_parser {
    options (arg_parser &&ap) : arg_parser {ap} {}

    // path to an env file containing program options.
    data::maybe<filepath> env () const;

    // nothing means the database is in memory.
    data::maybe<filepath> sqlite_path () const;

    Omnibus::JSON_RPC::options rpc () const;

    Omnibus::payout_options payout_options () const;
};

#endif
