#ifndef OMNIBUS_WRITE
#define OMNIBUS_WRITE

#include <Omnibus/types.hpp>

// provide standard ways of converting certain types into strings and back.
namespace Omnibus {

    // amounts are exchanged with the node as decimal coins with
    // at most eight fractional digits. Internally they are satoshis.
    constexpr int64 SatoshisPerCoin {100000000};

    // always writes eight fractional digits, eg "0.09990000".
    std::string write_amount (const Bitcoin::satoshi &);

    // throws if the text is not a decimal number representable in satoshis.
    // Exponent notation such as "1e-05" is accepted since that is how
    // small JSON numbers are sometimes written.
    Bitcoin::satoshi read_amount (string_view);

    // JSON amounts may be strings or numbers. Numbers are read through
    // their decimal text so that no floating point arithmetic is done.
    Bitcoin::satoshi read_amount (const JSON &);

    // txids are written as hex in the same order that the node uses.
    std::string write (const Bitcoin::TXID &);
    Bitcoin::TXID read_TXID (string_view);
    Bitcoin::TXID read_TXID (const JSON &);

    std::string write (const Bitcoin::outpoint &);

    Bitcoin::TXID inline read_TXID (const JSON &j) {
        if (!j.is_string ()) throw exception {} << "expected txid as a string but found " << j.dump ();
        return read_TXID (string_view {j.get_ref<const std::string &> ()});
    }

    std::string inline write (const Bitcoin::outpoint &o) {
        std::stringstream ss;
        ss << write (o.Digest) << ":" << o.Index;
        return ss.str ();
    }
}

#endif
