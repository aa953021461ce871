#include <Omnibus/write.hpp>
#include <iomanip>
#include <limits>
#include <cctype>

namespace Omnibus {

    std::string write_amount (const Bitcoin::satoshi &x) {
        int64 v = int64 (x);
        std::stringstream ss;
        if (v < 0) {
            ss << "-";
            // the most negative value has no positive counterpart.
            if (v == std::numeric_limits<int64>::min ()) throw exception {} << "amount out of range";
            v = -v;
        }

        ss << (v / SatoshisPerCoin) << "." << std::setw (8) << std::setfill ('0') << (v % SatoshisPerCoin);
        return ss.str ();
    }

    Bitcoin::satoshi read_amount (string_view x) {
        if (x.size () == 0) throw exception {} << "empty amount";

        size_t i = 0;
        bool negative = false;
        if (x[0] == '-' || x[0] == '+') {
            negative = x[0] == '-';
            i++;
        }

        // all digits of the mantissa with the decimal point removed.
        std::string digits;
        int fractional_digits = 0;
        bool point = false;

        for (; i < x.size () && x[i] != 'e' && x[i] != 'E'; i++) {
            char c = x[i];
            if (c == '.') {
                if (point) throw exception {} << "invalid amount " << x;
                point = true;
                continue;
            }

            if (c < '0' || c > '9') throw exception {} << "invalid amount " << x;
            digits.push_back (c);
            if (point) fractional_digits++;
        }

        if (digits.size () == 0) throw exception {} << "invalid amount " << x;

        int exponent = 0;
        if (i < x.size ()) {
            // skip 'e'
            i++;
            bool negative_exponent = false;
            if (i < x.size () && (x[i] == '-' || x[i] == '+')) {
                negative_exponent = x[i] == '-';
                i++;
            }

            if (i == x.size ()) throw exception {} << "invalid amount " << x;

            for (; i < x.size (); i++) {
                if (x[i] < '0' || x[i] > '9') throw exception {} << "invalid amount " << x;
                exponent = exponent * 10 + (x[i] - '0');
                if (exponent > 64) throw exception {} << "amount out of range: " << x;
            }

            if (negative_exponent) exponent = -exponent;
        }

        // value in satoshis is digits * 10 ^ shift
        int shift = exponent - fractional_digits + 8;

        // digits that would fall below one satoshi must all be zero.
        while (shift < 0) {
            if (digits.back () != '0') throw exception {} << "amount " << x << " has more than 8 decimal places";
            digits.pop_back ();
            shift++;
            if (digits.size () == 0) digits = "0";
        }

        constexpr int64 max = std::numeric_limits<int64>::max ();
        int64 v = 0;
        for (char c : digits) {
            int64 d = c - '0';
            if (v > (max - d) / 10) throw exception {} << "amount out of range: " << x;
            v = v * 10 + d;
        }

        for (; shift > 0; shift--) {
            if (v > max / 10) throw exception {} << "amount out of range: " << x;
            v *= 10;
        }

        return Bitcoin::satoshi {negative ? -v : v};
    }

    Bitcoin::satoshi read_amount (const JSON &j) {
        if (j.is_string ()) return read_amount (string_view {j.get_ref<const std::string &> ()});
        if (j.is_number ()) return read_amount (string_view {j.dump ()});
        throw exception {} << "expected amount but found " << j.dump ();
    }

    std::string write (const Bitcoin::TXID &txid) {
        std::stringstream ss;
        ss << txid;
        return ss.str ().substr (2);
    }

    Bitcoin::TXID read_TXID (string_view x) {
        if (x.size () != 64) throw exception {} << "invalid txid " << x;
        for (char c : x) if (!std::isxdigit (static_cast<unsigned char> (c))) throw exception {} << "invalid txid " << x;

        Bitcoin::TXID t {std::string {"0x"} + std::string {x}};
        if (!t.valid ()) throw exception {} << "invalid txid " << x;
        return t;
    }
}
