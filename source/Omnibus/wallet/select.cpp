#include <Omnibus/wallet/select.hpp>
#include <algorithm>

namespace Omnibus {

    insufficient_funds::insufficient_funds (Bitcoin::satoshi available, Bitcoin::satoshi required) :
        std::runtime_error {(std::stringstream {} << "pool has " << write_amount (available) <<
            " available but " << write_amount (required) << " is required").str ()},
        Available {available}, Required {required} {}

    selected largest_first::operator () (list<unspent_output> unspent, Bitcoin::satoshi target) const {
        if (int64 (target) <= 0) throw exception {} << "selection target must be positive";

        std::vector<unspent_output> candidates;
        for (const unspent_output &u : unspent) if (u.Spendable) candidates.push_back (u);

        std::sort (candidates.begin (), candidates.end (), [] (const unspent_output &a, const unspent_output &b) {
            if (a.Amount != b.Amount) return a.Amount > b.Amount;
            return a.Outpoint < b.Outpoint;
        });

        selected result {{}, Bitcoin::satoshi {0}};
        for (const unspent_output &u : candidates) {
            if (result.Total >= target) break;
            result.Selected <<= u;
            result.Total += u.Amount;
        }

        if (result.Total < target) throw insufficient_funds {result.Total, target};

        return result;
    }

}
