#include <Omnibus/wallet/build.hpp>

namespace Omnibus {

    negative_change::negative_change (Bitcoin::satoshi total, Bitcoin::satoshi spent) :
        std::logic_error {(std::stringstream {} << "inputs worth " << write_amount (total) <<
            " cannot cover " << write_amount (spent)).str ()}, Total {total}, Spent {spent} {}

    raw_transaction_request build::operator () (
        list<unspent_output> inputs,
        const std::string &destination,
        Bitcoin::satoshi amount,
        Bitcoin::satoshi fee,
        const std::string &change_address) const {

        if (int64 (amount) <= 0) throw exception {} << "payment amount must be positive";
        if (int64 (fee) < 0) throw exception {} << "fee cannot be negative";
        if (destination == change_address)
            throw exception {} << "change address cannot be the same as the destination " << destination;

        raw_transaction_request request {{}, {}, {}, Bitcoin::satoshi {0}, Bitcoin::satoshi {0}};

        for (const unspent_output &u : inputs) {
            request.Inputs <<= u.Outpoint;
            request.Total += u.Amount;
        }

        Bitcoin::satoshi spent = amount + fee;
        if (request.Total < spent) throw negative_change {request.Total, spent};

        request.Change = request.Total - spent;

        request.Outputs <<= payee {destination, amount};

        // no zero-value outputs.
        if (int64 (request.Change) > 0) request.Outputs <<= payee {change_address, request.Change};

        request.Raw = Node.create_raw_transaction (request.Inputs, request.Outputs);

        return request;
    }

}
