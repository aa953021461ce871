#include <Omnibus/wallet/payout.hpp>
#include <algorithm>

namespace Omnibus {

    std::ostream &operator << (std::ostream &o, payout_result::state s) {
        switch (s) {
            case payout_result::CREATED: return o << "created";
            case payout_result::BUILT: return o << "built";
            case payout_result::SIGNED: return o << "signed";
            case payout_result::BROADCAST: return o << "broadcast";
            case payout_result::RECORDED: return o << "recorded";
            default: return o << "invalid";
        }
    }

    std::ostream &operator << (std::ostream &o, payout_result::failure f) {
        switch (f) {
            case payout_result::NONE: return o << "none";
            case payout_result::INSUFFICIENT_BALANCE: return o << "insufficient balance";
            case payout_result::INSUFFICIENT_FUNDS: return o << "insufficient funds";
            case payout_result::NO_CHANGE_ADDRESS: return o << "no change address";
            case payout_result::NODE_ERROR: return o << "node error";
            case payout_result::SIGNING_FAILED: return o << "signing failed";
            case payout_result::BROADCAST_FAILED: return o << "broadcast failed";
            case payout_result::BROADCAST_UNCONFIRMED: return o << "broadcast unconfirmed";
            case payout_result::LEDGER_INCONSISTENCY: return o << "ledger inconsistency";
            case payout_result::PREVIOUS_PAYOUT: return o << "previous payout settled";
            default: return o << "invalid";
        }
    }

    std::ostream &operator << (std::ostream &o, const payout_result &r) {
        if (bool (r)) return o << "payout succeeded: " << *r.Record;
        if (r.Failure == payout_result::PREVIOUS_PAYOUT && bool (r.Record))
            return o << "nothing sent; earlier payout recorded: " << *r.Record;
        o << "payout failed after state " << r.Reached << ": " << r.Failure;
        if (r.Message != "") o << "; " << r.Message;
        if (bool (r.TXID)) o << "; txid " << write (*r.TXID);
        return o;
    }

    bool pool::reserved (const Bitcoin::outpoint &o) const {
        for (const auto &[_, tx] : Unconfirmed)
            for (const unspent_output &u : tx.Inputs) if (u.Outpoint == o) return true;
        return false;
    }

    ledger_inconsistency::ledger_inconsistency (const payout_result &r) :
        std::runtime_error {(std::stringstream {} << "transaction " << (bool (r.TXID) ? write (*r.TXID) : std::string {"(unknown)"}) <<
            " may have left the pool but the ledger was not updated. The ledger must be reconciled by hand. " << r).str ()},
        Result {r} {}

    namespace {

        enum class broadcast_outcome {
            sent,
            failed,
            unknown
        };

        // find out whether a transaction whose broadcast got no answer reached the network.
        broadcast_outcome settle (node &n, pending_transaction &tx, std::string &message) {
            list<unspent_output> unspent;
            try {
                unspent = n.list_unspent ();
            } catch (const node::error &x) {
                message = x.what ();
                return broadcast_outcome::unknown;
            }

            size_t remaining = 0;
            for (const unspent_output &in : tx.Inputs)
                for (const unspent_output &u : unspent) if (u.Outpoint == in.Outpoint) {
                    remaining++;
                    break;
                }

            if (remaining == 0) return broadcast_outcome::sent;

            if (remaining < data::size (tx.Inputs)) {
                message = "some but not all inputs of the transaction are spent";
                return broadcast_outcome::unknown;
            }

            // none of the inputs are spent so sending the same transaction again cannot pay twice.
            try {
                tx.TXID = n.send_raw_transaction (tx.Signed);
                return broadcast_outcome::sent;
            } catch (const node::command_failed &x) {
                message = x.what ();
                // already in the block chain.
                return x.Code == -27 ? broadcast_outcome::sent : broadcast_outcome::failed;
            } catch (const node::error &x) {
                message = x.what ();
                return broadcast_outcome::unknown;
            }
        }

        // check that the node built the transaction we asked for.
        bool matches (const decoded_transaction &decoded, const raw_transaction_request &request) {
            std::vector<Bitcoin::outpoint> expected_inputs;
            std::vector<Bitcoin::outpoint> decoded_inputs;
            for (const Bitcoin::outpoint &o : request.Inputs) expected_inputs.push_back (o);
            for (const Bitcoin::outpoint &o : decoded.Inputs) decoded_inputs.push_back (o);

            std::sort (expected_inputs.begin (), expected_inputs.end ());
            std::sort (decoded_inputs.begin (), decoded_inputs.end ());

            if (expected_inputs != decoded_inputs) return false;

            auto by_address = [] (const payee &a, const payee &b) {
                return a.Address < b.Address;
            };

            std::vector<payee> expected_outputs;
            std::vector<payee> decoded_outputs;
            for (const payee &p : request.Outputs) expected_outputs.push_back (p);
            for (const payee &p : decoded.Outputs) decoded_outputs.push_back (p);

            std::sort (expected_outputs.begin (), expected_outputs.end (), by_address);
            std::sort (decoded_outputs.begin (), decoded_outputs.end (), by_address);

            return expected_outputs == decoded_outputs;
        }

    }

    payout_result payout::record (const ledger::hold &h, const pending_transaction &tx) {
        try {
            return payout_result {Ledger.record_on_chain_send (h, tx.Amount, tx.Fee, tx.Destination, *tx.TXID)};
        } catch (const std::exception &x) {
            std::cout << "LEDGER INCONSISTENCY: transaction " << write (*tx.TXID) << " was broadcast for user " << tx.User <<
                " paying " << write_amount (tx.Amount) << " to " << tx.Destination << " with fee " << write_amount (tx.Fee) <<
                " but could not be recorded: " << x.what () << std::endl;
            return payout_result {payout_result::BROADCAST, payout_result::LEDGER_INCONSISTENCY, x.what (), tx.TXID};
        }
    }

    payout_result payout::operator () (user_id u, const std::string &destination,
        Bitcoin::satoshi amount, maybe<Bitcoin::satoshi> fee) {

        pending_transaction tx {u, destination, amount, bool (fee) ? *fee : Options.TransactionFee};

        if (int64 (tx.Amount) <= 0) throw exception {} << "payout amount must be positive";
        if (int64 (tx.Fee) < 0) throw exception {} << "fee cannot be negative";
        if (!bool (Directory.get_user (u))) throw exception {} << "unknown user " << u;

        // held until the send is recorded.
        ledger::hold h = Ledger.lock (u);

        {
            maybe<pending_transaction> earlier;
            broadcast_outcome outcome {broadcast_outcome::unknown};
            std::string message;

            {
                std::lock_guard<std::mutex> pool_lock (Pool.Mutex);
                auto e = Pool.Unconfirmed.find (u);
                if (e != Pool.Unconfirmed.end ()) {
                    outcome = settle (Pool.Node, e->second, message);
                    earlier = e->second;
                    if (outcome != broadcast_outcome::unknown) Pool.Unconfirmed.erase (e);
                }
            }

            if (bool (earlier)) switch (outcome) {
                case broadcast_outcome::unknown:
                    return payout_result {payout_result::CREATED, payout_result::BROADCAST_UNCONFIRMED,
                        (std::stringstream {} << "earlier payout " << write (*earlier->TXID) <<
                            " is still unconfirmed: " << message).str (), earlier->TXID};
                case broadcast_outcome::sent: {
                    std::cout << "earlier payout " << write (*earlier->TXID) << " of user " << u << " reached the network" << std::endl;
                    payout_result r = record (h, *earlier);
                    if (!bool (r)) return r;
                    r.Reached = payout_result::CREATED;
                    r.Failure = payout_result::PREVIOUS_PAYOUT;
                    return r;
                }
                default:
                    std::cout << "earlier payout " << write (*earlier->TXID) << " of user " << u <<
                        " was not broadcast: " << message << std::endl;
            }
        }

        Bitcoin::satoshi available = Ledger.balance (h);
        if (available < tx.Amount + tx.Fee)
            return payout_result {payout_result::CREATED, payout_result::INSUFFICIENT_BALANCE,
                insufficient_balance {u, available, tx.Amount + tx.Fee}.what ()};

        for (const std::string &address : Directory.addresses (u)) if (address != destination) {
            tx.ChangeAddress = address;
            break;
        }

        if (!bool (tx.ChangeAddress))
            return payout_result {payout_result::CREATED, payout_result::NO_CHANGE_ADDRESS,
                (std::stringstream {} << "user " << u << " has no address to receive change").str ()};

        {
            std::lock_guard<std::mutex> pool_lock (Pool.Mutex);

            try {
                list<unspent_output> unspent;
                for (const unspent_output &o : Pool.Node.list_unspent ()) if (!Pool.reserved (o.Outpoint)) unspent <<= o;

                selected selection = Select (unspent, tx.Amount + tx.Fee);
                tx.Inputs = selection.Selected;

                raw_transaction_request request = build {Pool.Node} (tx.Inputs, tx.Destination, tx.Amount, tx.Fee, *tx.ChangeAddress);
                tx.Change = request.Change;
                tx.Raw = request.Raw;

                if (!matches (Pool.Node.decode_raw_transaction (tx.Raw), request))
                    return payout_result {payout_result::CREATED, payout_result::NODE_ERROR,
                        "node created a transaction that does not match the request"};

            } catch (const insufficient_funds &x) {
                return payout_result {payout_result::CREATED, payout_result::INSUFFICIENT_FUNDS, x.what ()};
            } catch (const node::error &x) {
                return payout_result {payout_result::CREATED, payout_result::NODE_ERROR, x.what ()};
            }

            std::cout << "transaction design complete for user " << u << ": " << data::size (tx.Inputs) <<
                " inputs, paying " << write_amount (tx.Amount) << " to " << tx.Destination << " with fee " <<
                write_amount (tx.Fee) << " and change " << write_amount (tx.Change) << std::endl;

            try {
                tx.Signed = Pool.Node.sign_raw_transaction (tx.Raw);
            } catch (const node::error &x) {
                return payout_result {payout_result::BUILT, payout_result::SIGNING_FAILED, x.what ()};
            }

            // the txid must be known before the broadcast in case the node does not answer.
            try {
                tx.TXID = Pool.Node.decode_raw_transaction (tx.Signed).TXID;
            } catch (const node::error &x) {
                return payout_result {payout_result::SIGNED, payout_result::NODE_ERROR, x.what ()};
            }

            try {
                Bitcoin::TXID sent = Pool.Node.send_raw_transaction (tx.Signed);
                if (sent != *tx.TXID) std::cout << "node reports txid " << write (sent) <<
                    " for transaction " << write (*tx.TXID) << std::endl;
                tx.TXID = sent;
            } catch (const node::command_failed &x) {
                std::cout << "broadcast failed for user " << u << ": " << x.what () << std::endl;
                return payout_result {payout_result::SIGNED, payout_result::BROADCAST_FAILED, x.what ()};
            } catch (const node::error &x) {
                std::cout << "no answer to broadcast of transaction " << write (*tx.TXID) << ": " << x.what () << std::endl;

                std::string message;
                switch (settle (Pool.Node, tx, message)) {
                    case broadcast_outcome::failed:
                        std::cout << "broadcast failed for user " << u << ": " << message << std::endl;
                        return payout_result {payout_result::SIGNED, payout_result::BROADCAST_FAILED, message};
                    case broadcast_outcome::unknown:
                        Pool.Unconfirmed.insert_or_assign (u, tx);
                        std::cout << "BROADCAST UNCONFIRMED: transaction " << write (*tx.TXID) << " of user " << u <<
                            " paying " << write_amount (tx.Amount) << " to " << tx.Destination <<
                            " may have been broadcast: " << message << std::endl;
                        return payout_result {payout_result::SIGNED, payout_result::BROADCAST_UNCONFIRMED,
                            std::string {x.what ()} + "; " + message, tx.TXID};
                    default:
                        std::cout << "transaction " << write (*tx.TXID) << " reached the network" << std::endl;
                }
            }
        }

        return record (h, tx);
    }

}
