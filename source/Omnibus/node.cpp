#include <Omnibus/node.hpp>

namespace Omnibus {

    node::command_failed::command_failed (const std::string &method, int code, const std::string &message) :
        error {(std::stringstream {} << "node command " << method << " failed with code " << code << ": " << message).str ()},
        Method {method}, Code {code} {}

    unspent_output::unspent_output (const JSON &j) : unspent_output {} {
        if (!j.is_object ()) throw exception {} << "expected unspent output but found " << j.dump ();

        Outpoint = Bitcoin::outpoint {read_TXID (j.at ("txid")), uint32 (j.at ("vout"))};
        Amount = read_amount (j.at ("amount"));

        // older nodes do not say whether an output is spendable.
        Spendable = j.contains ("spendable") ? bool (j["spendable"]) : true;

        if (j.contains ("address") && j["address"].is_string ()) Address = std::string (j["address"]);
        if (j.contains ("confirmations")) Confirmations = uint32 (j["confirmations"]);
    }

    unspent_output::operator JSON () const {
        JSON::object_t j;
        j["txid"] = write (Outpoint.Digest);
        j["vout"] = Outpoint.Index;
        j["amount"] = write_amount (Amount);
        j["spendable"] = Spendable;
        if (bool (Address)) j["address"] = *Address;
        j["confirmations"] = Confirmations;
        return j;
    }

    std::ostream &operator << (std::ostream &o, const unspent_output &u) {
        return o << "unspent_output {" << write (u.Outpoint) << ", " << write_amount (u.Amount) <<
            (u.Spendable ? "" : ", unspendable") << "}";
    }

    namespace {
        // newer nodes give a single address, older ones an array.
        maybe<std::string> read_script_address (const JSON &script) {
            if (script.contains ("address") && script["address"].is_string ()) return std::string (script["address"]);
            if (script.contains ("addresses") && script["addresses"].is_array () && script["addresses"].size () == 1)
                return std::string (script["addresses"][0]);
            return {};
        }
    }

    decoded_transaction::decoded_transaction (const JSON &j) : decoded_transaction {} {
        if (!j.is_object ()) throw exception {} << "expected decoded transaction but found " << j.dump ();

        TXID = read_TXID (j.at ("txid"));

        for (const JSON &in : j.at ("vin"))
            Inputs <<= Bitcoin::outpoint {read_TXID (in.at ("txid")), uint32 (in.at ("vout"))};

        for (const JSON &out : j.at ("vout")) {
            maybe<std::string> address = read_script_address (out.at ("scriptPubKey"));
            if (!bool (address)) throw exception {} << "could not read address of output " << out.dump ();
            Outputs <<= payee {*address, read_amount (out.at ("value"))};
        }
    }

    wallet_transaction::wallet_transaction (const JSON &j) : wallet_transaction {} {
        if (!j.is_object ()) throw exception {} << "expected wallet transaction but found " << j.dump ();

        TXID = read_TXID (j.at ("txid"));
        Category = std::string (j.at ("category"));
        Amount = read_amount (j.at ("amount"));
        if (j.contains ("address") && j["address"].is_string ()) Address = std::string (j["address"]);
        if (j.contains ("confirmations")) {
            // conflicted transactions have negative confirmations.
            int64 confirmations = int64 (j["confirmations"]);
            Confirmations = confirmations < 0 ? 0 : uint32 (confirmations);
        }
        if (j.contains ("vout")) Vout = uint32 (j["vout"]);
    }

}
