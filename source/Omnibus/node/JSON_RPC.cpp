#include <Omnibus/node/JSON_RPC.hpp>
#include <data/encoding/base64.hpp>
#include <data/async.hpp>

namespace Omnibus {

    namespace {
        std::string authority (const JSON_RPC::options &o) {
            std::stringstream ss;
            ss << o.Host << ":" << o.Port;
            return ss.str ();
        }

        bytes read_hex (const JSON &j, const std::string &method) {
            if (!j.is_string ()) throw node::connection_failed {"expected hex string from " + method + " but found " + j.dump ()};
            maybe<bytes> b = encoding::hex::read (std::string (j));
            if (!bool (b)) throw node::connection_failed {"invalid hex string returned by " + method};
            return *b;
        }
    }

    JSON_RPC::JSON_RPC (const options &o) :
        net::HTTP::client_blocking {net::HTTP::REST {"http", authority (o)}, tools::rate_limiter {100, 1}}, Options {o} {
        if (bool (Options.User) != bool (Options.Password))
            throw exception {} << "node user and password must be provided together";

        if (bool (Options.User)) {
            std::string credentials = *Options.User + ":" + *Options.Password;
            bytes b (credentials.size ());
            std::copy (credentials.begin (), credentials.end (), b.begin ());
            Authorization = std::string {"Basic "} + encoding::base64::write (b);
        }
    }

    awaitable<net::HTTP::response> JSON_RPC::post (const JSON &body) {
        auto make = net::HTTP::request::make {}.method (net::HTTP::method::post).path ("/").body (body);
        if (bool (Authorization)) make = make.add_header ("Authorization", *Authorization);
        co_return co_await (*this) (REST (make));
    }

    JSON JSON_RPC::operator () (const std::string &method, JSON params) {
        JSON body {
            {"jsonrpc", "1.0"},
            {"id", ++Nonce},
            {"method", method},
            {"params", params}};

        auto response = [&] () -> net::HTTP::response {
            try {
                return synced (&JSON_RPC::post, this, body);
            } catch (const std::exception &x) {
                throw connection_failed {std::string {"could not reach node for method "} + method + ": " + x.what ()};
            }
        } ();

        return read_reply (method, response.Status, response.Body);
    }

    JSON JSON_RPC::read_reply (const std::string &method, net::HTTP::status status, const std::string &body) {
        // the node returns an error status along with a JSON body when a command fails.
        JSON reply;
        try {
            reply = JSON::parse (body);
        } catch (const JSON::exception &x) {
            std::stringstream ss;
            ss << "could not read reply to " << method << "; status = " << status << "; " << x.what ();
            throw connection_failed {ss.str ()};
        }

        if (!reply.is_object ()) throw connection_failed {"unexpected reply to " + method + ": " + reply.dump ()};

        if (reply.contains ("error") && !reply["error"].is_null ()) {
            const JSON &err = reply["error"];
            int code = err.contains ("code") && err["code"].is_number () ? int (err["code"]) : 0;
            std::string message = err.contains ("message") && err["message"].is_string () ?
                std::string (err["message"]) : err.dump ();
            throw command_failed {method, code, message};
        }

        if (status != net::HTTP::status::ok) {
            std::stringstream ss;
            ss << "method " << method << " returned status " << status;
            throw connection_failed {ss.str ()};
        }

        if (!reply.contains ("result")) throw connection_failed {"no result in reply to " + method};

        return reply["result"];
    }

    list<unspent_output> JSON_RPC::list_unspent () {
        JSON result = (*this) ("listunspent");
        if (!result.is_array ()) throw connection_failed {"expected array from listunspent"};

        list<unspent_output> unspent;
        try {
            for (const JSON &j : result) unspent <<= unspent_output {j};
        } catch (const std::exception &x) {
            throw connection_failed {std::string {"could not read listunspent: "} + x.what ()};
        }

        return unspent;
    }

    bytes JSON_RPC::create_raw_transaction (list<Bitcoin::outpoint> inputs, list<payee> outputs) {
        JSON::array_t in;
        for (const Bitcoin::outpoint &o : inputs) in.push_back (JSON {{"txid", write (o.Digest)}, {"vout", o.Index}});

        // the builder never pays the same address twice so the object form is enough.
        JSON::object_t out;
        for (const payee &p : outputs) {
            if (out.find (p.Address) != out.end ()) throw exception {} << "address " << p.Address << " paid twice";
            out[p.Address] = write_amount (p.Amount);
        }

        return read_hex ((*this) ("createrawtransaction", JSON::array ({in, out})), "createrawtransaction");
    }

    decoded_transaction JSON_RPC::decode_raw_transaction (const bytes &raw) {
        JSON result = (*this) ("decoderawtransaction", JSON::array ({encoding::hex::write (raw)}));
        try {
            return decoded_transaction {result};
        } catch (const std::exception &x) {
            throw connection_failed {std::string {"could not read decoded transaction: "} + x.what ()};
        }
    }

    bytes JSON_RPC::read_signed (const std::string &method, const JSON &result) {
        if (!result.is_object () || !result.contains ("hex"))
            throw connection_failed {"unexpected reply to " + method + ": " + result.dump ()};

        // a transaction that is only partly signed is no use to us.
        if (!result.contains ("complete") || !result["complete"].is_boolean () || !bool (result["complete"])) {
            std::string message = "signatures incomplete";
            if (result.contains ("errors")) message += ": " + result["errors"].dump ();
            throw command_failed {method, 0, message};
        }

        return read_hex (result["hex"], method);
    }

    bytes JSON_RPC::sign_raw_transaction (const bytes &raw) {
        return read_signed (Options.SignMethod, (*this) (Options.SignMethod, JSON::array ({encoding::hex::write (raw)})));
    }

    Bitcoin::TXID JSON_RPC::send_raw_transaction (const bytes &signed_tx) {
        std::cout << "broadcasting transaction " << encoding::hex::write (signed_tx) << std::endl;
        JSON result = (*this) ("sendrawtransaction", JSON::array ({encoding::hex::write (signed_tx)}));
        try {
            return read_TXID (result);
        } catch (const std::exception &x) {
            throw connection_failed {std::string {"could not read txid from sendrawtransaction: "} + x.what ()};
        }
    }

    std::string JSON_RPC::get_new_address () {
        JSON result = (*this) ("getnewaddress");
        if (!result.is_string ()) throw connection_failed {"expected string from getnewaddress but found " + result.dump ()};
        return std::string (result);
    }

    list<wallet_transaction> JSON_RPC::list_transactions (uint32 count, uint32 skip) {
        JSON result = (*this) ("listtransactions", JSON::array ({"*", count, skip}));
        if (!result.is_array ()) throw connection_failed {"expected array from listtransactions"};

        list<wallet_transaction> txs;
        try {
            for (const JSON &j : result) txs <<= wallet_transaction {j};
        } catch (const std::exception &x) {
            throw connection_failed {std::string {"could not read listtransactions: "} + x.what ()};
        }

        return txs;
    }

}
