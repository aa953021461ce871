#include <Omnibus/node/JSON_RPC.hpp>
#include "mock_node.hpp"
#include "gtest/gtest.h"

namespace Omnibus {

    std::string TestTXID = "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

    TEST (Node, ReadUnspent) {
        unspent_output u {JSON::parse (R"({
            "txid": ")" + TestTXID + R"(",
            "vout": 2,
            "address": "mxYZ",
            "amount": 0.0999,
            "confirmations": 12,
            "spendable": true
        })")};

        EXPECT_EQ (u.Outpoint, (Bitcoin::outpoint {read_TXID (string_view {TestTXID}), 2}));
        EXPECT_EQ (u.Amount, coins ("0.0999"));
        EXPECT_TRUE (u.Spendable);
        EXPECT_EQ (u.Address, maybe<std::string> {"mxYZ"});
        EXPECT_EQ (u.Confirmations, 12);

        unspent_output v {JSON::parse (R"({"txid": ")" + TestTXID + R"(", "vout": 0, "amount": 1, "spendable": false})")};
        EXPECT_FALSE (v.Spendable);
        EXPECT_FALSE (bool (v.Address));

        // missing spendable means spendable.
        unspent_output w {JSON::parse (R"({"txid": ")" + TestTXID + R"(", "vout": 0, "amount": 1})")};
        EXPECT_TRUE (w.Spendable);

        EXPECT_THROW (unspent_output {JSON::parse (R"({"txid": "xx", "vout": 0, "amount": 1})")}, exception);
        EXPECT_THROW (unspent_output {JSON::parse (R"({"txid": ")" + TestTXID + R"(", "vout": 0, "amount": 0.000000001})")}, exception);
        EXPECT_THROW (unspent_output {JSON::parse ("[]")}, exception);
    }

    TEST (Node, ReadDecodedTransaction) {
        decoded_transaction d {JSON::parse (R"({
            "txid": ")" + TestTXID + R"(",
            "vin": [{"txid": ")" + TestTXID + R"(", "vout": 1}],
            "vout": [
                {"value": 0.5, "n": 0, "scriptPubKey": {"addresses": ["addrX"]}},
                {"value": 0.0999, "n": 1, "scriptPubKey": {"address": "change"}}
            ]
        })")};

        EXPECT_EQ (d.TXID, read_TXID (string_view {TestTXID}));
        EXPECT_EQ (d.Inputs, (list<Bitcoin::outpoint> {Bitcoin::outpoint {read_TXID (string_view {TestTXID}), 1}}));
        EXPECT_EQ (d.Outputs, (list<payee> {payee {"addrX", coins ("0.5")}, payee {"change", coins ("0.0999")}}));

        // outputs that do not pay an address cannot be checked.
        EXPECT_THROW (decoded_transaction {JSON::parse (R"({
            "txid": ")" + TestTXID + R"(",
            "vin": [],
            "vout": [{"value": 0, "n": 0, "scriptPubKey": {"type": "nulldata"}}]
        })")}, exception);
    }

    TEST (Node, ReadWalletTransaction) {
        wallet_transaction t {JSON::parse (R"({
            "address": "addrA",
            "category": "receive",
            "amount": 1.25,
            "confirmations": 3,
            "txid": ")" + TestTXID + R"(",
            "vout": 1
        })")};

        EXPECT_EQ (t.Address, maybe<std::string> {"addrA"});
        EXPECT_EQ (t.Category, "receive");
        EXPECT_EQ (t.Amount, coins ("1.25"));
        EXPECT_EQ (t.Confirmations, 3);
        EXPECT_EQ (t.Vout, 1);

        // conflicted.
        wallet_transaction c {JSON::parse (R"({"category": "send", "amount": -1, "confirmations": -2, "txid": ")" + TestTXID + R"("})")};
        EXPECT_EQ (c.Confirmations, 0);
        EXPECT_EQ (c.Amount, Bitcoin::satoshi {0} - coins ("1"));
    }

    TEST (Node, UnspentJSON) {
        unspent_output u {Bitcoin::outpoint {read_TXID (string_view {TestTXID}), 3}, coins ("0.6"), true, std::string {"a"}, 2};
        unspent_output v {JSON (u)};
        EXPECT_EQ (u, v);
        EXPECT_EQ (v.Address, u.Address);
        EXPECT_EQ (v.Confirmations, u.Confirmations);
    }

    TEST (Node, ReadReply) {
        EXPECT_EQ (JSON_RPC::read_reply ("getnewaddress", net::HTTP::status::ok,
            R"({"result": "addrA", "error": null, "id": 1})"), JSON ("addrA"));

        // the node reports a failed command with an error status and an error object.
        try {
            JSON_RPC::read_reply ("sendrawtransaction", net::HTTP::status::internal_server_error,
                R"({"result": null, "error": {"code": -26, "message": "dust"}, "id": 2})");
            FAIL () << "expected command_failed";
        } catch (const node::command_failed &x) {
            EXPECT_EQ (x.Method, "sendrawtransaction");
            EXPECT_EQ (x.Code, -26);
            EXPECT_NE (std::string {x.what ()}.find ("dust"), std::string::npos);
        }

        // any other bad status is a connection problem.
        EXPECT_THROW (JSON_RPC::read_reply ("listunspent", net::HTTP::status::unauthorized, R"({"result": null, "error": null})"),
            node::connection_failed);
        EXPECT_THROW (JSON_RPC::read_reply ("listunspent", net::HTTP::status::unauthorized, ""), node::connection_failed);

        EXPECT_THROW (JSON_RPC::read_reply ("listunspent", net::HTTP::status::ok, "<html>"), node::connection_failed);
        EXPECT_THROW (JSON_RPC::read_reply ("listunspent", net::HTTP::status::ok, "[]"), node::connection_failed);
        EXPECT_THROW (JSON_RPC::read_reply ("listunspent", net::HTTP::status::ok, R"({"error": null})"), node::connection_failed);
    }

    TEST (Node, ReadSigned) {
        EXPECT_EQ (JSON_RPC::read_signed ("signrawtransactionwithwallet", JSON::parse (R"({"hex": "0102ff", "complete": true})")),
            *encoding::hex::read ("0102ff"));

        try {
            JSON_RPC::read_signed ("signrawtransactionwithwallet", JSON::parse (R"({
                "hex": "0102",
                "complete": false,
                "errors": [{"error": "Input not found or already spent"}]
            })"));
            FAIL () << "expected command_failed";
        } catch (const node::command_failed &x) {
            EXPECT_EQ (x.Method, "signrawtransactionwithwallet");
            EXPECT_NE (std::string {x.what ()}.find ("already spent"), std::string::npos);
        }

        EXPECT_THROW (JSON_RPC::read_signed ("signrawtransaction", JSON::parse (R"({"hex": "0102"})")), node::command_failed);
        EXPECT_THROW (JSON_RPC::read_signed ("signrawtransaction", JSON::parse (R"({"complete": true})")), node::connection_failed);
        EXPECT_THROW (JSON_RPC::read_signed ("signrawtransaction", JSON::parse (R"({"hex": "xyz", "complete": true})")),
            node::connection_failed);
    }

    TEST (Node, RPCCredentials) {
        JSON_RPC::options o {};
        o.User = "user";
        EXPECT_THROW (JSON_RPC {o}, exception);
    }

}
