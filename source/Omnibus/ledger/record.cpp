#include <Omnibus/ledger/record.hpp>

namespace Omnibus {

    ledger_record ledger_record::internal_transfer (user_id from, user_id to, Bitcoin::satoshi amount) {
        ledger_record r;
        r.User = from;
        r.Type = record_type::internal_transfer;
        r.Amount = amount;
        r.Counterparty = to;
        r.Created = Bitcoin::timestamp::now ();
        return r;
    }

    ledger_record ledger_record::on_chain_send (user_id u, Bitcoin::satoshi amount, Bitcoin::satoshi fee,
        const std::string &destination, const Bitcoin::TXID &txid) {
        ledger_record r;
        r.User = u;
        r.Type = record_type::on_chain_send;
        r.Amount = amount;
        r.Fee = fee;
        r.Address = destination;
        r.TXID = txid;
        r.Created = Bitcoin::timestamp::now ();
        return r;
    }

    ledger_record ledger_record::on_chain_receive (user_id u, Bitcoin::satoshi amount,
        const std::string &address, const Bitcoin::TXID &txid) {
        ledger_record r;
        r.User = u;
        r.Type = record_type::on_chain_receive;
        r.Amount = amount;
        r.Address = address;
        r.TXID = txid;
        r.Created = Bitcoin::timestamp::now ();
        return r;
    }

    bool ledger_record::valid () const {
        if (int64 (Amount) <= 0 || int64 (Fee) < 0) return false;
        switch (Type) {
            case record_type::internal_transfer:
                return bool (Counterparty) && *Counterparty != User && int64 (Fee) == 0;
            case record_type::on_chain_send:
                return bool (Address) && bool (TXID);
            case record_type::on_chain_receive:
                return bool (Address) && bool (TXID) && int64 (Fee) == 0;
            default: return false;
        }
    }

    bool ledger_record::operator == (const ledger_record &r) const {
        return ID == r.ID && User == r.User && Type == r.Type && Amount == r.Amount && Fee == r.Fee &&
            Counterparty == r.Counterparty && Address == r.Address && TXID == r.TXID &&
            uint32 (Created) == uint32 (r.Created);
    }

    ledger_record::operator JSON () const {
        JSON::object_t j;
        j["id"] = ID;
        j["user"] = User;
        std::stringstream type;
        type << Type;
        j["type"] = type.str ();
        j["amount"] = write_amount (Amount);
        if (Type == record_type::on_chain_send) j["fee"] = write_amount (Fee);
        if (bool (Counterparty)) j["counterparty"] = *Counterparty;
        if (bool (Address)) j["address"] = *Address;
        if (bool (TXID)) j["txid"] = write (*TXID);
        j["created"] = uint32 (Created);
        return j;
    }

    std::ostream &operator << (std::ostream &o, record_type t) {
        switch (t) {
            case record_type::internal_transfer: return o << "internal_transfer";
            case record_type::on_chain_send: return o << "on_chain_send";
            case record_type::on_chain_receive: return o << "on_chain_receive";
            default: return o << "invalid";
        }
    }

    std::ostream &operator << (std::ostream &o, const ledger_record &r) {
        return o << JSON (r).dump ();
    }
}
