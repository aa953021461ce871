#include <Omnibus/wallet/receive.hpp>

namespace Omnibus {

    list<ledger_record> credit_receipts (ledger &l, directory &d, node &n, uint32 min_confirmations, uint32 batch_size) {
        if (batch_size == 0) throw exception {} << "batch size must be positive";

        // a transaction can pay the same address in more than one output.
        std::map<std::pair<Bitcoin::TXID, std::string>, Bitcoin::satoshi> received;
        std::map<std::pair<Bitcoin::TXID, std::string>, user_id> owners;

        uint32 skip = 0;
        while (true) {
            list<wallet_transaction> txs = n.list_transactions (batch_size, skip);

            for (const wallet_transaction &tx : txs) {
                if (tx.Category != "receive" || tx.Confirmations < min_confirmations || !bool (tx.Address)) continue;

                maybe<user_id> owner = d.owner (*tx.Address);
                if (!bool (owner)) continue;

                auto key = std::make_pair (tx.TXID, *tx.Address);
                auto v = received.find (key);
                if (v == received.end ()) {
                    received[key] = tx.Amount;
                    owners[key] = *owner;
                } else v->second += tx.Amount;
            }

            if (data::size (txs) < batch_size) break;
            skip += batch_size;
        }

        list<ledger_record> credited;
        for (const auto &[key, amount] : received) {
            const auto &[txid, address] = key;
            user_id u = owners[key];

            // keep another sync from crediting the same payment.
            ledger::hold h = l.lock (u);

            bool recorded = false;
            for (const ledger_record &r : l.history (u)) {
                if (!bool (r.TXID) || *r.TXID != txid || r.User != u) continue;

                if (r.Type == record_type::on_chain_receive && *r.Address == address) recorded = true;

                // change from the user's own payout is not a receipt. A payout
                // to one of the user's own addresses is.
                if (r.Type == record_type::on_chain_send && *r.Address != address) recorded = true;

                if (recorded) break;
            }

            if (recorded || int64 (amount) <= 0) continue;

            ledger_record r = l.record_on_chain_receive (u, amount, address, txid);
            std::cout << "credited " << write_amount (amount) << " to user " << u << " from transaction " << write (txid) << std::endl;
            credited <<= r;
        }

        return credited;
    }

}
