#include "options.hpp"
#include "method.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

using namespace data;

namespace {
    template <typename N>
    maybe<N> read_env_number (const char *name) {
        const char *val = std::getenv (name);
        if (!bool (val)) return {};

        N n;
        auto [_, ec] = std::from_chars (val, val + std::strlen (val), n);
        if (ec != std::errc ()) throw data::exception {} << "could not parse " << name << " = " << val;
        return n;
    }

    maybe<std::string> read_env_string (const char *name) {
        const char *val = std::getenv (name);
        if (!bool (val)) return {};
        return std::string {val};
    }

    bool read_bool (const std::string &name, const std::string &x) {
        std::string sanitized = sanitize (x);
        if (sanitized == "true" || sanitized == "1" || sanitized == "yes") return true;
        if (sanitized == "false" || sanitized == "0" || sanitized == "no") return false;
        throw data::exception {} << "could not read " << name << " = " << x << " as a boolean";
    }
}

maybe<filepath> options::env () const {
    maybe<filepath> env_path;
    this->get ("env", env_path);
    return env_path;
}

maybe<filepath> options::sqlite_path () const {
    maybe<filepath> path;

    bool param_in_memory = this->has ("sqlite_in_memory");

    this->get ("sqlite_path", path);
    if (!bool (path) && !param_in_memory) {
        const char *val = std::getenv ("OMNIBUS_SQLITE_PATH");
        if (bool (val)) path = filepath {val};
    }

    if (param_in_memory && bool (path))
        throw data::exception {} << "SQLite database set as in-memory but a path was also set.";

    if (!bool (path) && !param_in_memory)
        std::cout << "warning: SQLite database is in-memory. All information will be erased on program exit." << std::endl;

    return path;
}

Omnibus::JSON_RPC::options options::rpc () const {
    Omnibus::JSON_RPC::options rpc {};

    maybe<std::string> host;
    this->get ("rpc_host", host);
    if (!bool (host)) host = read_env_string ("OMNIBUS_RPC_HOST");
    if (bool (host)) rpc.Host = *host;

    maybe<uint16> port;
    this->get ("rpc_port", port);
    if (!bool (port)) port = read_env_number<uint16> ("OMNIBUS_RPC_PORT");
    if (bool (port)) rpc.Port = *port;

    this->get ("rpc_user", rpc.User);
    if (!bool (rpc.User)) rpc.User = read_env_string ("OMNIBUS_RPC_USER");

    this->get ("rpc_password", rpc.Password);
    if (!bool (rpc.Password)) rpc.Password = read_env_string ("OMNIBUS_RPC_PASSWORD");

    maybe<std::string> sign_method;
    this->get ("sign_method", sign_method);
    if (!bool (sign_method)) sign_method = read_env_string ("OMNIBUS_SIGN_METHOD");
    if (bool (sign_method)) rpc.SignMethod = *sign_method;

    return rpc;
}

Omnibus::payout_options options::payout_options () const {
    Omnibus::payout_options po {};

    maybe<std::string> fee;
    this->get ("fee", fee);
    if (!bool (fee)) fee = read_env_string ("OMNIBUS_TRANSACTION_FEE");
    if (bool (fee)) {
        po.TransactionFee = Omnibus::read_amount (std::string_view {*fee});
        if (data::int64 (po.TransactionFee) < 0) throw data::exception {} << "transaction fee cannot be negative";
    }

    maybe<std::string> auto_create;
    this->get ("auto_create_address", auto_create);
    if (!bool (auto_create)) auto_create = read_env_string ("OMNIBUS_AUTO_CREATE_ADDRESS");
    if (bool (auto_create)) po.AutoCreateAddress = read_bool ("auto_create_address", *auto_create);

    maybe<uint32> min_confirmations;
    this->get ("min_confirmations", min_confirmations);
    if (!bool (min_confirmations)) min_confirmations = read_env_number<uint32> ("OMNIBUS_MIN_CONFIRMATIONS");
    if (bool (min_confirmations)) po.MinConfirmations = *min_confirmations;

    return po;
}
