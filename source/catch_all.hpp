#ifndef OMNIBUS_CATCH_ALL
#define OMNIBUS_CATCH_ALL

#include <Omnibus/wallet/payout.hpp>
#include "method.hpp"

// run a command and turn whatever it throws into an error with an exit code.
template <typename fun, typename ...args>
requires std::regular_invocable<fun, args...>
error catch_all (fun f, args... a) {
    try {
        std::invoke (std::forward<fun> (f), std::forward<args> (a)...);
    } catch (const Omnibus::ledger_inconsistency &x) {
        return error {8, x.what ()};
    } catch (const Omnibus::node::error &x) {
        return error {7, x.what ()};
    } catch (const Omnibus::insufficient_balance &x) {
        return error {6, x.what ()};
    } catch (const data::JSON::exception &x) {
        return error {5, x.what ()};
    } catch (const std::logic_error &x) {
        return error {4, x.what ()};
    } catch (const data::exception &x) {
        return error {3, x.what ()};
    } catch (const std::exception &x) {
        return error {2, x.what ()};
    } catch (...) {
        return error {1};
    }

    return error {};
}

#endif
