#ifndef OMNIBUS_DATABASE_SQLITE
#define OMNIBUS_DATABASE_SQLITE

#include <Omnibus/database.hpp>

namespace Omnibus::SQLite {

    // open the database at the given path, creating it if
    // necessary. With no path the database is in memory.
    ptr<database> load (const maybe<filepath> &);

}

#endif
