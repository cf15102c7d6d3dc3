#pragma once

#include "Book.hpp"
#include "Catalog.hpp"

#include "SQLiteCpp/Database.h"
#include "SQLiteCpp/Statement.h"

#include <memory> // unique_ptr
#include <stdexcept> // runtime_error
#include <string> // string

// The catalog could not be written to the database file
class StorageError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

class Librarydb{
    public:
        Librarydb(const std::string& dbfile) : db_path(dbfile) { init(); }

        // Never fails: a missing or corrupted file yields the default catalog,
        // which is written back in its place.
        Catalog load();
        // Strict decode. Throws SQLite::Exception or CatalogFormatError.
        Catalog read();
        // Throws StorageError
        void save(const Catalog& catalog);
        Catalog reset();

    private:
        void init();
        SQLite::Database& connect();
        void makeSchema();
        Catalog heal(const std::string& reason);
        Catalog unreadable(const std::string& reason);
        Catalog writeDefaults();
        Book extractBookInfo(const SQLite::Statement& stmnt);

        std::string db_path;
        std::unique_ptr<SQLite::Database> databs;
};
