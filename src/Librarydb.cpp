#include "Librarydb.hpp"
#include "Book.hpp"
#include "Catalog.hpp"

#include "SQLiteCpp/Exception.h"
#include "SQLiteCpp/Statement.h"
#include "SQLiteCpp/Transaction.h"

#include <cstdint> // int64_t
#include <filesystem> // exists, is_regular_file, remove
#include <iostream> // cerr
#include <limits> // numeric_limits
#include <memory> // make_unique
#include <stdexcept> // invalid_argument
#include <string> // string, to_string
#include <system_error> // error_code
#include <utility> // move

void Librarydb::init() {
    if(db_path.empty()) {
        throw std::invalid_argument{"empty database filename"};
    }
}

SQLite::Database& Librarydb::connect() {
    if(not databs) {
        databs = std::make_unique<SQLite::Database>(db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
    }
    return *databs;
}

void Librarydb::makeSchema() {
    connect().exec(R"#(
             CREATE TABLE IF NOT EXISTS [books]
             (
                [position] INTEGER NOT NULL PRIMARY KEY,
                [book_id] VARCHAR(10) NOT NULL,
                [title] VARCHAR(100) NOT NULL UNIQUE,
                [author] VARCHAR(50) NOT NULL,
                [total_copies] INTEGER NOT NULL CHECK (total_copies >= 0),
                [borrowed_copies] INTEGER NOT NULL DEFAULT 0,
                CHECK (borrowed_copies BETWEEN 0 AND total_copies)
             )
             )#");
}

Catalog Librarydb::load() {
    std::error_code ec;
    bool present = std::filesystem::exists(db_path, ec);
    if(ec) {
        return unreadable(ec.message());
    }
    if(not present) {
        return writeDefaults();
    }
    if(not std::filesystem::is_regular_file(db_path, ec)) {
        return unreadable(ec ? ec.message() : "not a regular file");
    }

    try {
        connect();
    }
    catch(const SQLite::Exception& e) {
        return unreadable(e.what());
    }

    try {
        return read();
    }
    catch(const SQLite::Exception& e) {
        return heal(e.what());
    }
    catch(const CatalogFormatError& e) {
        return heal(e.what());
    }
}

Catalog Librarydb::read() {
    auto& db = connect();
    if(not db.tableExists("books")) {
        throw CatalogFormatError{"no books table"};
    }

    auto query = R"#(
        SELECT [book_id], [title], [author], [total_copies], [borrowed_copies]
            FROM [books]
        ORDER BY [position]
    )#";
    SQLite::Statement stmnt{db, query};

    BookStack books;
    while (stmnt.executeStep()) {
        books.push_back(extractBookInfo(stmnt));
    }
    return Catalog::fromRecords(std::move(books));
}

void Librarydb::save(const Catalog& catalog) {
    try {
        auto& db = connect();
        SQLite::Transaction trxn(db);
        makeSchema();
        db.exec("DELETE FROM [books]");

        auto query = R"#(
            INSERT INTO [books] (
                        [position], [book_id], [title], [author],
                        [total_copies], [borrowed_copies]
            )
            VALUES (?1, ?2, ?3, ?4, ?5, ?6)
        )#";
        SQLite::Statement stmnt(db, query);
        int position = 0;
        for(const auto& book : catalog.books()) {
            stmnt.bind(1, position++);
            stmnt.bind(2, book.book_id);
            stmnt.bind(3, book.title);
            stmnt.bind(4, book.author);
            stmnt.bind(5, book.total_copies);
            stmnt.bind(6, book.borrowed_copies);
            stmnt.exec();
            stmnt.reset();
        }
        trxn.commit();
    }
    catch(const SQLite::Exception& e) {
        // uncommitted transaction rolls back on scope exit
        throw StorageError{"could not save catalog to " + db_path + ": " + e.what()};
    }
}

Catalog Librarydb::reset() {
    auto catalog = Catalog::defaults();
    save(catalog);
    return catalog;
}

Catalog Librarydb::heal(const std::string& reason) {
    std::cerr<<"[WARNING] Data file "<<db_path<<" is corrupted <"<<reason<<">. Resetting to defaults."<<std::endl;

    databs.reset();
    std::error_code ec;
    std::filesystem::remove(db_path, ec);
    if(ec) {
        std::cerr<<"[WARNING] Could not remove "<<db_path<<" <"<<ec.message()<<">"<<std::endl;
    }
    return writeDefaults();
}

// Unreadable, not corrupted: leave whatever is at the path alone
Catalog Librarydb::unreadable(const std::string& reason) {
    std::cerr<<"[WARNING] Could not read data file "<<db_path<<" <"<<reason<<">. Using default catalog."<<std::endl;
    return Catalog::defaults();
}

Catalog Librarydb::writeDefaults() {
    auto catalog = Catalog::defaults();
    try {
        save(catalog);
    }
    catch(const StorageError& e) {
        std::cerr<<"[WARNING] Failed to write default data. <"<<e.what()<<">"<<std::endl;
    }
    return catalog;
}

namespace {

int copyCount(std::int64_t value) {
    if(value < 0 || value > std::numeric_limits<int>::max()) {
        throw CatalogFormatError{"copy count out of range: " + std::to_string(value)};
    }
    return static_cast<int>(value);
}

}

Book Librarydb::extractBookInfo(const SQLite::Statement& stmnt) {
    auto title = stmnt.getColumn(1);
    auto total = stmnt.getColumn(3);
    auto borrowed = stmnt.getColumn(4);
    if(not title.isText() || not total.isInteger() || not borrowed.isInteger()) {
        throw CatalogFormatError{"malformed book row"};
    }

    Book bok;
    bok.book_id = stmnt.getColumn(0).isNull() ? "" : stmnt.getColumn(0).getString();
    bok.title = title.getString();
    bok.author = stmnt.getColumn(2).isNull() ? "" : stmnt.getColumn(2).getString();
    bok.total_copies = copyCount(total.getInt64());
    bok.borrowed_copies = copyCount(borrowed.getInt64());

    return bok;
}
