#pragma once

#include "Book.hpp"

#include <cstddef> // size_t
#include <stdexcept> // runtime_error
#include <string> // string
#include <utility> // move

enum class CatalogErrc {
    NOT_FOUND,
    NO_COPIES_AVAILABLE,
    NOTHING_TO_RETURN
};

// Rejected borrow/return. The catalog is left untouched.
class CatalogError : public std::runtime_error {
    public:
        CatalogError(CatalogErrc code, const std::string& title);
        CatalogErrc code() const { return errc; }
        const std::string& title() const { return book_title; }
    private:
        CatalogErrc errc;
        std::string book_title;
};

// Stored records that can't form a valid catalog
class CatalogFormatError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

class Catalog {
    public:
        // Validates the records: non-empty, unique non-empty titles,
        // 0 <= borrowed_copies <= total_copies.
        static Catalog fromRecords(BookStack records);
        static Catalog defaults();

        BookCounts listAvailable() const;
        BookCounts listBorrowed() const;

        const Book& borrow(const std::string& title);
        const Book& returnBook(const std::string& title);

        const Book* find(const std::string& title) const;

        const BookStack& books() const { return records; }
        std::size_t size() const { return records.size(); }
        bool empty() const { return records.empty(); }

        bool operator==(const Catalog&) const = default;

    private:
        explicit Catalog(BookStack books) : records(std::move(books)) {}
        Book& get(const std::string& title);
        BookStack records;
};
