#include "Catalog.hpp"
#include "Book.hpp"

#include <algorithm> // find_if
#include <set> // set
#include <string> // string, to_string
#include <utility> // move

namespace {

std::string describe(CatalogErrc code, const std::string& title) {
    switch (code) {
        case CatalogErrc::NOT_FOUND:
            return "Book not found: \"" + title + "\"";
        case CatalogErrc::NO_COPIES_AVAILABLE:
            return "No copies left to borrow: \"" + title + "\"";
        case CatalogErrc::NOTHING_TO_RETURN:
            return "All copies are already in the library: \"" + title + "\"";
    }
    return "Catalog error: \"" + title + "\"";
}

}

CatalogError::CatalogError(CatalogErrc code, const std::string& title)
    : std::runtime_error(describe(code, title)), errc(code), book_title(title) {}

Catalog Catalog::fromRecords(BookStack records) {
    if (records.empty()) {
        throw CatalogFormatError{"catalog has no books"};
    }

    std::set<std::string> titles;
    for (const auto& book : records) {
        if (book.title.empty()) {
            throw CatalogFormatError{"book " + book.book_id + " has an empty title"};
        }
        if (not titles.insert(book.title).second) {
            throw CatalogFormatError{"duplicate title \"" + book.title + "\""};
        }
        if (book.total_copies < 0 || book.borrowed_copies < 0
                || book.borrowed_copies > book.total_copies) {
            throw CatalogFormatError{"bad copy counts for \"" + book.title + "\": "
                + std::to_string(book.borrowed_copies) + " of "
                + std::to_string(book.total_copies) + " borrowed"};
        }
    }

    return Catalog{std::move(records)};
}

Catalog Catalog::defaults() {
    return Catalog{BookStack{
        {"B001", "1984", "George Orwell", 3, 0},
        {"B002", "Pride and Prejudice", "Jane Austen", 2, 0},
        {"B003", "To Kill a Mockingbird", "Harper Lee", 4, 0},
        {"B004", "The Great Gatsby", "F. Scott Fitzgerald", 2, 0},
        {"B005", "The Hobbit", "J. R. R. Tolkien", 2, 0}
    }};
}

BookCounts Catalog::listAvailable() const {
    BookCounts out;
    for (const auto& book : records) {
        if (book.available() > 0)
            out.push_back({book.title, book.available()});
    }
    return out;
}

BookCounts Catalog::listBorrowed() const {
    BookCounts out;
    for (const auto& book : records) {
        if (book.borrowed_copies > 0)
            out.push_back({book.title, book.borrowed_copies});
    }
    return out;
}

const Book& Catalog::borrow(const std::string& title) {
    Book& book = get(title);
    if (book.available() <= 0) {
        throw CatalogError{CatalogErrc::NO_COPIES_AVAILABLE, title};
    }
    ++book.borrowed_copies;
    return book;
}

const Book& Catalog::returnBook(const std::string& title) {
    Book& book = get(title);
    if (book.borrowed_copies <= 0) {
        throw CatalogError{CatalogErrc::NOTHING_TO_RETURN, title};
    }
    --book.borrowed_copies;
    return book;
}

const Book* Catalog::find(const std::string& title) const {
    auto it = std::find_if(records.begin(), records.end(),
            [&title](const Book& book) { return book.title == title; });
    return it == records.end() ? nullptr : &*it;
}

Book& Catalog::get(const std::string& title) {
    auto it = std::find_if(records.begin(), records.end(),
            [&title](const Book& book) { return book.title == title; });
    if (it == records.end()) {
        throw CatalogError{CatalogErrc::NOT_FOUND, title};
    }
    return *it;
}
