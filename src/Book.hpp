#pragma once

#include <string>
#include <vector>

struct Book {
    std::string book_id;
    std::string title;
    std::string author;
    int total_copies;
    int borrowed_copies;

    int available() const { return total_copies - borrowed_copies; }

    bool operator==(const Book&) const = default;
};

typedef std::vector<Book> BookStack;

// (title, copies) pairs returned by the catalog listings
struct BookCount {
    std::string title;
    int copies;

    bool operator==(const BookCount&) const = default;
};

typedef std::vector<BookCount> BookCounts;
