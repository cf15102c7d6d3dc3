#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>
#include "Catalog.hpp"

class CatalogTest : public ::testing::Test {
protected:
  Catalog catalog = Catalog::defaults();

  int available(const std::string& title) const {
    const Book* book = catalog.find(title);
    EXPECT_NE(book, nullptr) << "Missing title: " << title;
    return book ? book->available() : -1;
  }

  void expect_error(CatalogErrc expected, bool borrowing, const std::string& title) {
    const Catalog before = catalog;
    try {
      if (borrowing) {
        catalog.borrow(title);
      } else {
        catalog.returnBook(title);
      }
      ADD_FAILURE() << "Expected CatalogError for: " << title;
    } catch (const CatalogError& e) {
      EXPECT_EQ(e.code(), expected);
      EXPECT_EQ(e.title(), title);
    }
    EXPECT_EQ(catalog, before) << "Failed operation must leave the catalog unchanged";
  }

  void expect_invariants() const {
    for (const auto& book : catalog.books()) {
      EXPECT_GE(book.borrowed_copies, 0) << book.title;
      EXPECT_LE(book.borrowed_copies, book.total_copies) << book.title;
    }
  }
};

TEST_F(CatalogTest, DefaultsAreFixed) {
  ASSERT_FALSE(catalog.empty());
  EXPECT_EQ(catalog, Catalog::defaults());

  const std::vector<std::pair<std::string, int>> expected = {
    {"1984", 3},
    {"Pride and Prejudice", 2},
    {"To Kill a Mockingbird", 4},
    {"The Great Gatsby", 2},
    {"The Hobbit", 2}
  };
  ASSERT_EQ(catalog.size(), expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    const Book& book = catalog.books()[i];
    EXPECT_EQ(book.title, expected[i].first);
    EXPECT_EQ(book.total_copies, expected[i].second);
    EXPECT_EQ(book.borrowed_copies, 0);
  }
}

TEST_F(CatalogTest, ListingsFollowCatalogOrder) {
  EXPECT_EQ(catalog.listAvailable().size(), catalog.size());
  EXPECT_TRUE(catalog.listBorrowed().empty());

  catalog.borrow("The Hobbit");
  catalog.borrow("1984");
  catalog.borrow("1984");

  const BookCounts borrowed = catalog.listBorrowed();
  ASSERT_EQ(borrowed.size(), 2u);
  EXPECT_EQ(borrowed[0], (BookCount{"1984", 2}));
  EXPECT_EQ(borrowed[1], (BookCount{"The Hobbit", 1}));

  const BookCounts avail = catalog.listAvailable();
  ASSERT_EQ(avail.size(), 5u);
  EXPECT_EQ(avail.front(), (BookCount{"1984", 1}));
  EXPECT_EQ(avail.back(), (BookCount{"The Hobbit", 1}));
}

TEST_F(CatalogTest, ExhaustedTitleLeavesAvailableListing) {
  catalog.borrow("Pride and Prejudice");
  catalog.borrow("Pride and Prejudice");

  for (const auto& entry : catalog.listAvailable()) {
    EXPECT_NE(entry.title, "Pride and Prejudice");
  }
  EXPECT_EQ(catalog.listAvailable().size(), 4u);
}

TEST_F(CatalogTest, BorrowReturnsUpdatedRecord) {
  const Book& book = catalog.borrow("The Great Gatsby");
  EXPECT_EQ(book.title, "The Great Gatsby");
  EXPECT_EQ(book.borrowed_copies, 1);
  EXPECT_EQ(book.available(), 1);

  const Book& returned = catalog.returnBook("The Great Gatsby");
  EXPECT_EQ(returned.borrowed_copies, 0);
}

TEST_F(CatalogTest, BorrowThenReturnRestoresAvailability) {
  for (const auto& book : Catalog::defaults().books()) {
    const int before = available(book.title);
    catalog.borrow(book.title);
    catalog.returnBook(book.title);
    EXPECT_EQ(available(book.title), before) << book.title;
  }
  EXPECT_EQ(catalog, Catalog::defaults());
}

TEST_F(CatalogTest, HobbitScenario) {
  ASSERT_EQ(available("The Hobbit"), 2);

  EXPECT_NO_THROW(catalog.borrow("The Hobbit"));
  EXPECT_NO_THROW(catalog.borrow("The Hobbit"));
  EXPECT_EQ(available("The Hobbit"), 0);

  expect_error(CatalogErrc::NO_COPIES_AVAILABLE, true, "The Hobbit");

  catalog.returnBook("The Hobbit");
  EXPECT_EQ(available("The Hobbit"), 1);
}

TEST_F(CatalogTest, ReturnWithNothingBorrowedFails) {
  expect_error(CatalogErrc::NOTHING_TO_RETURN, false, "1984");

  catalog.borrow("1984");
  catalog.returnBook("1984");
  expect_error(CatalogErrc::NOTHING_TO_RETURN, false, "1984");
}

TEST_F(CatalogTest, UnknownTitleIsNotFound) {
  expect_error(CatalogErrc::NOT_FOUND, true, "Dune");
  expect_error(CatalogErrc::NOT_FOUND, false, "Dune");
}

TEST_F(CatalogTest, TitleMatchIsExact) {
  expect_error(CatalogErrc::NOT_FOUND, true, "the hobbit");
  expect_error(CatalogErrc::NOT_FOUND, true, " The Hobbit");
  expect_error(CatalogErrc::NOT_FOUND, true, "The Hobbit ");
  EXPECT_EQ(catalog.find("THE HOBBIT"), nullptr);
  EXPECT_NE(catalog.find("The Hobbit"), nullptr);
}

TEST_F(CatalogTest, InvariantsHoldUnderMixedOperations) {
  const std::vector<std::string> titles = {
    "1984", "The Hobbit", "Dune", "Pride and Prejudice", "The Hobbit", "1984"
  };

  for (int round = 0; round < 40; ++round) {
    const std::string& title = titles[round % titles.size()];
    try {
      if (round % 3 == 2) {
        catalog.returnBook(title);
      } else {
        catalog.borrow(title);
      }
    } catch (const CatalogError& e) {
      EXPECT_FALSE(std::string(e.what()).empty());
    }
    expect_invariants();
  }
}

TEST(CatalogRecordsTest, AcceptsValidRecords) {
  const Catalog catalog = Catalog::fromRecords({
    {"X1", "Dune", "Frank Herbert", 1, 1},
    {"X2", "Emma", "Jane Austen", 0, 0}
  });
  ASSERT_EQ(catalog.size(), 2u);
  EXPECT_EQ(catalog.books()[0].title, "Dune");
  EXPECT_TRUE(catalog.listAvailable().empty());
  EXPECT_EQ(catalog.listBorrowed().size(), 1u);
}

TEST(CatalogRecordsTest, RejectsInvalidRecords) {
  EXPECT_THROW(Catalog::fromRecords({}), CatalogFormatError);
  EXPECT_THROW(Catalog::fromRecords({{"X1", "", "", 1, 0}}), CatalogFormatError);
  EXPECT_THROW(Catalog::fromRecords({{"X1", "Dune", "", 1, 2}}), CatalogFormatError);
  EXPECT_THROW(Catalog::fromRecords({{"X1", "Dune", "", 1, -1}}), CatalogFormatError);
  EXPECT_THROW(Catalog::fromRecords({{"X1", "Dune", "", -1, 0}}), CatalogFormatError);
  EXPECT_THROW(Catalog::fromRecords({
    {"X1", "Dune", "", 1, 0},
    {"X2", "Dune", "", 2, 0}
  }), CatalogFormatError);
}
