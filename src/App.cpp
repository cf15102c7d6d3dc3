#include "App.hpp"
#include "Book.hpp"
#include "Catalog.hpp"
#include "Librarydb.hpp"
#include "StatusTimer.hpp"

#include "ftxui/component/screen_interactive.hpp"
#include "ftxui/component/component.hpp"
#include "ftxui/component/component_options.hpp"
#include "ftxui/dom/elements.hpp"
#include "ftxui/component/event.hpp"

#include <chrono> // seconds
#include <cstdlib> // EXIT_FAILURE, EXIT_SUCCESS
#include <exception> // exception
#include <iostream> // cerr
#include <string> // string, to_string
#include <vector> // vector

class Exit : public std::exception {};

ftxui::MenuOption menuOption() {
    using namespace ftxui;
    auto option = MenuOption();

    option.entries_option.transform = [](const EntryState& state) {
        Element e;
        if (state.focused) {
            e = text("> " + state.label);
        }
        if (state.active) {
            e = text("< " + state.label + " >") | bold;
        }
        if (!state.focused && !state.active) {
            e = text("  " + state.label) | dim;
        }
        return e;
    };

    return option;
}

ftxui::ButtonOption buttonOption() {
    return ftxui::ButtonOption::Ascii();
}

int App::run() {
    refresh();
    try {
        home();
    }
    catch(const Exit& e){
        screen.Exit();
    }
    catch(const std::exception& e) {
        screen.Exit();
        std::cerr<<"[ERROR] Unknown error. <"<<e.what()<<">"<<std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

// Rebuild the menu entries after the catalog changed
void App::refresh() {
    auto fill = [this](const BookCounts& counts, std::vector<std::string>& entries,
                       std::vector<std::string>& titles, int& selector) {
        entries.clear();
        titles.clear();
        for(const auto& count : counts) {
            const Book* book = catalog.find(count.title);
            entries.push_back(book->book_id + "_" + count.title + " (" + std::to_string(count.copies) + ")");
            titles.push_back(count.title);
        }
        if(selector >= static_cast<int>(titles.size()))
            selector = titles.empty() ? 0 : static_cast<int>(titles.size()) - 1;
    };

    fill(catalog.listAvailable(), available_entries, available_titles, available_selected);
    fill(catalog.listBorrowed(), borrowed_entries, borrowed_titles, borrowed_selected);
}

void App::borrowSelected() {
    if(available_titles.empty())
        return;

    try {
        const Book& book = catalog.borrow(available_titles[available_selected]);
        commit("You borrowed \"" + book.title + "\".");
    }
    catch(const CatalogError& e) {
        report(e.what(), true);
    }
}

void App::returnSelected() {
    if(borrowed_titles.empty())
        return;

    try {
        const Book& book = catalog.returnBook(borrowed_titles[borrowed_selected]);
        commit("Thank you for returning \"" + book.title + "\".");
    }
    catch(const CatalogError& e) {
        report(e.what(), true);
    }
}

// The in-memory change stands even when the save fails; the next successful
// save carries it to disk.
void App::commit(const std::string& message) {
    refresh();
    try {
        db.save(catalog);
        report(message, false);
    }
    catch(const StorageError& e) {
        report(message + " Change not saved! <" + e.what() + ">", true);
    }
}

void App::report(const std::string& message, bool failed) {
    status_message = message;
    status_failed = failed;
    show_status = true;

    auto generation = ++status_generation;
    status_timer.start(std::chrono::seconds{2}, [this, generation] {
        screen.Post([this, generation] {
            if(generation == status_generation)
                show_status = false;
        });
        screen.PostEvent(ftxui::Event::Custom);
    });
}

void App::home() {
    using namespace ftxui;

    std::vector<std::string> main_selection {
        "Available books",
        "Borrowed books"
    };

    // Main menu selector
    int main_menu_selected = 0;
    auto main_menu = Menu(&main_selection, &main_menu_selected, menuOption());

    auto borrow_button = Button("Borrow", [&] { borrowSelected(); }, buttonOption());
    auto return_button = Button("Return", [&] { returnSelected(); }, buttonOption());

    // entries on the left, selected book detail and the action on the right
    auto bookView = [&](std::vector<std::string>& entries, std::vector<std::string>& titles,
                        int& selector, Component action) {
        return Container::Vertical({
            Renderer([] { return text("No books to display.") | dim; }) | Maybe([&titles] { return titles.empty(); }),
            Container::Horizontal({
                bookMenu(entries, selector),
                Renderer([] { return separator(); }),
                Container::Vertical({
                    bookDetail(titles, selector),
                    Renderer([] { return filler(); }),
                    Container::Horizontal({
                        Renderer([] { return filler(); }),
                        action,
                        Renderer([] { return filler(); })
                    })
                })
            }) | Maybe([&titles] { return ! titles.empty(); })
        });
    };

    auto main_tab = Container::Tab({
        bookView(available_entries, available_titles, available_selected, borrow_button),
        bookView(borrowed_entries, borrowed_titles, borrowed_selected, return_button)
    }, &main_menu_selected);

    auto status_line = Renderer([&] {
        return text(status_message) | color(status_failed ? Color::Red : Color::Green);
    }) | Maybe(&show_status);

    // Main menu on left most side
    auto main_menu_container = Container::Vertical({
        Renderer([] {
            return hbox({
                filler(),
                text("Library") | bold,
                filler()
            });
        }),
        main_menu,
        Renderer([] { return filler(); }),
        Renderer([] { return separator(); }),
        Button("Quit", [] { throw Exit(); }, buttonOption())
    });

    // Outer most container
    auto home_screen = Container::Horizontal({
        main_menu_container,
        Renderer([] { return separator(); }),
        Container::Vertical({
            main_tab | flex,
            Renderer([] { return separator(); }),
            status_line
        }) | flex
    }) | border;

    screen.Loop(home_screen);
}

ftxui::Component App::bookMenu(std::vector<std::string>& entries, int& selector) {
    using namespace ftxui;
    return Menu(&entries, &selector, menuOption()) | size(ftxui::WIDTH, ftxui::EQUAL, entryMenuSize);
}

ftxui::Component App::bookDetail(const std::vector<std::string>& titles, const int& selector) {
    using namespace ftxui;

    // the listed title may be gone after a refresh
    auto selected = [&]() -> const Book* {
        if(selector < 0 || selector >= static_cast<int>(titles.size()))
            return nullptr;
        return catalog.find(titles[selector]);
    };

    return Renderer([selected] {
        const Book* book = selected();
        if(not book)
            return text("");

        return vbox({
            text("ID: " + book->book_id),
            text("Title: " + book->title),
            text("Author: " + book->author),
            text("Available: " + std::to_string(book->available())),
            text("Borrowed: " + std::to_string(book->borrowed_copies)),
            text("Total copies: " + std::to_string(book->total_copies))
        });
    });
}
