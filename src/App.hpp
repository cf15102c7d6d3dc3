#pragma once

#include "Book.hpp"
#include "Catalog.hpp"
#include "Librarydb.hpp"
#include "StatusTimer.hpp"

#include "ftxui/component/component.hpp"
#include "ftxui/component/screen_interactive.hpp"

#include <string> // string
#include <vector> // vector

// Main app
class App {
    public:
        App(Librarydb& database, Catalog& books) : db(database), catalog(books) {}

        int run();

    private:
        void home();

        void borrowSelected();
        void returnSelected();
        void commit(const std::string& message);
        void refresh();

        void report(const std::string& message, bool failed);

        ftxui::Component bookDetail(const std::vector<std::string>& titles, const int& selector);
        ftxui::Component bookMenu(std::vector<std::string>& entries, int& selector);

        Librarydb& db;
        Catalog& catalog;

        // menu entries and the catalog titles they refer to
        std::vector<std::string> available_entries, borrowed_entries;
        std::vector<std::string> available_titles, borrowed_titles;
        int available_selected = 0;
        int borrowed_selected = 0;

        std::string status_message;
        bool status_failed = false;
        bool show_status = false;
        unsigned status_generation = 0;

        int entryMenuSize = 50;
        inline static ftxui::ScreenInteractive screen = ftxui::ScreenInteractive::Fullscreen();

        // Last member: stopped and joined before the state it touches goes away
        StatusTimer status_timer;
};
