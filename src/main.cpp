#include "App.hpp"
#include "Catalog.hpp"
#include "Librarydb.hpp"

#include <iostream> // cerr
#include <cstdlib> // EXIT_FAILURE, getenv
#include <filesystem> // create_directories, exists, is_regular_file
#include <iterator> // next
#include <optional> // optional
#include <stdexcept> // invalid_argument
#include <system_error> // error_code
#include <vector> // vector
#include <string> // string

void print_usage() {
std::cerr<<
R"#(
Library System

Usage: library [-r] [-d dbfile]
    -r          Reset the catalog to the default books
    -d FILE     Open database file FILE
)#";
}

int main(int argc, char** argv) {
    std::vector<std::string> args{argv+1, argv+argc};
    bool reset = false;
    std::string db_path;

    for(auto it = args.begin(); it != args.end(); ++it) {
        if(*it == "-r")
            reset = true;
        else if (*it == "-d") {
            if(std::next(it) == args.end()){
                print_usage();
                return EXIT_FAILURE;
            }
            db_path = *std::next(it);
            ++it;
        }
        else {
            print_usage();
            return EXIT_FAILURE;
        }
    }

    if(not db_path.empty()) {
        // a missing file is fine, it gets the default catalog
        std::error_code ec;
        bool present = std::filesystem::exists(db_path, ec);
        if(ec) {
            std::cerr<<"Error: Can't open database file "<<db_path<<" : "<<ec.message()<<"\n";
            return EXIT_FAILURE;
        }
        if(present && not std::filesystem::is_regular_file(db_path, ec)){
            std::cerr<<"Error: Can't open database file "<<db_path<<" : Not regular file\n";
            return EXIT_FAILURE;
        }
    }
    else {
        std::filesystem::path data_dir;
        if(auto dir = std::getenv("XDG_DATA_HOME")){
            data_dir = dir;
        }
        else if(auto home = std::getenv("HOME")){
            data_dir = std::filesystem::path(home) / ".local" / "share";
        }
        else {
            std::cerr<<"Error: Neither XDG_DATA_HOME nor HOME is set. Use -d FILE\n";
            return EXIT_FAILURE;
        }

        data_dir /= "library-system";
        std::error_code ec;
        std::filesystem::create_directories(data_dir, ec);
        if(ec) {
            std::cerr<<"Error: Can't create data directory "<<data_dir<<" <"<<ec.message()<<">\n";
            return EXIT_FAILURE;
        }
        db_path = data_dir / "library.db";
    }

    std::optional<Librarydb> db;
    try {
        db.emplace(db_path);
    }
    catch(const std::invalid_argument& e) {
        std::cerr<<"[ERROR] Failed to initialize database: <"<<e.what()<<">"<<std::endl;
        return EXIT_FAILURE;
    }

    Catalog catalog = Catalog::defaults();
    if(reset) {
        try {
            catalog = db->reset();
        }
        catch(const StorageError& e) {
            std::cerr<<"[ERROR] Failed to reset catalog: <"<<e.what()<<">"<<std::endl;
            return EXIT_FAILURE;
        }
    }
    else {
        catalog = db->load();
    }

    App app(*db, catalog);
    return app.run();
}
