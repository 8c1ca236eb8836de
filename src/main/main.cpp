#include "main/migrate_main.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    try {
        return migrateMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
