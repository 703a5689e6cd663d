#include "app/InventoryApp.hpp"

int main(int argc, char** argv) {
    bacnetinventory::app::InventoryApp app;
    return app.Run(argc, argv);
}
