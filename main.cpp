#include "app/MoveSlotApp.hpp"

int main(int argc, char** argv) {
    moveslot::app::MoveSlotApp app;
    return app.Run(argc, argv);
}
